#pragma once

#include <istream>
#include <ostream>
#include "protocol/cli_request.hpp"
#include "tools/lint_dispatch.hpp"

namespace hookguard::app {

// Each command returns the process exit status. `in` carries the hook
// payload, `out` and `err` stand in for stdout and stderr.
int run_check(const protocol::CliRequest& request, std::istream& in,
              std::ostream& err);

int run_format(std::istream& in, std::ostream& out, std::ostream& err);

int run_resolve(const protocol::CliRequest& request, std::ostream& out,
                std::ostream& err);

int run_inject(const protocol::CliRequest& request, std::istream& in,
               std::ostream& out, std::ostream& err);

// Exits 1 when the linter reports problems, after printing its output and
// the skills that apply to the file. Missing linters and timeouts pass.
int run_validate(const protocol::CliRequest& request,
                 const tools::LintDispatch& dispatch, std::istream& in,
                 std::ostream& out, std::ostream& err);

int run_validate(const protocol::CliRequest& request, std::istream& in,
                 std::ostream& out, std::ostream& err);

int run_command(const protocol::CliRequest& request, std::istream& in,
                std::ostream& out, std::ostream& err);

}  // namespace hookguard::app
