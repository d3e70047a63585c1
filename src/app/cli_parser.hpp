#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/hook_errors.hpp"

namespace hookguard::app::cli {
    hookguard::core::errors::Result<hookguard::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}
