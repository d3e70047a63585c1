#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "tools/formatter_dispatch.hpp"

namespace hookguard::tools {

struct LintStep {
    ProcessRequest request;
    bool must_pass = true;  // false for auto-fix passes
};

enum class LintStatus {
    Skipped,
    Passed,
    Failed,
    TimedOut,
    SpawnFailed
};

struct LintReport {
    LintStatus status = LintStatus::Skipped;
    std::string output;  // combined linter output of the checking steps
};

std::string to_string(LintStatus status);

// Nearest ancestor of `file_path` holding .golangci.yml, .golangci.yaml or
// go.mod.
std::optional<std::filesystem::path> find_go_project_root(
    const std::filesystem::path& file_path);

// Post-write linting: ruff for Python, eslint for JS/TS, golangci-lint for
// Go (go vet outside a Go project or without golangci-lint). Linters that
// are not installed are skipped.
class LintDispatch {
public:
    // `search_path` is where linters are looked up; it defaults to $PATH.
    explicit LintDispatch(std::optional<std::string> search_path = std::nullopt,
                          std::uint32_t timeout_ms = 120000);

    std::vector<LintStep> plan(const std::string& file_path) const;

    LintReport lint(const protocol::ToolCall& call) const;

private:
    std::optional<std::string> locate(const std::string& program) const;

    std::string search_path_;
    std::uint32_t timeout_ms_;
};

}  // namespace hookguard::tools
