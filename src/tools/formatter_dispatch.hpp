#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace hookguard::tools {

struct FormatterSpec {
    std::string program;
    std::vector<std::string> args;  // the file path is appended last
};

struct ProcessRequest {
    std::vector<std::string> argv;
    std::uint32_t timeout_ms = 30000;
    std::optional<std::filesystem::path> working_dir;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Spawns argv[0] (looked up on PATH) without a shell and captures both
// streams. The child is killed once timeout_ms elapses. A working_dir that
// cannot be entered makes the child exit 127, like a missing program.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// First executable `program` in the colon-separated `search_path`.
std::optional<std::filesystem::path> find_on_path(const std::string& program,
                                                  const std::string& search_path);

enum class FormatStatus {
    Skipped,
    Formatted,
    Failed,
    TimedOut,
    SpawnFailed
};

struct FormatReport {
    FormatStatus status = FormatStatus::Skipped;
    std::string message;  // empty when skipped
};

std::string to_string(FormatStatus status);

// prettier for web sources and docs, gofmt for Go, black for Python.
std::map<std::string, FormatterSpec> default_formatters();

// Vendored, generated and VCS paths are never formatted.
bool is_skipped_path(const std::string& path);

// Best-effort post-edit formatting. A report never turns into a failure of
// the hook: the caller prints the message and exits 0.
class FormatterDispatch {
public:
    explicit FormatterDispatch(
        std::map<std::string, FormatterSpec> formatters = default_formatters(),
        std::uint32_t timeout_ms = 30000);

    std::optional<FormatterSpec> formatter_for(
        const std::filesystem::path& file_path) const;

    FormatReport format(const protocol::ToolCall& call) const;

private:
    std::map<std::string, FormatterSpec> formatters_;
    std::uint32_t timeout_ms_;
};

}  // namespace hookguard::tools
