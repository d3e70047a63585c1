#include "tools/formatter_dispatch.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace hookguard::tools {

using core::errors::ErrorCategory;
using core::errors::HookError;

namespace {

const std::vector<std::string> kSkippedFragments = {
    "node_modules", ".git", "vendor", "__pycache__", ".next", "dist", "build"};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
        }
    }
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return HookError{ErrorCategory::Input, "Process argv cannot be empty.",
                         "empty_argv"};
    }

    // execvp takes mutable strings; keep owned copies alive until exec.
    std::vector<std::vector<char>> buffers;
    buffers.reserve(request.argv.size());
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        buffers.emplace_back(arg.begin(), arg.end());
        buffers.back().push_back('\0');
        argv.push_back(buffers.back().data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return HookError{ErrorCategory::Execution, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return HookError{ErrorCategory::Execution, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        // Own process group so a timeout also reaches helpers the formatter spawned.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        if (request.working_dir && chdir(request.working_dir->c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

std::optional<std::filesystem::path> find_on_path(const std::string& program,
                                                  const std::string& search_path) {
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / program;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string to_string(const FormatStatus status) {
    switch (status) {
        case FormatStatus::Skipped:     return "skipped";
        case FormatStatus::Formatted:   return "formatted";
        case FormatStatus::Failed:      return "failed";
        case FormatStatus::TimedOut:    return "timed_out";
        case FormatStatus::SpawnFailed: return "spawn_failed";
        default: return "unknown";
    }
}

std::map<std::string, FormatterSpec> default_formatters() {
    const FormatterSpec prettier{"npx", {"prettier", "--write"}};
    std::map<std::string, FormatterSpec> formatters;
    for (const char* ext : {".ts", ".tsx", ".js", ".jsx", ".json", ".css", ".scss",
                            ".md", ".yaml", ".yml"}) {
        formatters[ext] = prettier;
    }
    formatters[".go"] = FormatterSpec{"gofmt", {"-w"}};
    formatters[".py"] = FormatterSpec{"black", {}};
    return formatters;
}

bool is_skipped_path(const std::string& path) {
    return std::any_of(kSkippedFragments.begin(), kSkippedFragments.end(),
                       [&path](const std::string& fragment) {
                           return path.find(fragment) != std::string::npos;
                       });
}

FormatterDispatch::FormatterDispatch(std::map<std::string, FormatterSpec> formatters,
                                     const std::uint32_t timeout_ms)
    : formatters_(std::move(formatters)), timeout_ms_(timeout_ms) {}

std::optional<FormatterSpec> FormatterDispatch::formatter_for(
    const std::filesystem::path& file_path) const {
    const auto it = formatters_.find(lowercase(file_path.extension().string()));
    if (it == formatters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

FormatReport FormatterDispatch::format(const protocol::ToolCall& call) const {
    if ((call.name != "Edit" && call.name != "Write") || call.file_path.empty()) {
        return FormatReport{};
    }
    if (is_skipped_path(call.file_path)) {
        LOG_DEBUG("Skipping excluded path " + call.file_path);
        return FormatReport{};
    }

    std::error_code ec;
    if (!std::filesystem::exists(call.file_path, ec) || ec) {
        return FormatReport{};
    }

    const auto spec = formatter_for(call.file_path);
    if (!spec) {
        return FormatReport{};
    }

    const char* path_env = std::getenv("PATH");
    if (!find_on_path(spec->program, path_env != nullptr ? path_env : "")) {
        LOG_DEBUG("Formatter not installed: " + spec->program);
        return FormatReport{};
    }

    ProcessRequest request;
    request.argv.push_back(spec->program);
    request.argv.insert(request.argv.end(), spec->args.begin(), spec->args.end());
    request.argv.push_back(call.file_path);
    request.timeout_ms = timeout_ms_;

    auto capture_result = run_process(request);
    if (core::errors::is_error(capture_result)) {
        const auto& error = core::errors::get_error(capture_result);
        LOG_WARN("Formatter spawn failed: " + error.code);
        return FormatReport{FormatStatus::SpawnFailed, "Format error: " + error.message};
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        return FormatReport{FormatStatus::TimedOut, "Format timeout: " + call.file_path};
    }
    if (capture.exit_code != 0) {
        return FormatReport{FormatStatus::Failed,
                            "Format warning: " + trim_trailing_newlines(capture.stderr_text)};
    }

    LOG_DEBUG("Formatted " + call.file_path + " with " + spec->program);
    return FormatReport{FormatStatus::Formatted, "Formatted: " + call.file_path};
}

}  // namespace hookguard::tools
