#include "tools/lint_dispatch.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace hookguard::tools {

namespace {

std::string extension_of(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

bool has_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

std::string to_string(const LintStatus status) {
    switch (status) {
        case LintStatus::Skipped:     return "skipped";
        case LintStatus::Passed:      return "passed";
        case LintStatus::Failed:      return "failed";
        case LintStatus::TimedOut:    return "timed_out";
        case LintStatus::SpawnFailed: return "spawn_failed";
        default: return "unknown";
    }
}

std::optional<std::filesystem::path> find_go_project_root(
    const std::filesystem::path& file_path) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::absolute(file_path, ec).parent_path();
    if (ec) {
        return std::nullopt;
    }

    while (!dir.empty()) {
        if (has_file(dir / ".golangci.yml") || has_file(dir / ".golangci.yaml") ||
            has_file(dir / "go.mod")) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

LintDispatch::LintDispatch(std::optional<std::string> search_path,
                           const std::uint32_t timeout_ms)
    : timeout_ms_(timeout_ms) {
    if (search_path) {
        search_path_ = std::move(*search_path);
    } else {
        const char* path_env = std::getenv("PATH");
        search_path_ = path_env != nullptr ? path_env : "";
    }
}

std::optional<std::string> LintDispatch::locate(const std::string& program) const {
    const auto found = find_on_path(program, search_path_);
    if (!found) {
        return std::nullopt;
    }
    return found->string();
}

std::vector<LintStep> LintDispatch::plan(const std::string& file_path) const {
    const std::string ext = extension_of(file_path);
    std::vector<LintStep> steps;

    auto step = [&](std::vector<std::string> argv, const bool must_pass,
                    std::optional<std::filesystem::path> working_dir = std::nullopt) {
        LintStep lint_step;
        lint_step.request.argv = std::move(argv);
        lint_step.request.timeout_ms = timeout_ms_;
        lint_step.request.working_dir = std::move(working_dir);
        lint_step.must_pass = must_pass;
        steps.push_back(std::move(lint_step));
    };

    if (ext == ".py" || ext == ".pyi") {
        if (const auto uvx = locate("uvx")) {
            step({*uvx, "ruff", "check", file_path}, true);
        }
    } else if (ext == ".ts" || ext == ".tsx" || ext == ".js" || ext == ".jsx") {
        if (const auto eslint = locate("eslint")) {
            step({*eslint, file_path}, true);
        } else if (const auto npx = locate("npx"); npx && has_file("package.json")) {
            step({*npx, "eslint", file_path}, true);
        }
    } else if (ext == ".go") {
        const auto root = find_go_project_root(file_path);
        const auto golangci = locate("golangci-lint");
        if (golangci && root) {
            // Formatting fixes first so the check only reports real findings.
            step({*golangci, "run", "--fix", file_path}, false, root);
            step({*golangci, "run", file_path}, true, root);
        } else if (const auto go = locate("go")) {
            step({*go, "vet", file_path}, true);
        }
    }
    return steps;
}

LintReport LintDispatch::lint(const protocol::ToolCall& call) const {
    if (call.file_path.empty()) {
        return LintReport{};
    }
    std::error_code ec;
    if (!std::filesystem::exists(call.file_path, ec) || ec) {
        LOG_DEBUG("Nothing to lint at " + call.file_path);
        return LintReport{};
    }

    const auto steps = plan(call.file_path);
    if (steps.empty()) {
        return LintReport{};
    }

    LintReport report;
    report.status = LintStatus::Passed;
    for (const auto& lint_step : steps) {
        auto capture_result = run_process(lint_step.request);
        if (core::errors::is_error(capture_result)) {
            const auto& error = core::errors::get_error(capture_result);
            LOG_WARN("Linter spawn failed: " + error.code);
            return LintReport{LintStatus::SpawnFailed, error.message};
        }
        const auto& capture = core::errors::get_value(capture_result);
        if (capture.timed_out) {
            return LintReport{LintStatus::TimedOut, "Lint timeout: " + call.file_path};
        }
        if (!lint_step.must_pass) {
            continue;
        }

        report.output += capture.stdout_text + capture.stderr_text;
        if (capture.exit_code != 0) {
            report.status = LintStatus::Failed;
            return report;
        }
    }

    LOG_DEBUG("Lint passed for " + call.file_path);
    return report;
}

}  // namespace hookguard::tools
