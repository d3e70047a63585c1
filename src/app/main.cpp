#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/hook_commands.hpp"
#include "core/config/invocation_id.hpp"
#include "core/errors/hook_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/decision_contract.hpp"

int main(int argc, char* argv[]) {
    // 1. Correlate every log line of this hook run
    const std::string invocation_id = hookguard::core::config::generate_invocation_id();
    hookguard::core::logging::Logger::get().set_invocation_id(invocation_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = hookguard::app::cli::parse_and_validate(argc, argv);
    if (hookguard::core::errors::is_error(parsed)) {
        const auto& err = hookguard::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_WARN("Hint: " + err.hint);
        }
        return hookguard::protocol::kExitInternalError;
    }

    const auto& req = hookguard::core::errors::get_value(parsed);
    if (req.verbose) {
        hookguard::core::logging::Logger::get().set_threshold(
            hookguard::core::logging::LogLevel::DEBUG);
    }

    // 3. Run the hook; stdout and stderr belong to the host
    const int exit_code = hookguard::app::run_command(req, std::cin, std::cout, std::cerr);
    LOG_DEBUG("Exit status " + std::to_string(exit_code));
    return exit_code;
}
