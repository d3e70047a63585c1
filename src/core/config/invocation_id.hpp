#pragma once
#include <string>
#include <random>
#include <sstream>

namespace hookguard::core::config {

    // 8 hex characters prefixed with "inv-", used to correlate log lines of
    // one hook invocation.
    inline std::string generate_invocation_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "inv-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace hookguard::core::config
