#pragma once
#include <string>

namespace hookguard::protocol {

    // The fields of one tool-use payload that the hooks read.
    // tool_input.command for shell tools, tool_input.file_path for edits.
    struct ToolCall {
        std::string name;       // e.g., "Bash", "Edit", "Write"
        std::string command;
        std::string file_path;
    };

} // namespace hookguard::protocol
