#pragma once

#include <optional>
#include <string>

namespace hookguard::protocol {

enum class OperationKind {
    ShellCommand,
    FileEdit,
    FileWrite
};

// One normalized tool-use event. raw_text is the command string for shell
// commands and the file path for edits and writes.
struct Invocation {
    OperationKind kind = OperationKind::ShellCommand;
    std::string raw_text;
    std::optional<std::string> target_path;
};

inline bool is_file_operation(const OperationKind kind) {
    switch (kind) {
        case OperationKind::ShellCommand:
            return false;
        case OperationKind::FileEdit:
        case OperationKind::FileWrite:
            return true;
    }
    return false;
}

inline std::string to_string(const OperationKind kind) {
    switch (kind) {
        case OperationKind::ShellCommand:
            return "shell_command";
        case OperationKind::FileEdit:
            return "file_edit";
        case OperationKind::FileWrite:
            return "file_write";
        default:
            return "unknown";
    }
}

}  // namespace hookguard::protocol
