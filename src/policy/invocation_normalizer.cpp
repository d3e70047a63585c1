#include "policy/invocation_normalizer.hpp"

#include <iterator>
#include <nlohmann/json.hpp>

namespace hookguard::policy {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

namespace {

HookError invalid_payload(const std::string& message) {
    return HookError{ErrorCategory::Input, message, "invalid_payload",
                     "Expected {\"tool_name\": ..., \"tool_input\": {...}} on stdin."};
}

// Copies an optional string member; anything other than a string is an error.
bool read_string_field(const json& object, const char* key, std::string& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

core::errors::Result<protocol::ToolCall> parse_payload(const std::string& text) {
    const json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return invalid_payload("Invocation payload is not valid JSON.");
    }
    if (!payload.is_object()) {
        return invalid_payload("Invocation payload must be a JSON object.");
    }

    protocol::ToolCall call;
    if (!read_string_field(payload, "tool_name", call.name)) {
        return invalid_payload("tool_name must be a string.");
    }

    const auto input_it = payload.find("tool_input");
    if (input_it == payload.end() || !input_it->is_object()) {
        return call;
    }
    if (!read_string_field(*input_it, "command", call.command)) {
        return invalid_payload("tool_input.command must be a string.");
    }
    if (!read_string_field(*input_it, "file_path", call.file_path)) {
        return invalid_payload("tool_input.file_path must be a string.");
    }
    return call;
}

core::errors::Result<protocol::ToolCall> parse_payload(std::istream& in) {
    const std::string text((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    return parse_payload(text);
}

std::optional<protocol::Invocation> normalize(const protocol::ToolCall& call) {
    if (call.name == "Bash") {
        if (call.command.empty()) {
            return std::nullopt;
        }
        return protocol::Invocation{protocol::OperationKind::ShellCommand,
                                    call.command, std::nullopt};
    }

    std::optional<protocol::OperationKind> kind;
    if (call.name == "Edit") {
        kind = protocol::OperationKind::FileEdit;
    } else if (call.name == "Write") {
        kind = protocol::OperationKind::FileWrite;
    }
    if (!kind || call.file_path.empty()) {
        return std::nullopt;
    }
    return protocol::Invocation{*kind, call.file_path, call.file_path};
}

}  // namespace hookguard::policy
