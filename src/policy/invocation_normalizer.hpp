#pragma once

#include <istream>
#include <optional>
#include <string>
#include "core/errors/hook_errors.hpp"
#include "protocol/invocation_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace hookguard::policy {

// Reads `{ "tool_name": ..., "tool_input": { "command" | "file_path": ... } }`.
// Fails with code "invalid_payload" when the text is not a JSON object or a
// present command/file_path is not a string.
core::errors::Result<protocol::ToolCall> parse_payload(const std::string& text);
core::errors::Result<protocol::ToolCall> parse_payload(std::istream& in);

// Maps a tool call onto an operation kind. Returns nullopt when no policy
// domain could apply (unknown tool or empty subject).
std::optional<protocol::Invocation> normalize(const protocol::ToolCall& call);

}  // namespace hookguard::policy
