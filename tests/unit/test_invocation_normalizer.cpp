#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/hook_errors.hpp"
#include "policy/invocation_normalizer.hpp"

namespace {

using hookguard::core::errors::ErrorCategory;
using hookguard::core::errors::get_error;
using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::policy::normalize;
using hookguard::policy::parse_payload;
using hookguard::protocol::OperationKind;
using hookguard::protocol::ToolCall;

TEST(InvocationNormalizerTest, ParsesShellPayload) {
    std::istringstream in(R"({"tool_name": "Bash", "tool_input": {"command": "ls -la"}})");
    auto result = parse_payload(in);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).name, "Bash");
    EXPECT_EQ(get_value(result).command, "ls -la");
    EXPECT_TRUE(get_value(result).file_path.empty());
}

TEST(InvocationNormalizerTest, RejectsInvalidJson) {
    auto result = parse_payload(std::string("not json"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_payload");
}

TEST(InvocationNormalizerTest, RejectsNonObjectPayload) {
    auto result = parse_payload(std::string("[\"Bash\"]"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_payload");
}

TEST(InvocationNormalizerTest, RejectsNonStringCommand) {
    auto result = parse_payload(
        std::string(R"({"tool_name": "Bash", "tool_input": {"command": ["rm", "-rf"]}})"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_payload");
}

TEST(InvocationNormalizerTest, MissingToolInputIsNotAnError) {
    auto result = parse_payload(std::string(R"({"tool_name": "Bash"})"));
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(normalize(get_value(result)).has_value());
}

TEST(InvocationNormalizerTest, NormalizesShellCommand) {
    const auto invocation = normalize(ToolCall{"Bash", "git status", ""});
    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->kind, OperationKind::ShellCommand);
    EXPECT_EQ(invocation->raw_text, "git status");
    EXPECT_FALSE(invocation->target_path.has_value());
}

TEST(InvocationNormalizerTest, NormalizesEditAndWrite) {
    const auto edit = normalize(ToolCall{"Edit", "", "src/.env"});
    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->kind, OperationKind::FileEdit);
    EXPECT_EQ(edit->raw_text, "src/.env");
    ASSERT_TRUE(edit->target_path.has_value());
    EXPECT_EQ(edit->target_path.value(), "src/.env");

    const auto write = normalize(ToolCall{"Write", "", "notes.md"});
    ASSERT_TRUE(write.has_value());
    EXPECT_EQ(write->kind, OperationKind::FileWrite);
}

TEST(InvocationNormalizerTest, UnknownToolsAndEmptySubjectsAreNotApplicable) {
    EXPECT_FALSE(normalize(ToolCall{"Read", "", "src/.env"}).has_value());
    EXPECT_FALSE(normalize(ToolCall{"Bash", "", ""}).has_value());
    EXPECT_FALSE(normalize(ToolCall{"Edit", "", ""}).has_value());
    // A shell tool does not read file_path, nor an edit tool the command.
    EXPECT_FALSE(normalize(ToolCall{"Write", "rm -rf /", ""}).has_value());
}

}  // namespace
