#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/invocation_id.hpp"
#include "core/errors/hook_errors.hpp"
#include "skills/skill_resolver.hpp"

namespace {

using hookguard::core::errors::get_error;
using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::skills::glob_match;
using hookguard::skills::parse_manifest;
using hookguard::skills::read_content_sample;
using hookguard::skills::render_skill_bundle;
using hookguard::skills::SkillResolver;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_skill_resolver_" + hookguard::core::config::generate_invocation_id());
        std::filesystem::create_directories(root_ / "skills");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path skills() const { return root_ / "skills"; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::vector<std::filesystem::path> resolve_in(const TempWorkspace& workspace,
                                              const std::string& target) {
    auto resolver = SkillResolver::from_directory(workspace.skills());
    EXPECT_FALSE(is_error(resolver));
    if (is_error(resolver)) {
        return {};
    }
    return get_value(resolver).resolve(target);
}

TEST(SkillResolverTest, UnionsExtensionAndPathRules) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json", R"({
        "extensions": {".py": ["python/*.md"]},
        "paths": {"services/*": ["services.md", "python/style.md"]}
    })");
    write_file(skills / "python/style.md", "# style");
    write_file(skills / "python/typing.md", "# typing");
    write_file(skills / "services.md", "# services");

    const auto resolved = resolve_in(workspace, "services/app.py");
    const std::vector<std::filesystem::path> expected = {
        skills / "python" / "style.md", skills / "python" / "typing.md", skills / "services.md"};
    EXPECT_EQ(resolved, expected);
}

TEST(SkillResolverTest, ExtensionKeysAreCaseInsensitive) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json", R"({"extensions": {".go": ["go.md"]}})");
    write_file(skills / "go.md", "# go");

    EXPECT_EQ(resolve_in(workspace, "cmd/MAIN.GO"),
              (std::vector<std::filesystem::path>{skills / "go.md"}));
    EXPECT_TRUE(resolve_in(workspace, "cmd/main.rs").empty());
}

TEST(SkillResolverTest, KeepsOnlyExistingMarkdownDocuments) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json",
               R"({"always": ["core.md", "missing.md", "notes.txt", "core.md"]})");
    write_file(skills / "core.md", "# core");
    write_file(skills / "notes.txt", "plain");

    EXPECT_EQ(resolve_in(workspace, "anything.txt"),
              (std::vector<std::filesystem::path>{skills / "core.md"}));
}

TEST(SkillResolverTest, DoubleStarSpansDirectories) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json", R"({"always": ["go/**/*.md"], "paths": {"*": ["top/*.md"]}})");
    write_file(skills / "go/style.md", "# style");
    write_file(skills / "go/testing/table.md", "# table");
    write_file(skills / "top/a.md", "# a");
    write_file(skills / "top/nested/b.md", "# b");

    const std::vector<std::filesystem::path> expected = {
        skills / "go" / "style.md", skills / "go" / "testing" / "table.md",
        skills / "top" / "a.md"};
    EXPECT_EQ(resolve_in(workspace, "main.go"), expected);
}

TEST(SkillResolverTest, ContentHintsScanFilePrefix) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json", R"({"content_hints": {
        "import\\s+\"testing\"": ["testing.md"],
        "PACKAGE MAIN": ["cli.md"],
        "needle": ["late.md"],
        "([": ["broken.md"]
    }})");
    write_file(skills / "testing.md", "# testing");
    write_file(skills / "cli.md", "# cli");
    write_file(skills / "late.md", "# late");
    write_file(skills / "broken.md", "# broken");

    const auto target = workspace.root() / "src/main_test.go";
    write_file(target, "package main\n\nimport \"testing\"\n" + std::string(2100, 'x') + "needle\n");

    const std::vector<std::filesystem::path> expected = {skills / "cli.md",
                                                         skills / "testing.md"};
    EXPECT_EQ(resolve_in(workspace, target.string()), expected);
}

TEST(SkillResolverTest, ContentHintsNeedReadableTarget) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "manifest.json", R"({"content_hints": {".*": ["any.md"]}})");
    write_file(skills / "any.md", "# any");

    EXPECT_TRUE(resolve_in(workspace, (workspace.root() / "absent.go").string()).empty());
}

TEST(SkillResolverTest, MissingManifestResolvesNothing) {
    TempWorkspace workspace;
    write_file(workspace.skills() / "core.md", "# core");
    EXPECT_TRUE(resolve_in(workspace, "main.go").empty());
}

TEST(SkillResolverTest, RejectsMissingDirectoryAndMalformedManifest) {
    TempWorkspace workspace;
    auto missing = SkillResolver::from_directory(workspace.root() / "nope");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_skills_dir");

    write_file(workspace.skills() / "manifest.json", "{\"always\": ");
    auto malformed = SkillResolver::from_directory(workspace.skills());
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "invalid_manifest");
}

TEST(SkillResolverTest, ParseManifestChecksShapes) {
    EXPECT_FALSE(is_error(parse_manifest("{}")));
    EXPECT_TRUE(is_error(parse_manifest("[]")));
    EXPECT_TRUE(is_error(parse_manifest(R"({"always": "core.md"})")));
    EXPECT_TRUE(is_error(parse_manifest(R"({"extensions": {".go": "go.md"}})")));
    EXPECT_TRUE(is_error(parse_manifest(R"({"paths": ["x"]})")));
    EXPECT_TRUE(is_error(parse_manifest(R"({"content_hints": {"x": [1]}})")));

    auto parsed = parse_manifest(R"({"always": ["a.md"], "paths": {"src/*": ["b.md"]}})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).always, (std::vector<std::string>{"a.md"}));
    EXPECT_EQ(get_value(parsed).paths.at("src/*"), (std::vector<std::string>{"b.md"}));
}

TEST(SkillResolverTest, GlobStarCrossesDirectories) {
    EXPECT_TRUE(glob_match("*.go", "cmd/server/main.go"));
    EXPECT_TRUE(glob_match("services/*", "services/api/app.py"));
    EXPECT_TRUE(glob_match("*_test.go", "pkg/x_test.go"));
    EXPECT_FALSE(glob_match("services/*", "other/app.py"));
    EXPECT_FALSE(glob_match("*.go", "main.gox"));
}

TEST(SkillResolverTest, ContentSampleIsBounded) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "big.txt";
    write_file(file, std::string(5000, 'a'));
    EXPECT_EQ(read_content_sample(file).size(), 2000u);
    EXPECT_EQ(read_content_sample(file, 10), std::string(10, 'a'));
    EXPECT_TRUE(read_content_sample(workspace.root() / "absent.txt").empty());
    EXPECT_TRUE(read_content_sample(workspace.root()).empty());
}

TEST(SkillResolverTest, RendersBundle) {
    TempWorkspace workspace;
    const auto skills = workspace.skills();
    write_file(skills / "errors.md", "Wrap errors.");
    write_file(skills / "naming.md", "Short names.\n");

    const std::string bundle = render_skill_bundle(
        {skills / "errors.md", skills / "missing.md", skills / "naming.md"});
    EXPECT_EQ(bundle,
              "---\n# errors\n---\nWrap errors.\n"
              "---\n# naming\n---\nShort names.\n\n");
}

}  // namespace
