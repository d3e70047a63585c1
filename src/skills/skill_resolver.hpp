#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"

namespace hookguard::skills {

// manifest.json: each key maps to patterns relative to the skills directory.
struct SkillManifest {
    std::vector<std::string> always;
    std::map<std::string, std::vector<std::string>> extensions;     // ".go" -> patterns
    std::map<std::string, std::vector<std::string>> paths;          // target glob -> patterns
    std::map<std::string, std::vector<std::string>> content_hints;  // regex -> patterns
};

core::errors::Result<SkillManifest> parse_manifest(const std::string& text);

// A missing manifest is an empty one; an unreadable or malformed one is an
// error.
core::errors::Result<SkillManifest> load_manifest(
    const std::filesystem::path& manifest_file);

// Shell-style match in which `*` also crosses `/`.
bool glob_match(const std::string& pattern, const std::string& path);

// Files under `skills_dir` named by `patterns`. Patterns containing `*` are
// globbed (`**` spans directories); others are kept only if they exist.
std::vector<std::filesystem::path> expand_skill_patterns(
    const std::filesystem::path& skills_dir,
    const std::vector<std::string>& patterns);

// First `max_chars` bytes of a file; empty when missing or unreadable.
std::string read_content_sample(const std::filesystem::path& file,
                                std::size_t max_chars = 2000);

class SkillResolver {
public:
    SkillResolver(std::filesystem::path skills_dir, SkillManifest manifest);

    static core::errors::Result<SkillResolver> from_directory(
        const std::filesystem::path& skills_dir);

    // Union of always, extension, path and content-hint matches, restricted
    // to Markdown documents, sorted and de-duplicated. Never fails.
    std::vector<std::filesystem::path> resolve(const std::string& target_path) const;

    const SkillManifest& manifest() const { return manifest_; }

private:
    std::filesystem::path skills_dir_;
    SkillManifest manifest_;
};

// Concatenates the documents as `---\n# <stem>\n---\n<content>\n` blocks,
// skipping any that cannot be read.
std::string render_skill_bundle(const std::vector<std::filesystem::path>& skills);

}  // namespace hookguard::skills
