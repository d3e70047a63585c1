#include "skills/skill_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace hookguard::skills {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

namespace {

constexpr const char* kManifestName = "manifest.json";
constexpr const char* kSkillSuffix = ".md";

HookError invalid_manifest(const std::string& message) {
    return HookError{ErrorCategory::Input, message, "invalid_manifest",
                     "Keys: always (list), extensions, paths, content_hints "
                     "(objects of lists)."};
}

bool read_pattern_list(const json& value, std::vector<std::string>& out) {
    if (!value.is_array()) {
        return false;
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

bool read_pattern_map(const json& value,
                      std::map<std::string, std::vector<std::string>>& out) {
    if (!value.is_object()) {
        return false;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        std::vector<std::string> patterns;
        if (!read_pattern_list(it.value(), patterns)) {
            return false;
        }
        out[it.key()] = std::move(patterns);
    }
    return true;
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::istringstream in(path);
    std::string segment;
    while (std::getline(in, segment, '/')) {
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
    }
    return segments;
}

bool match_segments(const std::vector<std::string>& pattern, const std::size_t pi,
                    const std::vector<std::string>& path, const std::size_t si) {
    if (pi == pattern.size()) {
        return si == path.size();
    }
    if (pattern[pi] == "**") {
        for (std::size_t next = si; next <= path.size(); ++next) {
            if (match_segments(pattern, pi + 1, path, next)) {
                return true;
            }
        }
        return false;
    }
    if (si == path.size()) {
        return false;
    }
    return fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) == 0 &&
           match_segments(pattern, pi + 1, path, si + 1);
}

std::vector<std::filesystem::path> glob_under(const std::filesystem::path& root,
                                              const std::string& pattern) {
    std::vector<std::filesystem::path> matches;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return matches;
    }

    const auto pattern_segments = split_segments(pattern);
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec) || ec) {
            ec.clear();
            continue;
        }
        const auto relative = it->path().lexically_relative(root).generic_string();
        if (match_segments(pattern_segments, 0, split_segments(relative), 0)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("Stopped scanning " + root.string() + ": " + ec.message());
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

void add_documents(const std::filesystem::path& skills_dir,
                   const std::vector<std::string>& patterns,
                   std::set<std::filesystem::path>& matched) {
    for (const auto& skill : expand_skill_patterns(skills_dir, patterns)) {
        if (skill.extension() == kSkillSuffix) {
            matched.insert(skill);
        }
    }
}

}  // namespace

core::errors::Result<SkillManifest> parse_manifest(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return invalid_manifest("Skill manifest is not valid JSON.");
    }
    if (!document.is_object()) {
        return invalid_manifest("Skill manifest must be a JSON object.");
    }

    SkillManifest manifest;
    if (document.contains("always") &&
        !read_pattern_list(document.at("always"), manifest.always)) {
        return invalid_manifest("'always' must be a list of patterns.");
    }
    if (document.contains("extensions") &&
        !read_pattern_map(document.at("extensions"), manifest.extensions)) {
        return invalid_manifest("'extensions' must map extensions to pattern lists.");
    }
    if (document.contains("paths") &&
        !read_pattern_map(document.at("paths"), manifest.paths)) {
        return invalid_manifest("'paths' must map globs to pattern lists.");
    }
    if (document.contains("content_hints") &&
        !read_pattern_map(document.at("content_hints"), manifest.content_hints)) {
        return invalid_manifest("'content_hints' must map expressions to pattern lists.");
    }
    return manifest;
}

core::errors::Result<SkillManifest> load_manifest(
    const std::filesystem::path& manifest_file) {
    std::error_code ec;
    if (!std::filesystem::exists(manifest_file, ec) || ec) {
        LOG_DEBUG("No skill manifest at " + manifest_file.string());
        return SkillManifest{};
    }

    std::ifstream in(manifest_file);
    if (!in.is_open()) {
        return HookError{ErrorCategory::Input,
                         "Failed to open skill manifest: " + manifest_file.string(),
                         "unreadable_manifest"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_manifest(buffer.str());
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

std::vector<std::filesystem::path> expand_skill_patterns(
    const std::filesystem::path& skills_dir,
    const std::vector<std::string>& patterns) {
    std::vector<std::filesystem::path> resolved;
    for (const auto& pattern : patterns) {
        if (pattern.find('*') != std::string::npos) {
            const auto globbed = glob_under(skills_dir, pattern);
            resolved.insert(resolved.end(), globbed.begin(), globbed.end());
            continue;
        }
        const auto candidate = skills_dir / pattern;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec) {
            resolved.push_back(candidate);
        }
    }
    return resolved;
}

std::string read_content_sample(const std::filesystem::path& file,
                                const std::size_t max_chars) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec) || ec) {
        return "";
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return "";
    }
    std::string sample(max_chars, '\0');
    in.read(&sample[0], static_cast<std::streamsize>(max_chars));
    sample.resize(static_cast<std::size_t>(in.gcount()));
    return sample;
}

SkillResolver::SkillResolver(std::filesystem::path skills_dir, SkillManifest manifest)
    : skills_dir_(std::move(skills_dir)), manifest_(std::move(manifest)) {}

core::errors::Result<SkillResolver> SkillResolver::from_directory(
    const std::filesystem::path& skills_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(skills_dir, ec) || ec) {
        return HookError{ErrorCategory::Input,
                         "Skills directory does not exist: " + skills_dir.string(),
                         "invalid_skills_dir"};
    }
    auto manifest = load_manifest(skills_dir / kManifestName);
    if (core::errors::is_error(manifest)) {
        return core::errors::get_error(manifest);
    }
    return SkillResolver(skills_dir, core::errors::get_value(manifest));
}

std::vector<std::filesystem::path> SkillResolver::resolve(
    const std::string& target_path) const {
    const std::filesystem::path target(target_path);
    std::set<std::filesystem::path> matched;

    add_documents(skills_dir_, manifest_.always, matched);

    const auto ext_it = manifest_.extensions.find(lowercase(target.extension().string()));
    if (ext_it != manifest_.extensions.end()) {
        add_documents(skills_dir_, ext_it->second, matched);
    }

    for (const auto& [path_glob, patterns] : manifest_.paths) {
        if (glob_match(path_glob, target_path)) {
            add_documents(skills_dir_, patterns, matched);
        }
    }

    const std::string content = read_content_sample(target);
    if (!content.empty()) {
        for (const auto& [expression, patterns] : manifest_.content_hints) {
            std::regex hint;
            try {
                hint = std::regex(expression, std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& e) {
                LOG_DEBUG("Skipping invalid content hint '" + expression + "': " + e.what());
                continue;
            }
            if (std::regex_search(content, hint)) {
                add_documents(skills_dir_, patterns, matched);
            }
        }
    }

    return std::vector<std::filesystem::path>(matched.begin(), matched.end());
}

std::string render_skill_bundle(const std::vector<std::filesystem::path>& skills) {
    std::ostringstream out;
    for (const auto& skill : skills) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(skill, ec) || ec) {
            continue;
        }
        std::ifstream in(skill);
        if (!in.is_open()) {
            LOG_WARN("Unable to read skill document " + skill.string());
            continue;
        }
        const std::string content((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());
        out << "---\n# " << skill.stem().string() << "\n---\n" << content << "\n";
    }
    return out.str();
}

}  // namespace hookguard::skills
