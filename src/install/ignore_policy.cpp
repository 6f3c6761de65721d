#include "scb/ignore_policy.hpp"
#include "scb/layout.hpp"
#include "scb/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace scb {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

// (template file, destination relative to the target)
std::vector<std::pair<std::string, std::string>> ignore_mappings(IgnoreMode mode) {
    std::string claude_ignore = std::string(kClaudeDir) + "/.gitignore";
    std::string framework_ignore = std::string(kFrameworkDir) + "/.gitignore";
    switch (mode) {
        case IgnoreMode::Track:
            return {};
        case IgnoreMode::All:
            return {
                {"dot_claude-strategic-ignore.template", claude_ignore},
                {"dot_strategic-claude-basic-ignore-all.template", framework_ignore},
            };
        case IgnoreMode::NonUser:
            return {
                {"dot_claude-strategic-ignore.template", claude_ignore},
                {"dot_strategic-claude-basic-ignore-non-user-dirs.template", framework_ignore},
            };
    }
    return {};
}

} // namespace

std::vector<std::string> merge_ignore_lines(const std::vector<std::string>& existing,
                                            const std::vector<std::string>& tmpl) {
    std::vector<std::string> result = {kIgnoreHeader};
    std::set<std::string> seen;

    for (const auto& line : existing) {
        std::string t = trim(line);
        if (t.empty() || t.rfind("# Strategic Claude Basic", 0) == 0) continue;
        if (seen.insert(t).second) result.push_back(line);
    }
    for (const auto& line : tmpl) {
        std::string t = trim(line);
        if (t.empty()) continue;
        if (seen.insert(t).second) result.push_back(line);
    }
    return result;
}

Result<IgnorePolicyResult> apply_ignore_policy(const std::string& source_root,
                                               const std::string& target_dir, IgnoreMode mode) {
    using R = Result<IgnorePolicyResult>;
    IgnorePolicyResult result;

    std::string template_dir = join_path(join_path(source_root, kFrameworkDir), kIgnoreTemplateDir);

    for (const auto& [template_file, destination] : ignore_mappings(mode)) {
        std::string tmpl_path = join_path(template_dir, template_file);
        if (!is_regular_file(tmpl_path)) {
            result.warnings.push_back("Ignore template " + template_file + " not found, skipping");
            continue;
        }

        auto tmpl = read_file(tmpl_path);
        if (!tmpl) return R::err(Error(ErrorCode::IO_ERROR, tmpl_path + ": cannot read file"));

        std::string target_path = join_path(target_dir, destination);
        std::vector<std::string> existing_lines;
        std::optional<std::string> existing;
        if (path_exists(target_path)) {
            existing = read_file(target_path);
            if (!existing) return R::err(Error(ErrorCode::IO_ERROR, target_path + ": cannot read file"));
            existing_lines = split_lines(*existing);
        }

        std::string merged = join_lines(merge_ignore_lines(existing_lines, split_lines(*tmpl)));
        if (existing && *existing == merged) continue;

        auto dir = ensure_directory(get_parent_directory(target_path));
        if (dir.isErr()) return R::err(dir.error().withContext("apply ignore policy"));

        if (existing) {
            auto backup = atomic_write_file(target_path + ".backup", *existing);
            if (!backup.ok) {
                result.warnings.push_back("Failed to back up " + destination + ": " + backup.error);
            }
        }

        auto written = atomic_write_file(target_path, merged);
        if (!written.ok) {
            return R::err(Error(ErrorCode::IO_ERROR, target_path + ": " + written.error));
        }
        spdlog::info("applied {} -> {}", template_file, destination);
        result.applied.push_back(destination);
    }

    return R::ok(result);
}

} // namespace scb
