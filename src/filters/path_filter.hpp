#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace smartmig::filters {

/// Decides which files of a project tree are carried over.
///
/// Tokens are literal names (`node_modules`), extension suffixes (`*.pyc`),
/// name prefixes (`cache*`) or multi-segment paths (`.idea/workspace.xml`).
/// Include tokens always win over exclude tokens so project metadata such as
/// `.env` or lockfiles is never dropped.
class PathFilter {
public:
    PathFilter();
    PathFilter(const std::vector<std::string>& additional_exclude,
               const std::vector<std::string>& additional_include);

    /// `path` is expected relative to the migration root.
    [[nodiscard]] bool should_exclude(const std::filesystem::path& path) const;

    [[nodiscard]] const std::set<std::string>& exclude_tokens() const { return exclude_; }
    [[nodiscard]] const std::set<std::string>& include_tokens() const { return include_; }

    static const std::set<std::string>& default_exclude_tokens();
    static const std::set<std::string>& default_include_tokens();

private:
    [[nodiscard]] bool matches_include(const std::string& name,
                                       const std::string& path_str) const;
    [[nodiscard]] bool in_git_bulk_storage(const std::vector<std::string>& segments) const;
    [[nodiscard]] bool matches_exclude(const std::string& token,
                                       const std::string& name,
                                       const std::string& path_str,
                                       const std::vector<std::string>& segments) const;

    std::set<std::string> exclude_;
    std::set<std::string> include_;
};

} // namespace smartmig::filters
