#include "path_filter.hpp"

#include <algorithm>

namespace smartmig::filters {

namespace {

const std::set<std::string> k_git_bulk_dirs{"objects", "refs", "logs"};

auto split_segments(const std::filesystem::path& path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    for (const auto& part : path) {
        auto s = part.string();
        if (s.empty() || s == "/" || s == ".") continue;
        segments.push_back(std::move(s));
    }
    return segments;
}

// `a/b` matches when the segments a, b appear consecutively in the path.
bool contains_segment_run(const std::vector<std::string>& segments,
                          const std::vector<std::string>& run) {
    if (run.empty() || run.size() > segments.size()) return false;
    return std::search(segments.begin(), segments.end(), run.begin(), run.end())
        != segments.end();
}

} // namespace

const std::set<std::string>& PathFilter::default_exclude_tokens() {
    static const std::set<std::string> tokens{
        // JavaScript / web
        "node_modules", "node_modules.bak", "bower_components",
        ".next", ".nuxt", ".sass-cache", ".parcel-cache",
        // Python
        "__pycache__", ".pytest_cache", ".mypy_cache", ".tox",
        ".venv", "venv", "*.pyc", "*.pyo", "*.pyd",
        // Build output
        "dist", "build", "target", "bin", "obj", "coverage", ".coverage",
        // Caches, temp files, OS litter
        ".cache", "*.log", "*.tmp", "*.temp", ".DS_Store", "Thumbs.db",
        // Per-user IDE state
        ".vs", ".vscode/settings.json", ".idea/workspace.xml", ".idea/tasks.xml",
    };
    return tokens;
}

const std::set<std::string>& PathFilter::default_include_tokens() {
    static const std::set<std::string> tokens{
        // Environment files
        ".env", ".env.local", ".env.development", ".env.production",
        ".env.staging", ".env.test", ".env.example", ".env.template", ".env.sample",
        // Version control and container metadata
        ".gitignore", ".gitmodules", ".gitattributes", ".gitkeep", ".github",
        ".dockerignore", "Dockerfile", "docker-compose.yml", "docker-compose.yaml",
        // Editor / formatter settings
        ".editorconfig", ".prettierrc", ".pre-commit-config.yaml",
        // Python packaging
        "pyproject.toml", "poetry.lock", "requirements.txt", "requirements-dev.txt",
        "setup.py", "setup.cfg", "tox.ini",
        // JavaScript packaging and tooling
        "package.json", "package-lock.json", "yarn.lock", "pnpm-lock.yaml",
        ".npmrc", ".yarnrc", "tsconfig.json", "tslint.json",
        "eslint.config.js", ".eslintrc.js", ".eslintrc.json",
        "jest.config.js", "babel.config.js", "webpack.config.js",
        "vite.config.ts", "tailwind.config.js", "postcss.config.js",
        // Project documents
        "Makefile", "LICENSE", "README.md", "CHANGELOG.md",
    };
    return tokens;
}

PathFilter::PathFilter()
    : exclude_(default_exclude_tokens())
    , include_(default_include_tokens())
{}

PathFilter::PathFilter(const std::vector<std::string>& additional_exclude,
                       const std::vector<std::string>& additional_include)
    : PathFilter()
{
    for (const auto& token : additional_exclude) {
        if (!token.empty()) exclude_.insert(token);
    }
    for (const auto& token : additional_include) {
        if (!token.empty()) include_.insert(token);
    }
}

bool PathFilter::should_exclude(const std::filesystem::path& path) const {
    const auto path_str = path.generic_string();
    const auto name = path.filename().string();

    if (matches_include(name, path_str)) {
        return false;
    }

    const auto segments = split_segments(path);

    if (in_git_bulk_storage(segments)) {
        return true;
    }

    return std::any_of(exclude_.begin(), exclude_.end(), [&](const std::string& token) {
        return matches_exclude(token, name, path_str, segments);
    });
}

bool PathFilter::matches_include(const std::string& name, const std::string& path_str) const {
    return std::any_of(include_.begin(), include_.end(), [&](const std::string& token) {
        return name.contains(token) || path_str.contains(token);
    });
}

bool PathFilter::in_git_bulk_storage(const std::vector<std::string>& segments) const {
    if (std::find(segments.begin(), segments.end(), ".git") == segments.end()) {
        return false;
    }
    return std::any_of(segments.begin(), segments.end(), [](const std::string& s) {
        return k_git_bulk_dirs.contains(s);
    });
}

bool PathFilter::matches_exclude(const std::string& token,
                                 const std::string& name,
                                 const std::string& path_str,
                                 const std::vector<std::string>& segments) const {
    if (token.starts_with("*.")) {
        return path_str.ends_with(token.substr(1));
    }
    if (token.size() > 1 && token.ends_with('*')) {
        return name.starts_with(token.substr(0, token.size() - 1));
    }
    if (token.contains('/')) {
        return contains_segment_run(segments, split_segments(std::filesystem::path(token)));
    }
    return token == name
        || std::find(segments.begin(), segments.end(), token) != segments.end();
}

} // namespace smartmig::filters
