#ifndef DOCKWIRE_PATH_FILTER_HPP
#define DOCKWIRE_PATH_FILTER_HPP

#include <string>
#include <vector>

namespace Dockwire {
    // Strips "./", leading and trailing slashes and collapses "//".
    std::string cleanPath(const std::string& path);

    // Glob match of a slash-separated relative path. A pattern that matches a parent
    // directory matches everything below it; "**" crosses directory boundaries.
    bool matchPath(const std::string& pattern, const std::string& path);

    // True when some path below `directory` could match the pattern.
    bool matchesBelow(const std::string& pattern, const std::string& directory);

    struct PathRule {
        std::string pattern;
        bool negated = false;
    };

    // Include and exclude patterns in .dockerignore semantics: excludes are evaluated in
    // order, the last matching rule wins and a leading '!' re-includes.
    class PathFilter {
        std::vector<std::string> includes_;
        std::vector<PathRule> excludes_;

    public:
        PathFilter() = default;
        PathFilter(const std::vector<std::string>& includes, const std::vector<std::string>& excludes);

        static PathFilter fromDockerignore(const std::string& contents);
        static std::vector<std::string> parseIgnoreFile(const std::string& contents);

        bool excluded(const std::string& path) const;
        bool included(const std::string& path, bool directory) const;
        // A directory whose whole subtree can be skipped.
        bool skipDirectory(const std::string& directory) const;

        bool empty() const { return includes_.empty() && excludes_.empty(); }
    };
}

#endif // DOCKWIRE_PATH_FILTER_HPP
