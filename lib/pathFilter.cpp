#include "pathFilter.hpp"

#include <fnmatch.h>
#include <sstream>

namespace Dockwire {
    namespace {
        std::vector<std::string> split(const std::string& path) {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream stream(path);
            while (std::getline(stream, part, '/')) {
                if (!part.empty()) parts.push_back(part);
            }
            return parts;
        }

        bool glob(const std::string& pat, const std::string& path) {
            int flags = 0;
            std::string pattern = pat;
            if (pattern.find("**") == std::string::npos) {
                flags |= FNM_PATHNAME;
            } else {
                // '**' becomes '*', which crosses '/' without FNM_PATHNAME
                std::string collapsed;
                collapsed.reserve(pattern.size());
                for (std::size_t i = 0; i < pattern.size(); ++i) {
                    if (pattern[i] == '*' && i + 1 < pattern.size() && pattern[i + 1] == '*') {
                        collapsed.push_back('*');
                        ++i;
                    } else {
                        collapsed.push_back(pattern[i]);
                    }
                }
                pattern.swap(collapsed);
            }
            return fnmatch(pattern.c_str(), path.c_str(), flags) == 0;
        }

        bool matchExact(const std::string& pattern, const std::string& path) {
            if (glob(pattern, path)) return true;
            return pattern.rfind("**/", 0) == 0 && glob(pattern.substr(3), path);
        }
    }

    std::string cleanPath(const std::string& path) {
        std::string result;
        for (const auto& part : split(path)) {
            if (part == ".") continue;
            if (!result.empty()) result += '/';
            result += part;
        }
        return result;
    }

    bool matchPath(const std::string& pattern, const std::string& path) {
        const std::string cleanPattern = cleanPath(pattern);
        const std::string cleanTarget = cleanPath(path);
        if (cleanPattern.empty()) return true;
        if (matchExact(cleanPattern, cleanTarget)) return true;
        for (auto slash = cleanTarget.find('/'); slash != std::string::npos; slash = cleanTarget.find('/', slash + 1)) {
            if (matchExact(cleanPattern, cleanTarget.substr(0, slash))) return true;
        }
        return false;
    }

    bool matchesBelow(const std::string& pattern, const std::string& directory) {
        const auto patternParts = split(cleanPath(pattern));
        const auto directoryParts = split(cleanPath(directory));
        if (directoryParts.empty()) return true;
        for (std::size_t i = 0; i < directoryParts.size(); ++i) {
            if (i >= patternParts.size()) return false;
            if (patternParts[i].find("**") != std::string::npos) return true;
            if (!glob(patternParts[i], directoryParts[i])) return false;
        }
        return patternParts.size() > directoryParts.size();
    }

    PathFilter::PathFilter(const std::vector<std::string>& includes, const std::vector<std::string>& excludes) {
        for (const auto& include : includes) {
            if (!cleanPath(include).empty()) includes_.push_back(cleanPath(include));
        }
        for (const auto& exclude : excludes) {
            PathRule rule;
            rule.negated = !exclude.empty() && exclude.front() == '!';
            rule.pattern = cleanPath(rule.negated ? exclude.substr(1) : exclude);
            if (!rule.pattern.empty()) excludes_.push_back(rule);
        }
    }

    std::vector<std::string> PathFilter::parseIgnoreFile(const std::string& contents) {
        std::vector<std::string> patterns;
        std::istringstream stream(contents);
        std::string line;
        while (std::getline(stream, line)) {
            auto begin = line.find_first_not_of(" \t\r");
            if (begin == std::string::npos || line[begin] == '#') continue;
            auto end = line.find_last_not_of(" \t\r");
            patterns.push_back(line.substr(begin, end - begin + 1));
        }
        return patterns;
    }

    PathFilter PathFilter::fromDockerignore(const std::string& contents) {
        return PathFilter({}, parseIgnoreFile(contents));
    }

    bool PathFilter::excluded(const std::string& path) const {
        bool result = false;
        for (const auto& rule : excludes_) {
            if (matchPath(rule.pattern, path)) result = !rule.negated;
        }
        return result;
    }

    bool PathFilter::included(const std::string& path, bool directory) const {
        if (excluded(path)) return false;
        if (includes_.empty()) return true;
        for (const auto& include : includes_) {
            if (matchPath(include, path)) return true;
            if (directory && matchesBelow(include, path)) return true;
        }
        return false;
    }

    bool PathFilter::skipDirectory(const std::string& directory) const {
        if (!includes_.empty()) {
            bool reachable = false;
            for (const auto& include : includes_) {
                if (matchPath(include, directory) || matchesBelow(include, directory)) {
                    reachable = true;
                    break;
                }
            }
            if (!reachable) return true;
        }
        if (!excluded(directory)) return false;
        for (const auto& rule : excludes_) {
            if (rule.negated && matchesBelow(rule.pattern, directory)) return false;
        }
        return true;
    }
}
