#pragma once

#include <string>
#include <vector>
#include <map>

#ifndef _WIN32
#include <unistd.h>
#include <pwd.h>
#include <sys/types.h>
#endif

namespace pyrunner {

// Read-only view of the process environment plus helpers for building a
// child environment. Nothing here calls setenv: overlays are returned as
// values and handed to the spawn call.
class Env {
public:
    using Map = std::map<std::string, std::string>;

#ifdef _WIN32
    static constexpr char pathListSeparator = ';';
#else
    static constexpr char pathListSeparator = ':';
#endif

    // Environment variable operations
    static std::string get(const std::string& name, const std::string& defaultValue = "");
    static Map getAll();

    // Returns base with every key of overrides replaced or added
    static Map overlay(Map base, const Map& overrides);
    // KEY=VALUE strings suitable for execve
    static std::vector<std::string> toEntries(const Map& env);

    // Path list operations (PATH, PYTHONPATH, ...)
    static std::string joinPathList(const std::vector<std::string>& entries);
    static std::vector<std::string> splitPathList(const std::string& list);
    // entries first, then the existing list when it is non-empty
    static std::string prependPathList(const std::vector<std::string>& entries,
                                       const std::string& existing);

    static std::vector<std::string> getPath();
    static std::string which(const std::string& command);

    // System paths
    static std::string home();
    static std::string config();
    static std::string expandTilde(const std::string& path);

    // File system helpers
    static bool pathExists(const std::string& path);
    static bool isFile(const std::string& path);
    static bool isDirectory(const std::string& path);
    static bool isExecutable(const std::string& path);

private:
    Env() = delete;
};

} // namespace pyrunner
