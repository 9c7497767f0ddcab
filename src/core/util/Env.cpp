#include "Env.hpp"
#include <filesystem>
#include <cstdlib>
#include <sstream>

#ifndef _WIN32
extern char** environ;
#endif

namespace fs = std::filesystem;
namespace pyrunner {

std::string Env::get(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

Env::Map Env::getAll() {
    Map env;
#ifndef _WIN32
    for (char** current = environ; current && *current; ++current) {
        std::string line(*current);
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            env[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
#endif
    return env;
}

Env::Map Env::overlay(Map base, const Map& overrides) {
    for (const auto& [key, value] : overrides) {
        base[key] = value;
    }
    return base;
}

std::vector<std::string> Env::toEntries(const Map& env) {
    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::string Env::joinPathList(const std::vector<std::string>& entries) {
    std::string result;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) result += pathListSeparator;
        result += entries[i];
    }
    return result;
}

std::vector<std::string> Env::splitPathList(const std::string& list) {
    std::vector<std::string> paths;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, pathListSeparator)) {
        if (!item.empty()) {
            paths.push_back(item);
        }
    }
    return paths;
}

std::string Env::prependPathList(const std::vector<std::string>& entries,
                                 const std::string& existing) {
    std::string joined = joinPathList(entries);
    if (existing.empty()) return joined;
    if (joined.empty()) return existing;
    return joined + pathListSeparator + existing;
}

std::vector<std::string> Env::getPath() {
    return splitPathList(get("PATH"));
}

std::string Env::which(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return isExecutable(command) ? command : "";
    }
    for (const auto& dir : getPath()) {
        std::string fullPath = (fs::path(dir) / command).string();
        if (isExecutable(fullPath)) {
            return fullPath;
        }
    }
    return "";
}

std::string Env::home() {
    std::string home = get("HOME");
#ifndef _WIN32
    if (home.empty()) {
        if (struct passwd* pw = getpwuid(getuid())) {
            home = pw->pw_dir;
        }
    }
#endif
    return home;
}

std::string Env::config() {
    std::string xdg = get("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg;
    return (fs::path(home()) / ".config").string();
}

std::string Env::expandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    return home() + path.substr(1);
}

bool Env::pathExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

bool Env::isFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool Env::isDirectory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool Env::isExecutable(const std::string& path) {
#ifdef _WIN32
    return isFile(path);
#else
    return isFile(path) && access(path.c_str(), X_OK) == 0;
#endif
}

} // namespace pyrunner
