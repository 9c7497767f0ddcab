/*
 * ConfigManager.hpp
 *
 * Read-only runner settings. The file is INI-style:
 *
 *   [Runner]
 *   Interpreter=/usr/bin/python3
 *   TimeoutSeconds=30
 *
 * Keys are addressed as "Section.Key". Nothing is ever written back;
 * command line and GUI values override these per run.
 */
#pragma once
#include <unordered_map>
#include <string>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>
#include "util/Env.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Util.hpp"

namespace pyrunner {

namespace ConfigPaths {
    inline std::string DefaultConfigPath() {
        return (std::filesystem::path(Env::config()) / "pyrunner" / "pyrunner.cfg").string();
    }
}

class Configs {
public:
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
    static constexpr int MAX_TIMEOUT_SECONDS = 3600;
    static constexpr int DEFAULT_POLL_INTERVAL_MS = 50;
    static constexpr int DEFAULT_TERMINATE_GRACE_MS = 2000;
    static constexpr int DEFAULT_LOG_MAX_DAYS = 3;
    static inline const std::string DEFAULT_INTERPRETER = "python3";
    static inline const std::string DEFAULT_SEARCH_PATH_VARIABLE = "PYTHONPATH";

    static Configs& Get() {
        static Configs instance;
        return instance;
    }

    // Returns false when the file does not exist or cannot be opened;
    // defaults stay in effect
    bool Load(const std::string& path = "") {
        std::string configPath = path.empty() ? ConfigPaths::DefaultConfigPath() : path;
        this->path = configPath;
        std::ifstream file(configPath);
        if (!file.is_open()) {
            debug("No config file at {}, using defaults", configPath);
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        LoadFromString(buffer.str());
        info("Loaded {} settings from {}", settings.size(), configPath);
        return true;
    }

    void LoadFromString(const std::string& text) {
        std::istringstream stream(text);
        std::string line, currentSection;
        while (std::getline(stream, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                auto close = line.find(']');
                currentSection = trim(line.substr(1, close == std::string::npos ? std::string::npos : close - 1));
            } else {
                size_t delim = line.find('=');
                if (delim == std::string::npos) {
                    warning("Ignoring config line without '=': {}", line);
                    continue;
                }
                std::string name = trim(line.substr(0, delim));
                std::string key = currentSection.empty() ? name : currentSection + "." + name;
                settings[key] = trim(line.substr(delim + 1));
            }
        }
    }

    void Clear() {
        settings.clear();
        path.clear();
    }

    const std::string& getPath() const { return path; }

    bool Has(const std::string& key) const {
        return settings.find(key) != settings.end();
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue) const {
        auto it = settings.find(key);
        if (it == settings.end()) return defaultValue;
        try {
            return Convert(it->second, defaultValue);
        } catch (const std::exception& e) {
            warning("Invalid value for {}: '{}' ({})", key, it->second, e.what());
            return defaultValue;
        }
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue, T min, T max) const {
        T value = Get(key, defaultValue);
        if (value < min || value > max) {
            warning("Config value out of range: {}={} (valid: {}-{})", key, value, min, max);
            return defaultValue;
        }
        return value;
    }

    // Typed accessors
    std::string GetInterpreter() const { return Get<std::string>("Runner.Interpreter", DEFAULT_INTERPRETER); }
    int GetTimeoutSeconds() const { return Get<int>("Runner.TimeoutSeconds", DEFAULT_TIMEOUT_SECONDS, 0, MAX_TIMEOUT_SECONDS); }
    int GetPollIntervalMs() const { return Get<int>("Runner.PollIntervalMs", DEFAULT_POLL_INTERVAL_MS, 1, 1000); }
    int GetTerminateGraceMs() const { return Get<int>("Runner.TerminateGraceMs", DEFAULT_TERMINATE_GRACE_MS, 0, 60000); }
    std::string GetSearchPathVariable() const {
        return Get<std::string>("Runner.SearchPathVariable", DEFAULT_SEARCH_PATH_VARIABLE);
    }
    bool GetForceUtf8() const { return Get<bool>("Runner.ForceUtf8", true); }
    std::string GetLogLevel() const { return Get<std::string>("Log.Level", "info"); }
    bool GetLogToFile() const { return Get<bool>("Log.File", true); }
    int GetLogMaxDays() const { return Get<int>("Log.MaxDays", DEFAULT_LOG_MAX_DAYS); }
    bool GetLogColor() const { return Get<bool>("Log.Color", true); }

private:
    Configs() = default;
    Configs(const Configs&) = delete;
    Configs& operator=(const Configs&) = delete;

    std::unordered_map<std::string, std::string> settings;
    std::string path;

    static bool Convert(const std::string& val, bool defaultValue) {
        return parseBool(val, defaultValue);
    }

    static int Convert(const std::string& val, int) {
        return std::stoi(val);
    }

    static std::string Convert(const std::string& val, const std::string&) {
        return val;
    }

    template<typename T>
    static T Convert(const std::string& val, T defaultValue) {
        std::istringstream iss(val);
        T result;
        if (!(iss >> result)) return defaultValue;
        return result;
    }
};

} // namespace pyrunner
