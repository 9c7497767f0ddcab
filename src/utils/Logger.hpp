#pragma once
#include <version>
#include <string>
#include <mutex>
#include <memory>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <unordered_map>
#include <sstream>

// Use std::format if available, otherwise fallback to fmt library
#ifdef __cpp_lib_format
    #include <format>
    namespace formatting = std;
#else
    #include <fmt/format.h>
    namespace formatting = fmt;
#endif

namespace pyrunner {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    // Opens the daily log file (when enabled) and applies retention
    void initialize(bool fileOutput = true,
                    int logMaxPeriod = 3,  // days
                    bool coloredOutput = true);

    void setLogFile(const std::string& filename);
    void setLogLevel(Level level);
    void setColoredOutput(bool enabled);
    void setConsoleOutput(bool enabled);
    Level getLogLevel() const { return currentLevel; }
    std::string getLogFile() const;

    // Accepts debug/info/warning/warn/error/fatal, case-insensitive
    static Level parseLevel(const std::string& name, Level fallback = LOG_INFO);

    void debug(const std::string& message)   { log(LOG_DEBUG, message); }
    void info(const std::string& message)    { log(LOG_INFO, message); }
    void warning(const std::string& message) { log(LOG_WARNING, message); }
    void error(const std::string& message)   { log(LOG_ERROR, message); }
    void fatal(const std::string& message)   { log(LOG_FATAL, message); }

    /**
     * Logging with {}-style formatting
     * Usage: Logger::getInstance().debug("Value: {}, Name: {}", 42, "test");
     */
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        logFormatted(LOG_DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        logFormatted(LOG_INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(const std::string& format, Args&&... args) {
        logFormatted(LOG_WARNING, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        logFormatted(LOG_ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const std::string& format, Args&&... args) {
        logFormatted(LOG_FATAL, format, std::forward<Args>(args)...);
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const std::string& format, Args&&... args) {
        if (level < currentLevel) return;
        if constexpr (sizeof...(args) == 0) {
            log(level, format);
        } else {
            try {
#ifdef __cpp_lib_format
                log(level, std::vformat(format, std::make_format_args(args...)));
#else
                log(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
#endif
            } catch (const std::exception& e) {
                log(LOG_ERROR, "Logger format error: " + std::string(e.what()) +
                              " | Original format: " + format);
                log(level, format);
            }
        }
    }

    void log(Level level, const std::string& message);
    std::string getLevelString(Level level) const;
    std::string getCurrentTimestamp() const;
    std::string getFormattedDate() const;
    std::string getColorCode(Level level) const;
    std::string resetColorCode() const;
    std::string getLogDirectory() const;
    void cleanupOldLogs();
    void openNewLogFile();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
    mutable std::mutex mutex;
    Level currentLevel;
    bool consoleOutput;
    bool fileOutput = false;
    int logMaxPeriod = 3;
    bool coloredOutput = true;

    std::unordered_map<Level, std::string> colorCodes = {
        {LOG_DEBUG, "\033[36m"},    // Cyan
        {LOG_INFO, "\033[32m"},     // Green
        {LOG_WARNING, "\033[33m"},  // Yellow
        {LOG_ERROR, "\033[31m"},    // Red
        {LOG_FATAL, "\033[35m"}     // Magenta
    };
};

#define PYRUNNER_LOG_DEBUG(...) pyrunner::Logger::getInstance().debug(__VA_ARGS__)
#define PYRUNNER_LOG_INFO(...)  pyrunner::Logger::getInstance().info(__VA_ARGS__)
#define PYRUNNER_LOG_WARN(...)  pyrunner::Logger::getInstance().warning(__VA_ARGS__)
#define PYRUNNER_LOG_ERROR(...) pyrunner::Logger::getInstance().error(__VA_ARGS__)
#define PYRUNNER_LOG_FATAL(...) pyrunner::Logger::getInstance().fatal(__VA_ARGS__)

template<typename... Args>
inline void debug(const std::string& format, Args&&... args) {
    Logger::getInstance().debug(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void info(const std::string& format, Args&&... args) {
    Logger::getInstance().info(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warning(const std::string& format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void error(const std::string& format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void fatal(const std::string& format, Args&&... args) {
    Logger::getInstance().fatal(format, std::forward<Args>(args)...);
}
} // namespace pyrunner
