#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace pyrunner {

struct Logger::Impl {
    std::ofstream logFile;
    std::string currentFilename;
    std::string currentDate;      // YYYY-MM-DD of the open daily file
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : pImpl(std::make_unique<Impl>())
    , currentLevel(LOG_INFO)
    , consoleOutput(true) {
}

Logger::~Logger() {
    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
}

void Logger::initialize(bool fileOutput, int logMaxPeriod, bool coloredOutput) {
    std::lock_guard<std::mutex> lock(mutex);
    this->fileOutput = fileOutput;
    this->logMaxPeriod = logMaxPeriod;
    this->coloredOutput = coloredOutput;

    if (fileOutput) {
        openNewLogFile();
    } else if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
        pImpl->currentFilename.clear();
    }
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex);
    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
    // A fixed file name disables daily rotation
    fileOutput = false;
    pImpl->logFile.open(filename, std::ios::app);
    pImpl->currentFilename = filename;
}

void Logger::setLogLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
}

void Logger::setColoredOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    coloredOutput = enabled;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    consoleOutput = enabled;
}

std::string Logger::getLogFile() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pImpl->currentFilename;
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return LOG_DEBUG;
    if (lowered == "info") return LOG_INFO;
    if (lowered == "warning" || lowered == "warn") return LOG_WARNING;
    if (lowered == "error") return LOG_ERROR;
    if (lowered == "fatal") return LOG_FATAL;
    return fallback;
}

void Logger::log(Level level, const std::string& message) {
    if (level < currentLevel) return;

    std::lock_guard<std::mutex> lock(mutex);

    // Roll over to a new file when the date changes
    if (fileOutput) {
        std::string today = getFormattedDate();
        if (pImpl->currentDate != today) {
            openNewLogFile();
        }
    }

    std::string logMessage = getCurrentTimestamp() + " [" + getLevelString(level) + "] " + message + "\n";

    if (pImpl->logFile.is_open()) {
        pImpl->logFile << logMessage;
        pImpl->logFile.flush();
    }

    // Console goes to stderr; stdout carries script output in the CLI
    if (consoleOutput) {
        if (coloredOutput) {
            std::cerr << getColorCode(level) << logMessage << resetColorCode();
        } else {
            std::cerr << logMessage;
        }
    }
}

std::string Logger::getLevelString(Level level) const {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::getFormattedDate() const {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

std::string Logger::getColorCode(Level level) const {
    if (coloredOutput) {
        auto it = colorCodes.find(level);
        if (it != colorCodes.end()) {
            return it->second;
        }
    }
    return "";
}

std::string Logger::resetColorCode() const {
    return coloredOutput ? "\033[0m" : "";
}

std::string Logger::getLogDirectory() const {
    const char* home = std::getenv("HOME");
    if (!home) {
        return "./logs";
    }

    std::filesystem::path logDir(home);
    logDir /= ".local/share/pyrunner/logs";

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    return logDir.string();
}

void Logger::openNewLogFile() {
    std::string today = getFormattedDate();
    std::string fullFilePath = getLogDirectory() + "/" + today + ".log";

    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }

    pImpl->logFile.open(fullFilePath, std::ios::app);
    pImpl->currentFilename = fullFilePath;
    pImpl->currentDate = today;

    cleanupOldLogs();
}

void Logger::cleanupOldLogs() {
    if (logMaxPeriod <= 0) return;

    std::filesystem::path logPath(getLogDirectory());
    auto now = std::chrono::system_clock::now();

    std::error_code ec;
    for (std::filesystem::directory_iterator it(logPath, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (!entry.is_regular_file() || entry.path().extension() != ".log") {
            continue;
        }
        std::string filename = entry.path().filename().string();
        if (filename.length() < 10) {
            continue;
        }

        int year, month, day;
        char dash1, dash2;
        std::istringstream dateStream(filename.substr(0, 10));
        dateStream >> year >> dash1 >> month >> dash2 >> day;
        if (!dateStream || dash1 != '-' || dash2 != '-') {
            continue;
        }

        std::tm tm = {};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        std::time_t logTime = std::mktime(&tm);
        if (logTime == -1) {
            continue;
        }

        auto age = std::chrono::duration_cast<std::chrono::hours>(
            now - std::chrono::system_clock::from_time_t(logTime)).count() / 24;
        if (age > logMaxPeriod) {
            std::error_code removeEc;
            std::filesystem::remove(entry.path(), removeEc);
        }
    }
}

} // namespace pyrunner
