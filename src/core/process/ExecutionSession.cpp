#include "ExecutionSession.hpp"
#include "../util/Env.hpp"
#include "../../utils/Util.hpp"
#include "../../utils/Logger.hpp"

namespace pyrunner {

std::vector<std::string> ExecutionSession::commandLine() const {
    std::vector<std::string> argv;
    argv.reserve(interpreterArgs_.size() + 2);
    argv.push_back(interpreterPath_);
    argv.insert(argv.end(), interpreterArgs_.begin(), interpreterArgs_.end());
    argv.push_back(scriptPath_);
    return argv;
}

ExecutionSession SessionFactory::create(const SessionRequest& request) {
    if (request.interpreterPath.empty()) {
        throw ValidationError("No interpreter selected");
    }
    if (request.scriptPath.empty()) {
        throw ValidationError("No script selected");
    }
    if (!Env::pathExists(request.interpreterPath)) {
        throw ValidationError("Interpreter does not exist: " + request.interpreterPath);
    }
    if (!Env::pathExists(request.scriptPath)) {
        throw ValidationError("Script does not exist: " + request.scriptPath);
    }
    if (request.timeoutSeconds < 0) {
        throw ValidationError("Timeout must not be negative");
    }
    if (!request.workingDirectory.empty() && !Env::isDirectory(request.workingDirectory)) {
        throw ValidationError("Working directory does not exist: " + request.workingDirectory);
    }

    ExecutionSession session;
    session.extraEnvironment_ = Env::overlay(request.extraEnvironment,
                                             parseEnvironmentText(request.environmentText));
    session.interpreterPath_ = request.interpreterPath;
    session.scriptPath_ = request.scriptPath;
    for (const auto& path : request.extraSearchPaths) {
        std::string trimmed = trim(path);
        if (!trimmed.empty()) {
            session.extraSearchPaths_.push_back(trimmed);
        }
    }
    session.timeoutSeconds_ = request.timeoutSeconds;
    session.workingDirectory_ = request.workingDirectory;
    session.interpreterArgs_ = request.interpreterArgs;
    session.searchPathVariable_ = request.searchPathVariable.empty()
        ? std::string("PYTHONPATH") : request.searchPathVariable;
    session.forceUtf8_ = request.forceUtf8;

    debug("Session validated: {} {}", session.interpreterPath_, session.scriptPath_);
    return session;
}

std::map<std::string, std::string> SessionFactory::parseEnvironmentText(const std::string& text) {
    std::map<std::string, std::string> env;
    for (const auto& pair : split(text, ';')) {
        if (trim(pair).empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            throw ValidationError("Invalid environment entry (expected KEY=VALUE): " + trim(pair));
        }
        std::string key = trim(pair.substr(0, eq));
        if (key.empty()) {
            throw ValidationError("Invalid environment entry (empty name): " + trim(pair));
        }
        env[key] = trim(pair.substr(eq + 1));
    }
    return env;
}

std::string SessionFactory::resolveInterpreter(const std::string& nameOrPath) {
    if (nameOrPath.empty() || nameOrPath.find('/') != std::string::npos) {
        return Env::expandTilde(nameOrPath);
    }
    std::string found = Env::which(nameOrPath);
    return found.empty() ? nameOrPath : found;
}

} // namespace pyrunner
