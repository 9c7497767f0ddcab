#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyrunner {

/**
 * @brief Immutable description of one script run.
 *
 * Built by SessionFactory, which validates the request first.
 */
class ExecutionSession {
public:
    const std::string& interpreterPath() const { return interpreterPath_; }
    const std::string& scriptPath() const { return scriptPath_; }
    const std::vector<std::string>& extraSearchPaths() const { return extraSearchPaths_; }
    int timeoutSeconds() const { return timeoutSeconds_; }                   ///< 0 = unbounded
    const std::map<std::string, std::string>& extraEnvironment() const { return extraEnvironment_; }
    const std::string& workingDirectory() const { return workingDirectory_; } ///< empty = inherit
    const std::vector<std::string>& interpreterArgs() const { return interpreterArgs_; }
    const std::string& searchPathVariable() const { return searchPathVariable_; }
    bool forceUtf8() const { return forceUtf8_; }

    // interpreter, interpreterArgs..., script
    std::vector<std::string> commandLine() const;

private:
    friend class SessionFactory;
    ExecutionSession() = default;

    std::string interpreterPath_;
    std::string scriptPath_;
    std::vector<std::string> extraSearchPaths_;
    int timeoutSeconds_ = 0;
    std::map<std::string, std::string> extraEnvironment_;
    std::string workingDirectory_;
    std::vector<std::string> interpreterArgs_{"-u"};
    std::string searchPathVariable_{"PYTHONPATH"};
    bool forceUtf8_ = true;
};

/**
 * @brief Raw, unvalidated request as collected by a front end.
 */
struct SessionRequest {
    std::string interpreterPath;
    std::string scriptPath;
    std::vector<std::string> extraSearchPaths;
    int timeoutSeconds = 0;
    std::string environmentText;                          ///< KEY=VALUE;KEY=VALUE
    std::map<std::string, std::string> extraEnvironment;  ///< merged under environmentText
    std::string workingDirectory;
    std::vector<std::string> interpreterArgs{"-u"};
    std::string searchPathVariable{"PYTHONPATH"};
    bool forceUtf8 = true;
};

class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SessionFactory {
public:
    // Throws ValidationError; never starts anything
    static ExecutionSession create(const SessionRequest& request);

    // Splits "KEY=VALUE;KEY2=VALUE2". Blank pairs are skipped, a pair
    // without '=' or with an empty key throws ValidationError.
    static std::map<std::string, std::string> parseEnvironmentText(const std::string& text);

    // Bare command names are looked up on PATH; anything with a '/' is
    // returned unchanged. Returns the input when nothing is found.
    static std::string resolveInterpreter(const std::string& nameOrPath);
};

} // namespace pyrunner
