#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/process/ExecutionSession.hpp"
#include "../core/process/ProcessSupervisor.hpp"
#include "../core/process/RunEvents.hpp"

namespace pyrunner {
class Configs;
}

namespace pyrunner::cli {

// Exit statuses besides the child's own
constexpr int EXIT_SUPERVISOR_ERROR = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_TIMED_OUT = 124;
constexpr int EXIT_STOPPED = 130;

struct CliOptions {
    std::string script;
    std::optional<std::string> interpreter;
    std::vector<std::string> searchPaths;
    std::string environmentText;
    std::optional<int> timeoutSeconds;
    bool forceUtf8 = true;
    std::string configPath;
    bool debug = false;
    bool showHelp = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws UsageError on unknown options, missing values or a missing script
CliOptions parseArguments(const std::vector<std::string>& args);

std::string usage(const std::string& program);

// Command line values win over the config file
SessionRequest buildRequest(const CliOptions& options, const Configs& config);

int exitCodeFor(const RunOutcome& outcome);

} // namespace pyrunner::cli
