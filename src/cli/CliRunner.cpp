#include "CliRunner.hpp"
#include "../core/ConfigManager.hpp"
#include "../utils/Util.hpp"

#include <fmt/format.h>

namespace pyrunner::cli {

namespace {

int parseTimeout(const std::string& value) {
    size_t consumed = 0;
    int seconds = 0;
    try {
        seconds = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError("Invalid timeout: " + value);
    }
    if (consumed != value.size() || seconds < 0) {
        throw UsageError("Invalid timeout: " + value);
    }
    return seconds;
}

} // namespace

CliOptions parseArguments(const std::vector<std::string>& args) {
    CliOptions options;

    auto valueFor = [&](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw UsageError("Option " + args[i] + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return options;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--interpreter" || arg == "-i") {
            options.interpreter = valueFor(i);
        } else if (arg == "--path" || arg == "-p") {
            options.searchPaths.push_back(valueFor(i));
        } else if (arg == "--env" || arg == "-e") {
            if (!options.environmentText.empty()) {
                options.environmentText += ";";
            }
            options.environmentText += valueFor(i);
        } else if (arg == "--timeout" || arg == "-t") {
            options.timeoutSeconds = parseTimeout(valueFor(i));
        } else if (arg == "--no-utf8") {
            options.forceUtf8 = false;
        } else if (arg == "--config" || arg == "-c") {
            options.configPath = valueFor(i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else {
            if (!options.script.empty()) {
                throw UsageError(fmt::format("Only one script can be run. Got {} and {}", options.script, arg));
            }
            options.script = arg;
        }
    }

    if (options.script.empty()) {
        throw UsageError("No script given");
    }
    return options;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] <script>\n"
        "Options:\n"
        "  --interpreter, -i PATH   Interpreter to run the script with\n"
        "  --path, -p DIR           Prepend DIR to the module search path (repeatable)\n"
        "  --env, -e TEXT           Extra environment, KEY=VALUE;KEY=VALUE\n"
        "  --timeout, -t SECONDS    Kill the script after SECONDS, 0 for no limit\n"
        "  --no-utf8                Do not force the legacy UTF-8 stream variables\n"
        "  --config, -c FILE        Read settings from FILE\n"
        "  --debug, -d              Enable debug logging\n"
        "  --help, -h               Show this help\n"
        "\n"
        "Exit status is the script's own, 124 on timeout, 130 when interrupted,\n"
        "2 for invalid arguments and 1 when the script could not be run.\n",
        program);
}

SessionRequest buildRequest(const CliOptions& options, const Configs& config) {
    SessionRequest request;
    request.interpreterPath = SessionFactory::resolveInterpreter(
        options.interpreter.value_or(config.GetInterpreter()));
    request.scriptPath = options.script;
    request.extraSearchPaths = options.searchPaths;
    request.timeoutSeconds = options.timeoutSeconds.value_or(config.GetTimeoutSeconds());
    request.environmentText = options.environmentText;
    request.searchPathVariable = config.GetSearchPathVariable();
    request.forceUtf8 = options.forceUtf8 && config.GetForceUtf8();
    return request;
}

int exitCodeFor(const RunOutcome& outcome) {
    return std::visit(overloaded{
        [](const Completed& c) {
            // Shell convention for signal deaths
            return c.exitCode >= 0 ? c.exitCode : 128 - c.exitCode;
        },
        [](const TimedOut&) { return EXIT_TIMED_OUT; },
        [](const Stopped&) { return EXIT_STOPPED; },
        [](const SupervisorError&) { return EXIT_SUPERVISOR_ERROR; },
    }, outcome);
}

} // namespace pyrunner::cli
