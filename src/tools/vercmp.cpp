#include "vercmp/Operation.hpp"

#include "gflags/gflags.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

DEFINE_string(operation, "compare", "Operation to run on the two versions, one of compare, higher, strictly-higher, "
    "higher-or-same, strictly-lower, lower-or-same, same.");
DEFINE_bool(verbose, false, "If true vercmp will log how each comparison was decided.");
DEFINE_bool(exitStatus, false, "If true predicate operations also report their result as the exit status, 0 for true "
    "and 1 for false.");
DEFINE_string(logFile, "", "A path to log to a file to. If not provided, file logging is disabled.");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("vercmp [flags] [--] <left version> <right version>\n"
        "Put -- before the versions if either starts with '-', for example: vercmp -- -SNAPSHOT 1.0");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    // Results go to stdout, so keep the log on stderr.
    auto consoleLog = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("vercmp", consoleLog);
    spdlog::set_default_logger(logger);
    spdlog::set_level(FLAGS_verbose ? spdlog::level::debug : spdlog::level::info);

    if (FLAGS_logFile.size() > 0) {
        spdlog::info("additionally logging to file at {}", FLAGS_logFile);
        try {
            auto fileLog = std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_logFile.data(), false);
            spdlog::default_logger()->sinks().push_back(fileLog);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("unable to open log file {}: {}", FLAGS_logFile, e.what());
            return 1;
        }
    }

    if (argc != 3) {
        spdlog::error("expected exactly two versions, got {}. usage: {}", argc - 1, gflags::ProgramUsage());
        return 1;
    }

    auto operation = Vercmp::parseOperation(FLAGS_operation);
    if (!operation) {
        spdlog::error("unknown operation \"{}\"", FLAGS_operation);
        return 1;
    }

    std::string left(argv[1]);
    std::string right(argv[2]);
    std::string result;
    try {
        result = Vercmp::runOperation(*operation, left, right);
    } catch (const std::invalid_argument& e) {
        spdlog::error("unable to {} \"{}\" and \"{}\": {}", Vercmp::operationName(*operation), left, right, e.what());
        return 2;
    }

    spdlog::debug("{} \"{}\" \"{}\" is {}", Vercmp::operationName(*operation), left, right, result);
    std::cout << result << std::endl;

    if (FLAGS_exitStatus && Vercmp::isPredicate(*operation)) {
        return result == "true" ? 0 : 1;
    }
    return 0;
}
