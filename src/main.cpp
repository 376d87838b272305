#include <iostream>
#include <iterator>
#include <string>

#include "cli/cli_commands.hpp"
#include "config/guard_config.hpp"
#include "core/errors.hpp"
#include "guard/guard_orchestrator.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage()
{
    std::cerr << "usage: triageguard [--config <file>] <mask|scrub|roundtrip>\n"
              << "  reads text from stdin\n"
              << "  mask       print {session, masked, warnings}\n"
              << "  scrub      print the text with credentials redacted\n"
              << "  roundtrip  mask, then restore in the same session\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace triageguard;

    std::string configPath;
    std::string command;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            printUsage();
            return 2;
        }
    }
    if (!cli::IsCommand(command)) {
        printUsage();
        return 2;
    }

    // 1. Parse configuration
    config::GuardConfig guardConfig;
    util::ConfigParser configParser(guardConfig);
    try {
        if (!configPath.empty()) {
            configParser.loadFromFile(configPath);
        }
    } catch (const std::exception& ex) {
        std::cerr << "triageguard: invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    util::logger::setLogLevel(util::logger::parseLogLevel(guardConfig.logLevel));
    if (!guardConfig.logFile.empty()) {
        util::logger::enableFileOutput(guardConfig.logFile, true);
    }

    const std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    try {
        // 2. Build the guard
        guard::GuardOrchestrator guardian(guardConfig);
        guardian.StartBackgroundSweeper();

        // 3. Run the command
        return cli::RunCommand(guardian, command, input, std::cout);
    } catch (const core::GuardError& ex) {
        util::logger::critical(std::string("[main] ") + ex.what());
    } catch (const std::exception& ex) {
        util::logger::critical(std::string("[main] unexpected failure: ") + ex.what());
    }
    return 1;
}
