#ifndef TRIAGEGUARD_CLI_CLI_COMMANDS_HPP
#define TRIAGEGUARD_CLI_CLI_COMMANDS_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../guard/guard_orchestrator.hpp"
#include "../util/logger.hpp"

/**
 * @file cli_commands.hpp
 * @brief The mask / scrub / roundtrip commands behind the triageguard executable.
 */

namespace triageguard {
namespace cli {

inline bool IsCommand(const std::string &command)
{
    return command == "mask" || command == "scrub" || command == "roundtrip";
}

/**
 * @brief Run one command over input and print its result to out.
 *
 * Input is arbitrary bytes; invalid UTF-8 is replaced with U+FFFD in the JSON
 * output rather than rejected.
 *
 * @return 0 on success, 1 on any failure (logged at CRITICAL).
 */
inline int RunCommand(guard::GuardOrchestrator &guardian,
                      const std::string &command,
                      const std::string &input,
                      std::ostream &out)
{
    try {
        if (command == "scrub") {
            out << guardian.Scrub(input).get<std::string>() << std::endl;
            return 0;
        }
        if (command != "mask" && command != "roundtrip") {
            throw std::invalid_argument("unknown command '" + command + "'");
        }

        const std::string session = guardian.NewSession();
        guard::MaskResult masked = guardian.Mask(input, session, core::Namespace::IncomingInput);

        nlohmann::json report;
        report["session"] = session;
        report["masked"] = masked.value;
        report["warnings"] = masked.warnings;

        if (command == "roundtrip") {
            guard::RestoreResult restored =
                guardian.Restore(masked.value, session, core::ToolBoundaryRestoreOrder());
            report["restored"] = restored.value;
            report["unresolved"] = restored.unresolved;
            guardian.Purge(session);
        }

        out << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        util::logger::info("[cli] " + command + " completed for session " + session);
        return 0;
    }
    catch (const core::GuardError &ex) {
        util::logger::critical("[cli] " + command + " failed: " + ex.what());
    }
    catch (const std::exception &ex) {
        util::logger::critical("[cli] " + command + " failed unexpectedly: " + ex.what());
    }
    return 1;
}

} // namespace cli
} // namespace triageguard

#endif // TRIAGEGUARD_CLI_CLI_COMMANDS_HPP
