#ifndef TRIAGEGUARD_UTIL_CONFIG_PARSER_HPP
#define TRIAGEGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <functional>
#include <cstdint>
#include <limits>
#include <mutex>
#include "../../config/guard_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Populates triageguard::config::GuardConfig from a "key=value" file.
 *
 * DESIGN GOALS:
 *   - Lines are "key = value"; '#' starts a comment line; blank lines are skipped.
 *   - Unknown keys are logged and ignored, malformed lines and bad numbers throw.
 *   - A missing file is not an error: defaults stay in place.
 *
 * USAGE:
 *   @code
 *   triageguard::config::GuardConfig cfg;
 *   triageguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("triageguard.conf");
 *   @endcode
 */

namespace triageguard {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(triageguard::config::GuardConfig &guardConfig)
        : guardConfig_(guardConfig)
    {
        registerKeys();
    }

    /**
     * @brief Read the given file line by line and apply recognized keys.
     * @return false if the file does not exist (defaults kept).
     * @throw std::runtime_error on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse configuration text held in memory.
     */
    inline void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(text);
        parseStream(in);
    }

private:
    using Setter = std::function<void(const std::string &)>;

    triageguard::config::GuardConfig &guardConfig_;
    std::unordered_map<std::string, Setter> setters_;
    std::mutex mutex_;

    inline void registerKeys()
    {
        auto &c = guardConfig_;
        setters_["secret_key_ref"] = [&c](const std::string &v) { c.secretKeyRef = v; };
        setters_["vault_location"] = [&c](const std::string &v) { c.vaultLocation = v; };
        setters_["recognizer_endpoint"] = [&c](const std::string &v) { c.recognizerEndpoint = v; };
        setters_["log_level"] = [&c](const std::string &v) { c.logLevel = v; };
        setters_["log_file"] = [&c](const std::string &v) { c.logFile = v; };

        setters_["retention_incoming_input_seconds"] =
            [this, &c](const std::string &v) { c.retentionIncomingInputSeconds = parseSeconds(v); };
        setters_["retention_outgoing_tool_arguments_seconds"] =
            [this, &c](const std::string &v) { c.retentionOutgoingToolArgumentsSeconds = parseSeconds(v); };
        setters_["retention_tool_results_seconds"] =
            [this, &c](const std::string &v) { c.retentionToolResultsSeconds = parseSeconds(v); };
        setters_["retention_final_output_seconds"] =
            [this, &c](const std::string &v) { c.retentionFinalOutputSeconds = parseSeconds(v); };
        setters_["sweep_interval_seconds"] =
            [this, &c](const std::string &v) { c.sweepIntervalSeconds = parseSeconds(v); };
        setters_["purge_delay_millis"] =
            [this, &c](const std::string &v) { c.purgeDelayMillis = parseMillis(v); };
        setters_["placeholder_tag_length"] =
            [this, &c](const std::string &v) { c.placeholderTagLength = parseUInt32(v); };
        setters_["mint_salt_attempts"] =
            [this, &c](const std::string &v) { c.mintSaltAttempts = parseUInt32(v); };
        setters_["max_in_flight_tool_calls"] =
            [this, &c](const std::string &v) { c.maxInFlightToolCalls = parseUInt32(v); };
        setters_["tool_deadline_millis"] =
            [this, &c](const std::string &v) { c.toolDeadlineMillis = parseMillis(v); };
        setters_["max_tool_retries"] =
            [this, &c](const std::string &v) { c.maxToolRetries = parseUInt32(v); };
        setters_["retry_backoff_millis"] =
            [this, &c](const std::string &v) { c.retryBackoffMillis = parseMillis(v); };
        setters_["max_steps"] =
            [this, &c](const std::string &v) { c.maxSteps = parseUInt32(v); };
        setters_["request_budget_millis"] =
            [this, &c](const std::string &v) { c.requestBudgetMillis = parseMillis(v); };
        setters_["recognizer_timeout_millis"] =
            [this, &c](const std::string &v) { c.recognizerTimeoutMillis = parseMillis(v); };
    }

    inline void parseStream(std::istream &in)
    {
        std::string line;
        while (std::getline(in, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto it = setters_.find(key);
        if (it == setters_.end()) {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        it->second(val);
        // secret_key_ref is a reference, but keep its value out of the log anyway
        logger::debug("ConfigParser: " + key + " set");
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline uint64_t parseUInt(const std::string &val) const
    {
        if (val.empty() || val[0] == '-') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    inline uint64_t parseBounded(const std::string &val, uint64_t max) const
    {
        uint64_t n = parseUInt(val);
        if (n > max) {
            throw std::runtime_error("ConfigParser: value out of range (max " + std::to_string(max) + "): " + val);
        }
        return n;
    }

    inline uint64_t parseSeconds(const std::string &val) const
    {
        return parseBounded(val, config::kMaxDurationSeconds);
    }

    inline uint64_t parseMillis(const std::string &val) const
    {
        return parseBounded(val, config::kMaxDurationMillis);
    }

    inline uint32_t parseUInt32(const std::string &val) const
    {
        uint64_t n = parseUInt(val);
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("ConfigParser: value out of range: " + val);
        }
        return static_cast<uint32_t>(n);
    }
};

} // namespace util
} // namespace triageguard

#endif // TRIAGEGUARD_UTIL_CONFIG_PARSER_HPP
