#ifndef TRIAGEGUARD_CONFIG_GUARD_CONFIG_HPP
#define TRIAGEGUARD_CONFIG_GUARD_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

/**
 * @file guard_config.hpp
 * @brief Process-level settings for the anonymization guard.
 *
 * USAGE:
 *   - Populated with defaults, then overridden by util/config_parser.hpp.
 *   - The key material itself is never stored here, only a reference to it
 *     (an environment variable or a file path).
 */

namespace triageguard {
namespace config {

/// Upper bound for every duration setting (ten years), so that any window
/// stays representable in nanoseconds once added to a clock reading.
constexpr uint64_t kMaxDurationSeconds = 10ULL * 365 * 24 * 60 * 60;
constexpr uint64_t kMaxDurationMillis = kMaxDurationSeconds * 1000;

inline std::chrono::seconds BoundedSeconds(uint64_t seconds)
{
    return std::chrono::seconds(static_cast<int64_t>(std::min(seconds, kMaxDurationSeconds)));
}

inline std::chrono::milliseconds BoundedMillis(uint64_t millis)
{
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(millis, kMaxDurationMillis)));
}

/**
 * @struct GuardConfig
 * @brief Holds the externally supplied configuration for one guard process:
 *   - secretKeyRef: where to load the placeholder HMAC key from ("env:VAR" or "file:/path").
 *   - vaultLocation: "memory" or "sqlite:<path>".
 *   - per-namespace retention windows and the sweep cadence.
 *   - tool-call fan-out, deadline, retry and budget limits.
 */
struct GuardConfig
{
    GuardConfig()
        : secretKeyRef("env:TRIAGEGUARD_HMAC_KEY"),
          vaultLocation("memory"),
          retentionIncomingInputSeconds(3600),
          retentionOutgoingToolArgumentsSeconds(3600),
          retentionToolResultsSeconds(3600),
          retentionFinalOutputSeconds(3600),
          sweepIntervalSeconds(60),
          purgeDelayMillis(0),
          placeholderTagLength(12),
          mintSaltAttempts(8),
          maxInFlightToolCalls(4),
          toolDeadlineMillis(30000),
          maxToolRetries(2),
          retryBackoffMillis(200),
          maxSteps(32),
          requestBudgetMillis(120000),
          recognizerTimeoutMillis(5000),
          logLevel("INFO")
    {
    }

    /// Reference to the keyed-hash secret, resolved by SecretKeyRing.
    std::string secretKeyRef;

    /// Storage location reference for the vault.
    std::string vaultLocation;

    uint64_t retentionIncomingInputSeconds;
    uint64_t retentionOutgoingToolArgumentsSeconds;
    uint64_t retentionToolResultsSeconds;
    uint64_t retentionFinalOutputSeconds;

    /// How often the retention sweeper wakes up.
    uint64_t sweepIntervalSeconds;

    /// Delay before the best-effort purge of a finished request.
    uint64_t purgeDelayMillis;

    /// Hex characters of HMAC output used as placeholder tag (minimum 8).
    uint32_t placeholderTagLength;

    /// Salted re-derivations attempted before a mint collision becomes fatal.
    uint32_t mintSaltAttempts;

    uint32_t maxInFlightToolCalls;
    uint64_t toolDeadlineMillis;
    uint32_t maxToolRetries;
    uint64_t retryBackoffMillis;

    /// Cap on tool invocation attempts per request.
    uint32_t maxSteps;

    /// Wall-clock budget for one request.
    uint64_t requestBudgetMillis;

    /// Optional external recognition backend (empty = disabled).
    std::string recognizerEndpoint;
    uint64_t recognizerTimeoutMillis;

    std::string logLevel;
    std::string logFile;
};

} // namespace config
} // namespace triageguard

#endif // TRIAGEGUARD_CONFIG_GUARD_CONFIG_HPP
