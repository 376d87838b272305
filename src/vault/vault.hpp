#ifndef TRIAGEGUARD_VAULT_VAULT_HPP
#define TRIAGEGUARD_VAULT_VAULT_HPP

#include <algorithm>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <map>
#include <chrono>
#include "../core/types.hpp"
#include "../../config/guard_config.hpp"

/**
 * @file vault.hpp
 * @brief Ephemeral, session- and namespace-partitioned store of placeholder mappings.
 *
 * Invariants every backend keeps:
 *   - append-only per session; records are only removed by Purge or SweepExpired,
 *     whole session or whole (session, namespace) at a time;
 *   - one placeholder per (session, entity type, original);
 *   - a placeholder never maps to two different originals within a session;
 *   - an expired record is NotFound even before the sweep deletes it.
 */

namespace triageguard {
namespace vault {

struct UpsertOutcome
{
    enum class Status {
        Inserted,   ///< new record written with the proposed placeholder
        Existing,   ///< (type, original) already mapped in the session; placeholder is the existing one
        Collision   ///< proposed placeholder already maps to a different original; nothing written
    };

    Status status = Status::Inserted;
    std::string placeholder;
};

/**
 * @brief Per-namespace retention windows.
 */
class RetentionPolicy
{
public:
    RetentionPolicy()
    {
        for (core::Namespace ns : allNamespaces()) {
            m_windows[ns] = std::chrono::hours(1);
        }
    }

    static RetentionPolicy FromConfig(const config::GuardConfig &cfg)
    {
        RetentionPolicy p;
        p.Set(core::Namespace::IncomingInput, config::BoundedSeconds(cfg.retentionIncomingInputSeconds));
        p.Set(core::Namespace::OutgoingToolArguments,
              config::BoundedSeconds(cfg.retentionOutgoingToolArgumentsSeconds));
        p.Set(core::Namespace::ToolResults, config::BoundedSeconds(cfg.retentionToolResultsSeconds));
        p.Set(core::Namespace::FinalOutput, config::BoundedSeconds(cfg.retentionFinalOutputSeconds));
        return p;
    }

    /// Windows are clamped to [0, config::kMaxDurationSeconds].
    void Set(core::Namespace ns, std::chrono::seconds window)
    {
        const std::chrono::seconds longest(static_cast<int64_t>(config::kMaxDurationSeconds));
        m_windows[ns] = std::max(std::chrono::seconds(0), std::min(window, longest));
    }

    std::chrono::seconds Window(core::Namespace ns) const { return m_windows.at(ns); }

    bool IsExpired(const core::MappingRecord &record, core::TimePoint now) const
    {
        return now - record.createdAt >= Window(record.ns);
    }

private:
    static std::vector<core::Namespace> allNamespaces()
    {
        return {core::Namespace::IncomingInput, core::Namespace::OutgoingToolArguments,
                core::Namespace::ToolResults, core::Namespace::FinalOutput};
    }

    std::map<core::Namespace, std::chrono::seconds> m_windows;
};

using ClockFn = std::function<core::TimePoint()>;

inline ClockFn SystemClock()
{
    return [] { return core::Clock::now(); };
}

class Vault
{
public:
    virtual ~Vault() = default;

    /**
     * @brief Insert-or-fetch-existing. Looks up (session, type, original) before
     *        writing; the check and the write happen under the session's write lock.
     * @throw core::VaultUnavailableError on backend failure.
     */
    virtual UpsertOutcome Upsert(const core::MappingRecord &record) = 0;

    /**
     * @brief First live record for placeholder, searching namespaces in the given order.
     * @return std::nullopt for NotFound (including expired records).
     * @throw core::VaultUnavailableError on backend failure.
     */
    virtual std::optional<core::MappingRecord> Resolve(const std::string &session,
                                                       const std::string &placeholder,
                                                       const std::vector<core::Namespace> &order) = 0;

    /// Remove every record of the session. Returns the number removed.
    virtual size_t Purge(const std::string &session) = 0;

    /// Remove every record of one (session, namespace) partition.
    virtual size_t Purge(const std::string &session, core::Namespace ns) = 0;

    /// Remove every record past its namespace retention window.
    virtual size_t SweepExpired(core::TimePoint now) = 0;

    virtual size_t CountRecords(const std::string &session) const = 0;
    virtual size_t CountRecords(const std::string &session, core::Namespace ns) const = 0;

    virtual size_t SessionCount() const = 0;
};

} // namespace vault
} // namespace triageguard

#endif // TRIAGEGUARD_VAULT_VAULT_HPP
