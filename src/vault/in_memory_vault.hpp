#ifndef TRIAGEGUARD_VAULT_IN_MEMORY_VAULT_HPP
#define TRIAGEGUARD_VAULT_IN_MEMORY_VAULT_HPP

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include "vault.hpp"
#include "../core/types.hpp"
#include "../util/logger.hpp"

namespace triageguard {
namespace vault {

/*
  InMemoryVault
  --------------------------------
  Default vault backend. Nothing leaves process memory.

  Locking:
    - m_tableMutex guards the session -> partition table only;
    - each partition has its own reader/writer lock, so unrelated sessions never
      contend once their partition exists;
    - writes to one session are serialized; reads share the lock and therefore
      wait out an in-flight write instead of observing half of it;
    - lock order is always table then partition.

  A purged or emptied partition is marked retired before it leaves the table.
  A writer that wins the partition lock after retirement fetches a fresh
  partition and retries, so a racing upsert is never written into a dead one.
*/

class InMemoryVault : public Vault
{
public:
    explicit InMemoryVault(RetentionPolicy policy = RetentionPolicy(), ClockFn clock = SystemClock())
        : m_policy(std::move(policy)), m_clock(std::move(clock))
    {
    }

    UpsertOutcome Upsert(const core::MappingRecord &record) override
    {
        while (true) {
            std::shared_ptr<Partition> partition = partitionFor(record.session, true);
            std::unique_lock<std::shared_mutex> write(partition->mutex);
            if (partition->retired) {
                continue;
            }

            const core::TimePoint now = m_clock();
            auto &bucket = partition->records[record.ns];

            // (type, original) already known anywhere in the session
            auto known = partition->byOriginal.find(originalKey(record.type, record.original));
            if (known != partition->byOriginal.end()) {
                const std::string &existing = known->second;
                auto present = bucket.find(existing);
                if (present == bucket.end() || m_policy.IsExpired(present->second, now)) {
                    core::MappingRecord copy = record;
                    copy.placeholder = existing;
                    copy.createdAt = now;
                    bucket[existing] = copy;
                }
                return UpsertOutcome{UpsertOutcome::Status::Existing, existing};
            }

            auto owner = partition->byPlaceholder.find(record.placeholder);
            if (owner != partition->byPlaceholder.end()) {
                // same placeholder, different (type, original)
                return UpsertOutcome{UpsertOutcome::Status::Collision, record.placeholder};
            }

            core::MappingRecord copy = record;
            copy.createdAt = now;
            bucket[copy.placeholder] = copy;
            partition->byOriginal[originalKey(copy.type, copy.original)] = copy.placeholder;
            partition->byPlaceholder[copy.placeholder] = originalKey(copy.type, copy.original);
            return UpsertOutcome{UpsertOutcome::Status::Inserted, copy.placeholder};
        }
    }

    std::optional<core::MappingRecord> Resolve(const std::string &session,
                                               const std::string &placeholder,
                                               const std::vector<core::Namespace> &order) override
    {
        std::shared_ptr<Partition> partition = partitionFor(session, false);
        if (!partition) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> read(partition->mutex);
        if (partition->retired) {
            return std::nullopt;
        }

        const core::TimePoint now = m_clock();
        for (core::Namespace ns : order) {
            auto bucket = partition->records.find(ns);
            if (bucket == partition->records.end()) {
                continue;
            }
            auto it = bucket->second.find(placeholder);
            if (it != bucket->second.end() && !m_policy.IsExpired(it->second, now)) {
                return it->second;
            }
        }
        return std::nullopt;
    }

    size_t Purge(const std::string &session) override
    {
        std::unique_lock<std::shared_mutex> table(m_tableMutex);
        auto it = m_partitions.find(session);
        if (it == m_partitions.end()) {
            return 0;
        }
        std::shared_ptr<Partition> partition = it->second;
        std::unique_lock<std::shared_mutex> write(partition->mutex);
        size_t removed = 0;
        for (const auto &bucket : partition->records) {
            removed += bucket.second.size();
        }
        partition->records.clear();
        partition->byOriginal.clear();
        partition->byPlaceholder.clear();
        partition->retired = true;
        m_partitions.erase(it);

        util::logger::debug("InMemoryVault: purged session " + session + " ("
                            + std::to_string(removed) + " records)");
        return removed;
    }

    size_t Purge(const std::string &session, core::Namespace ns) override
    {
        std::shared_ptr<Partition> partition = partitionFor(session, false);
        if (!partition) {
            return 0;
        }
        size_t removed = 0;
        bool empty = false;
        {
            std::unique_lock<std::shared_mutex> write(partition->mutex);
            auto bucket = partition->records.find(ns);
            if (bucket != partition->records.end()) {
                removed = bucket->second.size();
                partition->records.erase(bucket);
                rebuildIndexes(*partition);
            }
            empty = partition->records.empty();
        }
        if (empty) {
            retireIfEmpty(session);
        }
        return removed;
    }

    size_t SweepExpired(core::TimePoint now) override
    {
        std::vector<std::pair<std::string, std::shared_ptr<Partition>>> snapshot;
        {
            std::shared_lock<std::shared_mutex> table(m_tableMutex);
            snapshot.assign(m_partitions.begin(), m_partitions.end());
        }

        size_t removed = 0;
        std::vector<std::string> emptied;
        for (auto &entry : snapshot) {
            Partition &partition = *entry.second;
            std::unique_lock<std::shared_mutex> write(partition.mutex);
            if (partition.retired) {
                continue;
            }
            size_t before = removed;
            for (auto bucket = partition.records.begin(); bucket != partition.records.end();) {
                for (auto rec = bucket->second.begin(); rec != bucket->second.end();) {
                    if (m_policy.IsExpired(rec->second, now)) {
                        rec = bucket->second.erase(rec);
                        ++removed;
                    } else {
                        ++rec;
                    }
                }
                if (bucket->second.empty()) {
                    bucket = partition.records.erase(bucket);
                } else {
                    ++bucket;
                }
            }
            if (removed != before) {
                rebuildIndexes(partition);
            }
            if (partition.records.empty()) {
                emptied.push_back(entry.first);
            }
        }

        for (const auto &session : emptied) {
            retireIfEmpty(session);
        }
        if (removed > 0) {
            util::logger::debug("InMemoryVault: sweep removed " + std::to_string(removed) + " expired records");
        }
        return removed;
    }

    size_t CountRecords(const std::string &session) const override
    {
        size_t total = 0;
        for (core::Namespace ns : {core::Namespace::IncomingInput, core::Namespace::OutgoingToolArguments,
                                   core::Namespace::ToolResults, core::Namespace::FinalOutput}) {
            total += CountRecords(session, ns);
        }
        return total;
    }

    size_t CountRecords(const std::string &session, core::Namespace ns) const override
    {
        std::shared_ptr<Partition> partition = partitionFor(session, false);
        if (!partition) {
            return 0;
        }
        std::shared_lock<std::shared_mutex> read(partition->mutex);
        auto bucket = partition->records.find(ns);
        if (bucket == partition->records.end()) {
            return 0;
        }
        const core::TimePoint now = m_clock();
        size_t live = 0;
        for (const auto &rec : bucket->second) {
            if (!m_policy.IsExpired(rec.second, now)) {
                ++live;
            }
        }
        return live;
    }

    size_t SessionCount() const override
    {
        std::shared_lock<std::shared_mutex> table(m_tableMutex);
        return m_partitions.size();
    }

private:
    struct Partition
    {
        std::shared_mutex mutex;
        bool retired = false;
        std::map<core::Namespace, std::unordered_map<std::string, core::MappingRecord>> records;
        std::unordered_map<std::string, std::string> byOriginal;    ///< type+original -> placeholder
        std::unordered_map<std::string, std::string> byPlaceholder; ///< placeholder -> type+original
    };

    static std::string originalKey(core::EntityType type, const std::string &original)
    {
        return core::EntityTypeTag(type) + '\x1f' + original;
    }

    static void rebuildIndexes(Partition &partition)
    {
        partition.byOriginal.clear();
        partition.byPlaceholder.clear();
        for (const auto &bucket : partition.records) {
            for (const auto &rec : bucket.second) {
                const std::string key = originalKey(rec.second.type, rec.second.original);
                partition.byOriginal[key] = rec.first;
                partition.byPlaceholder[rec.first] = key;
            }
        }
    }

    std::shared_ptr<Partition> partitionFor(const std::string &session, bool create) const
    {
        {
            std::shared_lock<std::shared_mutex> table(m_tableMutex);
            auto it = m_partitions.find(session);
            if (it != m_partitions.end()) {
                return it->second;
            }
        }
        if (!create) {
            return nullptr;
        }
        std::unique_lock<std::shared_mutex> table(m_tableMutex);
        auto &slot = m_partitions[session];
        if (!slot) {
            slot = std::make_shared<Partition>();
        }
        return slot;
    }

    void retireIfEmpty(const std::string &session)
    {
        std::unique_lock<std::shared_mutex> table(m_tableMutex);
        auto it = m_partitions.find(session);
        if (it == m_partitions.end()) {
            return;
        }
        std::shared_ptr<Partition> partition = it->second;
        std::unique_lock<std::shared_mutex> write(partition->mutex);
        if (!partition->records.empty()) {
            return;
        }
        partition->retired = true;
        m_partitions.erase(it);
    }

    RetentionPolicy m_policy;
    ClockFn m_clock;
    mutable std::shared_mutex m_tableMutex;
    mutable std::unordered_map<std::string, std::shared_ptr<Partition>> m_partitions;
};

} // namespace vault
} // namespace triageguard

#endif // TRIAGEGUARD_VAULT_IN_MEMORY_VAULT_HPP
