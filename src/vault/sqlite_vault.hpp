#ifndef TRIAGEGUARD_VAULT_SQLITE_VAULT_HPP
#define TRIAGEGUARD_VAULT_SQLITE_VAULT_HPP

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "vault.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../util/logger.hpp"

namespace triageguard {
namespace vault {

class SqliteVault : public Vault {
  public:
    // -------------------------------------------------------------------------
    // Opens (or creates) the database at dbFilePath; ":memory:" keeps it in RAM.
    // Throws VaultUnavailableError if the file cannot be opened or initialized.
    // -------------------------------------------------------------------------
    SqliteVault(const std::string& dbFilePath, RetentionPolicy policy = RetentionPolicy(),
                ClockFn clock = SystemClock())
        : m_dbFilePath(dbFilePath), m_db(nullptr), m_policy(std::move(policy)),
          m_clock(std::move(clock)) {
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(m_dbFilePath.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw core::VaultUnavailableError("[SqliteVault] Could not open database " + m_dbFilePath +
                                              ": " + msg);
        }
        if (!initDatabaseSchema()) {
            std::string msg = sqlite3_errmsg(m_db);
            sqlite3_close(m_db);
            m_db = nullptr;
            throw core::VaultUnavailableError("[SqliteVault] Failed to initialize schema: " + msg);
        }
        util::logger::info("[SqliteVault] Opened vault database " + m_dbFilePath);
    }

    ~SqliteVault() override {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    SqliteVault(const SqliteVault&) = delete;
    SqliteVault& operator=(const SqliteVault&) = delete;

    UpsertOutcome Upsert(const core::MappingRecord& record) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t now = toMillis(m_clock());
        const std::string type = core::EntityTypeTag(record.type);
        const std::string ns = core::NamespaceName(record.ns);

        exec("BEGIN IMMEDIATE;");
        try {
            // Existing mapping for (type, original) anywhere in the session
            Statement known(m_db, "SELECT placeholder FROM mappings"
                                  " WHERE session = ?1 AND entity_type = ?2 AND original = ?3 LIMIT 1;");
            known.Bind(1, record.session).Bind(2, type).Bind(3, record.original);
            if (known.Step()) {
                std::string existing = known.Text(0);

                Statement present(m_db, "SELECT created_at FROM mappings WHERE session = ?1 AND"
                                        " namespace = ?2 AND entity_type = ?3 AND placeholder = ?4;");
                present.Bind(1, record.session).Bind(2, ns).Bind(3, type).Bind(4, existing);
                bool live = present.Step() &&
                            !isExpired(record.ns, present.Int64(0), now);
                if (!live) {
                    insertRow(record, existing, now, true);
                }
                exec("COMMIT;");
                return UpsertOutcome{UpsertOutcome::Status::Existing, existing};
            }

            Statement owner(m_db, "SELECT 1 FROM mappings WHERE session = ?1 AND placeholder = ?2 LIMIT 1;");
            owner.Bind(1, record.session).Bind(2, record.placeholder);
            if (owner.Step()) {
                exec("COMMIT;");
                return UpsertOutcome{UpsertOutcome::Status::Collision, record.placeholder};
            }

            insertRow(record, record.placeholder, now, false);
            exec("COMMIT;");
            return UpsertOutcome{UpsertOutcome::Status::Inserted, record.placeholder};
        } catch (const std::exception&) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    }

    std::optional<core::MappingRecord> Resolve(const std::string& session,
                                               const std::string& placeholder,
                                               const std::vector<core::Namespace>& order) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t now = toMillis(m_clock());

        for (core::Namespace ns : order) {
            Statement stmt(m_db, "SELECT entity_type, original, created_at FROM mappings"
                                 " WHERE session = ?1 AND namespace = ?2 AND placeholder = ?3;");
            stmt.Bind(1, session).Bind(2, core::NamespaceName(ns)).Bind(3, placeholder);
            if (!stmt.Step()) {
                continue;
            }
            const int64_t createdAt = stmt.Int64(2);
            if (isExpired(ns, createdAt, now)) {
                continue;
            }
            core::MappingRecord rec;
            rec.session = session;
            rec.ns = ns;
            if (!core::ParseEntityTypeTag(stmt.Text(0), rec.type)) {
                util::logger::critical("[SqliteVault] Corrupted entity_type for placeholder " +
                                       placeholder + " in session " + session);
                throw core::VaultUnavailableError("[SqliteVault] corrupted record for " + placeholder);
            }
            rec.placeholder = placeholder;
            rec.original = stmt.Text(1);
            rec.createdAt = fromMillis(createdAt);
            return rec;
        }
        return std::nullopt;
    }

    size_t Purge(const std::string& session) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM mappings WHERE session = ?1;");
        stmt.Bind(1, session);
        stmt.Step();
        return static_cast<size_t>(sqlite3_changes(m_db));
    }

    size_t Purge(const std::string& session, core::Namespace ns) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM mappings WHERE session = ?1 AND namespace = ?2;");
        stmt.Bind(1, session).Bind(2, core::NamespaceName(ns));
        stmt.Step();
        return static_cast<size_t>(sqlite3_changes(m_db));
    }

    size_t SweepExpired(core::TimePoint now) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t nowMs = toMillis(now);
        size_t removed = 0;
        for (core::Namespace ns : allNamespaces()) {
            Statement stmt(m_db, "DELETE FROM mappings WHERE namespace = ?1 AND created_at <= ?2;");
            stmt.Bind(1, core::NamespaceName(ns)).Bind(2, nowMs - windowMillis(ns));
            stmt.Step();
            removed += static_cast<size_t>(sqlite3_changes(m_db));
        }
        return removed;
    }

    size_t CountRecords(const std::string& session) const override {
        size_t total = 0;
        for (core::Namespace ns : allNamespaces()) {
            total += CountRecords(session, ns);
        }
        return total;
    }

    size_t CountRecords(const std::string& session, core::Namespace ns) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t now = toMillis(m_clock());
        Statement stmt(m_db, "SELECT COUNT(*) FROM mappings"
                             " WHERE session = ?1 AND namespace = ?2 AND created_at > ?3;");
        stmt.Bind(1, session).Bind(2, core::NamespaceName(ns)).Bind(3, now - windowMillis(ns));
        stmt.Step();
        return static_cast<size_t>(stmt.Int64(0));
    }

    size_t SessionCount() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT COUNT(DISTINCT session) FROM mappings;");
        stmt.Step();
        return static_cast<size_t>(stmt.Int64(0));
    }

  private:
    // -------------------------------------------------------------------------
    // Prepared statement owner; every failure surfaces as VaultUnavailableError
    // -------------------------------------------------------------------------
    class Statement {
      public:
        Statement(sqlite3* db, const char* sql) : m_db(db), m_stmt(nullptr) {
            if (sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
                throw core::VaultUnavailableError(std::string("[SqliteVault] prepare failed: ") +
                                                  sqlite3_errmsg(m_db));
            }
        }

        ~Statement() { sqlite3_finalize(m_stmt); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        Statement& Bind(int index, const std::string& value) {
            check(sqlite3_bind_text(m_stmt, index, value.data(), static_cast<int>(value.size()),
                                    SQLITE_TRANSIENT));
            return *this;
        }

        Statement& Bind(int index, int64_t value) {
            check(sqlite3_bind_int64(m_stmt, index, value));
            return *this;
        }

        // true when a row is available, false when done
        bool Step() {
            int rc = sqlite3_step(m_stmt);
            if (rc == SQLITE_ROW)
                return true;
            if (rc == SQLITE_DONE)
                return false;
            throw core::VaultUnavailableError(std::string("[SqliteVault] step failed: ") +
                                              sqlite3_errmsg(m_db));
        }

        std::string Text(int column) const {
            const unsigned char* text = sqlite3_column_text(m_stmt, column);
            int len = sqlite3_column_bytes(m_stmt, column);
            return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len))
                        : std::string();
        }

        int64_t Int64(int column) const { return sqlite3_column_int64(m_stmt, column); }

      private:
        void check(int rc) {
            if (rc != SQLITE_OK) {
                throw core::VaultUnavailableError(std::string("[SqliteVault] bind failed: ") +
                                                  sqlite3_errmsg(m_db));
            }
        }

        sqlite3* m_db;
        sqlite3_stmt* m_stmt;
    };

    bool initDatabaseSchema() {
        const char* ddl = "CREATE TABLE IF NOT EXISTS mappings ("
                          " session TEXT NOT NULL,"
                          " namespace TEXT NOT NULL,"
                          " entity_type TEXT NOT NULL,"
                          " placeholder TEXT NOT NULL,"
                          " original TEXT NOT NULL,"
                          " created_at INTEGER NOT NULL,"
                          " PRIMARY KEY (session, namespace, entity_type, placeholder)"
                          ");"
                          "CREATE INDEX IF NOT EXISTS idx_mappings_original"
                          " ON mappings (session, entity_type, original);"
                          "CREATE INDEX IF NOT EXISTS idx_mappings_placeholder"
                          " ON mappings (session, placeholder);";
        return sqlite3_exec(m_db, ddl, nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    void exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw core::VaultUnavailableError(std::string("[SqliteVault] ") + sql + " failed: " + msg);
        }
    }

    void insertRow(const core::MappingRecord& record, const std::string& placeholder, int64_t now,
                   bool replace) {
        Statement stmt(m_db, replace
                                 ? "INSERT OR REPLACE INTO mappings (session, namespace, entity_type,"
                                   " placeholder, original, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6);"
                                 : "INSERT INTO mappings (session, namespace, entity_type,"
                                   " placeholder, original, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6);");
        stmt.Bind(1, record.session)
            .Bind(2, core::NamespaceName(record.ns))
            .Bind(3, core::EntityTypeTag(record.type))
            .Bind(4, placeholder)
            .Bind(5, record.original)
            .Bind(6, now);
        stmt.Step();
    }

    bool isExpired(core::Namespace ns, int64_t createdAtMs, int64_t nowMs) const {
        return nowMs - createdAtMs >= windowMillis(ns);
    }

    int64_t windowMillis(core::Namespace ns) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(m_policy.Window(ns)).count();
    }

    static std::vector<core::Namespace> allNamespaces() {
        return {core::Namespace::IncomingInput, core::Namespace::OutgoingToolArguments,
                core::Namespace::ToolResults, core::Namespace::FinalOutput};
    }

    static int64_t toMillis(core::TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    static core::TimePoint fromMillis(int64_t ms) {
        return core::TimePoint(std::chrono::duration_cast<core::Clock::duration>(
            std::chrono::milliseconds(ms)));
    }

    std::string m_dbFilePath;
    sqlite3* m_db;
    RetentionPolicy m_policy;
    ClockFn m_clock;
    mutable std::mutex m_mutex;
};

} // namespace vault
} // namespace triageguard

#endif // TRIAGEGUARD_VAULT_SQLITE_VAULT_HPP
