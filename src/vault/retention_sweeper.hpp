#ifndef TRIAGEGUARD_VAULT_RETENTION_SWEEPER_HPP
#define TRIAGEGUARD_VAULT_RETENTION_SWEEPER_HPP

#include "vault.hpp"
#include "../util/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace triageguard {
namespace vault {

/**
 * @brief Background cleanup for a vault.
 *
 * Two duties on one thread:
 *  - best-effort purges of finished sessions, due a configurable delay after
 *    the response was produced (SchedulePurge);
 *  - a periodic SweepExpired pass, the durable guarantee that holds whether or
 *    not the best-effort purge ran.
 * A failing purge is logged and retried on the next wake-up.
 */
class RetentionSweeper {
  public:
    explicit RetentionSweeper(std::shared_ptr<Vault> vault, ClockFn clock = SystemClock())
        : m_vault(std::move(vault)), m_clock(std::move(clock)), m_isRunning(false),
          m_interval(std::chrono::seconds(60)), m_sweeps(0), m_purges(0) {}

    ~RetentionSweeper() { StopSweeping(); }

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    void ConfigureInterval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interval = interval;
    }

    bool StartSweeping() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_isRunning) {
            util::logger::warn("[RetentionSweeper] StartSweeping called but sweeper is already running.");
            return true;
        }
        m_isRunning = true;
        m_thread = std::thread(&RetentionSweeper::sweepLoop, this);
        util::logger::info("[RetentionSweeper] Sweeper thread started.");
        return true;
    }

    bool StopSweeping() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_isRunning) {
                return true;
            }
            m_isRunning = false;
            m_cv.notify_all();
        }
        if (m_thread.joinable()) {
            m_thread.join();
        }
        util::logger::info("[RetentionSweeper] Sweeper thread stopped.");
        return true;
    }

    bool IsRunning() const { return m_isRunning; }

    // Queue a best-effort purge of session after delay.
    void SchedulePurge(const std::string& session, std::chrono::milliseconds delay) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.push_back(PendingPurge{session, m_clock() + delay});
        }
        m_cv.notify_all();
    }

    size_t PendingPurges() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    // Runs one sweep plus every due purge on the caller's thread.
    size_t RunSweepCycle() {
        size_t removed = runDuePurges();
        try {
            removed += m_vault->SweepExpired(m_clock());
            ++m_sweeps;
        } catch (const std::exception& ex) {
            util::logger::error(std::string("[RetentionSweeper] SweepExpired failed: ") + ex.what());
        }
        return removed;
    }

    uint64_t CompletedSweeps() const { return m_sweeps.load(); }
    uint64_t CompletedPurges() const { return m_purges.load(); }

  private:
    struct PendingPurge {
        std::string session;
        core::TimePoint due;
    };

    static constexpr std::chrono::milliseconds kPurgeRetryDelay{1000};

    void sweepLoop() {
        auto nextSweep = std::chrono::steady_clock::now();
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                if (!m_isRunning) {
                    break;
                }
            }

            if (std::chrono::steady_clock::now() >= nextSweep) {
                RunSweepCycle();
                std::lock_guard<std::mutex> lock(m_mutex);
                nextSweep = std::chrono::steady_clock::now() + m_interval;
            } else {
                runDuePurges();
            }

            std::unique_lock<std::mutex> lock(m_mutex);
            auto wake = nextSweep;
            if (!m_pending.empty()) {
                // wake for the earliest due purge, bounded by the sweep interval
                auto earliest = std::min_element(
                    m_pending.begin(), m_pending.end(),
                    [](const PendingPurge& a, const PendingPurge& b) { return a.due < b.due; });
                auto untilDue = std::chrono::duration_cast<std::chrono::milliseconds>(earliest->due - m_clock());
                wake = std::min(wake, std::chrono::steady_clock::now() +
                                          std::max(untilDue, std::chrono::milliseconds(1)));
            }
            m_cv.wait_until(lock, wake, [this] { return !m_isRunning || hasDuePurgeLocked(); });
        }
    }

    bool hasDuePurgeLocked() const {
        const core::TimePoint now = m_clock();
        return std::any_of(m_pending.begin(), m_pending.end(),
                           [now](const PendingPurge& p) { return p.due <= now; });
    }

    size_t runDuePurges() {
        std::deque<PendingPurge> due;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const core::TimePoint now = m_clock();
            for (auto it = m_pending.begin(); it != m_pending.end();) {
                if (it->due <= now) {
                    due.push_back(*it);
                    it = m_pending.erase(it);
                } else {
                    ++it;
                }
            }
        }

        size_t removed = 0;
        for (const auto& p : due) {
            try {
                removed += m_vault->Purge(p.session);
                ++m_purges;
                util::logger::debug("[RetentionSweeper] Purged session " + p.session);
            } catch (const std::exception& ex) {
                util::logger::error("[RetentionSweeper] Purge of session " + p.session +
                                    " failed, will retry: " + ex.what());
                std::lock_guard<std::mutex> lock(m_mutex);
                m_pending.push_back(PendingPurge{p.session, m_clock() + kPurgeRetryDelay});
            }
        }
        return removed;
    }

    std::shared_ptr<Vault> m_vault;
    ClockFn m_clock;
    std::atomic<bool> m_isRunning;
    std::chrono::milliseconds m_interval;
    std::deque<PendingPurge> m_pending;
    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<uint64_t> m_sweeps;
    std::atomic<uint64_t> m_purges;
};

} // namespace vault
} // namespace triageguard

#endif // TRIAGEGUARD_VAULT_RETENTION_SWEEPER_HPP
