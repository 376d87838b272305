#ifndef TRIAGEGUARD_GUARD_REQUEST_SESSION_HPP
#define TRIAGEGUARD_GUARD_REQUEST_SESSION_HPP

#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "guard_orchestrator.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../substitution/schema_filter.hpp"
#include "../tools/tool.hpp"
#include "../util/logger.hpp"
#include "../util/thread_pool.hpp"

/**
 * @file request_session.hpp
 * @brief Drives one request through the guard:
 *
 *   Received -> Masked -> {Restore -> Invoke -> ReMask}* -> Finalized -> PurgeScheduled
 *
 * Each tool call runs its own Restore/Invoke/ReMask cycle; cycles of one
 * request may run concurrently. A failed invocation enters ErrorHandler, which
 * resolves to Retry (bounded) or SkipWithGap, so Finalize always has a
 * partial result to report.
 *
 * Only SecretScanError escapes a tool call; every other failure becomes a gap.
 */

namespace triageguard {
namespace guard {

using json = nlohmann::json;

enum class RequestState {
    Received,
    Masked,
    Restore,
    Invoke,
    ReMask,
    ErrorHandler,
    Retry,
    SkipWithGap,
    Finalized,
    PurgeScheduled
};

inline std::string RequestStateName(RequestState state)
{
    switch (state) {
    case RequestState::Received:       return "Received";
    case RequestState::Masked:         return "Masked";
    case RequestState::Restore:        return "Restore";
    case RequestState::Invoke:         return "Invoke";
    case RequestState::ReMask:         return "ReMask";
    case RequestState::ErrorHandler:   return "ErrorHandler";
    case RequestState::Retry:          return "Retry";
    case RequestState::SkipWithGap:    return "SkipWithGap";
    case RequestState::Finalized:      return "Finalized";
    case RequestState::PurgeScheduled: return "PurgeScheduled";
    }
    return "Unknown";
}

/**
 * @brief Legal edges of the state machine, request-level and per-call.
 */
inline bool IsLegalTransition(RequestState from, RequestState to)
{
    switch (from) {
    case RequestState::Received:     return to == RequestState::Masked;
    case RequestState::Masked:       return to == RequestState::Restore || to == RequestState::Finalized;
    case RequestState::Restore:      return to == RequestState::Invoke || to == RequestState::ErrorHandler;
    case RequestState::Invoke:       return to == RequestState::ReMask || to == RequestState::ErrorHandler;
    case RequestState::ReMask:       return to == RequestState::ErrorHandler;
    case RequestState::ErrorHandler: return to == RequestState::Retry || to == RequestState::SkipWithGap;
    case RequestState::Retry:        return to == RequestState::Restore;
    case RequestState::SkipWithGap:  return false;
    case RequestState::Finalized:    return to == RequestState::PurgeScheduled;
    case RequestState::PurgeScheduled: return false;
    }
    return false;
}

/// A tool invocation as planned by the reasoning loop (arguments may hold placeholders).
struct ToolCall
{
    std::string id;
    std::string tool;
    json arguments = json::object();
};

struct ToolCallOutcome
{
    std::string callId;
    std::string tool;
    bool ok = false;
    uint32_t attempts = 0;
    json result;            ///< masked tool result (ok)
    std::string gap;        ///< masked gap marker (not ok)
    std::vector<RequestState> trace;
    size_t sequence = 0;

    json ToJson() const
    {
        json out = {{"call", callId}, {"tool", tool}, {"status", ok ? "ok" : "gap"}, {"attempts", attempts}};
        if (ok) {
            out["result"] = result;
        } else {
            out["gap"] = gap;
        }
        return out;
    }
};

/**
 * @brief Counting limit on live tool invocations. A slot is released by the
 *        invocation thread itself, so an invocation abandoned at its deadline
 *        keeps its slot until the handler really returns.
 */
class InvocationSlots
{
public:
    explicit InvocationSlots(uint32_t capacity)
        : m_free(std::max<uint32_t>(1, capacity))
    {
    }

    bool Acquire(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, timeout, [this] { return m_free > 0; })) {
            return false;
        }
        --m_free;
        return true;
    }

    void Release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_free;
        }
        m_cv.notify_one();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    uint32_t m_free;
};

class RequestSession
{
public:
    /**
     * @param session Existing session id, or empty to mint a new one.
     */
    RequestSession(GuardOrchestrator &guard, const tools::ToolRegistry &registry, std::string session = "")
        : m_guard(guard)
        , m_registry(registry)
        , m_session(session.empty() ? guard.NewSession() : std::move(session))
        , m_state(RequestState::Received)
        , m_started(std::chrono::steady_clock::now())
        , m_slots(std::make_shared<InvocationSlots>(guard.Config().maxInFlightToolCalls))
        , m_steps(0)
        , m_nextSequence(0)
        , m_partial(false)
    {
    }

    const std::string &Session() const { return m_session; }
    RequestState State() const { return m_state.load(); }

    /**
     * @brief Received -> Masked. Masks the incoming request into incoming-input.
     * @throw std::logic_error if called twice.
     */
    MaskResult Receive(const json &input)
    {
        transition(RequestState::Received, RequestState::Masked, "Receive");
        MaskResult masked = m_guard.Mask(input, m_session, core::Namespace::IncomingInput);
        addWarnings(masked.warnings);
        util::logger::info("RequestSession: request received for session " + m_session);
        return masked;
    }

    /**
     * @brief One Restore -> Invoke -> ReMask cycle with retry / gap handling.
     * @throw core::SecretScanError (fatal to the request).
     * @throw std::logic_error outside the Masked state.
     */
    ToolCallOutcome RunToolCall(const ToolCall &call)
    {
        requireState(RequestState::Masked, "RunToolCall");

        CallCycle cycle;
        cycle.outcome.sequence = m_nextSequence++;
        cycle.outcome.callId = call.id.empty() ? "call-" + std::to_string(cycle.outcome.sequence + 1) : call.id;
        cycle.outcome.tool = call.tool;

        const config::GuardConfig &cfg = m_guard.Config();
        std::string failure;

        while (true) {
            cycle.Enter(RequestState::Restore);

            auto tool = m_registry.Find(call.tool);
            if (!tool) {
                return skip(cycle, "unknown tool");
            }

            json arguments;
            try {
                arguments = prepareArguments(call, *tool);
            }
            catch (const core::UnresolvedPlaceholderError &ex) {
                return skip(cycle, "unresolved placeholders " + joinPlaceholders(ex.Placeholders()));
            }
            catch (const core::ToolSchemaError &ex) {
                return skip(cycle, std::string("schema mismatch: ") + ex.what());
            }
            catch (const core::VaultUnavailableError &) {
                return skip(cycle, "vault unavailable");
            }
            catch (const core::MintCollisionError &) {
                return skip(cycle, "placeholder collision");
            }

            if (!reserveStep()) {
                m_partial = true;
                return skip(cycle, "step limit reached");
            }
            const auto remaining = remainingBudget();
            if (remaining.count() <= 0) {
                m_partial = true;
                return skip(cycle, "request budget exhausted");
            }

            cycle.Enter(RequestState::Invoke);
            ++cycle.outcome.attempts;

            bool invoked = false;
            tools::ToolResult raw;
            try {
                raw = invokeWithDeadline(tool->handler, arguments, call.tool);
                if (raw.is_error) {
                    failure = "tool error: " + raw.content;
                } else {
                    invoked = true;
                }
            }
            catch (const core::ToolTimeoutError &ex) {
                failure = ex.what();
            }
            catch (const std::exception &ex) {
                failure = std::string("tool error: ") + ex.what();
            }

            if (invoked) {
                cycle.Enter(RequestState::ReMask);
                try {
                    MaskResult masked = m_guard.Mask(raw.ToJson(), m_session, core::Namespace::ToolResults);
                    addWarnings(masked.warnings);
                    cycle.outcome.result = std::move(masked.value);
                    cycle.outcome.ok = true;
                    record(cycle.outcome);
                    return cycle.outcome;
                }
                catch (const core::VaultUnavailableError &) {
                    return skip(cycle, "vault unavailable");
                }
                catch (const core::MintCollisionError &) {
                    return skip(cycle, "placeholder collision");
                }
            }

            cycle.Enter(RequestState::ErrorHandler);
            util::logger::warn("RequestSession: call " + cycle.outcome.callId + " to '" + call.tool
                               + "' failed on attempt " + std::to_string(cycle.outcome.attempts));
            if (cycle.outcome.attempts > cfg.maxToolRetries || remainingBudget().count() <= 0) {
                cycle.Enter(RequestState::SkipWithGap);
                return finishGap(cycle, failure);
            }
            cycle.Enter(RequestState::Retry);
            backoff(cycle.outcome.attempts);
        }
    }

    /**
     * @brief Fan out calls over a pool capped at max_in_flight_tool_calls.
     *        Outcomes are returned in call order.
     */
    std::vector<ToolCallOutcome> RunToolCalls(const std::vector<ToolCall> &calls)
    {
        requireState(RequestState::Masked, "RunToolCalls");

        std::vector<ToolCallOutcome> outcomes;
        std::exception_ptr fatal;
        {
            util::ThreadPool pool(std::max<uint32_t>(1, m_guard.Config().maxInFlightToolCalls));
            std::vector<std::future<ToolCallOutcome>> futures;
            futures.reserve(calls.size());
            for (const auto &call : calls) {
                futures.push_back(pool.enqueue([this, call]() { return RunToolCall(call); }));
            }
            for (auto &f : futures) {
                try {
                    outcomes.push_back(f.get());
                }
                catch (const std::exception &) {
                    if (!fatal) {
                        fatal = std::current_exception();
                    }
                }
            }
        }
        if (fatal) {
            std::rethrow_exception(fatal);
        }
        return outcomes;
    }

    /**
     * @brief Masked -> Finalized -> PurgeScheduled. Builds the final report.
     *
     * {"summary": ..., "observations": [...], "partial": bool, "warnings": [...]}
     */
    json Finalize(const json &summary)
    {
        transition(RequestState::Masked, RequestState::Finalized, "Finalize");

        MaskResult maskedSummary;
        try {
            maskedSummary = m_guard.Mask(summary, m_session, core::Namespace::FinalOutput);
        }
        catch (const std::exception &) {
            schedulePurge();
            throw;
        }
        addWarnings(maskedSummary.warnings);

        json report;
        report["summary"] = maskedSummary.value;
        json observations = json::array();
        bool anyGap = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<ToolCallOutcome> ordered = m_outcomes;
            std::sort(ordered.begin(), ordered.end(),
                      [](const ToolCallOutcome &a, const ToolCallOutcome &b) { return a.sequence < b.sequence; });
            for (const auto &o : ordered) {
                observations.push_back(o.ToJson());
                anyGap = anyGap || !o.ok;
            }
            report["warnings"] = m_warnings;
        }
        report["observations"] = observations;
        report["partial"] = m_partial.load() || anyGap;

        schedulePurge();
        return report;
    }

    uint32_t StepsUsed() const { return std::min(m_steps.load(), m_guard.Config().maxSteps); }

    bool IsPartial() const { return m_partial.load(); }

private:
    struct CallCycle
    {
        RequestState current = RequestState::Masked;
        ToolCallOutcome outcome;

        void Enter(RequestState next)
        {
            if (!IsLegalTransition(current, next)) {
                throw std::logic_error("illegal tool-call transition " + RequestStateName(current) + " -> "
                                       + RequestStateName(next));
            }
            current = next;
            outcome.trace.push_back(next);
        }
    };

    void transition(RequestState from, RequestState to, const std::string &operation)
    {
        RequestState expected = from;
        if (!m_state.compare_exchange_strong(expected, to)) {
            throw std::logic_error(operation + " not allowed in state " + RequestStateName(expected));
        }
    }

    void requireState(RequestState state, const std::string &operation) const
    {
        RequestState current = m_state.load();
        if (current != state) {
            throw std::logic_error(operation + " not allowed in state " + RequestStateName(current));
        }
    }

    void schedulePurge()
    {
        m_guard.SchedulePurge(m_session);
        m_state = RequestState::PurgeScheduled;
        util::logger::info("RequestSession: purge scheduled for session " + m_session);
    }

    /**
     * Arguments are masked into outgoing-tool-arguments first so raw values
     * the reasoning loop introduced are recorded (and secrets scrubbed), then
     * restored with the tool-boundary order and filtered by the tool schema.
     */
    json prepareArguments(const ToolCall &call, const tools::RegisteredTool &tool)
    {
        MaskResult masked = m_guard.Mask(call.arguments, m_session, core::Namespace::OutgoingToolArguments);
        addWarnings(masked.warnings);

        RestoreResult restored = m_guard.Restore(masked.value, m_session, core::ToolBoundaryRestoreOrder());
        if (restored.vaultFailure) {
            throw core::VaultUnavailableError("restoration denied for call to '" + call.tool + "'");
        }
        if (!restored.unresolved.empty()) {
            throw core::UnresolvedPlaceholderError("unresolved placeholders in arguments for '" + call.tool + "'",
                                                   restored.unresolved);
        }

        std::vector<std::string> dropped;
        json filtered = substitution::FilterBySchema(restored.value, tool.schema.input_schema, dropped);
        if (!dropped.empty()) {
            util::logger::debug("RequestSession: dropped " + std::to_string(dropped.size())
                                + " undeclared argument(s) for '" + call.tool + "'");
        }
        return filtered;
    }

    /**
     * The handler runs on its own thread; a call that misses the deadline is
     * abandoned and its eventual result discarded. The thread holds one of the
     * request's invocation slots until the handler returns, so retries wait
     * for abandoned calls instead of piling onto the tool.
     */
    tools::ToolResult invokeWithDeadline(const tools::ToolHandler &handler,
                                         const json &arguments,
                                         const std::string &toolName)
    {
        if (!m_slots->Acquire(std::max(remainingBudget(), std::chrono::milliseconds(0)))) {
            throw core::ToolTimeoutError("request budget exhausted waiting for an invocation slot for '"
                                         + toolName + "'");
        }
        const auto deadline =
            std::min(config::BoundedMillis(m_guard.Config().toolDeadlineMillis), remainingBudget());
        if (deadline.count() <= 0) {
            m_slots->Release();
            throw core::ToolTimeoutError("request budget exhausted before calling '" + toolName + "'");
        }

        auto promise = std::make_shared<std::promise<tools::ToolResult>>();
        std::future<tools::ToolResult> result = promise->get_future();
        auto slots = m_slots;

        std::thread([promise, handler, arguments, slots]() {
            try {
                promise->set_value(handler(arguments));
            }
            catch (...) {
                promise->set_exception(std::current_exception());
            }
            slots->Release();
        }).detach();

        if (result.wait_for(deadline) != std::future_status::ready) {
            throw core::ToolTimeoutError("timeout after " + std::to_string(deadline.count()) + "ms calling '"
                                         + toolName + "'");
        }
        return result.get();
    }

    ToolCallOutcome skip(CallCycle &cycle, const std::string &reason)
    {
        cycle.Enter(RequestState::ErrorHandler);
        cycle.Enter(RequestState::SkipWithGap);
        return finishGap(cycle, reason);
    }

    /// Gap markers are masked into tool-results like any other tool output.
    ToolCallOutcome finishGap(CallCycle &cycle, const std::string &reason)
    {
        const std::string marker = "[GAP: " + cycle.outcome.tool + " " + reason + "]";
        try {
            MaskResult masked = m_guard.Mask(marker, m_session, core::Namespace::ToolResults);
            cycle.outcome.gap = masked.value.get<std::string>();
        }
        catch (const core::VaultUnavailableError &) {
            cycle.outcome.gap = "[GAP: " + cycle.outcome.tool + " vault unavailable]";
        }
        catch (const core::MintCollisionError &) {
            cycle.outcome.gap = "[GAP: " + cycle.outcome.tool + " placeholder collision]";
        }
        cycle.outcome.ok = false;
        util::logger::warn("RequestSession: call " + cycle.outcome.callId + " skipped with gap after "
                           + std::to_string(cycle.outcome.attempts) + " attempt(s)");
        record(cycle.outcome);
        return cycle.outcome;
    }

    bool reserveStep()
    {
        const uint32_t cap = m_guard.Config().maxSteps;
        uint32_t used = m_steps.load();
        while (used < cap) {
            if (m_steps.compare_exchange_weak(used, used + 1)) {
                return true;
            }
        }
        return false;
    }

    std::chrono::milliseconds remainingBudget() const
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                             - m_started);
        return config::BoundedMillis(m_guard.Config().requestBudgetMillis) - elapsed;
    }

    void backoff(uint32_t attempt) const
    {
        const auto base = config::BoundedMillis(m_guard.Config().retryBackoffMillis);
        auto wait = base.count() > 0 && attempt > config::kMaxDurationMillis / base.count()
                        ? config::BoundedMillis(config::kMaxDurationMillis)
                        : base * attempt;
        wait = std::min(wait, std::max(remainingBudget(), std::chrono::milliseconds(0)));
        if (wait.count() > 0) {
            std::this_thread::sleep_for(wait);
        }
    }

    void record(const ToolCallOutcome &outcome)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_outcomes.push_back(outcome);
    }

    void addWarnings(const std::vector<std::string> &warnings)
    {
        if (warnings.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &w : warnings) {
            if (std::find(m_warnings.begin(), m_warnings.end(), w) == m_warnings.end()) {
                m_warnings.push_back(w);
            }
        }
    }

    static std::string joinPlaceholders(const std::vector<std::string> &placeholders)
    {
        std::string out;
        for (const auto &p : placeholders) {
            out += (out.empty() ? "" : ",") + p;
        }
        return out;
    }

    GuardOrchestrator &m_guard;
    const tools::ToolRegistry &m_registry;
    std::string m_session;
    std::atomic<RequestState> m_state;
    std::chrono::steady_clock::time_point m_started;
    std::shared_ptr<InvocationSlots> m_slots;
    std::atomic<uint32_t> m_steps;
    std::atomic<size_t> m_nextSequence;
    std::atomic<bool> m_partial;
    mutable std::mutex m_mutex;
    std::vector<ToolCallOutcome> m_outcomes;
    std::vector<std::string> m_warnings;
};

} // namespace guard
} // namespace triageguard

#endif // TRIAGEGUARD_GUARD_REQUEST_SESSION_HPP
