#ifndef TRIAGEGUARD_TEST_TEST_HELPERS_HPP
#define TRIAGEGUARD_TEST_TEST_HELPERS_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../config/guard_config.hpp"
#include "../src/core/placeholder_syntax.hpp"
#include "../src/core/secret_key_ring.hpp"
#include "../src/core/types.hpp"
#include "../src/guard/guard_orchestrator.hpp"
#include "../src/vault/in_memory_vault.hpp"
#include "../src/vault/vault.hpp"

/**
 * @file test_helpers.hpp
 * @brief Fixtures shared by the unit and integration tests.
 */

namespace triageguard {
namespace test {

inline std::vector<uint8_t> TestKey(char fill = 'k')
{
    return std::vector<uint8_t>(32, static_cast<uint8_t>(fill));
}

inline std::shared_ptr<core::SecretKeyRing> TestKeyRing(char fill = 'k')
{
    return std::make_shared<core::SecretKeyRing>(TestKey(fill));
}

/// First placeholder of the given type tag in text, or "".
inline std::string FindToken(const std::string &text, const std::string &typeTag)
{
    for (const auto &tok : core::FindPlaceholders(text)) {
        if (tok.typeTag == typeTag) {
            return tok.token;
        }
    }
    return "";
}

/// Clock the test advances by hand. Must outlive whatever holds Fn().
class ManualClock
{
public:
    ManualClock() : m_now(core::Clock::now()) {}

    core::TimePoint Now() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void Advance(std::chrono::seconds by)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += by;
    }

    vault::ClockFn Fn()
    {
        return [this] { return Now(); };
    }

private:
    mutable std::mutex m_mutex;
    core::TimePoint m_now;
};

/// Guard over an in-memory vault with a fixed test key.
inline std::unique_ptr<guard::GuardOrchestrator> MakeGuard(const config::GuardConfig &cfg = config::GuardConfig(),
                                                           vault::ClockFn clock = vault::SystemClock())
{
    auto vault = std::make_shared<vault::InMemoryVault>(vault::RetentionPolicy::FromConfig(cfg), clock);
    return std::make_unique<guard::GuardOrchestrator>(cfg, TestKeyRing(), vault, nullptr, clock);
}

} // namespace test
} // namespace triageguard

#endif // TRIAGEGUARD_TEST_TEST_HELPERS_HPP
