#ifndef TRIAGEGUARD_GUARD_GUARD_ORCHESTRATOR_HPP
#define TRIAGEGUARD_GUARD_GUARD_ORCHESTRATOR_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "../../config/guard_config.hpp"
#include "../core/errors.hpp"
#include "../core/secret_key_ring.hpp"
#include "../core/types.hpp"
#include "../mint/placeholder_mint.hpp"
#include "../recognizer/http_recognition_detector.hpp"
#include "../recognizer/recognizer_engine.hpp"
#include "../substitution/deep_substitution.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"
#include "../vault/retention_sweeper.hpp"
#include "../vault/vault.hpp"
#include "../vault/vault_factory.hpp"

/**
 * @file guard_orchestrator.hpp
 * @brief Public contract of the anonymization layer: Mask, Restore, Scrub, Purge.
 *
 * The orchestrator owns one key ring, one vault, one recognizer and the
 * retention sweeper, and is shared by every concurrent request. Sessions are
 * explicit arguments; nothing is looked up from ambient state.
 *
 * USAGE EXAMPLE:
 *   @code
 *   GuardOrchestrator guard(cfg);
 *   std::string s = guard.NewSession();
 *   auto masked = guard.Mask("Ticket PROJ-1234 failed", s, core::Namespace::IncomingInput);
 *   auto restored = guard.Restore(masked.value, s, {core::Namespace::IncomingInput});
 *   guard.Purge(s);
 *   @endcode
 */

namespace triageguard {
namespace guard {

using json = nlohmann::json;

struct MaskResult
{
    json value;
    std::vector<std::string> warnings;
};

struct RestoreResult
{
    json value;
    std::vector<std::string> unresolved;
    /// Set when restoration was denied because the vault failed.
    bool vaultFailure = false;
};

class GuardOrchestrator
{
public:
    /**
     * @brief Build every collaborator from configuration.
     * @throw core::KeyConfigurationError if the key reference cannot be resolved.
     * @throw core::VaultUnavailableError if the vault location is unusable.
     */
    explicit GuardOrchestrator(const config::GuardConfig &cfg, vault::ClockFn clock = vault::SystemClock())
        : GuardOrchestrator(cfg,
                            std::shared_ptr<core::SecretKeyRing>(core::SecretKeyRing::FromReference(cfg.secretKeyRef)),
                            vault::MakeVault(cfg, clock),
                            nullptr,
                            clock)
    {
    }

    /**
     * @brief Build around injected collaborators. A null recognizer gets the
     *        default detector set (plus the HTTP backend if one is configured).
     */
    GuardOrchestrator(const config::GuardConfig &cfg,
                      std::shared_ptr<core::SecretKeyRing> keys,
                      std::shared_ptr<vault::Vault> vault,
                      std::shared_ptr<recognizer::RecognizerEngine> recognizer = nullptr,
                      vault::ClockFn clock = vault::SystemClock())
        : m_config(cfg)
        , m_keys(std::move(keys))
        , m_vault(std::move(vault))
        , m_recognizer(recognizer ? std::move(recognizer) : makeRecognizer(cfg))
    {
        m_mint = std::make_shared<mint::PlaceholderMint>(m_keys, m_vault, m_config.placeholderTagLength,
                                                         m_config.mintSaltAttempts);
        m_substitution = std::make_unique<substitution::DeepSubstitutionEngine>(m_recognizer, m_mint, m_vault);
        m_sweeper = std::make_unique<vault::RetentionSweeper>(m_vault, std::move(clock));
        m_sweeper->ConfigureInterval(config::BoundedSeconds(m_config.sweepIntervalSeconds));
    }

    ~GuardOrchestrator()
    {
        m_sweeper->StopSweeping();
    }

    GuardOrchestrator(const GuardOrchestrator&) = delete;
    GuardOrchestrator& operator=(const GuardOrchestrator&) = delete;

    /// Fresh 128-bit session identifier.
    std::string NewSession() const
    {
        return util::hashing::randomHex(16);
    }

    /**
     * @brief Mask every string leaf of value into namespace ns of session.
     * @throw core::SecretScanError, core::MintCollisionError, core::VaultUnavailableError
     */
    MaskResult Mask(const json &value, const std::string &session, core::Namespace ns)
    {
        substitution::NamespaceContext context;
        context.target = ns;
        substitution::TransformReport report;

        MaskResult result;
        try {
            result.value = m_substitution->Transform(value, substitution::Mode::Mask, session, context, report);
        }
        catch (const core::VaultUnavailableError &ex) {
            util::logger::critical("GuardOrchestrator: vault unavailable while masking for session "
                                   + session + ": " + ex.what());
            throw;
        }
        result.warnings = std::move(report.warnings);
        util::logger::debug("GuardOrchestrator: masked " + std::to_string(report.masked) + " and scrubbed "
                            + std::to_string(report.scrubbed) + " value(s) into "
                            + core::NamespaceName(ns) + " for session " + session);
        return result;
    }

    /**
     * @brief Restore placeholders, searching namespaces in order.
     *
     * Fail-closed: if the vault fails, the still-masked value is returned,
     * every placeholder in it is reported unresolved and vaultFailure is set.
     * @throw core::SecretScanError if the scrub pass fails.
     */
    RestoreResult Restore(const json &value, const std::string &session, const std::vector<core::Namespace> &order)
    {
        substitution::NamespaceContext context;
        context.lookupOrder = order;
        substitution::TransformReport report;

        RestoreResult result;
        try {
            result.value = m_substitution->Transform(value, substitution::Mode::Restore, session, context, report);
            result.unresolved = std::move(report.unresolved);
        }
        catch (const core::VaultUnavailableError &ex) {
            util::logger::critical("GuardOrchestrator: vault unavailable, restoration denied for session "
                                   + session + ": " + ex.what());
            substitution::TransformReport scrubReport;
            result.value = m_substitution->Scrub(value, scrubReport);
            result.unresolved = substitution::DeepSubstitutionEngine::CollectPlaceholders(value);
            result.vaultFailure = true;
            return result;
        }

        if (!result.unresolved.empty()) {
            util::logger::warn("GuardOrchestrator: " + std::to_string(result.unresolved.size())
                               + " placeholder(s) unresolved in session " + session);
        }
        return result;
    }

    /**
     * @brief Stateless, irreversible secret redaction.
     * @throw core::SecretScanError if a secret detector fails.
     */
    json Scrub(const json &value) const
    {
        substitution::TransformReport report;
        return m_substitution->Scrub(value, report);
    }

    size_t Purge(const std::string &session)
    {
        size_t removed = m_vault->Purge(session);
        util::logger::info("GuardOrchestrator: purged " + std::to_string(removed) + " record(s) of session " + session);
        return removed;
    }

    size_t Purge(const std::string &session, core::Namespace ns)
    {
        size_t removed = m_vault->Purge(session, ns);
        util::logger::info("GuardOrchestrator: purged " + std::to_string(removed) + " record(s) of session "
                           + session + " in " + core::NamespaceName(ns));
        return removed;
    }

    /// Best-effort purge after the configured delay; the sweep remains the backstop.
    void SchedulePurge(const std::string &session)
    {
        m_sweeper->SchedulePurge(session, config::BoundedMillis(m_config.purgeDelayMillis));
    }

    bool StartBackgroundSweeper() { return m_sweeper->StartSweeping(); }
    bool StopBackgroundSweeper() { return m_sweeper->StopSweeping(); }

    const config::GuardConfig &Config() const { return m_config; }
    std::shared_ptr<vault::Vault> GetVault() const { return m_vault; }
    std::shared_ptr<core::SecretKeyRing> GetKeyRing() const { return m_keys; }
    vault::RetentionSweeper &GetSweeper() { return *m_sweeper; }

private:
    static std::shared_ptr<recognizer::RecognizerEngine> makeRecognizer(const config::GuardConfig &cfg)
    {
        auto engine = std::make_shared<recognizer::RecognizerEngine>();
        if (!cfg.recognizerEndpoint.empty()) {
            engine->AddDetector(std::make_shared<recognizer::HttpRecognitionDetector>(
                cfg.recognizerEndpoint, static_cast<long>(config::BoundedMillis(cfg.recognizerTimeoutMillis).count())));
            util::logger::info("GuardOrchestrator: external recognition backend enabled");
        }
        return engine;
    }

    config::GuardConfig m_config;
    std::shared_ptr<core::SecretKeyRing> m_keys;
    std::shared_ptr<vault::Vault> m_vault;
    std::shared_ptr<recognizer::RecognizerEngine> m_recognizer;
    std::shared_ptr<mint::PlaceholderMint> m_mint;
    std::unique_ptr<substitution::DeepSubstitutionEngine> m_substitution;
    std::unique_ptr<vault::RetentionSweeper> m_sweeper;
};

} // namespace guard
} // namespace triageguard

#endif // TRIAGEGUARD_GUARD_GUARD_ORCHESTRATOR_HPP
