#ifndef TRIAGEGUARD_MINT_PLACEHOLDER_MINT_HPP
#define TRIAGEGUARD_MINT_PLACEHOLDER_MINT_HPP

#include <string>
#include <memory>
#include <algorithm>
#include <cstdint>
#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "../core/placeholder_syntax.hpp"
#include "../core/secret_key_ring.hpp"
#include "../vault/vault.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"

/**
 * @file placeholder_mint.hpp
 * @brief Derives stable, session-scoped placeholders and records them in the vault.
 *
 * tag = hex(HMAC-SHA256(key, session | type | original [| salt]))[0, tagLength)
 *
 *   - same (session, type, original) -> same placeholder;
 *   - different session -> unrelated tag, so no cross-session correlation;
 *   - not invertible without both the key and the vault.
 *
 * Collisions are detected by the vault's lookup-before-write: when the derived
 * placeholder already belongs to another original in the session, the mint
 * re-derives with a salt. Secret-class values never reach the vault.
 *
 * USAGE EXAMPLE:
 *   @code
 *   PlaceholderMint mint(keyRing, vault);
 *   std::string ph = mint.Mint("s1", Namespace::IncomingInput, EntityType::TicketKey, "PROJ-1234");
 *   // ph == "<<TICKET_5c1e0a7b93d2>>"
 *   @endcode
 */

namespace triageguard {
namespace mint {

class PlaceholderMint
{
public:
    static constexpr uint32_t kMinTagLength = 8;
    static constexpr uint32_t kMaxTagLength = 64;

    PlaceholderMint(std::shared_ptr<core::SecretKeyRing> keys,
                    std::shared_ptr<vault::Vault> vault,
                    uint32_t tagLength = 12,
                    uint32_t saltAttempts = 8)
        : m_keys(std::move(keys))
        , m_vault(std::move(vault))
        , m_tagLength(std::min(kMaxTagLength, std::max(kMinTagLength, tagLength)))
        , m_saltAttempts(std::max<uint32_t>(1, saltAttempts))
    {
    }

    /**
     * @brief Placeholder for original, reusing the session's existing mapping if any.
     * @return The redaction literal for secrets (no vault record).
     * @throw core::MintCollisionError when every salted derivation collides.
     * @throw core::VaultUnavailableError if the vault fails.
     */
    std::string Mint(const std::string &session,
                     core::Namespace ns,
                     core::EntityType type,
                     const std::string &original)
    {
        if (type == core::EntityType::Secret) {
            return core::RedactionLiteral();
        }

        for (uint32_t salt = 0; salt < m_saltAttempts; ++salt) {
            core::MappingRecord record;
            record.session = session;
            record.ns = ns;
            record.type = type;
            record.placeholder = core::FormatPlaceholder(type, DeriveTag(session, type, original, salt));
            record.original = original;
            record.createdAt = core::Clock::now();

            vault::UpsertOutcome outcome = m_vault->Upsert(record);
            if (outcome.status != vault::UpsertOutcome::Status::Collision) {
                return outcome.placeholder;
            }
            util::logger::warn("PlaceholderMint: collision on " + record.placeholder + " in session "
                               + session + ", re-deriving with salt " + std::to_string(salt + 1));
        }

        util::logger::critical("PlaceholderMint: salt budget exhausted for a "
                               + core::EntityTypeTag(type) + " value in session " + session);
        throw core::MintCollisionError("placeholder collision budget exhausted for type "
                                       + core::EntityTypeTag(type));
    }

    /**
     * @brief The keyed tag for (session, type, original, salt), without touching the vault.
     */
    std::string DeriveTag(const std::string &session,
                          core::EntityType type,
                          const std::string &original,
                          uint32_t salt) const
    {
        std::string message;
        message.reserve(session.size() + original.size() + 16);
        message.append(session).push_back('\x1f');
        message.append(core::EntityTypeTag(type)).push_back('\x1f');
        message.append(original);
        if (salt > 0) {
            message.push_back('\x1f');
            message.append("salt:").append(std::to_string(salt));
        }
        return util::hashing::hmacSha256Hex(m_keys->CurrentKey(), message).substr(0, m_tagLength);
    }

    uint32_t TagLength() const { return m_tagLength; }

private:
    std::shared_ptr<core::SecretKeyRing> m_keys;
    std::shared_ptr<vault::Vault> m_vault;
    uint32_t m_tagLength;
    uint32_t m_saltAttempts;
};

} // namespace mint
} // namespace triageguard

#endif // TRIAGEGUARD_MINT_PLACEHOLDER_MINT_HPP
