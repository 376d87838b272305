#ifndef TRIAGEGUARD_VAULT_VAULT_FACTORY_HPP
#define TRIAGEGUARD_VAULT_VAULT_FACTORY_HPP

#include <memory>
#include <string>
#include "vault.hpp"
#include "in_memory_vault.hpp"
#include "sqlite_vault.hpp"
#include "../core/errors.hpp"
#include "../../config/guard_config.hpp"

namespace triageguard {
namespace vault {

/**
 * @brief Build the vault named by cfg.vaultLocation:
 *        "memory" (or empty) -> InMemoryVault, "sqlite:<path>" -> SqliteVault.
 * @throw core::VaultUnavailableError for an unknown scheme or an unusable database.
 */
inline std::shared_ptr<Vault> MakeVault(const config::GuardConfig &cfg, ClockFn clock = SystemClock())
{
    RetentionPolicy policy = RetentionPolicy::FromConfig(cfg);
    const std::string &location = cfg.vaultLocation;

    if (location.empty() || location == "memory") {
        return std::make_shared<InMemoryVault>(policy, clock);
    }
    if (location.rfind("sqlite:", 0) == 0) {
        return std::make_shared<SqliteVault>(location.substr(7), policy, clock);
    }
    throw core::VaultUnavailableError("unsupported vault location: " + location);
}

} // namespace vault
} // namespace triageguard

#endif // TRIAGEGUARD_VAULT_VAULT_FACTORY_HPP
