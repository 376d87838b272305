#ifndef TRIAGEGUARD_CORE_ERRORS_HPP
#define TRIAGEGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file errors.hpp
 * @brief Exception types raised by the guard.
 *
 * Security-relevant failures (SecretScanError, VaultUnavailableError,
 * MintCollisionError, KeyConfigurationError) are fail-closed and escalate.
 * Tool-call failures are contained to one call by RequestSession.
 */

namespace triageguard {
namespace core {

class GuardError : public std::runtime_error
{
public:
    explicit GuardError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/// A secret-class detector failed; the whole anonymize call must fail.
class SecretScanError : public GuardError
{
public:
    explicit SecretScanError(const std::string &what) : GuardError(what) {}
};

/// Salted re-derivation budget exhausted.
class MintCollisionError : public GuardError
{
public:
    explicit MintCollisionError(const std::string &what) : GuardError(what) {}
};

/// Storage backend unreachable or inconsistent. Restoration is denied.
class VaultUnavailableError : public GuardError
{
public:
    explicit VaultUnavailableError(const std::string &what) : GuardError(what) {}
};

class KeyConfigurationError : public GuardError
{
public:
    explicit KeyConfigurationError(const std::string &what) : GuardError(what) {}
};

/**
 * @brief Placeholders in tool-call arguments that the vault could not resolve.
 */
class UnresolvedPlaceholderError : public GuardError
{
public:
    UnresolvedPlaceholderError(const std::string &what, std::vector<std::string> placeholders)
        : GuardError(what)
        , m_placeholders(std::move(placeholders))
    {
    }

    const std::vector<std::string> &Placeholders() const { return m_placeholders; }

private:
    std::vector<std::string> m_placeholders;
};

/// Arguments do not satisfy the target tool's input contract.
class ToolSchemaError : public GuardError
{
public:
    explicit ToolSchemaError(const std::string &what) : GuardError(what) {}
};

class ToolInvocationError : public GuardError
{
public:
    explicit ToolInvocationError(const std::string &what) : GuardError(what) {}
};

class ToolTimeoutError : public ToolInvocationError
{
public:
    explicit ToolTimeoutError(const std::string &what) : ToolInvocationError(what) {}
};

} // namespace core
} // namespace triageguard

#endif // TRIAGEGUARD_CORE_ERRORS_HPP
