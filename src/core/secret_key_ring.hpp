#ifndef TRIAGEGUARD_CORE_SECRET_KEY_RING_HPP
#define TRIAGEGUARD_CORE_SECRET_KEY_RING_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <openssl/crypto.h>
#include "errors.hpp"
#include "../util/logger.hpp"

/**
 * @file secret_key_ring.hpp
 * @brief Holds the HMAC key used for placeholder derivation.
 *
 * The key is injected from configuration ("env:VAR" or "file:/path"); it is
 * never compiled in. Rotate() swaps the key at runtime; mappings already in the
 * vault stay valid because the vault reuses existing (type, original) mappings
 * before a freshly derived tag is consulted.
 */

namespace triageguard {
namespace core {

class SecretKeyRing
{
public:
    static constexpr size_t kMinimumKeyBytes = 16;

    explicit SecretKeyRing(std::vector<uint8_t> key)
        : m_version(1)
    {
        validate(key);
        m_key = std::move(key);
    }

    ~SecretKeyRing()
    {
        if (!m_key.empty()) {
            OPENSSL_cleanse(m_key.data(), m_key.size());
        }
    }

    SecretKeyRing(const SecretKeyRing&) = delete;
    SecretKeyRing& operator=(const SecretKeyRing&) = delete;

    /**
     * @brief Resolve a key reference: "env:NAME" reads an environment variable,
     *        "file:/path" reads the whole file (one trailing newline is dropped).
     * @throw KeyConfigurationError if the reference is malformed, missing or too short.
     */
    static std::unique_ptr<SecretKeyRing> FromReference(const std::string &reference)
    {
        std::string material;
        if (reference.rfind("env:", 0) == 0) {
            const std::string var = reference.substr(4);
            const char *value = std::getenv(var.c_str());
            if (value == nullptr) {
                throw KeyConfigurationError("SecretKeyRing: environment variable not set: " + var);
            }
            material = value;
        }
        else if (reference.rfind("file:", 0) == 0) {
            const std::string path = reference.substr(5);
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open()) {
                throw KeyConfigurationError("SecretKeyRing: cannot open key file: " + path);
            }
            material.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            if (!material.empty() && material.back() == '\n') {
                material.pop_back();
            }
        }
        else {
            throw KeyConfigurationError("SecretKeyRing: unsupported key reference scheme");
        }

        std::vector<uint8_t> key(material.begin(), material.end());
        OPENSSL_cleanse(&material[0], material.size());
        auto ring = std::make_unique<SecretKeyRing>(std::move(key));
        util::logger::info("SecretKeyRing: key loaded (version 1)");
        return ring;
    }

    std::vector<uint8_t> CurrentKey() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_key;
    }

    uint32_t Version() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_version;
    }

    void Rotate(std::vector<uint8_t> newKey)
    {
        validate(newKey);
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        OPENSSL_cleanse(m_key.data(), m_key.size());
        m_key = std::move(newKey);
        ++m_version;
        util::logger::info("SecretKeyRing: key rotated to version " + std::to_string(m_version));
    }

private:
    static void validate(const std::vector<uint8_t> &key)
    {
        if (key.size() < kMinimumKeyBytes) {
            throw KeyConfigurationError("SecretKeyRing: key must be at least "
                                        + std::to_string(kMinimumKeyBytes) + " bytes");
        }
    }

    mutable std::shared_mutex m_mutex;
    std::vector<uint8_t> m_key;
    uint32_t m_version;
};

} // namespace core
} // namespace triageguard

#endif // TRIAGEGUARD_CORE_SECRET_KEY_RING_HPP
