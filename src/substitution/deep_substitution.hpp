#ifndef TRIAGEGUARD_SUBSTITUTION_DEEP_SUBSTITUTION_HPP
#define TRIAGEGUARD_SUBSTITUTION_DEEP_SUBSTITUTION_HPP

#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "../core/types.hpp"
#include "../core/placeholder_syntax.hpp"
#include "../recognizer/recognizer_engine.hpp"
#include "../mint/placeholder_mint.hpp"
#include "../vault/vault.hpp"

/**
 * @file deep_substitution.hpp
 * @brief Shape-preserving mask/restore over nested call arguments and results.
 *
 * Only string leaves change. Object keys, array lengths and non-string scalars
 * are copied as-is.
 *
 *   Mask:    recognize + mint every raw identifier; existing placeholders and
 *            redaction literals are left alone, so masking is idempotent.
 *   Restore: replace placeholders found in the vault (first hit in lookup
 *            order); unknown ones stay in the text and are reported.
 *
 * Both modes finish with the secret scrub pass. Secrets have no vault record,
 * so no mode or namespace order can bring a redacted value back.
 */

namespace triageguard {
namespace substitution {

using json = nlohmann::json;

enum class Mode {
    Mask,
    Restore
};

struct NamespaceContext
{
    /// Namespace new mappings are recorded in (mask).
    core::Namespace target = core::Namespace::IncomingInput;
    /// Lookup precedence (restore).
    std::vector<core::Namespace> lookupOrder = core::ToolBoundaryRestoreOrder();
};

struct TransformReport
{
    std::vector<std::string> warnings;
    std::vector<std::string> unresolved;
    size_t masked = 0;
    size_t restored = 0;
    size_t scrubbed = 0;

    void AddWarning(const std::string &w)
    {
        if (std::find(warnings.begin(), warnings.end(), w) == warnings.end()) {
            warnings.push_back(w);
        }
    }

    void AddUnresolved(const std::string &placeholder)
    {
        if (std::find(unresolved.begin(), unresolved.end(), placeholder) == unresolved.end()) {
            unresolved.push_back(placeholder);
        }
    }
};

class DeepSubstitutionEngine
{
public:
    DeepSubstitutionEngine(std::shared_ptr<recognizer::RecognizerEngine> recognizer,
                           std::shared_ptr<mint::PlaceholderMint> mint,
                           std::shared_ptr<vault::Vault> vault)
        : m_recognizer(std::move(recognizer))
        , m_mint(std::move(mint))
        , m_vault(std::move(vault))
    {
    }

    json Transform(const json &value,
                   Mode mode,
                   const std::string &session,
                   const NamespaceContext &context,
                   TransformReport &report) const
    {
        if (mode == Mode::Mask) {
            return mapStrings(value, [&](const std::string &s) {
                return MaskText(s, session, context.target, report);
            });
        }
        return mapStrings(value, [&](const std::string &s) {
            return RestoreText(s, session, context.lookupOrder, report);
        });
    }

    /**
     * @throw core::SecretScanError, core::MintCollisionError, core::VaultUnavailableError
     */
    std::string MaskText(const std::string &text,
                         const std::string &session,
                         core::Namespace ns,
                         TransformReport &report) const
    {
        recognizer::ScanResult scan = m_recognizer->Scan(text);
        for (const auto &w : scan.warnings) {
            report.AddWarning(w);
        }
        if (scan.spans.empty()) {
            return text;
        }

        std::string out;
        out.reserve(text.size() + scan.spans.size() * 16);
        size_t cursor = 0;
        for (const auto &span : scan.spans) {
            out.append(text, cursor, span.start - cursor);
            const std::string original = text.substr(span.start, span.Length());
            if (span.type == core::EntityType::Secret) {
                out.append(core::RedactionLiteral());
                ++report.scrubbed;
            } else {
                out.append(m_mint->Mint(session, ns, span.type, original));
                ++report.masked;
            }
            cursor = span.end;
        }
        out.append(text, cursor, std::string::npos);
        return out;
    }

    /**
     * @brief Restore placeholders; unresolved tokens are kept verbatim and reported.
     * @throw core::VaultUnavailableError, core::SecretScanError
     */
    std::string RestoreText(const std::string &text,
                            const std::string &session,
                            const std::vector<core::Namespace> &order,
                            TransformReport &report) const
    {
        const auto tokens = core::FindPlaceholders(text);
        if (tokens.empty()) {
            return ScrubText(text, report);
        }

        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const auto &tok : tokens) {
            out.append(text, cursor, tok.start - cursor);
            auto record = m_vault->Resolve(session, tok.token, order);
            if (record) {
                out.append(record->original);
                ++report.restored;
            } else {
                out.append(tok.token);
                report.AddUnresolved(tok.token);
            }
            cursor = tok.end;
        }
        out.append(text, cursor, std::string::npos);
        return ScrubText(out, report);
    }

    /**
     * @brief Independent, stateless secret pass.
     * @throw core::SecretScanError if a secret detector fails.
     */
    std::string ScrubText(const std::string &text, TransformReport &report) const
    {
        recognizer::ScanResult scan = m_recognizer->ScanSecrets(text);
        if (scan.spans.empty()) {
            return text;
        }
        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const auto &span : scan.spans) {
            out.append(text, cursor, span.start - cursor);
            out.append(core::RedactionLiteral());
            cursor = span.end;
            ++report.scrubbed;
        }
        out.append(text, cursor, std::string::npos);
        return out;
    }

    json Scrub(const json &value, TransformReport &report) const
    {
        return mapStrings(value, [&](const std::string &s) { return ScrubText(s, report); });
    }

    /// Every distinct placeholder token in value's string leaves, in visit order.
    static std::vector<std::string> CollectPlaceholders(const json &value)
    {
        std::vector<std::string> found;
        mapStrings(value, [&found](const std::string &s) {
            for (const auto &tok : core::FindPlaceholders(s)) {
                if (std::find(found.begin(), found.end(), tok.token) == found.end()) {
                    found.push_back(tok.token);
                }
            }
            return s;
        });
        return found;
    }

private:
    /// Rebuilds value with fn applied to every string leaf.
    template <typename Fn>
    static json mapStrings(const json &value, Fn &&fn)
    {
        switch (value.type()) {
        case json::value_t::string:
            return json(fn(value.get_ref<const std::string &>()));
        case json::value_t::array: {
            json out = json::array();
            for (const auto &element : value) {
                out.push_back(mapStrings(element, fn));
            }
            return out;
        }
        case json::value_t::object: {
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = mapStrings(it.value(), fn);
            }
            return out;
        }
        default:
            return value;
        }
    }

    std::shared_ptr<recognizer::RecognizerEngine> m_recognizer;
    std::shared_ptr<mint::PlaceholderMint> m_mint;
    std::shared_ptr<vault::Vault> m_vault;
};

} // namespace substitution
} // namespace triageguard

#endif // TRIAGEGUARD_SUBSTITUTION_DEEP_SUBSTITUTION_HPP
