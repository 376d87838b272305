#ifndef TRIAGEGUARD_RECOGNIZER_DETECTORS_HPP
#define TRIAGEGUARD_RECOGNIZER_DETECTORS_HPP

#include <string>
#include <vector>
#include <regex>
#include <memory>
#include <unordered_set>
#include "../core/types.hpp"

/**
 * @file detectors.hpp
 * @brief Pattern detectors, one or more per entity type.
 *
 * Detectors may return overlapping candidates; RecognizerEngine resolves them.
 * Each detector declares the entity class it serves so the engine can apply the
 * failure policy (secret class: fatal, otherwise: degrade with a warning).
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace triageguard::recognizer;
 *   RecognizerEngine engine(DefaultDetectors());
 *   @endcode
 */

namespace triageguard {
namespace recognizer {

class Detector
{
public:
    virtual ~Detector() = default;

    virtual std::string Name() const = 0;

    /// Class whose failure policy applies when Detect() throws.
    virtual core::EntityClass Class() const = 0;

    /**
     * @brief Candidate spans in text. May throw; the engine decides what a failure means.
     */
    virtual std::vector<core::EntitySpan> Detect(const std::string &text) const = 0;
};

/**
 * @class RegexDetector
 * @brief Emits one span per regex match, optionally narrowed to a capture group.
 */
class RegexDetector : public Detector
{
public:
    RegexDetector(std::string name,
                  core::EntityType type,
                  const std::string &pattern,
                  std::regex::flag_type flags = std::regex::ECMAScript,
                  size_t captureGroup = 0,
                  double confidence = 0.9)
        : m_name(std::move(name))
        , m_type(type)
        , m_regex(pattern, flags)
        , m_group(captureGroup)
        , m_confidence(confidence)
    {
    }

    std::string Name() const override { return m_name; }

    core::EntityClass Class() const override { return core::ClassOf(m_type); }

    std::vector<core::EntitySpan> Detect(const std::string &text) const override
    {
        std::vector<core::EntitySpan> spans;
        auto begin = std::sregex_iterator(text.begin(), text.end(), m_regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const auto &m = *it;
            if (m_group >= m.size() || !m[m_group].matched || m.length(m_group) == 0) {
                continue;
            }
            core::EntitySpan span;
            span.start = static_cast<size_t>(m.position(m_group));
            span.end = span.start + static_cast<size_t>(m.length(m_group));
            span.type = m_type;
            span.confidence = m_confidence;
            if (accept(text, span)) {
                spans.push_back(span);
            }
        }
        return spans;
    }

protected:
    /// Post-match filter for checks std::regex cannot express (no lookbehind).
    virtual bool accept(const std::string &text, const core::EntitySpan &span) const
    {
        (void)text;
        (void)span;
        return true;
    }

private:
    std::string m_name;
    core::EntityType m_type;
    std::regex m_regex;
    size_t m_group;
    double m_confidence;
};

/**
 * @brief Bare infrastructure host names. Skips the domain part of an e-mail address.
 */
class HostnameDetector : public RegexDetector
{
public:
    HostnameDetector()
        : RegexDetector("hostname", core::EntityType::Host,
                        R"(\b(?:[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?\.)+)"
                        R"((?:internal|local|localdomain|lan|corp|intra|intranet|svc|cluster|com|net|org|io|dev|cloud)\b)",
                        std::regex::ECMAScript | std::regex::icase, 0, 0.8)
    {
    }

protected:
    bool accept(const std::string &text, const core::EntitySpan &span) const override
    {
        if (span.start > 0 && text[span.start - 1] == '@') {
            return false;
        }
        if (span.end < text.size() && text[span.end] == '@') {
            return false;
        }
        return true;
    }
};

/**
 * @brief Project-style ticket keys (PROJ-1234) minus common standard names.
 */
class TicketKeyDetector : public RegexDetector
{
public:
    TicketKeyDetector()
        : RegexDetector("ticket_key", core::EntityType::TicketKey,
                        R"(\b([A-Z][A-Z0-9]{1,9})-[0-9]{1,7}\b)",
                        std::regex::ECMAScript, 0, 0.95)
    {
    }

protected:
    bool accept(const std::string &text, const core::EntitySpan &span) const override
    {
        static const std::unordered_set<std::string> denied = {
            "UTF", "SHA", "ISO", "RFC", "TLS", "SSL", "HTTP", "MD", "AES", "CVE", "X"
        };
        const std::string key = text.substr(span.start, span.Length());
        return denied.count(key.substr(0, key.find('-'))) == 0;
    }
};

/**
 * @brief The built-in detector set.
 */
inline std::vector<std::shared_ptr<Detector>> DefaultDetectors()
{
    using core::EntityType;
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    std::vector<std::shared_ptr<Detector>> d;

    // secrets
    d.push_back(std::make_shared<RegexDetector>(
        "bearer_token", EntityType::Secret,
        R"(\bBearer\s+[A-Za-z0-9\-._~+/]{8,}=*)", std::regex::ECMAScript, 0, 0.99));
    d.push_back(std::make_shared<RegexDetector>(
        "basic_auth", EntityType::Secret,
        R"(\bAuthorization\s*:\s*Basic\s+([A-Za-z0-9+/]+=*))", icase, 1, 0.99));
    d.push_back(std::make_shared<RegexDetector>(
        "credential_assignment", EntityType::Secret,
        R"(\b(?:password|passwd|pwd|secret|client[_-]?secret|api[_-]?key|apikey|access[_-]?token|)"
        R"(auth[_-]?token|refresh[_-]?token|token|private[_-]?key)["']?\s*[:=]\s*["']?([^\s"'&,;]+))",
        icase, 1, 0.95));
    d.push_back(std::make_shared<RegexDetector>(
        "aws_access_key", EntityType::Secret, R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)"));
    d.push_back(std::make_shared<RegexDetector>(
        "github_token", EntityType::Secret, R"(\bgh[pousr]_[A-Za-z0-9]{36,255}\b)"));
    d.push_back(std::make_shared<RegexDetector>(
        "slack_token", EntityType::Secret, R"(\bxox[abprs]-[A-Za-z0-9-]{10,})"));
    d.push_back(std::make_shared<RegexDetector>(
        "jwt", EntityType::Secret,
        R"(\beyJ[A-Za-z0-9_-]{5,}\.[A-Za-z0-9_-]{5,}\.[A-Za-z0-9_-]{5,})"));
    d.push_back(std::make_shared<RegexDetector>(
        "pem_private_key", EntityType::Secret,
        R"(-----BEGIN [A-Z ]*PRIVATE KEY-----[\s\S]*?-----END [A-Z ]*PRIVATE KEY-----)"));
    d.push_back(std::make_shared<RegexDetector>(
        "url_password", EntityType::Secret,
        R"([A-Za-z][A-Za-z0-9+.-]*://[^\s:/@]+:([^\s@/]+)@)", std::regex::ECMAScript, 1, 0.99));

    // domain identifiers
    d.push_back(std::make_shared<TicketKeyDetector>());

    // hosts: URL host segment only, then bare names
    d.push_back(std::make_shared<RegexDetector>(
        "url_host", EntityType::Host,
        R"(\b[A-Za-z][A-Za-z0-9+.-]*://(?:[^\s/@<>]+@)?([^\s/:?#<>\[\]@]+))",
        std::regex::ECMAScript, 1, 0.95));
    d.push_back(std::make_shared<HostnameDetector>());

    // personal identifiers
    d.push_back(std::make_shared<RegexDetector>(
        "email", EntityType::Email,
        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"));
    d.push_back(std::make_shared<RegexDetector>(
        "ipv4", EntityType::IpAddress,
        R"(\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9]?[0-9])\.){3})"
        R"((?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9]?[0-9])\b)"));
    d.push_back(std::make_shared<RegexDetector>(
        "phone", EntityType::Phone,
        R"((?:\+[0-9]{1,3}[\s.-]?)?(?:\([0-9]{3}\)\s?|\b[0-9]{3}[\s.-])[0-9]{3}[\s.-][0-9]{4}\b)",
        std::regex::ECMAScript, 0, 0.7));

    return d;
}

} // namespace recognizer
} // namespace triageguard

#endif // TRIAGEGUARD_RECOGNIZER_DETECTORS_HPP
