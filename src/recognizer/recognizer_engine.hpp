#ifndef TRIAGEGUARD_RECOGNIZER_RECOGNIZER_ENGINE_HPP
#define TRIAGEGUARD_RECOGNIZER_RECOGNIZER_ENGINE_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <algorithm>
#include <stdexcept>
#include "detectors.hpp"
#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "../core/placeholder_syntax.hpp"
#include "../util/logger.hpp"

/**
 * @file recognizer_engine.hpp
 * @brief Runs all detectors over a text and resolves their candidates into a
 *        non-overlapping, start-ordered span list.
 *
 * Resolution order: entity class priority (secret > ticket > host > personal),
 * then longer span, then earlier start. Candidates are visited in that order
 * and accepted when they do not overlap an already accepted span, which keeps
 * the result deterministic for a given detector set.
 *
 * Failure policy:
 *   - a non-secret detector that throws is skipped and reported as a warning;
 *   - a secret-class detector that throws aborts the scan with SecretScanError.
 */

namespace triageguard {
namespace recognizer {

struct ScanResult
{
    std::vector<core::EntitySpan> spans;
    std::vector<std::string> warnings;
};

class RecognizerEngine
{
public:
    explicit RecognizerEngine(std::vector<std::shared_ptr<Detector>> detectors = DefaultDetectors())
        : m_detectors(std::move(detectors))
    {
    }

    void AddDetector(std::shared_ptr<Detector> detector)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_detectors.push_back(std::move(detector));
    }

    /**
     * @brief All entity spans in text, outside placeholders and redaction literals.
     * @throw core::SecretScanError if a secret-class detector fails.
     */
    ScanResult Scan(const std::string &text) const
    {
        return scan(text, false);
    }

    /**
     * @brief Secret-class spans only; used by the independent scrub pass.
     */
    ScanResult ScanSecrets(const std::string &text) const
    {
        return scan(text, true);
    }

    /**
     * @brief Sort key used during resolution: true if a beats b.
     */
    static bool Outranks(const core::EntitySpan &a, const core::EntitySpan &b)
    {
        const int pa = core::PriorityOf(a.type);
        const int pb = core::PriorityOf(b.type);
        if (pa != pb) {
            return pa > pb;
        }
        if (a.Length() != b.Length()) {
            return a.Length() > b.Length();
        }
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return static_cast<int>(a.type) < static_cast<int>(b.type);
    }

    /**
     * @brief Resolve overlapping candidates into a disjoint list ordered by start offset.
     */
    static std::vector<core::EntitySpan> ResolveOverlaps(std::vector<core::EntitySpan> candidates)
    {
        std::sort(candidates.begin(), candidates.end(), Outranks);

        // accepted intervals keyed by start -> end
        std::map<size_t, size_t> taken;
        std::vector<core::EntitySpan> accepted;
        for (const auto &c : candidates) {
            if (c.Length() == 0 || overlapsTaken(taken, c.start, c.end)) {
                continue;
            }
            taken[c.start] = c.end;
            accepted.push_back(c);
        }

        std::sort(accepted.begin(), accepted.end(),
                  [](const core::EntitySpan &a, const core::EntitySpan &b) { return a.start < b.start; });
        return accepted;
    }

private:
    ScanResult scan(const std::string &text, bool secretsOnly) const
    {
        ScanResult result;
        if (text.empty()) {
            return result;
        }

        std::vector<std::shared_ptr<Detector>> detectors;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            detectors = m_detectors;
        }

        const auto protectedRegions = core::ProtectedRegions(text);
        std::vector<core::EntitySpan> candidates;

        for (const auto &detector : detectors) {
            const bool secretClass = detector->Class() == core::EntityClass::Secret;
            if (secretsOnly && !secretClass) {
                continue;
            }

            std::vector<core::EntitySpan> found;
            try {
                found = detector->Detect(text);
            }
            catch (const std::exception &ex) {
                if (secretClass) {
                    util::logger::critical("RecognizerEngine: secret detector '" + detector->Name()
                                           + "' failed, aborting scan: " + ex.what());
                    throw core::SecretScanError("secret detector '" + detector->Name() + "' failed: " + ex.what());
                }
                std::string warning = "detector '" + detector->Name() + "' failed: " + ex.what();
                util::logger::warn("RecognizerEngine: quality issue, " + warning);
                result.warnings.push_back(warning);
                continue;
            }

            for (const auto &span : found) {
                if (span.end > text.size() || span.start >= span.end) {
                    continue;
                }
                if (secretsOnly && span.type != core::EntityType::Secret) {
                    continue;
                }
                if (span.type == core::EntityType::Secret) {
                    // a neighbouring token must not shield a credential
                    for (const auto &piece : outsideProtected(protectedRegions, span)) {
                        candidates.push_back(piece);
                    }
                    continue;
                }
                if (insideProtected(protectedRegions, span)) {
                    continue;
                }
                candidates.push_back(span);
            }
        }

        result.spans = ResolveOverlaps(std::move(candidates));
        return result;
    }

    static bool insideProtected(const std::vector<std::pair<size_t, size_t>> &regions,
                                const core::EntitySpan &span)
    {
        for (const auto &r : regions) {
            if (span.Overlaps(r.first, r.second)) {
                return true;
            }
        }
        return false;
    }

    /**
     * The parts of span not covered by any protected region, in order.
     */
    static std::vector<core::EntitySpan> outsideProtected(std::vector<std::pair<size_t, size_t>> regions,
                                                          const core::EntitySpan &span)
    {
        std::sort(regions.begin(), regions.end());
        std::vector<core::EntitySpan> pieces;
        size_t cursor = span.start;
        for (const auto &r : regions) {
            if (r.second <= cursor || r.first >= span.end) {
                continue;
            }
            if (r.first > cursor) {
                core::EntitySpan piece = span;
                piece.start = cursor;
                piece.end = r.first;
                pieces.push_back(piece);
            }
            cursor = std::max(cursor, r.second);
        }
        if (cursor < span.end) {
            core::EntitySpan piece = span;
            piece.start = cursor;
            pieces.push_back(piece);
        }
        return pieces;
    }

    static bool overlapsTaken(const std::map<size_t, size_t> &taken, size_t start, size_t end)
    {
        // first interval starting at or after start
        auto it = taken.lower_bound(start);
        if (it != taken.end() && it->first < end) {
            return true;
        }
        if (it != taken.begin()) {
            --it;
            if (it->second > start) {
                return true;
            }
        }
        return false;
    }

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<Detector>> m_detectors;
};

} // namespace recognizer
} // namespace triageguard

#endif // TRIAGEGUARD_RECOGNIZER_RECOGNIZER_ENGINE_HPP
