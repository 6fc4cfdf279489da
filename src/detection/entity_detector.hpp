#ifndef PRIVGATE_DETECTION_ENTITY_DETECTOR_HPP
#define PRIVGATE_DETECTION_ENTITY_DETECTOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <regex>
#include <algorithm>
#include <stdexcept>
#include "backend/backend_probe.hpp"
#include "detection/pattern_table.hpp"
#include "privacy/policy_config.hpp"
#include "privacy/types.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file entity_detector.hpp
 * @brief Sensitive-entity detection with two interchangeable variants.
 *
 * DESIGN:
 *   - EntityDetector is the abstract seam. detect() returns entities sorted by start,
 *     pairwise non-overlapping, above the configured scoreThreshold and restricted to
 *     the configured allowlist.
 *   - PatternEntityDetector runs the fixed structural table from pattern_table.hpp.
 *   - MlEntityDetector forwards to an EntityRecognitionBackend and post-processes its
 *     raw spans. If the backend throws BackendUnavailableError mid-flight, that call is
 *     answered by an embedded PatternEntityDetector and a degraded-mode warning is logged.
 *   - makeEntityDetector() selects the variant once from a BackendHandle.
 *
 * USAGE:
 *   @code
 *   auto detector = privgate::detection::makeEntityDetector(handle);
 *   privgate::privacy::AnonymizationConfig cfg;
 *   auto entities = detector->detect("Contact John Smith at john@example.com", cfg);
 *   @endcode
 */

namespace privgate {
namespace detection {

/**
 * @brief Overlap resolution: among overlapping candidates keep the longer span, then the
 *        higher confidence, then the earlier start. Output is sorted by start.
 */
inline std::vector<privacy::PIIEntity> resolveOverlaps(std::vector<privacy::PIIEntity> candidates)
{
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const privacy::PIIEntity &a, const privacy::PIIEntity &b) {
            if (a.length() != b.length()) return a.length() > b.length();
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            return a.start < b.start;
        });

    std::vector<privacy::PIIEntity> kept;
    for (auto &candidate : candidates) {
        bool clash = std::any_of(kept.begin(), kept.end(),
            [&candidate](const privacy::PIIEntity &k) { return k.overlaps(candidate); });
        if (!clash) {
            kept.push_back(std::move(candidate));
        }
    }

    std::sort(kept.begin(), kept.end(),
        [](const privacy::PIIEntity &a, const privacy::PIIEntity &b) { return a.start < b.start; });
    return kept;
}

/**
 * @brief Drop candidates below threshold or outside the allowlist, then resolve overlaps.
 */
inline std::vector<privacy::PIIEntity> finalizeCandidates(std::vector<privacy::PIIEntity> candidates,
                                                          const privacy::AnonymizationConfig &config)
{
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
        [&config](const privacy::PIIEntity &e) {
            return e.confidence < config.scoreThreshold
                || config.entityAllowlist.count(e.type) == 0;
        }), candidates.end());
    return resolveOverlaps(std::move(candidates));
}

/**
 * @class EntityDetector
 * @brief Abstract detector. Implementations are immutable after construction and may be
 *        shared across threads.
 */
class EntityDetector
{
public:
    virtual ~EntityDetector() = default;

    /**
     * @throw util::DetectionError if text is not well-formed UTF-8 or contains NUL bytes.
     */
    std::vector<privacy::PIIEntity> detect(const std::string &text,
                                           const privacy::AnonymizationConfig &config) const
    {
        if (!util::text::isWellFormedText(text)) {
            throw util::DetectionError("input is not well-formed UTF-8 text ("
                                       + std::to_string(text.size()) + " bytes)");
        }
        if (text.empty()) {
            return {};
        }
        return detectImpl(text, config);
    }

    virtual std::string variantName() const = 0;

protected:
    virtual std::vector<privacy::PIIEntity> detectImpl(const std::string &text,
                                                       const privacy::AnonymizationConfig &config) const = 0;
};

/**
 * @class PatternEntityDetector
 * @brief Regex/shape based fallback detector.
 */
class PatternEntityDetector : public EntityDetector
{
public:
    std::string variantName() const override { return "pattern"; }

protected:
    std::vector<privacy::PIIEntity> detectImpl(const std::string &text,
                                               const privacy::AnonymizationConfig &config) const override
    {
        std::vector<privacy::PIIEntity> candidates;

        for (const PatternRule &rule : patternTable()) {
            if (config.entityAllowlist.count(rule.kind) == 0) {
                continue;
            }
            for (auto it = std::sregex_iterator(text.begin(), text.end(), rule.pattern);
                 it != std::sregex_iterator(); ++it) {
                std::string value = it->str();
                if (rule.accept && !rule.accept(value)) {
                    continue;
                }
                privacy::PIIEntity entity;
                entity.type = rule.kind;
                entity.start = static_cast<size_t>(it->position());
                entity.end = entity.start + static_cast<size_t>(it->length());
                entity.matchedText = std::move(value);
                entity.confidence = rule.confidence;
                candidates.push_back(std::move(entity));
            }
        }

        if (config.entityAllowlist.count(privacy::EntityKind::Person) != 0) {
            appendNameRuns(text, candidates);
        }

        return finalizeCandidates(std::move(candidates), config);
    }

private:
    // Capitalized runs like "John Smith", trimmed of stopwords at both ends.
    static void appendNameRuns(const std::string &text, std::vector<privacy::PIIEntity> &out)
    {
        const auto &stop = nameStopwords();
        for (auto it = std::sregex_iterator(text.begin(), text.end(), nameRunPattern());
             it != std::sregex_iterator(); ++it) {
            const size_t runStart = static_cast<size_t>(it->position());
            const std::string run = it->str();

            struct Word { size_t start; size_t end; };
            std::vector<Word> words;
            size_t i = 0;
            while (i < run.size()) {
                while (i < run.size() && (run[i] == ' ' || run[i] == '\t')) ++i;
                size_t j = i;
                while (j < run.size() && run[j] != ' ' && run[j] != '\t') ++j;
                if (j > i) words.push_back({i, j});
                i = j;
            }

            size_t first = 0;
            size_t last = words.size();
            while (first < last && stop.count(run.substr(words[first].start,
                                               words[first].end - words[first].start)) != 0) {
                ++first;
            }
            while (last > first && stop.count(run.substr(words[last - 1].start,
                                               words[last - 1].end - words[last - 1].start)) != 0) {
                --last;
            }
            if (last - first < 2) {
                continue;
            }

            privacy::PIIEntity entity;
            entity.type = privacy::EntityKind::Person;
            entity.start = runStart + words[first].start;
            entity.end = runStart + words[last - 1].end;
            entity.matchedText = text.substr(entity.start, entity.end - entity.start);
            entity.confidence = kNameRunConfidence;
            out.push_back(std::move(entity));
        }
    }
};

/**
 * @class MlEntityDetector
 * @brief Adapts an EntityRecognitionBackend to the EntityDetector contract.
 */
class MlEntityDetector : public EntityDetector
{
public:
    explicit MlEntityDetector(std::shared_ptr<const backend::EntityRecognitionBackend> recognizer)
        : recognizer_(std::move(recognizer))
    {
        if (!recognizer_) {
            throw std::invalid_argument("MlEntityDetector: recognizer must not be null");
        }
    }

    std::string variantName() const override { return "ml:" + recognizer_->name(); }

protected:
    std::vector<privacy::PIIEntity> detectImpl(const std::string &text,
                                               const privacy::AnonymizationConfig &config) const override
    {
        std::vector<backend::RecognizedSpan> raw;
        try {
            raw = recognizer_->recognize(text);
        }
        catch (const util::BackendUnavailableError &ex) {
            util::logger::warn("MlEntityDetector: degraded mode, backend '" + recognizer_->name()
                               + "' unavailable (" + ex.what() + "), using pattern detector.");
            return fallback_.detect(text, config);
        }

        std::vector<privacy::PIIEntity> candidates;
        candidates.reserve(raw.size());
        for (const auto &span : raw) {
            privacy::EntityKind kind;
            if (!privacy::tryParseEntityKind(span.kind, kind)) {
                util::logger::debug("MlEntityDetector: skipping unknown entity kind '" + span.kind + "'");
                continue;
            }
            if (span.start >= span.end || span.end > text.size()) {
                util::logger::debug("MlEntityDetector: dropping out-of-range span for " + span.kind);
                continue;
            }
            if (util::text::isContinuationByte(text[span.start])
                || (span.end < text.size() && util::text::isContinuationByte(text[span.end]))) {
                util::logger::debug("MlEntityDetector: dropping span that splits a character for " + span.kind);
                continue;
            }
            privacy::PIIEntity entity;
            entity.type = kind;
            entity.start = span.start;
            entity.end = span.end;
            entity.matchedText = text.substr(span.start, span.end - span.start);
            entity.confidence = std::min(1.0, std::max(0.0, span.confidence));
            candidates.push_back(std::move(entity));
        }
        return finalizeCandidates(std::move(candidates), config);
    }

private:
    std::shared_ptr<const backend::EntityRecognitionBackend> recognizer_;
    PatternEntityDetector fallback_;
};

/**
 * @brief Choose the detector variant for a probed handle. Called once at startup.
 */
inline std::shared_ptr<const EntityDetector> makeEntityDetector(const backend::BackendHandle &handle)
{
    if (handle.hasRecognizer()) {
        return std::make_shared<MlEntityDetector>(handle.recognizer());
    }
    return std::make_shared<PatternEntityDetector>();
}

} // namespace detection
} // namespace privgate

#endif // PRIVGATE_DETECTION_ENTITY_DETECTOR_HPP
