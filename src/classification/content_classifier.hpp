#ifndef PRIVGATE_CLASSIFICATION_CONTENT_CLASSIFIER_HPP
#define PRIVGATE_CLASSIFICATION_CONTENT_CLASSIFIER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <algorithm>
#include <stdexcept>
#include "backend/backend_probe.hpp"
#include "classification/lexicon.hpp"
#include "privacy/types.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file content_classifier.hpp
 * @brief Harmful-content scoring with an ML-backed and a lexicon-based variant.
 *
 * DESIGN:
 *   - ContentClassifier::score() returns a score in [0, 1] per category.
 *   - LexiconContentClassifier matches defaultLexicon() terms. A category scores
 *     min(1, sum of matched term weights + 0.5 * matched terms / words). Overlapping
 *     matches inside one category keep the longest term. Toxicity also absorbs
 *     0.9 * the strongest other category, since every harmful category is toxic.
 *     Matched spans are reported so the filter can redact them.
 *   - MlContentClassifier forwards to a ContentClassificationBackend. Whole-text scores
 *     only; spansAvailable is false. BackendUnavailableError during a call falls back to
 *     the lexicon variant for that call.
 */

namespace privgate {
namespace classification {

/// Weight of the match-density term in a lexicon score.
constexpr double kDensityWeight = 0.5;
/// Share of the strongest other category that toxicity inherits.
constexpr double kToxicityPropagation = 0.9;

struct ClassificationResult
{
    std::map<privacy::ContentCategory, double> scores;
    std::map<privacy::ContentCategory, std::vector<privacy::Span>> spans;
    bool spansAvailable = false;

    /// Missing categories score 0.
    double scoreFor(privacy::ContentCategory category) const
    {
        auto it = scores.find(category);
        return it != scores.end() ? it->second : 0.0;
    }
};

/**
 * @class ContentClassifier
 * @brief Abstract scorer. Implementations are immutable and thread-safe.
 */
class ContentClassifier
{
public:
    virtual ~ContentClassifier() = default;

    /**
     * @throw util::ClassificationError if text is not well-formed UTF-8 or contains NUL bytes.
     */
    ClassificationResult score(const std::string &text) const
    {
        if (!util::text::isWellFormedText(text)) {
            throw util::ClassificationError("input is not well-formed UTF-8 text ("
                                            + std::to_string(text.size()) + " bytes)");
        }
        if (util::text::isBlank(text)) {
            ClassificationResult empty;
            empty.spansAvailable = true;
            for (privacy::ContentCategory c : privacy::kScoredCategories) {
                empty.scores[c] = 0.0;
            }
            return empty;
        }
        return scoreImpl(text);
    }

    virtual std::string variantName() const = 0;

protected:
    virtual ClassificationResult scoreImpl(const std::string &text) const = 0;
};

class LexiconContentClassifier : public ContentClassifier
{
public:
    LexiconContentClassifier()
        : lexicon_(defaultLexicon())
    {
    }

    explicit LexiconContentClassifier(Lexicon lexicon)
        : lexicon_(std::move(lexicon))
    {
    }

    std::string variantName() const override { return "lexicon"; }

protected:
    ClassificationResult scoreImpl(const std::string &text) const override
    {
        const std::string lowered = util::text::toLowerAscii(text);
        const double words = static_cast<double>(std::max<size_t>(1, wordCount(text)));

        ClassificationResult result;
        result.spansAvailable = true;

        for (privacy::ContentCategory category : privacy::kScoredCategories) {
            double weight = 0.0;
            std::vector<privacy::Span> accepted;
            auto it = lexicon_.find(category);
            if (it != lexicon_.end()) {
                acceptMatches(lowered, it->second, weight, accepted);
            }
            double s = 0.0;
            if (!accepted.empty()) {
                s = std::min(1.0, weight + kDensityWeight * static_cast<double>(accepted.size()) / words);
            }
            result.scores[category] = s;
            result.spans[category] = std::move(accepted);
        }

        propagateToxicity(result);
        return result;
    }

private:
    // Longest terms claim their bytes first; shorter overlapping terms are ignored.
    static void acceptMatches(const std::string &lowered,
                              const std::vector<LexiconTerm> &terms,
                              double &weight,
                              std::vector<privacy::Span> &accepted)
    {
        std::vector<const LexiconTerm*> ordered;
        for (const auto &t : terms) {
            ordered.push_back(&t);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const LexiconTerm *a, const LexiconTerm *b) { return a->term.size() > b->term.size(); });

        for (const LexiconTerm *t : ordered) {
            for (const privacy::Span &span : findTerm(lowered, t->term)) {
                bool clash = std::any_of(accepted.begin(), accepted.end(),
                    [&span](const privacy::Span &a) { return a.start < span.end && span.start < a.end; });
                if (!clash) {
                    accepted.push_back(span);
                    weight += t->weight;
                }
            }
        }
        std::sort(accepted.begin(), accepted.end(),
            [](const privacy::Span &a, const privacy::Span &b) { return a.start < b.start; });
    }

    static void propagateToxicity(ClassificationResult &result)
    {
        using privacy::ContentCategory;
        double strongest = 0.0;
        std::vector<privacy::Span> inherited;
        for (ContentCategory c : privacy::kScoredCategories) {
            if (c == ContentCategory::Toxicity) continue;
            strongest = std::max(strongest, result.scores[c]);
            if (result.scores[c] > 0.0) {
                const auto &s = result.spans[c];
                inherited.insert(inherited.end(), s.begin(), s.end());
            }
        }
        double &toxicity = result.scores[ContentCategory::Toxicity];
        toxicity = std::max(toxicity, kToxicityPropagation * strongest);

        auto &spans = result.spans[ContentCategory::Toxicity];
        spans.insert(spans.end(), inherited.begin(), inherited.end());
        std::sort(spans.begin(), spans.end(),
            [](const privacy::Span &a, const privacy::Span &b) {
                return a.start != b.start ? a.start < b.start : a.end < b.end;
            });
    }

    Lexicon lexicon_;
};

/**
 * @class MlContentClassifier
 * @brief Adapts a ContentClassificationBackend to the ContentClassifier contract.
 */
class MlContentClassifier : public ContentClassifier
{
public:
    explicit MlContentClassifier(std::shared_ptr<const backend::ContentClassificationBackend> backend)
        : backend_(std::move(backend))
    {
        if (!backend_) {
            throw std::invalid_argument("MlContentClassifier: backend must not be null");
        }
    }

    std::string variantName() const override { return "ml:" + backend_->name(); }

protected:
    ClassificationResult scoreImpl(const std::string &text) const override
    {
        std::map<std::string, double> raw;
        try {
            raw = backend_->classify(text);
        }
        catch (const util::BackendUnavailableError &ex) {
            util::logger::warn("MlContentClassifier: degraded mode, backend '" + backend_->name()
                               + "' unavailable (" + ex.what() + "), using lexicon classifier.");
            return fallback_.score(text);
        }

        ClassificationResult result;
        result.spansAvailable = false;
        for (const auto &kv : raw) {
            privacy::ContentCategory category;
            if (!privacy::tryParseContentCategory(kv.first, category)
                || category == privacy::ContentCategory::CustomBlocklist) {
                util::logger::debug("MlContentClassifier: skipping unknown category '" + kv.first + "'");
                continue;
            }
            result.scores[category] = std::min(1.0, std::max(0.0, kv.second));
        }
        return result;
    }

private:
    std::shared_ptr<const backend::ContentClassificationBackend> backend_;
    LexiconContentClassifier fallback_;
};

/**
 * @brief Choose the classifier variant for a probed handle. Called once at startup.
 */
inline std::shared_ptr<const ContentClassifier> makeContentClassifier(const backend::BackendHandle &handle)
{
    if (handle.hasClassifier()) {
        return std::make_shared<MlContentClassifier>(handle.classifier());
    }
    return std::make_shared<LexiconContentClassifier>();
}

} // namespace classification
} // namespace privgate

#endif // PRIVGATE_CLASSIFICATION_CONTENT_CLASSIFIER_HPP
