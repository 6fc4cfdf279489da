#ifndef PRIVGATE_FILTER_CONTENT_FILTER_HPP
#define PRIVGATE_FILTER_CONTENT_FILTER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include "audit/audit_ledger.hpp"
#include "classification/content_classifier.hpp"
#include "privacy/policy_config.hpp"
#include "privacy/types.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"
#include "util/worker_pool.hpp"

/**
 * @file content_filter.hpp
 * @brief Applies a FilterAction to text based on classifier scores and per-category thresholds.
 *
 * Violations are the configured categories whose score reaches its threshold, in
 * category order, followed by custom_blocklist when a blocklist term occurs anywhere in
 * the text (case-insensitive substring).
 *
 * ACTIONS:
 *   - Allow:  passed, text unchanged, violations still reported.
 *   - Flag:   passed iff no violations, text unchanged.
 *   - Redact: violating spans become "[FILTERED]". When the classifier cannot give spans
 *             for a violating category the whole text becomes "[CONTENT FILTERED]".
 *             Always passed.
 *   - Reject: any violation gives passed=false and empty text.
 */

namespace privgate {
namespace filter {

constexpr const char* kFilteredSpanToken = "[FILTERED]";
constexpr const char* kFilteredTextToken = "[CONTENT FILTERED]";

struct FilterResult
{
    bool passed = true;
    std::string text;
    std::vector<privacy::ContentCategory> violations;
    std::map<privacy::ContentCategory, double> scores;
    privacy::FilterAction actionTaken = privacy::FilterAction::Allow;

    std::vector<std::string> violationNames() const
    {
        std::vector<std::string> names;
        for (auto c : violations) {
            names.push_back(privacy::contentCategoryName(c));
        }
        return names;
    }
};

class ContentFilter
{
public:
    /**
     * @throw util::ConfigurationError if the config does not normalize.
     */
    ContentFilter(std::shared_ptr<const classification::ContentClassifier> classifier,
                  privacy::FilterConfig config)
        : classifier_(std::move(classifier))
        , config_(std::move(config))
        , ledger_(nullptr)
        , pool_(nullptr)
    {
        if (!classifier_) {
            throw std::invalid_argument("ContentFilter: classifier must not be null");
        }
        config_.normalize();
        for (const auto &term : config_.customBlocklist) {
            const std::string lowered = util::text::toLowerAscii(util::text::trim(term));
            if (!lowered.empty()) {
                blocklist_.push_back(lowered);
            }
        }
    }

    const privacy::FilterConfig& config() const { return config_; }
    const classification::ContentClassifier& classifier() const { return *classifier_; }

    void setAuditLedger(audit::AuditLedger *ledger) { ledger_ = ledger; }
    void setWorkerPool(util::WorkerPool *pool) { pool_ = pool; }

    /**
     * @brief Score and apply the action without writing an audit entry.
     * @throw util::ClassificationError on malformed input.
     */
    FilterResult evaluate(const std::string &text) const
    {
        FilterResult result;
        result.text = text;
        if (!config_.enabled) {
            result.actionTaken = privacy::FilterAction::Allow;
            return result;
        }

        const classification::ClassificationResult scored = classifier_->score(text);
        for (privacy::ContentCategory c : privacy::kScoredCategories) {
            const double s = scored.scoreFor(c);
            result.scores[c] = s;
            if (config_.categories.count(c) != 0 && s >= config_.thresholdFor(c)) {
                result.violations.push_back(c);
            }
        }

        const std::vector<privacy::Span> blockHits = findBlocklistHits(text);
        if (!blockHits.empty()) {
            result.violations.push_back(privacy::ContentCategory::CustomBlocklist);
            result.scores[privacy::ContentCategory::CustomBlocklist] = 1.0;
        }

        applyAction(result, scored, blockHits);
        return result;
    }

    /**
     * @brief evaluate() plus a Filter audit entry when a ledger is attached.
     */
    FilterResult filter(const std::string &text,
                        const std::optional<std::string> &contextId = std::nullopt) const
    {
        FilterResult result = evaluate(text);
        if (ledger_) {
            ledger_->recordBestEffort(audit::AuditOperation::Filter, 0, result.violationNames(),
                                      result.passed, contextId);
        }
        return result;
    }

    std::vector<FilterResult> filterBatch(const std::vector<std::string> &texts) const
    {
        if (pool_ && texts.size() > 1) {
            return pool_->mapOrdered(texts, [this](const std::string &t) { return filter(t); });
        }
        std::vector<FilterResult> out;
        out.reserve(texts.size());
        for (const auto &t : texts) {
            out.push_back(filter(t));
        }
        return out;
    }

private:
    std::vector<privacy::Span> findBlocklistHits(const std::string &text) const
    {
        std::vector<privacy::Span> hits;
        if (blocklist_.empty()) {
            return hits;
        }
        const std::string lowered = util::text::toLowerAscii(text);
        for (const auto &term : blocklist_) {
            for (size_t pos = lowered.find(term); pos != std::string::npos;
                 pos = lowered.find(term, pos + 1)) {
                hits.push_back({pos, pos + term.size()});
            }
        }
        return hits;
    }

    void applyAction(FilterResult &result,
                     const classification::ClassificationResult &scored,
                     const std::vector<privacy::Span> &blockHits) const
    {
        result.actionTaken = config_.action;
        const bool violated = !result.violations.empty();

        switch (config_.action) {
            case privacy::FilterAction::Allow:
                result.passed = true;
                break;
            case privacy::FilterAction::Flag:
                result.passed = !violated;
                break;
            case privacy::FilterAction::Reject:
                result.passed = !violated;
                if (violated) {
                    result.text.clear();
                }
                break;
            case privacy::FilterAction::Redact:
                result.passed = true;
                if (violated) {
                    result.text = redact(result.text, result.violations, scored, blockHits);
                }
                break;
        }
    }

    static std::string redact(const std::string &text,
                              const std::vector<privacy::ContentCategory> &violations,
                              const classification::ClassificationResult &scored,
                              const std::vector<privacy::Span> &blockHits)
    {
        std::vector<privacy::Span> spans;
        for (privacy::ContentCategory c : violations) {
            if (c == privacy::ContentCategory::CustomBlocklist) {
                spans.insert(spans.end(), blockHits.begin(), blockHits.end());
                continue;
            }
            auto it = scored.spans.find(c);
            if (!scored.spansAvailable || it == scored.spans.end() || it->second.empty()) {
                return kFilteredTextToken;
            }
            spans.insert(spans.end(), it->second.begin(), it->second.end());
        }
        if (spans.empty()) {
            return kFilteredTextToken;
        }

        // Merge overlapping spans, then rewrite right to left.
        std::sort(spans.begin(), spans.end(),
            [](const privacy::Span &a, const privacy::Span &b) { return a.start < b.start; });
        std::vector<privacy::Span> merged;
        for (const auto &s : spans) {
            if (!merged.empty() && s.start < merged.back().end) {
                merged.back().end = std::max(merged.back().end, s.end);
            }
            else {
                merged.push_back(s);
            }
        }

        std::string out = text;
        for (auto it = merged.rbegin(); it != merged.rend(); ++it) {
            out.replace(it->start, it->end - it->start, kFilteredSpanToken);
        }
        return out;
    }

    std::shared_ptr<const classification::ContentClassifier> classifier_;
    privacy::FilterConfig config_;
    std::vector<std::string> blocklist_;
    audit::AuditLedger *ledger_;
    util::WorkerPool *pool_;
};

} // namespace filter
} // namespace privgate

#endif // PRIVGATE_FILTER_CONTENT_FILTER_HPP
