#ifndef PRIVGATE_VALIDATION_PRIVACY_VALIDATOR_HPP
#define PRIVGATE_VALIDATION_PRIVACY_VALIDATOR_HPP

#include <string>
#include <vector>
#include <set>
#include <map>
#include <algorithm>
#include <array>
#include <optional>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include "anonymization/anonymizer.hpp"
#include "audit/audit_ledger.hpp"
#include "filter/content_filter.hpp"
#include "privacy/types.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"

/**
 * @file privacy_validator.hpp
 * @brief Combines entity detection and content filtering into a pass/fail verdict
 *        under a compliance level.
 *
 * POLICY (one row per level, see kLevelPolicies):
 *
 *   level   detect  filter  PII fails  content fails  forced audit
 *   none    no      no      no         no             no
 *   low     yes     no      no         no             no
 *   medium  yes     yes     no         yes            no
 *   high    yes     yes     yes        yes            yes
 *   strict  yes     yes     yes        yes            yes
 *
 * Every column is non-decreasing down the table, so a text rejected at one level is
 * rejected at every stricter level.
 *
 * The validator never writes Detect/Filter entries of its own: one validate() call
 * appends exactly one Validate entry (when auditing is on or the level forces it).
 */

namespace privgate {
namespace validation {

struct LevelPolicy
{
    bool detect;
    bool filter;
    bool piiFails;
    bool contentFails;
    bool forcedAudit;
};

constexpr std::array<LevelPolicy, 5> kLevelPolicies = {{
    //  detect filter piiFails contentFails forcedAudit
    {   false, false, false,   false,       false },  // None
    {   true,  false, false,   false,       false },  // Low
    {   true,  true,  false,   true,        false },  // Medium
    {   true,  true,  true,    true,        true  },  // High
    {   true,  true,  true,    true,        true  },  // Strict
}};

constexpr const LevelPolicy& policyFor(privacy::PrivacyLevel level)
{
    return kLevelPolicies[static_cast<size_t>(level)];
}

/// A category scoring at least this share of its threshold earns a near-miss notice.
constexpr double kNearMissRatio = 0.8;

struct ValidationResult
{
    bool passed = true;
    privacy::PrivacyLevel level = privacy::PrivacyLevel::None;
    bool piiDetected = false;
    size_t piiCount = 0;
    std::vector<privacy::PIIEntity> entities;
    std::vector<privacy::ContentCategory> contentViolations;
    std::map<privacy::ContentCategory, double> contentScores;
    std::vector<std::string> recommendations;
    std::optional<std::string> auditWarning;
};

class PrivacyValidator
{
public:
    explicit PrivacyValidator(audit::AuditLedger *ledger = nullptr,
                              privacy::PrivacyLevel defaultLevel = privacy::PrivacyLevel::Medium)
        : ledger_(ledger)
        , level_(defaultLevel)
        , auditEnabled_(true)
        , pool_(nullptr)
    {
    }

    void setLevel(privacy::PrivacyLevel level) { level_ = level; }
    privacy::PrivacyLevel level() const { return level_; }

    /// High and Strict audit regardless of this flag.
    void setAuditEnabled(bool enabled) { auditEnabled_ = enabled; }
    bool auditEnabled() const { return auditEnabled_; }

    void setAuditLedger(audit::AuditLedger *ledger) { ledger_ = ledger; }
    void setWorkerPool(util::WorkerPool *pool) { pool_ = pool; }

    /**
     * @brief Validate text at the given level.
     * @throw std::invalid_argument if the level needs a component that is null.
     * @throw util::DetectionError / util::ClassificationError on malformed input.
     */
    ValidationResult validate(const std::string &text,
                              privacy::PrivacyLevel level,
                              const anonymization::Anonymizer *anonymizer,
                              const filter::ContentFilter *contentFilter,
                              const std::optional<std::string> &contextId = std::nullopt) const
    {
        const LevelPolicy &policy = policyFor(level);
        ValidationResult result;
        result.level = level;

        if (policy.detect) {
            if (!anonymizer) {
                throw std::invalid_argument(std::string("PrivacyValidator: level '")
                    + privacy::privacyLevelName(level) + "' requires an anonymizer");
            }
            result.entities = anonymizer->detector().detect(text, anonymizer->config());
            result.piiCount = result.entities.size();
            result.piiDetected = result.piiCount > 0;
        }

        if (policy.filter) {
            if (!contentFilter) {
                throw std::invalid_argument(std::string("PrivacyValidator: level '")
                    + privacy::privacyLevelName(level) + "' requires a content filter");
            }
            filter::FilterResult filtered = contentFilter->evaluate(text);
            result.contentViolations = filtered.violations;
            result.contentScores = filtered.scores;
        }

        result.passed = true;
        if (policy.piiFails && result.piiDetected) {
            result.passed = false;
        }
        if (policy.contentFails && !result.contentViolations.empty()) {
            result.passed = false;
        }

        buildRecommendations(result, contentFilter);
        writeAudit(result, policy, contextId);
        return result;
    }

    /// validate() at the validator's default level.
    ValidationResult validate(const std::string &text,
                              const anonymization::Anonymizer *anonymizer,
                              const filter::ContentFilter *contentFilter,
                              const std::optional<std::string> &contextId = std::nullopt) const
    {
        return validate(text, level_, anonymizer, contentFilter, contextId);
    }

    std::vector<ValidationResult> validateBatch(const std::vector<std::string> &texts,
                                                privacy::PrivacyLevel level,
                                                const anonymization::Anonymizer *anonymizer,
                                                const filter::ContentFilter *contentFilter) const
    {
        auto one = [this, level, anonymizer, contentFilter](const std::string &t) {
            return validate(t, level, anonymizer, contentFilter);
        };
        if (pool_ && texts.size() > 1) {
            return pool_->mapOrdered(texts, one);
        }
        std::vector<ValidationResult> out;
        out.reserve(texts.size());
        for (const auto &t : texts) {
            out.push_back(one(t));
        }
        return out;
    }

    std::vector<ValidationResult> validateBatch(const std::vector<std::string> &texts,
                                                const anonymization::Anonymizer *anonymizer,
                                                const filter::ContentFilter *contentFilter) const
    {
        return validateBatch(texts, level_, anonymizer, contentFilter);
    }

private:
    static std::string formatScore(double v)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << v;
        return oss.str();
    }

    static void buildRecommendations(ValidationResult &result, const filter::ContentFilter *contentFilter)
    {
        if (result.piiDetected) {
            std::set<std::string> kinds;
            for (const auto &e : result.entities) {
                kinds.insert(privacy::entityKindName(e.type));
            }
            std::string joined;
            for (const auto &k : kinds) {
                if (!joined.empty()) joined += ", ";
                joined += k;
            }
            result.recommendations.push_back("Detected " + std::to_string(result.piiCount)
                + " sensitive entit" + (result.piiCount == 1 ? "y" : "ies") + " (" + joined
                + "); anonymize the text before use.");
        }

        for (privacy::ContentCategory c : result.contentViolations) {
            if (c == privacy::ContentCategory::CustomBlocklist) {
                result.recommendations.push_back("Text contains blocklisted terms; remove them.");
                continue;
            }
            std::string line = std::string("Content violates '") + privacy::contentCategoryName(c) + "'";
            if (contentFilter) {
                line += " (score " + formatScore(result.contentScores[c]) + " >= threshold "
                      + formatScore(contentFilter->config().thresholdFor(c)) + ")";
            }
            result.recommendations.push_back(line + "; revise or filter the text.");
        }

        if (contentFilter) {
            for (privacy::ContentCategory c : contentFilter->config().categories) {
                auto it = result.contentScores.find(c);
                if (it == result.contentScores.end() || it->second <= 0.0) continue;
                const double threshold = contentFilter->config().thresholdFor(c);
                const bool violated = std::find(result.contentViolations.begin(),
                                                result.contentViolations.end(), c)
                                      != result.contentViolations.end();
                if (!violated && it->second >= kNearMissRatio * threshold) {
                    result.recommendations.push_back(std::string("Content is close to the '")
                        + privacy::contentCategoryName(c) + "' threshold (score "
                        + formatScore(it->second) + " of " + formatScore(threshold) + ").");
                }
            }
        }

        if (!result.passed && result.recommendations.empty()) {
            result.recommendations.push_back(std::string("Review the text against the '")
                + privacy::privacyLevelName(result.level) + "' compliance policy.");
        }
    }

    void writeAudit(ValidationResult &result, const LevelPolicy &policy,
                    const std::optional<std::string> &contextId) const
    {
        if (!auditEnabled_ && !policy.forcedAudit) {
            return;
        }
        if (!ledger_) {
            if (policy.forcedAudit) {
                result.auditWarning = std::string("level '") + privacy::privacyLevelName(result.level)
                                    + "' requires an audit entry but no audit ledger is attached";
                util::logger::warn("PrivacyValidator: " + *result.auditWarning);
            }
            return;
        }
        std::vector<std::string> names;
        for (auto c : result.contentViolations) {
            names.push_back(privacy::contentCategoryName(c));
        }
        result.auditWarning = ledger_->recordBestEffort(audit::AuditOperation::Validate,
                                                        result.piiCount, std::move(names),
                                                        result.passed, contextId);
    }

    audit::AuditLedger *ledger_;
    privacy::PrivacyLevel level_;
    bool auditEnabled_;
    util::WorkerPool *pool_;
};

} // namespace validation
} // namespace privgate

#endif // PRIVGATE_VALIDATION_PRIVACY_VALIDATOR_HPP
