#ifndef PRIVGATE_ANONYMIZATION_ANONYMIZER_HPP
#define PRIVGATE_ANONYMIZATION_ANONYMIZER_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <stdexcept>
#include "audit/audit_ledger.hpp"
#include "detection/entity_detector.hpp"
#include "privacy/policy_config.hpp"
#include "privacy/types.hpp"
#include "util/crypto.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"
#include "util/worker_pool.hpp"

/**
 * @file anonymizer.hpp
 * @brief Rewrites detected entity spans according to the configured method.
 *
 * METHODS (applied per entity, right to left so earlier offsets stay valid):
 *   - Mask:    every code point becomes maskChar except separators (@ . - ( ) / : and
 *              whitespace). "john@example.com" -> "****@*******.***".
 *   - Redact:  span -> "[REDACTED]".
 *   - Replace: span -> "<KIND>", e.g. "<EMAIL_ADDRESS>".
 *   - Hash:    span -> lowercase hex SHA-256 of the span. Stable across calls.
 *   - Encrypt: span -> base64(IV || AES-CBC(key, span)). Fresh IV per span.
 *
 * A text with no detected entities is returned unchanged for every method.
 *
 * USAGE:
 *   @code
 *   privgate::privacy::AnonymizationConfig cfg;
 *   cfg.method = privgate::privacy::AnonymizationMethod::Replace;
 *   privgate::anonymization::Anonymizer anonymizer(detector, cfg);
 *   std::string safe = anonymizer.anonymize("Email: a@b.com");   // "Email: <EMAIL_ADDRESS>"
 *   @endcode
 */

namespace privgate {
namespace anonymization {

constexpr const char* kRedactedToken = "[REDACTED]";

class Anonymizer
{
public:
    /**
     * @throw util::ConfigurationError if config cannot run (see AnonymizationConfig::validate).
     */
    Anonymizer(std::shared_ptr<const detection::EntityDetector> detector,
               privacy::AnonymizationConfig config)
        : detector_(std::move(detector))
        , config_(std::move(config))
        , ledger_(nullptr)
        , pool_(nullptr)
    {
        if (!detector_) {
            throw std::invalid_argument("Anonymizer: detector must not be null");
        }
        config_.validate();
    }

    const privacy::AnonymizationConfig& config() const { return config_; }
    const detection::EntityDetector& detector() const { return *detector_; }

    /// Record Detect/Anonymize operations into this ledger. Null disables auditing.
    void setAuditLedger(audit::AuditLedger *ledger) { ledger_ = ledger; }

    /// Run anonymizeBatch on this pool. Null runs batches on the calling thread.
    void setWorkerPool(util::WorkerPool *pool) { pool_ = pool; }

    /**
     * @brief Entity detection under this anonymizer's allowlist and threshold.
     */
    std::vector<privacy::PIIEntity> detectPII(const std::string &text,
                                              const std::optional<std::string> &contextId = std::nullopt) const
    {
        auto entities = detector_->detect(text, config_);
        if (ledger_) {
            ledger_->recordBestEffort(audit::AuditOperation::Detect, entities.size(), {},
                                      std::nullopt, contextId);
        }
        return entities;
    }

    bool containsPII(const std::string &text) const
    {
        return !detector_->detect(text, config_).empty();
    }

    std::string anonymize(const std::string &text,
                          const std::optional<std::string> &contextId = std::nullopt) const
    {
        if (!config_.enabled) {
            return text;
        }
        const auto entities = detector_->detect(text, config_);
        std::string result = applyTo(text, entities);
        if (ledger_) {
            ledger_->recordBestEffort(audit::AuditOperation::Anonymize, entities.size(), {},
                                      std::nullopt, contextId);
        }
        return result;
    }

    /**
     * @brief Output has the same length and order as the input; items are independent.
     */
    std::vector<std::string> anonymizeBatch(const std::vector<std::string> &texts) const
    {
        if (pool_ && texts.size() > 1) {
            return pool_->mapOrdered(texts, [this](const std::string &t) { return anonymize(t); });
        }
        std::vector<std::string> out;
        out.reserve(texts.size());
        for (const auto &t : texts) {
            out.push_back(anonymize(t));
        }
        return out;
    }

    /**
     * @brief Rewrite the given entity spans of text. Entities must be sorted and disjoint,
     *        as detect() returns them.
     * @throw std::invalid_argument if a span lies outside text or entities overlap.
     */
    std::string applyTo(const std::string &text, const std::vector<privacy::PIIEntity> &entities) const
    {
        std::string result = text;
        size_t previousStart = text.size();
        for (auto it = entities.rbegin(); it != entities.rend(); ++it) {
            if (it->start >= it->end || it->end > previousStart) {
                throw std::invalid_argument("Anonymizer::applyTo: entity spans must be sorted, "
                                            "disjoint and inside the text");
            }
            const std::string original = text.substr(it->start, it->end - it->start);
            result.replace(it->start, it->end - it->start, replacementFor(*it, original));
            previousStart = it->start;
        }
        return result;
    }

private:
    std::string replacementFor(const privacy::PIIEntity &entity, const std::string &original) const
    {
        switch (config_.method) {
            case privacy::AnonymizationMethod::Mask:
                return mask(original);
            case privacy::AnonymizationMethod::Redact:
                return kRedactedToken;
            case privacy::AnonymizationMethod::Replace:
                return std::string("<") + privacy::entityKindName(entity.type) + ">";
            case privacy::AnonymizationMethod::Hash:
                return util::hashing::sha256Hex(original);
            case privacy::AnonymizationMethod::Encrypt:
                return util::crypto::encryptToken(original, *config_.encryptionKey);
        }
        return original;
    }

    static bool isSeparator(char c)
    {
        switch (c) {
            case '@': case '.': case '-': case '(': case ')': case '/': case ':':
            case ' ': case '\t': case '\n': case '\r':
                return true;
            default:
                return false;
        }
    }

    // One mask character per code point.
    std::string mask(const std::string &original) const
    {
        std::string out;
        out.reserve(original.size());
        for (char c : original) {
            if (util::text::isContinuationByte(c)) {
                continue;
            }
            out.push_back(isSeparator(c) ? c : config_.maskChar);
        }
        return out;
    }

    std::shared_ptr<const detection::EntityDetector> detector_;
    privacy::AnonymizationConfig config_;
    audit::AuditLedger *ledger_;
    util::WorkerPool *pool_;
};

} // namespace anonymization
} // namespace privgate

#endif // PRIVGATE_ANONYMIZATION_ANONYMIZER_HPP
