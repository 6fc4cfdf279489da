#ifndef PRIVGATE_PRIVACY_POLICY_CONFIG_HPP
#define PRIVGATE_PRIVACY_POLICY_CONFIG_HPP

#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <cstdint>
#include "privacy/types.hpp"
#include "util/crypto.hpp"
#include "util/errors.hpp"

/**
 * @file policy_config.hpp
 * @brief Anonymization and content-filter configuration structs with their defaults tables.
 *
 * Anonymization defaults:
 *   enabled = true, method = Mask, entityAllowlist = every EntityKind,
 *   scoreThreshold = 0.6, maskChar = '*', encryptionKey = none
 *
 * Filter defaults (threshold / enabled by default):
 *   toxicity 0.7 yes, severe_toxicity 0.5 yes, obscene 0.7 yes, threat 0.5 yes,
 *   insult 0.7 yes, identity_attack 0.7 yes, sexual_explicit 0.8 no,
 *   profanity 0.7 no, hate_speech 0.6 no
 *   action = Flag, customBlocklist = {}
 */

namespace privgate {
namespace privacy {

// ----------------------------------------------------------------------------
//  Anonymization
// ----------------------------------------------------------------------------

enum class AnonymizationMethod {
    Mask,
    Redact,
    Replace,
    Hash,
    Encrypt
};

inline const char* anonymizationMethodName(AnonymizationMethod method)
{
    switch (method) {
        case AnonymizationMethod::Mask:    return "mask";
        case AnonymizationMethod::Redact:  return "redact";
        case AnonymizationMethod::Replace: return "replace";
        case AnonymizationMethod::Hash:    return "hash";
        case AnonymizationMethod::Encrypt: return "encrypt";
    }
    return "unknown";
}

/**
 * @throw util::ConfigurationError for unknown names.
 */
inline AnonymizationMethod parseAnonymizationMethod(const std::string &name)
{
    const std::string lower = util::text::toLowerAscii(name);
    for (AnonymizationMethod m : {AnonymizationMethod::Mask, AnonymizationMethod::Redact,
                                  AnonymizationMethod::Replace, AnonymizationMethod::Hash,
                                  AnonymizationMethod::Encrypt}) {
        if (lower == anonymizationMethodName(m)) {
            return m;
        }
    }
    throw util::ConfigurationError("unknown anonymization method '" + name + "'");
}

struct AnonymizationConfig
{
    bool enabled = true;
    AnonymizationMethod method = AnonymizationMethod::Mask;
    std::set<EntityKind> entityAllowlist = allEntityKinds();
    double scoreThreshold = 0.6;
    char maskChar = '*';
    std::optional<std::vector<uint8_t>> encryptionKey;

    /**
     * @brief Reject configurations that cannot run.
     * @throw util::ConfigurationError on a missing/odd-sized Encrypt key or a
     *        threshold outside [0, 1].
     */
    void validate() const
    {
        if (scoreThreshold < 0.0 || scoreThreshold > 1.0) {
            throw util::ConfigurationError("scoreThreshold must lie in [0, 1], got "
                                           + std::to_string(scoreThreshold));
        }
        if (method == AnonymizationMethod::Encrypt) {
            if (!encryptionKey || encryptionKey->empty()) {
                throw util::ConfigurationError("method 'encrypt' requires an encryptionKey");
            }
            if (!util::crypto::isValidKeySize(encryptionKey->size())) {
                throw util::ConfigurationError("encryptionKey must be 16, 24 or 32 bytes, got "
                                               + std::to_string(encryptionKey->size()));
            }
        }
    }
};

// ----------------------------------------------------------------------------
//  Content filtering
// ----------------------------------------------------------------------------

enum class FilterAction {
    Allow,
    Flag,
    Redact,
    Reject
};

inline const char* filterActionName(FilterAction action)
{
    switch (action) {
        case FilterAction::Allow:  return "allow";
        case FilterAction::Flag:   return "flag";
        case FilterAction::Redact: return "redact";
        case FilterAction::Reject: return "reject";
    }
    return "unknown";
}

/**
 * @throw util::ConfigurationError for unknown names.
 */
inline FilterAction parseFilterAction(const std::string &name)
{
    const std::string lower = util::text::toLowerAscii(name);
    for (FilterAction a : {FilterAction::Allow, FilterAction::Flag,
                           FilterAction::Redact, FilterAction::Reject}) {
        if (lower == filterActionName(a)) {
            return a;
        }
    }
    throw util::ConfigurationError("unknown filter action '" + name + "'");
}

constexpr double kFallbackThreshold = 0.7;

inline std::map<ContentCategory, double> defaultThresholds()
{
    return {
        {ContentCategory::Toxicity,       0.7},
        {ContentCategory::SevereToxicity, 0.5},
        {ContentCategory::Obscene,        0.7},
        {ContentCategory::Threat,         0.5},
        {ContentCategory::Insult,         0.7},
        {ContentCategory::IdentityAttack, 0.7},
        {ContentCategory::SexualExplicit, 0.8},
        {ContentCategory::Profanity,      0.7},
        {ContentCategory::HateSpeech,     0.6},
    };
}

inline std::set<ContentCategory> defaultCategories()
{
    return {
        ContentCategory::Toxicity,
        ContentCategory::SevereToxicity,
        ContentCategory::Obscene,
        ContentCategory::Threat,
        ContentCategory::Insult,
        ContentCategory::IdentityAttack,
    };
}

struct FilterConfig
{
    bool enabled = true;
    std::set<ContentCategory> categories = defaultCategories();
    std::map<ContentCategory, double> thresholds = defaultThresholds();
    FilterAction action = FilterAction::Flag;
    std::set<std::string> customBlocklist;

    /**
     * @brief Threshold for a category: configured value, else the defaults table, else 0.7.
     */
    double thresholdFor(ContentCategory category) const
    {
        auto it = thresholds.find(category);
        if (it != thresholds.end()) {
            return it->second;
        }
        static const std::map<ContentCategory, double> defaults = defaultThresholds();
        auto d = defaults.find(category);
        return d != defaults.end() ? d->second : kFallbackThreshold;
    }

    /**
     * @brief Give every selected category a threshold and check ranges.
     * @throw util::ConfigurationError on a threshold outside [0, 1] or a
     *        CustomBlocklist entry in `categories`.
     */
    void normalize()
    {
        if (categories.count(ContentCategory::CustomBlocklist) != 0) {
            throw util::ConfigurationError(
                "custom_blocklist is driven by the blocklist, not by filter categories");
        }
        for (ContentCategory c : categories) {
            if (thresholds.find(c) == thresholds.end()) {
                thresholds[c] = thresholdFor(c);
            }
        }
        for (const auto &kv : thresholds) {
            if (kv.second < 0.0 || kv.second > 1.0) {
                throw util::ConfigurationError(std::string("threshold for ")
                    + contentCategoryName(kv.first) + " must lie in [0, 1]");
            }
        }
    }
};

} // namespace privacy
} // namespace privgate

#endif // PRIVGATE_PRIVACY_POLICY_CONFIG_HPP
