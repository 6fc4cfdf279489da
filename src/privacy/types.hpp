#ifndef PRIVGATE_PRIVACY_TYPES_HPP
#define PRIVGATE_PRIVACY_TYPES_HPP

#include <string>
#include <vector>
#include <set>
#include <array>
#include <cstddef>
#include <ostream>
#include "util/errors.hpp"
#include "util/text_utils.hpp"

/**
 * @file types.hpp
 * @brief Core value types shared across detection, filtering and validation.
 */

namespace privgate {
namespace privacy {

// ----------------------------------------------------------------------------
//  Entity kinds
// ----------------------------------------------------------------------------

enum class EntityKind {
    EmailAddress,
    PhoneNumber,
    CreditCard,
    UsSsn,
    Person,
    Location,
    DateTime,
    UsPassport,
    UsDriverLicense,
    IpAddress,
    IbanCode,
    MedicalLicense,
    Crypto
};

constexpr std::array<EntityKind, 13> kAllEntityKinds = {
    EntityKind::EmailAddress, EntityKind::PhoneNumber, EntityKind::CreditCard,
    EntityKind::UsSsn, EntityKind::Person, EntityKind::Location,
    EntityKind::DateTime, EntityKind::UsPassport, EntityKind::UsDriverLicense,
    EntityKind::IpAddress, EntityKind::IbanCode, EntityKind::MedicalLicense,
    EntityKind::Crypto
};

inline const char* entityKindName(EntityKind kind)
{
    switch (kind) {
        case EntityKind::EmailAddress:    return "EMAIL_ADDRESS";
        case EntityKind::PhoneNumber:     return "PHONE_NUMBER";
        case EntityKind::CreditCard:      return "CREDIT_CARD";
        case EntityKind::UsSsn:           return "US_SSN";
        case EntityKind::Person:          return "PERSON";
        case EntityKind::Location:        return "LOCATION";
        case EntityKind::DateTime:        return "DATE_TIME";
        case EntityKind::UsPassport:      return "US_PASSPORT";
        case EntityKind::UsDriverLicense: return "US_DRIVER_LICENSE";
        case EntityKind::IpAddress:       return "IP_ADDRESS";
        case EntityKind::IbanCode:        return "IBAN_CODE";
        case EntityKind::MedicalLicense:  return "MEDICAL_LICENSE";
        case EntityKind::Crypto:          return "CRYPTO";
    }
    return "UNKNOWN";
}

/**
 * @brief Look up a kind by its canonical name. Returns false for unknown names.
 */
inline bool tryParseEntityKind(const std::string &name, EntityKind &out)
{
    for (EntityKind kind : kAllEntityKinds) {
        if (name == entityKindName(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

/**
 * @throw util::ConfigurationError for unknown names.
 */
inline EntityKind parseEntityKind(const std::string &name)
{
    EntityKind kind;
    if (!tryParseEntityKind(name, kind)) {
        throw util::ConfigurationError("unknown entity kind '" + name + "'");
    }
    return kind;
}

inline std::set<EntityKind> allEntityKinds()
{
    return std::set<EntityKind>(kAllEntityKinds.begin(), kAllEntityKinds.end());
}

inline std::ostream& operator<<(std::ostream &os, EntityKind kind)
{
    return os << entityKindName(kind);
}

// ----------------------------------------------------------------------------
//  Content categories
// ----------------------------------------------------------------------------

enum class ContentCategory {
    Toxicity,
    SevereToxicity,
    Obscene,
    Threat,
    Insult,
    IdentityAttack,
    SexualExplicit,
    Profanity,
    HateSpeech,
    CustomBlocklist  ///< raised only by FilterConfig::customBlocklist hits
};

/// Categories a classifier scores. CustomBlocklist is filter-internal and never scored.
constexpr std::array<ContentCategory, 9> kScoredCategories = {
    ContentCategory::Toxicity, ContentCategory::SevereToxicity, ContentCategory::Obscene,
    ContentCategory::Threat, ContentCategory::Insult, ContentCategory::IdentityAttack,
    ContentCategory::SexualExplicit, ContentCategory::Profanity, ContentCategory::HateSpeech
};

inline const char* contentCategoryName(ContentCategory category)
{
    switch (category) {
        case ContentCategory::Toxicity:        return "toxicity";
        case ContentCategory::SevereToxicity:  return "severe_toxicity";
        case ContentCategory::Obscene:         return "obscene";
        case ContentCategory::Threat:          return "threat";
        case ContentCategory::Insult:          return "insult";
        case ContentCategory::IdentityAttack:  return "identity_attack";
        case ContentCategory::SexualExplicit:  return "sexual_explicit";
        case ContentCategory::Profanity:       return "profanity";
        case ContentCategory::HateSpeech:      return "hate_speech";
        case ContentCategory::CustomBlocklist: return "custom_blocklist";
    }
    return "unknown";
}

/**
 * @brief Case-insensitive lookup of a category name. Returns false for unknown names.
 */
inline bool tryParseContentCategory(const std::string &name, ContentCategory &out)
{
    const std::string lower = util::text::toLowerAscii(name);
    for (ContentCategory category : kScoredCategories) {
        if (lower == contentCategoryName(category)) {
            out = category;
            return true;
        }
    }
    if (lower == contentCategoryName(ContentCategory::CustomBlocklist)) {
        out = ContentCategory::CustomBlocklist;
        return true;
    }
    return false;
}

/**
 * @throw util::ConfigurationError for unknown names.
 */
inline ContentCategory parseContentCategory(const std::string &name)
{
    ContentCategory category;
    if (!tryParseContentCategory(name, category)) {
        throw util::ConfigurationError("unknown content category '" + name + "'");
    }
    return category;
}

inline std::ostream& operator<<(std::ostream &os, ContentCategory category)
{
    return os << contentCategoryName(category);
}

// ----------------------------------------------------------------------------
//  Compliance levels
// ----------------------------------------------------------------------------

/**
 * @brief Totally ordered strictness setting. A higher level never accepts an input
 *        that a lower level rejects.
 */
enum class PrivacyLevel {
    None = 0,
    Low,
    Medium,
    High,
    Strict
};

constexpr std::array<PrivacyLevel, 5> kAllPrivacyLevels = {
    PrivacyLevel::None, PrivacyLevel::Low, PrivacyLevel::Medium,
    PrivacyLevel::High, PrivacyLevel::Strict
};

inline const char* privacyLevelName(PrivacyLevel level)
{
    switch (level) {
        case PrivacyLevel::None:   return "none";
        case PrivacyLevel::Low:    return "low";
        case PrivacyLevel::Medium: return "medium";
        case PrivacyLevel::High:   return "high";
        case PrivacyLevel::Strict: return "strict";
    }
    return "unknown";
}

/**
 * @throw util::ConfigurationError for unknown names.
 */
inline PrivacyLevel parsePrivacyLevel(const std::string &name)
{
    const std::string lower = util::text::toLowerAscii(name);
    for (PrivacyLevel level : kAllPrivacyLevels) {
        if (lower == privacyLevelName(level)) {
            return level;
        }
    }
    throw util::ConfigurationError("unknown privacy level '" + name + "'");
}

inline std::ostream& operator<<(std::ostream &os, PrivacyLevel level)
{
    return os << privacyLevelName(level);
}

// ----------------------------------------------------------------------------
//  Detection results
// ----------------------------------------------------------------------------

/**
 * @brief One detected sensitive-entity occurrence. Offsets are byte offsets into
 *        the UTF-8 input, half-open [start, end).
 */
struct PIIEntity
{
    EntityKind type = EntityKind::EmailAddress;
    size_t start = 0;
    size_t end = 0;
    std::string matchedText;
    double confidence = 0.0;

    size_t length() const { return end - start; }

    bool overlaps(const PIIEntity &other) const
    {
        return start < other.end && other.start < end;
    }
};

/**
 * @brief A [start, end) byte range in text flagged by a content lexicon.
 */
struct Span
{
    size_t start = 0;
    size_t end = 0;
};

} // namespace privacy
} // namespace privgate

#endif // PRIVGATE_PRIVACY_TYPES_HPP
