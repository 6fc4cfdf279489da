#ifndef PRIVGATE_DETECTION_PATTERN_TABLE_HPP
#define PRIVGATE_DETECTION_PATTERN_TABLE_HPP

#include <string>
#include <vector>
#include <regex>
#include <set>
#include <functional>
#include <cctype>
#include "privacy/types.hpp"

/**
 * @file pattern_table.hpp
 * @brief Fixed table of structural patterns used by the pattern-based entity detector.
 *
 * Each row pairs an EntityKind with a regex, a fixed confidence and an optional
 * checksum/shape validator (Luhn for cards, mod-97 for IBANs, octet range for IPv4).
 * Person names are not a plain regex: capitalized-word runs are trimmed of
 * sentence-start and structural words before being accepted.
 *
 * Passport, driver-license and medical-license numbers have no reliable shape and are
 * left to an ML recognition backend.
 */

namespace privgate {
namespace detection {

struct PatternRule
{
    privacy::EntityKind kind;
    std::regex pattern;
    double confidence;
    std::function<bool(const std::string&)> accept; ///< empty means accept every match
};

namespace checks {

inline std::string digitsOnly(const std::string &value)
{
    std::string out;
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

inline bool luhnValid(const std::string &value)
{
    const std::string digits = digitsOnly(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }
    int sum = 0;
    bool alternate = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int n = *it - '0';
        if (alternate) {
            n *= 2;
            if (n > 9) n -= 9;
        }
        sum += n;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

inline bool ibanValid(const std::string &value)
{
    std::string compact;
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }
    const std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int mod = 0;
    for (char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            mod = (mod * 10 + (c - '0')) % 97;
        }
        else if (std::isupper(static_cast<unsigned char>(c))) {
            int v = c - 'A' + 10;
            mod = (mod * 100 + v) % 97;
        }
        else {
            return false;
        }
    }
    return mod == 1;
}

inline bool ipv4Valid(const std::string &value)
{
    size_t start = 0;
    int parts = 0;
    while (start <= value.size()) {
        size_t dot = value.find('.', start);
        if (dot == std::string::npos) {
            dot = value.size();
        }
        const std::string octet = value.substr(start, dot - start);
        if (octet.empty() || octet.size() > 3 || std::stoi(octet) > 255) {
            return false;
        }
        ++parts;
        start = dot + 1;
    }
    return parts == 4;
}

inline bool ssnValid(const std::string &value)
{
    const std::string area = value.substr(0, 3);
    const std::string group = value.substr(4, 2);
    const std::string serial = value.substr(7, 4);
    return area != "000" && area != "666" && area[0] != '9'
        && group != "00" && serial != "0000";
}

} // namespace checks

/**
 * @brief The structural pattern table, built once and shared read-only.
 */
inline const std::vector<PatternRule>& patternTable()
{
    using privacy::EntityKind;
    static const std::vector<PatternRule> table = {
        {EntityKind::EmailAddress,
         std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"),
         0.95, nullptr},
        {EntityKind::CreditCard,
         std::regex(R"(\b(?:\d{4}[- ]?){3}\d{1,7}\b)"),
         0.9, checks::luhnValid},
        {EntityKind::UsSsn,
         std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"),
         0.85, checks::ssnValid},
        {EntityKind::PhoneNumber,
         std::regex(R"((?:\+1[-.\s]?)?(?:\(\d{3}\)\s?|\b\d{3}[-.\s]?)\d{3}[-.]?\d{4}\b)"),
         0.75, nullptr},
        {EntityKind::IpAddress,
         std::regex(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)"),
         0.8, checks::ipv4Valid},
        {EntityKind::IbanCode,
         std::regex(R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)"),
         0.85, checks::ibanValid},
        {EntityKind::Crypto,
         std::regex(R"(\b(?:bc1[a-z0-9]{25,39}|[13][a-km-zA-HJ-NP-Z1-9]{25,34})\b)"),
         0.7, nullptr},
        {EntityKind::DateTime,
         std::regex(R"(\b\d{4}-\d{2}-\d{2}(?:[T ]\d{2}:\d{2}(?::\d{2})?)?\b)"),
         0.7, nullptr},
        {EntityKind::DateTime,
         std::regex(R"(\b\d{1,2}/\d{1,2}/\d{2,4}\b)"),
         0.7, nullptr},
        {EntityKind::DateTime,
         std::regex(R"(\b(?:January|February|March|April|May|June|July|August|September|October|November|December)\s+\d{1,2}(?:st|nd|rd|th)?,?\s+\d{4}\b)"),
         0.7, nullptr},
        {EntityKind::Location,
         std::regex(R"(\b\d{1,5}\s+(?:[A-Z][a-z]+\s+){1,3}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Court|Ct|Way|Place|Pl)\b\.?)"),
         0.7, nullptr},
        {EntityKind::Person,
         std::regex(R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof)\.?\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+)?)"),
         0.85, nullptr},
    };
    return table;
}

/// Confidence assigned to bare capitalized-name runs (no honorific).
constexpr double kNameRunConfidence = 0.65;

/**
 * @brief Words that start sentences or name structure rather than people. A capitalized
 *        run is trimmed of these at both ends before being accepted as a PERSON.
 */
inline const std::set<std::string>& nameStopwords()
{
    static const std::set<std::string> words = {
        "A", "An", "The", "This", "That", "These", "Those", "I", "It", "We", "You", "He",
        "She", "They", "My", "Our", "Your", "His", "Her", "Their", "And", "Or", "But",
        "If", "When", "Where", "What", "Who", "Why", "How", "Hello", "Hi", "Hey", "Dear",
        "Please", "Thanks", "Thank", "Regards", "Best", "Sincerely", "Yours", "Contact",
        "Call", "Email", "Phone", "Text", "Meet", "Ask", "Tell", "Send", "From", "To",
        "At", "In", "On", "For", "With", "By", "Name", "Address", "Mr", "Mrs", "Ms",
        "Dr", "Prof", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
        "Saturday", "Sunday", "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December", "Street",
        "Avenue", "Road", "Lane", "Drive", "Boulevard", "Court", "Place", "Way"
    };
    return words;
}

inline const std::regex& nameRunPattern()
{
    static const std::regex pattern(R"(\b[A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+)+\b)");
    return pattern;
}

} // namespace detection
} // namespace privgate

#endif // PRIVGATE_DETECTION_PATTERN_TABLE_HPP
