#ifndef PRIVGATE_CLASSIFICATION_LEXICON_HPP
#define PRIVGATE_CLASSIFICATION_LEXICON_HPP

#include <string>
#include <vector>
#include <map>
#include <cctype>
#include "privacy/types.hpp"

/**
 * @file lexicon.hpp
 * @brief Fixed per-category term lists for the lexicon-based content classifier.
 *
 * Terms are lower case ASCII and matched case-insensitively on word boundaries.
 * Multi-word terms match a single space between words. A term's weight is its
 * contribution to the category score per occurrence.
 */

namespace privgate {
namespace classification {

struct LexiconTerm
{
    std::string term;
    double weight;
};

using Lexicon = std::map<privacy::ContentCategory, std::vector<LexiconTerm>>;

inline const Lexicon& defaultLexicon()
{
    using privacy::ContentCategory;
    static const Lexicon lexicon = {
        {ContentCategory::Toxicity, {
            {"hate you", 0.5}, {"shut up", 0.4}, {"disgusting", 0.35}, {"trash", 0.3},
            {"garbage", 0.3}, {"stupid", 0.3}, {"idiot", 0.35}, {"screw you", 0.5},
            {"nobody likes you", 0.5}, {"get lost", 0.3},
        }},
        {ContentCategory::SevereToxicity, {
            {"kill yourself", 0.8}, {"kys", 0.7}, {"die in a fire", 0.8}, {"go die", 0.6},
            {"hope you die", 0.7}, {"should be dead", 0.6},
        }},
        {ContentCategory::Obscene, {
            {"fuck", 0.6}, {"fucking", 0.6}, {"shit", 0.45}, {"bitch", 0.5},
            {"asshole", 0.6}, {"bastard", 0.5}, {"crap", 0.3}, {"dick", 0.4},
        }},
        {ContentCategory::Threat, {
            {"kill you", 0.6}, {"kill", 0.4}, {"hurt you", 0.5}, {"destroy you", 0.5},
            {"going to die", 0.5}, {"murder", 0.5}, {"shoot", 0.4}, {"beat you", 0.4},
            {"find where you live", 0.6}, {"stab", 0.45},
        }},
        {ContentCategory::Insult, {
            {"idiot", 0.5}, {"stupid", 0.4}, {"moron", 0.5}, {"loser", 0.4},
            {"dumb", 0.35}, {"pathetic", 0.35}, {"worthless", 0.4}, {"fool", 0.3},
            {"ugly", 0.3}, {"imbecile", 0.5},
        }},
        {ContentCategory::IdentityAttack, {
            {"subhuman", 0.6}, {"vermin", 0.4}, {"inferior race", 0.7},
            {"go back to your country", 0.6}, {"your kind", 0.35}, {"those people", 0.25},
        }},
        {ContentCategory::SexualExplicit, {
            {"porn", 0.5}, {"nude", 0.4}, {"naked", 0.35}, {"sex", 0.35}, {"xxx", 0.5},
            {"orgasm", 0.5}, {"explicit", 0.2},
        }},
        {ContentCategory::Profanity, {
            {"fuck", 0.6}, {"fucking", 0.6}, {"shit", 0.5}, {"damn", 0.35}, {"hell", 0.2},
            {"crap", 0.35}, {"bastard", 0.5}, {"piss", 0.4}, {"bloody", 0.25},
        }},
        {ContentCategory::HateSpeech, {
            {"hate all", 0.5}, {"exterminate", 0.6}, {"inferior", 0.35}, {"subhuman", 0.5},
            {"ethnic cleansing", 0.8}, {"should be wiped out", 0.7}, {"don't deserve rights", 0.6},
        }},
    };
    return lexicon;
}

inline bool isWordChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '\'';
}

/**
 * @brief Byte offsets of every whole-word occurrence of term in lowered.
 *        `lowered` must already be ASCII-lowercased.
 */
inline std::vector<privacy::Span> findTerm(const std::string &lowered, const std::string &term)
{
    std::vector<privacy::Span> spans;
    if (term.empty()) {
        return spans;
    }
    size_t pos = lowered.find(term);
    while (pos != std::string::npos) {
        const size_t end = pos + term.size();
        const bool leftOk = pos == 0 || !isWordChar(lowered[pos - 1]);
        const bool rightOk = end == lowered.size() || !isWordChar(lowered[end]);
        if (leftOk && rightOk) {
            spans.push_back({pos, end});
        }
        pos = lowered.find(term, pos + 1);
    }
    return spans;
}

/// Number of whitespace-separated words.
inline size_t wordCount(const std::string &text)
{
    size_t count = 0;
    bool inWord = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inWord = false;
        }
        else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

} // namespace classification
} // namespace privgate

#endif // PRIVGATE_CLASSIFICATION_LEXICON_HPP
