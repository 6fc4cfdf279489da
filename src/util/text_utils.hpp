#ifndef PRIVGATE_UTIL_TEXT_UTILS_HPP
#define PRIVGATE_UTIL_TEXT_UTILS_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

/**
 * @file text_utils.hpp
 * @brief UTF-8 validation and small string helpers shared by detection and classification.
 */

namespace privgate {
namespace util {
namespace text {

/**
 * @brief Returns true when s is well-formed UTF-8 with no embedded NUL bytes.
 *        Overlong encodings, surrogates and code points above U+10FFFF are rejected.
 */
inline bool isWellFormedText(const std::string &s)
{
    const auto *p = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        if (c == 0x00) {
            return false;
        }
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t extra = 0;
        unsigned long cp = 0;
        if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else { return false; }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = p[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

/**
 * @brief True for UTF-8 continuation bytes (10xxxxxx).
 */
inline bool isContinuationByte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/**
 * @brief Number of code points in a well-formed UTF-8 string.
 */
inline size_t codePointCount(const std::string &s)
{
    return static_cast<size_t>(std::count_if(s.begin(), s.end(),
        [](char c) { return !isContinuationByte(c); }));
}

/**
 * @brief ASCII lowercase copy. Non-ASCII bytes are left untouched so offsets stay aligned.
 */
inline std::string toLowerAscii(const std::string &s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(c < 0x80 ? std::tolower(c) : c);
    });
    return out;
}

inline std::string trim(const std::string &s)
{
    static const char *whitespace = " \t\r\n";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

/**
 * @brief Split on a delimiter, trimming each piece and dropping empty ones.
 */
inline std::vector<std::string> splitList(const std::string &s, char delim = ',')
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            pos = s.size();
        }
        std::string piece = trim(s.substr(start, pos - start));
        if (!piece.empty()) {
            out.push_back(piece);
        }
        start = pos + 1;
    }
    return out;
}

inline bool isBlank(const std::string &s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace text
} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_TEXT_UTILS_HPP
