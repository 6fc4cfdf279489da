#ifndef PRIVGATE_AUDIT_AUDIT_ENTRY_HPP
#define PRIVGATE_AUDIT_AUDIT_ENTRY_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include "util/text_utils.hpp"

/**
 * @file audit_entry.hpp
 * @brief AuditEntry value type and its one-line JSON encoding.
 *
 * Line format (field order fixed):
 *   {"timestamp":"2026-01-31T12:00:00.123Z","operation":"validate","piiCount":1,
 *    "violationCategories":["toxicity"],"passed":false,"contextId":null}
 */

namespace privgate {
namespace audit {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class AuditOperation {
    Detect,
    Anonymize,
    Filter,
    Validate
};

constexpr AuditOperation kAllAuditOperations[] = {
    AuditOperation::Detect, AuditOperation::Anonymize,
    AuditOperation::Filter, AuditOperation::Validate
};

inline const char* auditOperationName(AuditOperation op)
{
    switch (op) {
        case AuditOperation::Detect:    return "detect";
        case AuditOperation::Anonymize: return "anonymize";
        case AuditOperation::Filter:    return "filter";
        case AuditOperation::Validate:  return "validate";
    }
    return "unknown";
}

inline bool tryParseAuditOperation(const std::string &name, AuditOperation &out)
{
    for (AuditOperation op : kAllAuditOperations) {
        if (name == auditOperationName(op)) {
            out = op;
            return true;
        }
    }
    return false;
}

struct AuditEntry
{
    Timestamp timestamp;
    AuditOperation operation = AuditOperation::Validate;
    size_t piiCount = 0;
    std::vector<std::string> violationCategories;
    std::optional<bool> passed;
    std::optional<std::string> contextId;
};

// ----------------------------------------------------------------------------
//  Timestamps
// ----------------------------------------------------------------------------

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian date.
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace detail

/**
 * @brief ISO-8601 UTC with millisecond precision, e.g. "2026-01-31T12:00:00.123Z".
 */
inline std::string formatTimestamp(Timestamp ts)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch());
    int64_t millis = ms.count() % 1000;
    int64_t seconds = ms.count() / 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tmUtc{};
    gmtime_r(&t, &tmUtc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
                  tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(millis));
    return buf;
}

/**
 * @throw std::invalid_argument if text is not in the formatTimestamp() layout.
 */
inline Timestamp parseTimestamp(const std::string &text)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    char tail = 0;
    if (text.size() != 24
        || std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c",
                       &year, &month, &day, &hour, &minute, &second, &millis, &tail) != 8
        || tail != 'Z' || month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("bad audit timestamp '" + text + "'");
    }
    const int64_t days = detail::daysFromCivil(year, static_cast<unsigned>(month),
                                               static_cast<unsigned>(day));
    const int64_t totalMs = ((days * 24 + hour) * 60 + minute) * 60000LL
                          + second * 1000LL + millis;
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(totalMs)));
}

/**
 * @brief Truncate to the millisecond precision the persisted format carries.
 */
inline Timestamp truncateToMillis(Timestamp ts)
{
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch())));
}

// ----------------------------------------------------------------------------
//  JSON line encoding
// ----------------------------------------------------------------------------

inline std::string jsonEscape(const std::string &s)
{
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    oss << buf;
                }
                else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

inline std::string toJsonLine(const AuditEntry &entry)
{
    std::ostringstream oss;
    oss << "{\"timestamp\":\"" << formatTimestamp(entry.timestamp) << "\""
        << ",\"operation\":\"" << auditOperationName(entry.operation) << "\""
        << ",\"piiCount\":" << entry.piiCount
        << ",\"violationCategories\":[";
    for (size_t i = 0; i < entry.violationCategories.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << jsonEscape(entry.violationCategories[i]) << "\"";
    }
    oss << "],\"passed\":";
    if (entry.passed) {
        oss << (*entry.passed ? "true" : "false");
    }
    else {
        oss << "null";
    }
    oss << ",\"contextId\":";
    if (entry.contextId) {
        oss << "\"" << jsonEscape(*entry.contextId) << "\"";
    }
    else {
        oss << "null";
    }
    oss << "}";
    return oss.str();
}

namespace detail {

/**
 * @brief Cursor over one audit line. Understands exactly the value shapes
 *        toJsonLine() emits: strings, unsigned integers, booleans, null and
 *        arrays of strings.
 */
class LineReader
{
public:
    explicit LineReader(const std::string &line) : s_(line), pos_(0) {}

    void expect(char c)
    {
        skipSpace();
        if (pos_ >= s_.size() || s_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool consumeIf(char c)
    {
        skipSpace();
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeLiteral(const char *word)
    {
        skipSpace();
        const std::string w(word);
        if (s_.compare(pos_, w.size(), w) == 0) {
            pos_ += w.size();
            return true;
        }
        return false;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (pos_ < s_.size() && s_[pos_] != '"') {
            char c = s_[pos_++];
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) fail("dangling escape");
            char e = s_[pos_++];
            switch (e) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    if (pos_ + 4 > s_.size()) fail("short \\u escape");
                    unsigned v = 0;
                    for (size_t i = 0; i < 4; ++i) {
                        const char h = s_[pos_ + i];
                        int digit = 0;
                        if (h >= '0' && h <= '9') digit = h - '0';
                        else if (h >= 'a' && h <= 'f') digit = h - 'a' + 10;
                        else if (h >= 'A' && h <= 'F') digit = h - 'A' + 10;
                        else fail("bad hex digit in \\u escape");
                        v = v * 16 + static_cast<unsigned>(digit);
                    }
                    pos_ += 4;
                    if (v >= 0x80) fail("non-ASCII \\u escape");
                    out.push_back(static_cast<char>(v));
                    break;
                }
                default:
                    fail("unknown escape");
            }
        }
        if (pos_ >= s_.size()) fail("unterminated string");
        ++pos_;
        return out;
    }

    size_t readUnsigned()
    {
        skipSpace();
        size_t begin = pos_;
        while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
        if (begin == pos_) fail("expected number");
        try {
            return static_cast<size_t>(std::stoull(s_.substr(begin, pos_ - begin)));
        }
        catch (const std::out_of_range &) {
            fail("number out of range");
        }
    }

    bool atEnd()
    {
        skipSpace();
        return pos_ >= s_.size();
    }

    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::invalid_argument("audit line parse error at offset "
                                    + std::to_string(pos_) + ": " + what);
    }

private:
    void skipSpace()
    {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\r')) ++pos_;
    }

    const std::string &s_;
    size_t pos_;
};

} // namespace detail

/**
 * @brief Decode one line written by toJsonLine(). Unknown keys are rejected.
 * @throw std::invalid_argument on malformed input.
 */
inline AuditEntry parseJsonLine(const std::string &line)
{
    detail::LineReader in(line);
    AuditEntry entry;
    bool sawTimestamp = false;
    bool sawOperation = false;

    in.expect('{');
    if (!in.consumeIf('}')) {
        do {
            const std::string key = in.readString();
            in.expect(':');
            if (key == "timestamp") {
                entry.timestamp = parseTimestamp(in.readString());
                sawTimestamp = true;
            }
            else if (key == "operation") {
                const std::string name = in.readString();
                if (!tryParseAuditOperation(name, entry.operation)) {
                    in.fail("unknown operation '" + name + "'");
                }
                sawOperation = true;
            }
            else if (key == "piiCount") {
                entry.piiCount = in.readUnsigned();
            }
            else if (key == "violationCategories") {
                in.expect('[');
                if (!in.consumeIf(']')) {
                    do {
                        entry.violationCategories.push_back(in.readString());
                    } while (in.consumeIf(','));
                    in.expect(']');
                }
            }
            else if (key == "passed") {
                if (in.consumeLiteral("true")) entry.passed = true;
                else if (in.consumeLiteral("false")) entry.passed = false;
                else if (in.consumeLiteral("null")) entry.passed.reset();
                else in.fail("expected true, false or null");
            }
            else if (key == "contextId") {
                if (in.consumeLiteral("null")) entry.contextId.reset();
                else entry.contextId = in.readString();
            }
            else {
                in.fail("unknown key '" + key + "'");
            }
        } while (in.consumeIf(','));
        in.expect('}');
    }
    if (!in.atEnd()) {
        in.fail("trailing characters");
    }
    if (!sawTimestamp || !sawOperation) {
        in.fail("timestamp and operation are required");
    }
    return entry;
}

} // namespace audit
} // namespace privgate

#endif // PRIVGATE_AUDIT_AUDIT_ENTRY_HPP
