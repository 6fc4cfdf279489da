#ifndef PRIVGATE_AUDIT_AUDIT_LEDGER_HPP
#define PRIVGATE_AUDIT_AUDIT_LEDGER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include "audit/audit_entry.hpp"
#include "audit/audit_store.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

/**
 * @file audit_ledger.hpp
 * @brief Append-only, time-ordered record of detect/anonymize/filter/validate operations.
 *
 * DESIGN:
 *   - append() is the only mutation. Entries are never edited or removed.
 *   - Appends are serialized by a mutex; the in-memory order is the call order and the
 *     backing store sees the same order.
 *   - Timestamps are stored at millisecond precision and clamped so they never decrease,
 *     even if the wall clock steps backwards.
 *   - A store failure keeps the in-memory entry and surfaces as util::AuditWriteError.
 *
 * USAGE:
 *   @code
 *   privgate::audit::AuditLedger ledger(
 *       std::make_unique<privgate::audit::JsonlAuditStore>("audit.jsonl"));
 *   ledger.record(privgate::audit::AuditOperation::Validate, 2, {"toxicity"}, false, "req-17");
 *   auto s = ledger.summary();
 *   @endcode
 */

namespace privgate {
namespace audit {

struct AuditSummary
{
    size_t totalEntries = 0;
    std::map<AuditOperation, size_t> countsByOperation;
    std::map<std::string, size_t> violationCounts;
    size_t passedCount = 0;
    size_t failedCount = 0;
    std::optional<Timestamp> firstTimestamp;
    std::optional<Timestamp> lastTimestamp;
};

/**
 * @brief Conjunctive filter for AuditLedger::entries(). Empty fields match everything.
 *        The time window is inclusive at both ends.
 */
struct AuditQuery
{
    std::optional<AuditOperation> operation;
    std::optional<Timestamp> since;
    std::optional<Timestamp> until;
    std::optional<std::string> contextId;

    bool matches(const AuditEntry &e) const
    {
        if (operation && e.operation != *operation) return false;
        if (since && e.timestamp < *since) return false;
        if (until && e.timestamp > *until) return false;
        if (contextId && e.contextId != contextId) return false;
        return true;
    }
};

class AuditLedger
{
public:
    /// In-memory ledger with no backing store.
    AuditLedger() = default;

    /**
     * @brief Ledger backed by store. Entries already in the store are loaded so
     *        summaries cover the persisted history.
     */
    explicit AuditLedger(std::unique_ptr<AuditStore> store)
        : store_(std::move(store))
    {
        if (store_) {
            entries_ = store_->loadAll();
            util::logger::info("AuditLedger: " + store_->describe() + " holds "
                               + std::to_string(entries_.size()) + " prior entries.");
        }
    }

    AuditLedger(const AuditLedger&) = delete;
    AuditLedger& operator=(const AuditLedger&) = delete;

    /**
     * @brief Append an entry. Returns the entry as stored (timestamp clamped).
     * @throw util::AuditWriteError if the backing store rejected it. The entry is
     *        kept in memory either way.
     */
    AuditEntry append(AuditEntry entry)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.timestamp = truncateToMillis(entry.timestamp);
        if (!entries_.empty() && entry.timestamp < entries_.back().timestamp) {
            entry.timestamp = entries_.back().timestamp;
        }
        entries_.push_back(entry);
        if (store_) {
            store_->append(entry);
        }
        return entry;
    }

    /**
     * @brief Stamp "now" and append.
     * @throw util::AuditWriteError as append().
     */
    AuditEntry record(AuditOperation operation,
                      size_t piiCount,
                      std::vector<std::string> violationCategories,
                      std::optional<bool> passed,
                      std::optional<std::string> contextId)
    {
        AuditEntry entry;
        entry.timestamp = Clock::now();
        entry.operation = operation;
        entry.piiCount = piiCount;
        entry.violationCategories = std::move(violationCategories);
        entry.passed = passed;
        entry.contextId = std::move(contextId);
        return append(std::move(entry));
    }

    /**
     * @brief record() for callers with no result object to carry a warning on.
     * @return the write-failure message, or nullopt when the store accepted the entry.
     */
    std::optional<std::string> recordBestEffort(AuditOperation operation,
                                                size_t piiCount,
                                                std::vector<std::string> violationCategories,
                                                std::optional<bool> passed,
                                                std::optional<std::string> contextId)
    {
        try {
            record(operation, piiCount, std::move(violationCategories), passed, std::move(contextId));
        }
        catch (const util::AuditWriteError &ex) {
            util::logger::error(std::string("AuditLedger: ") + ex.what());
            return std::string(ex.what());
        }
        return std::nullopt;
    }

    AuditSummary summary() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        AuditSummary s;
        s.totalEntries = entries_.size();
        for (const auto &e : entries_) {
            ++s.countsByOperation[e.operation];
            for (const auto &category : e.violationCategories) {
                ++s.violationCounts[category];
            }
            if (e.passed) {
                if (*e.passed) ++s.passedCount;
                else ++s.failedCount;
            }
        }
        if (!entries_.empty()) {
            s.firstTimestamp = entries_.front().timestamp;
            s.lastTimestamp = entries_.back().timestamp;
        }
        return s;
    }

    std::vector<AuditEntry> entries(const AuditQuery &query = AuditQuery()) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AuditEntry> out;
        for (const auto &e : entries_) {
            if (query.matches(e)) {
                out.push_back(e);
            }
        }
        return out;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void flush()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (store_) {
            store_->flush();
        }
    }

    std::string describe() const
    {
        return store_ ? store_->describe() : std::string("memory");
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditEntry> entries_;
    std::unique_ptr<AuditStore> store_;
};

} // namespace audit
} // namespace privgate

#endif // PRIVGATE_AUDIT_AUDIT_LEDGER_HPP
