#ifndef PRIVGATE_AUDIT_AUDIT_STORE_HPP
#define PRIVGATE_AUDIT_AUDIT_STORE_HPP

#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <sqlite3.h>
#include "audit/audit_entry.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file audit_store.hpp
 * @brief Durable backing stores for the AuditLedger.
 *
 * Both stores are insert-only: nothing here updates, truncates or deletes a record.
 * Callers serialize access (the ledger holds its mutex around every call).
 */

namespace privgate {
namespace audit {

/**
 * @class AuditStore
 * @brief Append-only persistence seam.
 */
class AuditStore
{
public:
    virtual ~AuditStore() = default;

    /**
     * @throw util::AuditWriteError if the entry could not be persisted.
     */
    virtual void append(const AuditEntry &entry) = 0;

    /// Entries already persisted, in write order.
    virtual std::vector<AuditEntry> loadAll() const = 0;

    virtual void flush() {}

    virtual std::string describe() const = 0;
};

/**
 * @class JsonlAuditStore
 * @brief One JSON object per line, file opened in append mode.
 */
class JsonlAuditStore : public AuditStore
{
public:
    explicit JsonlAuditStore(const std::string &path)
        : path_(path)
    {
        open();
    }

    void append(const AuditEntry &entry) override
    {
        if (!out_.is_open()) {
            open();
            if (!out_.is_open()) {
                throw util::AuditWriteError("cannot open audit log '" + path_ + "'");
            }
        }
        out_ << toJsonLine(entry) << '\n';
        out_.flush();
        if (!out_) {
            out_.close();
            throw util::AuditWriteError("write to audit log '" + path_ + "' failed");
        }
    }

    /**
     * @brief Read the log back. Lines that do not decode are logged and skipped.
     */
    std::vector<AuditEntry> loadAll() const override
    {
        std::vector<AuditEntry> entries;
        std::ifstream in(path_);
        if (!in.is_open()) {
            return entries;
        }
        std::string line;
        size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            if (util::text::isBlank(line)) {
                continue;
            }
            try {
                entries.push_back(parseJsonLine(line));
            }
            catch (const std::invalid_argument &ex) {
                util::logger::warn("JsonlAuditStore: skipping " + path_ + ":"
                                   + std::to_string(lineNumber) + " (" + ex.what() + ")");
            }
        }
        return entries;
    }

    void flush() override
    {
        if (out_.is_open()) {
            out_.flush();
        }
    }

    std::string describe() const override { return "jsonl:" + path_; }

    const std::string& path() const { return path_; }

private:
    void open()
    {
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            util::logger::error("JsonlAuditStore: cannot open '" + path_ + "' for append.");
        }
    }

    std::string path_;
    std::ofstream out_;
};

/**
 * @class SqliteAuditStore
 * @brief Mirrors audit entries into an SQLite table `audit_entries`.
 *
 * Schema:
 *   id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp TEXT, operation TEXT,
 *   pii_count INTEGER, violation_categories TEXT (comma separated),
 *   passed INTEGER NULL, context_id TEXT NULL
 */
class SqliteAuditStore : public AuditStore
{
public:
    explicit SqliteAuditStore(const std::string &dbPath)
        : dbPath_(dbPath)
        , db_(nullptr)
    {
        openDatabase();
    }

    ~SqliteAuditStore() override
    {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    SqliteAuditStore(const SqliteAuditStore&) = delete;
    SqliteAuditStore& operator=(const SqliteAuditStore&) = delete;

    void append(const AuditEntry &entry) override
    {
        if (!db_ && !openDatabase()) {
            throw util::AuditWriteError("cannot open audit database '" + dbPath_ + "'");
        }

        const char *sql = "INSERT INTO audit_entries "
                          "(timestamp, operation, pii_count, violation_categories, passed, context_id) "
                          "VALUES (?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            throw util::AuditWriteError("prepare failed: " + std::string(sqlite3_errmsg(db_)));
        }

        const std::string ts = formatTimestamp(entry.timestamp);
        std::string categories;
        for (size_t i = 0; i < entry.violationCategories.size(); ++i) {
            if (i > 0) categories += ",";
            categories += entry.violationCategories[i];
        }

        int rc = sqlite3_bind_text(stmt, 1, ts.c_str(), -1, SQLITE_TRANSIENT);
        if (rc == SQLITE_OK) {
            rc = sqlite3_bind_text(stmt, 2, auditOperationName(entry.operation), -1, SQLITE_STATIC);
        }
        if (rc == SQLITE_OK) {
            rc = sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(entry.piiCount));
        }
        if (rc == SQLITE_OK) {
            rc = sqlite3_bind_text(stmt, 4, categories.c_str(), -1, SQLITE_TRANSIENT);
        }
        if (rc == SQLITE_OK) {
            rc = entry.passed ? sqlite3_bind_int(stmt, 5, *entry.passed ? 1 : 0)
                              : sqlite3_bind_null(stmt, 5);
        }
        if (rc == SQLITE_OK) {
            rc = entry.contextId
                ? sqlite3_bind_text(stmt, 6, entry.contextId->c_str(), -1, SQLITE_TRANSIENT)
                : sqlite3_bind_null(stmt, 6);
        }
        if (rc == SQLITE_OK) {
            rc = sqlite3_step(stmt);
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw util::AuditWriteError("insert into audit_entries failed: "
                                        + std::string(sqlite3_errmsg(db_)));
        }
    }

    std::vector<AuditEntry> loadAll() const override
    {
        std::vector<AuditEntry> entries;
        if (!db_) {
            return entries;
        }
        const char *sql = "SELECT timestamp, operation, pii_count, violation_categories, passed, context_id "
                          "FROM audit_entries ORDER BY id ASC;";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            util::logger::error("SqliteAuditStore: cannot read audit_entries: "
                                + std::string(sqlite3_errmsg(db_)));
            return entries;
        }

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            AuditEntry entry;
            const std::string ts = columnText(stmt, 0);
            const std::string op = columnText(stmt, 1);
            try {
                entry.timestamp = parseTimestamp(ts);
            }
            catch (const std::invalid_argument &ex) {
                util::logger::warn(std::string("SqliteAuditStore: skipping row, ") + ex.what());
                continue;
            }
            if (!tryParseAuditOperation(op, entry.operation)) {
                util::logger::warn("SqliteAuditStore: skipping row with operation '" + op + "'");
                continue;
            }
            entry.piiCount = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
            const std::string categories = columnText(stmt, 3);
            if (!categories.empty()) {
                entry.violationCategories = util::text::splitList(categories);
            }
            if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
                entry.passed = sqlite3_column_int(stmt, 4) != 0;
            }
            if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
                entry.contextId = columnText(stmt, 5);
            }
            entries.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);
        return entries;
    }

    std::string describe() const override { return "sqlite:" + dbPath_; }

private:
    bool openDatabase()
    {
        sqlite3 *db = nullptr;
        if (sqlite3_open(dbPath_.c_str(), &db) != SQLITE_OK || !db) {
            util::logger::error("SqliteAuditStore: could not open database: " + dbPath_);
            if (db) {
                sqlite3_close(db);
            }
            return false;
        }
        const char *ddl = "CREATE TABLE IF NOT EXISTS audit_entries ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " timestamp TEXT NOT NULL,"
                          " operation TEXT NOT NULL,"
                          " pii_count INTEGER NOT NULL,"
                          " violation_categories TEXT NOT NULL,"
                          " passed INTEGER,"
                          " context_id TEXT"
                          ");";
        char *errMsg = nullptr;
        if (sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            util::logger::error("SqliteAuditStore: schema creation failed: "
                                + std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            sqlite3_close(db);
            return false;
        }
        db_ = db;
        return true;
    }

    static std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::string dbPath_;
    sqlite3 *db_;
};

} // namespace audit
} // namespace privgate

#endif // PRIVGATE_AUDIT_AUDIT_STORE_HPP
