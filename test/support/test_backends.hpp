#ifndef PRIVGATE_TEST_SUPPORT_TEST_BACKENDS_HPP
#define PRIVGATE_TEST_SUPPORT_TEST_BACKENDS_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "audit/audit_store.hpp"
#include "backend/backend_interfaces.hpp"
#include "util/errors.hpp"

/**
 * @file test_backends.hpp
 * @brief Scripted recognition/classification backends, a failing audit store and a
 *        self-deleting temp path for the test suite.
 */

namespace privgate {
namespace test {

class FakeRecognizer : public backend::EntityRecognitionBackend
{
public:
    explicit FakeRecognizer(std::vector<backend::RecognizedSpan> spans = {},
                            bool available = true, bool failOnCall = false)
        : spans_(std::move(spans)), available_(available), failOnCall_(failOnCall), calls_(0)
    {
    }

    std::string name() const override { return "fake-ner"; }
    bool isAvailable() const noexcept override { return available_; }

    std::vector<backend::RecognizedSpan> recognize(const std::string &) const override
    {
        ++calls_;
        if (failOnCall_) {
            throw util::BackendUnavailableError("model evicted");
        }
        return spans_;
    }

    int calls() const { return calls_.load(); }

private:
    std::vector<backend::RecognizedSpan> spans_;
    bool available_;
    bool failOnCall_;
    mutable std::atomic<int> calls_;
};

class FakeClassifier : public backend::ContentClassificationBackend
{
public:
    explicit FakeClassifier(std::map<std::string, double> scores = {},
                            bool available = true, bool failOnCall = false)
        : scores_(std::move(scores)), available_(available), failOnCall_(failOnCall)
    {
    }

    std::string name() const override { return "fake-tox"; }
    bool isAvailable() const noexcept override { return available_; }

    std::map<std::string, double> classify(const std::string &) const override
    {
        if (failOnCall_) {
            throw util::BackendUnavailableError("scoring service down");
        }
        return scores_;
    }

private:
    std::map<std::string, double> scores_;
    bool available_;
    bool failOnCall_;
};

/// Store whose every write fails, as a full disk would.
class FailingAuditStore : public audit::AuditStore
{
public:
    void append(const audit::AuditEntry &) override
    {
        throw util::AuditWriteError("disk full");
    }

    std::vector<audit::AuditEntry> loadAll() const override { return {}; }

    std::string describe() const override { return "failing"; }
};

/// Unique path under the system temp directory, removed on destruction.
class TempPath
{
public:
    explicit TempPath(const std::string &suffix)
    {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = (std::filesystem::temp_directory_path()
                 / ("privgate_test_" + std::to_string(stamp) + "_"
                    + std::to_string(counter++) + suffix)).string();
    }

    ~TempPath()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& str() const { return path_; }

private:
    std::string path_;
};

inline std::vector<std::string> readLines(const std::string &path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace test
} // namespace privgate

#endif // PRIVGATE_TEST_SUPPORT_TEST_BACKENDS_HPP
