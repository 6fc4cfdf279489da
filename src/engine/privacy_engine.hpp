#ifndef PRIVGATE_ENGINE_PRIVACY_ENGINE_HPP
#define PRIVGATE_ENGINE_PRIVACY_ENGINE_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include "anonymization/anonymizer.hpp"
#include "audit/audit_ledger.hpp"
#include "audit/audit_store.hpp"
#include "backend/backend_probe.hpp"
#include "classification/content_classifier.hpp"
#include "config/engine_config.hpp"
#include "detection/entity_detector.hpp"
#include "filter/content_filter.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"
#include "validation/privacy_validator.hpp"

/**
 * @file privacy_engine.hpp
 * @brief Owns and wires every privgate component for one process.
 *
 * LIFECYCLE:
 *   init(config, probe)   configure logging, probe backends once, open the audit store,
 *                         build detector/classifier/anonymizer/filter/validator.
 *   ...                   any number of concurrent detect/anonymize/filter/validate calls.
 *   shutdown()            flush the ledger and release components (also run by the destructor).
 *
 * Components receive the probed BackendHandle at construction and never re-probe.
 */

namespace privgate {
namespace engine {

class PrivacyEngine
{
public:
    PrivacyEngine() = default;

    ~PrivacyEngine()
    {
        shutdown();
    }

    PrivacyEngine(const PrivacyEngine&) = delete;
    PrivacyEngine& operator=(const PrivacyEngine&) = delete;

    /**
     * @throw util::ConfigurationError if a component rejects its configuration.
     * @throw std::runtime_error if the engine is already initialized.
     */
    void init(const config::EngineConfig &config,
              const backend::BackendProbe &probe = backend::BackendProbe())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("PrivacyEngine: already initialized");
        }

        config_ = config;
        util::logger::setLogLevel(config_.logLevel);
        if (!config_.logFile.empty()) {
            if (!util::logger::enableFileOutput(config_.logFile, true)) {
                util::logger::warn("PrivacyEngine: cannot open log file " + config_.logFile
                                   + ", logging to stderr only.");
            }
        }

        handle_ = probe.probe();

        auto detector = detection::makeEntityDetector(handle_);
        auto classifier = classification::makeContentClassifier(handle_);

        // Build the components that validate configuration before touching storage.
        auto anonymizer = std::make_unique<anonymization::Anonymizer>(detector, config_.anonymization);
        auto contentFilter = std::make_unique<filter::ContentFilter>(classifier, config_.filter);

        pool_ = std::make_unique<util::WorkerPool>(config_.workerThreads);
        ledger_ = std::make_unique<audit::AuditLedger>(makeStore());

        anonymizer_ = std::move(anonymizer);
        filter_ = std::move(contentFilter);
        anonymizer_->setWorkerPool(pool_.get());
        filter_->setWorkerPool(pool_.get());
        if (config_.auditEnabled) {
            anonymizer_->setAuditLedger(ledger_.get());
            filter_->setAuditLedger(ledger_.get());
        }

        validator_ = std::make_unique<validation::PrivacyValidator>(ledger_.get(), config_.privacyLevel);
        validator_->setAuditEnabled(config_.auditEnabled);
        validator_->setWorkerPool(pool_.get());

        initialized_ = true;
        util::logger::info("PrivacyEngine: initialized (detector=" + detector->variantName()
                           + ", classifier=" + classifier->variantName()
                           + ", level=" + privacy::privacyLevelName(config_.privacyLevel)
                           + ", audit=" + ledger_->describe()
                           + ", workers=" + std::to_string(pool_->size()) + ")");
    }

    void shutdown()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return;
        }
        validator_.reset();
        filter_.reset();
        anonymizer_.reset();
        pool_.reset();
        ledger_->flush();
        ledger_.reset();
        initialized_ = false;
        util::logger::info("PrivacyEngine: shut down.");
    }

    bool isInitialized() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return initialized_;
    }

    const config::EngineConfig& config() const { return config_; }
    const backend::BackendHandle& backends() const { return handle_; }

    const anonymization::Anonymizer& anonymizer() const { return *require(anonymizer_); }
    const filter::ContentFilter& contentFilter() const { return *require(filter_); }
    validation::PrivacyValidator& validator() { return *require(validator_); }
    audit::AuditLedger& ledger() { return *require(ledger_); }

    std::vector<privacy::PIIEntity> detect(const std::string &text,
                                           const std::optional<std::string> &contextId = std::nullopt) const
    {
        return require(anonymizer_)->detectPII(text, contextId);
    }

    std::string anonymize(const std::string &text,
                          const std::optional<std::string> &contextId = std::nullopt) const
    {
        return require(anonymizer_)->anonymize(text, contextId);
    }

    std::vector<std::string> anonymizeBatch(const std::vector<std::string> &texts) const
    {
        return require(anonymizer_)->anonymizeBatch(texts);
    }

    filter::FilterResult filter(const std::string &text,
                                const std::optional<std::string> &contextId = std::nullopt) const
    {
        return require(filter_)->filter(text, contextId);
    }

    std::vector<filter::FilterResult> filterBatch(const std::vector<std::string> &texts) const
    {
        return require(filter_)->filterBatch(texts);
    }

    validation::ValidationResult validate(const std::string &text,
                                          const std::optional<std::string> &contextId = std::nullopt) const
    {
        return require(validator_)->validate(text, anonymizer_.get(), filter_.get(), contextId);
    }

    validation::ValidationResult validate(const std::string &text, privacy::PrivacyLevel level,
                                          const std::optional<std::string> &contextId = std::nullopt) const
    {
        return require(validator_)->validate(text, level, anonymizer_.get(), filter_.get(), contextId);
    }

    std::vector<validation::ValidationResult> validateBatch(const std::vector<std::string> &texts) const
    {
        return require(validator_)->validateBatch(texts, anonymizer_.get(), filter_.get());
    }

    audit::AuditSummary summary() const
    {
        return require(ledger_)->summary();
    }

private:
    template<typename T>
    static T* require(const std::unique_ptr<T> &component)
    {
        if (!component) {
            throw std::runtime_error("PrivacyEngine: not initialized");
        }
        return component.get();
    }

    std::unique_ptr<audit::AuditStore> makeStore() const
    {
        if (config_.auditLogPath.empty()) {
            util::logger::info("PrivacyEngine: no auditLogPath, audit ledger is in-memory only.");
            return nullptr;
        }
        if (config_.auditStore == config::AuditStoreKind::Sqlite) {
            return std::make_unique<audit::SqliteAuditStore>(config_.auditLogPath);
        }
        return std::make_unique<audit::JsonlAuditStore>(config_.auditLogPath);
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    config::EngineConfig config_;
    backend::BackendHandle handle_;
    std::unique_ptr<util::WorkerPool> pool_;
    std::unique_ptr<audit::AuditLedger> ledger_;
    std::unique_ptr<anonymization::Anonymizer> anonymizer_;
    std::unique_ptr<filter::ContentFilter> filter_;
    std::unique_ptr<validation::PrivacyValidator> validator_;
};

} // namespace engine
} // namespace privgate

#endif // PRIVGATE_ENGINE_PRIVACY_ENGINE_HPP
