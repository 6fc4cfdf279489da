#ifndef PRIVGATE_CONFIG_ENGINE_CONFIG_HPP
#define PRIVGATE_CONFIG_ENGINE_CONFIG_HPP

#include <string>
#include <cstddef>
#include "privacy/policy_config.hpp"
#include "privacy/types.hpp"
#include "util/logger.hpp"

/**
 * @file engine_config.hpp
 * @brief Settings for one privgate engine instance.
 *
 * USAGE:
 *   - Populate manually or through util/config_parser.hpp.
 *   - Hand to engine::PrivacyEngine::init().
 */

namespace privgate {
namespace config {

enum class AuditStoreKind {
    Jsonl,
    Sqlite
};

/**
 * @struct EngineConfig
 * @brief Engine-wide settings:
 *   - privacyLevel: default compliance level for validate() without an explicit level.
 *   - auditEnabled / auditLogPath / auditStore: where Validate/Anonymize/Filter entries go.
 *     An empty auditLogPath keeps the ledger in memory.
 *   - anonymization / filter: component configs with their defaults tables.
 *   - workerThreads: batch pool size, 0 means hardware concurrency.
 *   - logLevel / logFile: logger setup; an empty logFile logs to stderr only.
 */
struct EngineConfig
{
    EngineConfig()
        : privacyLevel(privacy::PrivacyLevel::Medium),
          auditEnabled(true),
          auditLogPath("privgate_audit.jsonl"),
          auditStore(AuditStoreKind::Jsonl),
          workerThreads(0),
          logLevel(util::logger::LogLevel::INFO)
    {
    }

    privacy::PrivacyLevel privacyLevel;

    bool auditEnabled;

    std::string auditLogPath;

    AuditStoreKind auditStore;

    privacy::AnonymizationConfig anonymization;

    privacy::FilterConfig filter;

    size_t workerThreads;

    util::logger::LogLevel logLevel;

    std::string logFile;
};

} // namespace config
} // namespace privgate

#endif // PRIVGATE_CONFIG_ENGINE_CONFIG_HPP
