#include <iostream>
#include <sstream>
#include <string>

#include "audit/audit_entry.hpp"
#include "config/engine_config.hpp"
#include "engine/privacy_engine.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace {

using privgate::audit::jsonEscape;

std::string verdictJson(size_t lineNumber,
                        const privgate::validation::ValidationResult &result,
                        const std::string &anonymized)
{
    std::ostringstream oss;
    oss << "{\"line\":" << lineNumber
        << ",\"level\":\"" << privgate::privacy::privacyLevelName(result.level) << "\""
        << ",\"passed\":" << (result.passed ? "true" : "false")
        << ",\"piiCount\":" << result.piiCount
        << ",\"violations\":[";
    for (size_t i = 0; i < result.contentViolations.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << privgate::privacy::contentCategoryName(result.contentViolations[i]) << "\"";
    }
    oss << "],\"recommendations\":[";
    for (size_t i = 0; i < result.recommendations.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << jsonEscape(result.recommendations[i]) << "\"";
    }
    oss << "],\"anonymized\":\"" << jsonEscape(anonymized) << "\"";
    if (result.auditWarning) {
        oss << ",\"auditWarning\":\"" << jsonEscape(*result.auditWarning) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string summaryJson(const privgate::audit::AuditSummary &summary)
{
    std::ostringstream oss;
    oss << "{\"summary\":{\"totalEntries\":" << summary.totalEntries << ",\"countsByOperation\":{";
    bool first = true;
    for (const auto &kv : summary.countsByOperation) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << privgate::audit::auditOperationName(kv.first) << "\":" << kv.second;
    }
    oss << "},\"violationCounts\":{";
    first = true;
    for (const auto &kv : summary.violationCounts) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << jsonEscape(kv.first) << "\":" << kv.second;
    }
    oss << "},\"passed\":" << summary.passedCount << ",\"failed\":" << summary.failedCount << "}}";
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    namespace logger = privgate::util::logger;

    privgate::config::EngineConfig engineConfig;
    privgate::util::ConfigParser configParser(engineConfig);

    std::string configPath = "privgate.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    privgate::engine::PrivacyEngine engine;
    try {
        configParser.loadFromFile(configPath);
        engine.init(engineConfig);
    }
    catch (const privgate::util::PrivgateError &ex) {
        logger::critical(std::string("[main] Startup failed: ") + ex.what());
        return 2;
    }

    logger::info("[main] Reading texts from stdin, one per line.");

    int exitCode = 0;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(std::cin, line)) {
        ++lineNumber;
        const std::string contextId = "line-" + std::to_string(lineNumber);
        try {
            const auto result = engine.validate(line, contextId);
            const std::string anonymized = result.piiDetected
                ? engine.anonymizer().anonymize(line, contextId)
                : line;
            std::cout << verdictJson(lineNumber, result, anonymized) << "\n";
            if (!result.passed) {
                exitCode = 1;
            }
        }
        catch (const privgate::util::PrivgateError &ex) {
            logger::error("[main] line " + std::to_string(lineNumber) + ": " + ex.what());
            std::cout << "{\"line\":" << lineNumber << ",\"error\":\""
                      << jsonEscape(ex.what()) << "\"}\n";
            exitCode = 1;
        }
    }

    std::cout << summaryJson(engine.summary()) << std::endl;
    engine.shutdown();
    return exitCode;
}
