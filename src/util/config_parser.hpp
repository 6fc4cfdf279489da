#ifndef PRIVGATE_UTIL_CONFIG_PARSER_HPP
#define PRIVGATE_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <mutex>
#include "config/engine_config.hpp"
#include "privacy/policy_config.hpp"
#include "privacy/types.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" file into config::EngineConfig.
 *
 * FORMAT:
 *   - One key=value per line. '#' starts a comment line. Blank lines are ignored.
 *   - Lists are comma separated: entities=EMAIL_ADDRESS,PERSON
 *   - Per-category thresholds: threshold.toxicity=0.65
 *
 * USAGE:
 *   @code
 *   privgate::config::EngineConfig cfg;
 *   privgate::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("privgate.conf");
 *   @endcode
 *
 * A missing file logs a warning and leaves the defaults. A malformed line or an
 * invalid value throws ConfigurationError naming the line.
 */

namespace privgate {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(config::EngineConfig &engineConfig)
        : config_(engineConfig)
    {
    }

    /**
     * @throw ConfigurationError on malformed lines or invalid values.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults.");
            return;
        }
        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile, filepath);
        logger::info("ConfigParser: Config loaded.");
    }

    void loadFromStream(std::istream &in, const std::string &sourceName = "<stream>")
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            line = text::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw ConfigurationError(sourceName + ":" + std::to_string(lineNumber)
                                         + ": invalid line (no '='): " + line);
            }
            const std::string key = text::trim(line.substr(0, pos));
            const std::string val = text::trim(line.substr(pos + 1));
            try {
                applyKeyValue(key, val);
            }
            catch (const ConfigurationError &ex) {
                static const std::string prefix = "ConfigurationError: ";
                std::string reason = ex.what();
                if (reason.compare(0, prefix.size(), prefix) == 0) {
                    reason.erase(0, prefix.size());
                }
                throw ConfigurationError(sourceName + ":" + std::to_string(lineNumber) + ": " + reason);
            }
        }
    }

private:
    void applyKeyValue(const std::string &key, const std::string &val)
    {
        const std::string thresholdPrefix = "threshold.";

        if (key == "privacyLevel") {
            config_.privacyLevel = privacy::parsePrivacyLevel(val);
        }
        else if (key == "auditEnabled") {
            config_.auditEnabled = parseBool(key, val);
        }
        else if (key == "auditLogPath") {
            config_.auditLogPath = val;
        }
        else if (key == "auditStore") {
            const std::string lower = text::toLowerAscii(val);
            if (lower == "jsonl") config_.auditStore = config::AuditStoreKind::Jsonl;
            else if (lower == "sqlite") config_.auditStore = config::AuditStoreKind::Sqlite;
            else throw ConfigurationError("auditStore must be 'jsonl' or 'sqlite', got '" + val + "'");
        }
        else if (key == "anonymizationEnabled") {
            config_.anonymization.enabled = parseBool(key, val);
        }
        else if (key == "anonymizationMethod") {
            config_.anonymization.method = privacy::parseAnonymizationMethod(val);
        }
        else if (key == "entities") {
            std::set<privacy::EntityKind> kinds;
            for (const auto &name : text::splitList(val)) {
                kinds.insert(privacy::parseEntityKind(name));
            }
            config_.anonymization.entityAllowlist = kinds;
        }
        else if (key == "scoreThreshold") {
            config_.anonymization.scoreThreshold = parseUnitInterval(key, val);
        }
        else if (key == "maskChar") {
            if (val.size() != 1) {
                throw ConfigurationError("maskChar must be a single ASCII character, got '" + val + "'");
            }
            config_.anonymization.maskChar = val[0];
        }
        else if (key == "encryptionKey") {
            try {
                config_.anonymization.encryptionKey = hashing::fromHex(val);
            }
            catch (const std::invalid_argument &ex) {
                throw ConfigurationError(std::string("encryptionKey is not valid hex: ") + ex.what());
            }
        }
        else if (key == "filterEnabled") {
            config_.filter.enabled = parseBool(key, val);
        }
        else if (key == "filterCategories") {
            std::set<privacy::ContentCategory> categories;
            for (const auto &name : text::splitList(val)) {
                categories.insert(privacy::parseContentCategory(name));
            }
            config_.filter.categories = categories;
        }
        else if (key == "filterAction") {
            config_.filter.action = privacy::parseFilterAction(val);
        }
        else if (key.compare(0, thresholdPrefix.size(), thresholdPrefix) == 0) {
            const privacy::ContentCategory category =
                privacy::parseContentCategory(key.substr(thresholdPrefix.size()));
            config_.filter.thresholds[category] = parseUnitInterval(key, val);
        }
        else if (key == "blocklist") {
            for (const auto &term : text::splitList(val)) {
                config_.filter.customBlocklist.insert(term);
            }
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "logLevel") {
            if (!logger::parseLogLevel(val, config_.logLevel)) {
                throw ConfigurationError("unknown logLevel '" + val + "'");
            }
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to '" + (key == "encryptionKey" ? "<hidden>" : val) + "'");
    }

    static bool parseBool(const std::string &key, const std::string &val)
    {
        const std::string lower = text::toLowerAscii(val);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
        throw ConfigurationError(key + " expects a boolean, got '" + val + "'");
    }

    static uint64_t parseUInt(const std::string &key, const std::string &val)
    {
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size() || val[0] == '-') {
                throw std::invalid_argument("non-numeric suffix");
            }
            return n;
        }
        catch (const std::logic_error &ex) {
            throw ConfigurationError(key + " expects an unsigned integer, got '" + val + "' (" + ex.what() + ")");
        }
    }

    static double parseUnitInterval(const std::string &key, const std::string &val)
    {
        double d = 0.0;
        try {
            size_t idx = 0;
            d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
        }
        catch (const std::logic_error &ex) {
            throw ConfigurationError(key + " expects a number, got '" + val + "' (" + ex.what() + ")");
        }
        if (d < 0.0 || d > 1.0) {
            throw ConfigurationError(key + " must lie in [0, 1], got '" + val + "'");
        }
        return d;
    }

    config::EngineConfig &config_;
    std::mutex mutex_;
};

} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_CONFIG_PARSER_HPP
