#ifndef PIIANON_UTIL_CONFIG_PARSER_HPP
#define PIIANON_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <cmath>
#include <mutex>
#include "../../config/anonymizer_config.hpp"
#include "../core/errors.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for piianon's key=value settings file.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate piianon::config::AnonymizerConfig fields (thresholds, recognizer tuning, logging).
 *   - Lists are comma-separated: default_entities=PERSON,EMAIL_ADDRESS
 *   - Recognizers are declared with dotted keys:
 *       terms.PERSON=Alice Johnson,Bob Smith
 *       recognizer.employee_id.entity=EMPLOYEE_ID
 *       recognizer.employee_id.regex=\bEMP-\d{6}\b
 *       recognizer.employee_id.score=0.6
 *       recognizer.employee_id.context=employee,badge
 *
 * USAGE:
 *   @code
 *   using namespace piianon::util;
 *
 *   piianon::config::AnonymizerConfig settings;
 *   ConfigParser parser(settings);
 *   parser.loadFromFile("piianon.conf");
 *   @endcode
 *
 * Unknown keys are logged and ignored. Malformed lines or values throw core::ConfigError.
 */

namespace piianon {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates AnonymizerConfig fields.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piianon::config::AnonymizerConfig &settings)
        : settings_(settings)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     *        A missing file leaves the defaults in place.
     * @return true if the file existed and was applied.
     * @throw core::ConfigError if a line or value is malformed.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse settings from any input stream (used for files and inline text).
     * @throw core::ConfigError if a line or value is malformed.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw core::ConfigError("ConfigParser: invalid line " + std::to_string(lineNo) +
                                        " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    inline void loadFromString(const std::string &text)
    {
        std::istringstream in(text);
        loadFromStream(in);
    }

private:
    piianon::config::AnonymizerConfig &settings_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "default_entities") {
            settings_.defaultEntities = parseList(val);
            logger::debug("ConfigParser: default_entities set to " +
                          std::to_string(settings_.defaultEntities.size()) + " types");
        }
        else if (key == "score_threshold") {
            settings_.scoreThreshold = parseScore(key, val);
        }
        else if (key == "max_depth") {
            settings_.maxDepth = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "max_request_bytes") {
            settings_.maxRequestBytes = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "worker_threads") {
            settings_.workerThreads = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "log_level") {
            try {
                logger::parseLogLevel(val);
            }
            catch (const std::invalid_argument &ex) {
                throw core::ConfigError(std::string("ConfigParser: ") + ex.what());
            }
            settings_.logLevel = val;
        }
        else if (key == "log_file") {
            settings_.logFile = val;
        }
        else if (key == "context_boost") {
            settings_.contextBoost = parseScore(key, val);
        }
        else if (key == "context_prefix_count") {
            settings_.contextPrefixCount = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "context_suffix_count") {
            settings_.contextSuffixCount = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "phone_context") {
            settings_.phoneContext = parseList(val);
        }
        else if (key == "terms_score") {
            settings_.termsScore = parseScore(key, val);
        }
        else if (key == "disabled_recognizers") {
            settings_.disabledRecognizers = parseList(val);
        }
        else if (startsWith(key, "terms.")) {
            std::string entity = key.substr(6);
            if (entity.empty()) {
                throw core::ConfigError("ConfigParser: terms key without entity type");
            }
            settings_.termLists[entity] = parseList(val);
            logger::debug("ConfigParser: " + std::to_string(settings_.termLists[entity].size()) +
                          " terms registered for " + entity);
        }
        else if (startsWith(key, "recognizer.")) {
            applyRecognizerKey(key, val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    /**
     * @brief recognizer.<name>.<field>=value, where field is entity, regex, score or context.
     */
    inline void applyRecognizerKey(const std::string &key, const std::string &val)
    {
        const std::string rest = key.substr(11);
        auto dot = rest.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            throw core::ConfigError("ConfigParser: malformed recognizer key '" + key + "'");
        }
        std::string name = rest.substr(0, dot);
        std::string field = rest.substr(dot + 1);

        auto &custom = settings_.customRecognizers[name];
        if (field == "entity") {
            custom.entity = val;
        }
        else if (field == "regex") {
            custom.regex = val;
        }
        else if (field == "score") {
            custom.score = parseScore(key, val);
        }
        else if (field == "context") {
            custom.context = parseList(val);
        }
        else {
            throw core::ConfigError("ConfigParser: unknown recognizer field '" + field + "' in '" + key + "'");
        }
    }

    static inline bool startsWith(const std::string &s, const std::string &prefix)
    {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    static inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    /**
     * @brief Split a comma-separated value, trimming items and dropping empty ones.
     */
    static inline std::vector<std::string> parseList(const std::string &val)
    {
        std::vector<std::string> out;
        std::string item;
        std::istringstream iss(val);
        while (std::getline(iss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        try {
            if (!val.empty() && val[0] == '-') {
                throw std::invalid_argument("negative");
            }
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::invalid_argument("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw core::ConfigError("ConfigParser: " + key + " expects an unsigned integer, got '" +
                                    val + "': " + ex.what());
        }
    }

    /**
     * @brief Parse a score in [0, 1].
     */
    inline double parseScore(const std::string &key, const std::string &val) const
    {
        double d = 0.0;
        try {
            size_t idx = 0;
            d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::invalid_argument("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw core::ConfigError("ConfigParser: " + key + " expects a number, got '" + val +
                                    "': " + ex.what());
        }
        if (!std::isfinite(d) || d < 0.0 || d > 1.0) {
            throw core::ConfigError("ConfigParser: " + key + " must be within [0, 1], got '" + val + "'");
        }
        return d;
    }
};

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_CONFIG_PARSER_HPP
