#ifndef PIIANON_CONFIG_ANONYMIZER_CONFIG_HPP
#define PIIANON_CONFIG_ANONYMIZER_CONFIG_HPP

#include <string>
#include <vector>
#include <map>
#include <cstddef>

/**
 * @file anonymizer_config.hpp
 * @brief Defines process-wide settings for the piianon anonymizer.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - It is loaded once at startup and treated as read-only afterwards.
 *   - Recognizer tuning (context boost, term lists, custom regexes) lives here,
 *     and RecognizerRegistry::fromConfig() turns it into recognizers.
 */

namespace piianon {
namespace config {

/**
 * @struct CustomRecognizerConfig
 * @brief One ad-hoc regex recognizer declared via recognizer.<name>.* keys.
 */
struct CustomRecognizerConfig
{
    CustomRecognizerConfig()
        : score(0.5)
    {
    }

    std::string entity;
    std::string regex;
    double score;
    std::vector<std::string> context;
};

/**
 * @struct AnonymizerConfig
 * @brief Holds the settings of one anonymizer process:
 *   - defaultEntities: entity types detected when a request names none.
 *   - scoreThreshold: default minimum score of a finding.
 *   - maxDepth: nesting limit of the structure walker.
 *   - context*: context-word scoring of pattern recognizers.
 *   - termLists / customRecognizers: extra recognizers registered at startup.
 */
struct AnonymizerConfig
{
    /**
     * @brief Construct a new AnonymizerConfig with defaults:
     *   scoreThreshold = 0.35
     *   maxDepth = 256
     *   maxRequestBytes = 2 MiB
     *   contextBoost = 0.35, 5 words before, 0 words after
     */
    AnonymizerConfig()
        : defaultEntities({"PERSON", "PHONE_NUMBER", "EMAIL_ADDRESS", "CREDIT_CARD", "IBAN",
                           "US_SSN", "LOCATION", "DATE_TIME", "IP_ADDRESS", "URL"}),
          scoreThreshold(0.35),
          maxDepth(256),
          maxRequestBytes(2 * 1024 * 1024),
          workerThreads(0),
          logLevel("INFO"),
          contextBoost(0.35),
          contextPrefixCount(5),
          contextSuffixCount(0),
          termsScore(0.85)
    {
    }

    /// Entity types used when a request does not list any.
    std::vector<std::string> defaultEntities;

    /// Findings scoring below this are dropped unless the request overrides it.
    double scoreThreshold;

    /// Maximum nesting depth the structure walker accepts.
    std::size_t maxDepth;

    /// Largest request document the CLI accepts, in bytes.
    std::size_t maxRequestBytes;

    /// Worker threads for concurrent request processing (0 = hardware concurrency).
    std::size_t workerThreads;

    /// DEBUG, INFO, WARN, ERROR or CRITICAL.
    std::string logLevel;

    /// Optional log file; console only when empty.
    std::string logFile;

    /// Score added when a context word is found near a pattern match.
    double contextBoost;

    /// Words before a match searched for context.
    std::size_t contextPrefixCount;

    /// Words after a match searched for context.
    std::size_t contextSuffixCount;

    /// Replaces the built-in phone context words when non-empty.
    std::vector<std::string> phoneContext;

    /// Score of term-list matches.
    double termsScore;

    /// Names of predefined recognizers that must not be registered.
    std::vector<std::string> disabledRecognizers;

    /// entity type -> phrases recognized for it (terms.<ENTITY>=...).
    std::map<std::string, std::vector<std::string>> termLists;

    /// recognizer name -> ad-hoc regex recognizer.
    std::map<std::string, CustomRecognizerConfig> customRecognizers;
};

} // namespace config
} // namespace piianon

#endif // PIIANON_CONFIG_ANONYMIZER_CONFIG_HPP
