#ifndef PIIANON_SERVICE_ANONYMIZER_SERVICE_HPP
#define PIIANON_SERVICE_ANONYMIZER_SERVICE_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <json/json.h>
#include "../anonymize/token_cache.hpp"
#include "../anonymize/operator_engine.hpp"
#include "../anonymize/structure_walker.hpp"
#include "../detection/detection_engine.hpp"
#include "../detection/detection_adapter.hpp"
#include "../recognizers/recognizer_registry.hpp"
#include "../core/finding.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"
#include "../../config/anonymizer_config.hpp"

/**
 * @file anonymizer_service.hpp
 * @brief Caller-facing entry points of the anonymizer.
 *
 * DESIGN GOALS:
 *   - One service object per process, shared by every worker. It holds only
 *     read-only state (settings and the detection engine).
 *   - Each call builds its own TokenCache and finding list on the stack and
 *     returns them in its result; nothing survives the call.
 *   - Text mode honours the requested operator. Structure mode always writes tokens
 *     (counter or hash strategy) and ignores the operator.
 *   - Logged lines carry counts and entity types only, never request text.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto settings = std::make_shared<piianon::config::AnonymizerConfig>();
 *   settings->termLists["PERSON"] = {"Alice Johnson"};
 *   piianon::service::AnonymizerService service(settings);
 *
 *   auto result = service.anonymizeText("Call Alice Johnson at 555-1234",
 *                                       service.defaultRecognizerConfig(),
 *                                       piianon::anonymize::OperatorSpec());
 *   // result.anonymizedText == "Call <PERSON_1> at <PHONE_NUMBER_1>"
 *   @endcode
 */

namespace piianon {
namespace service {

struct TextResult
{
    std::string anonymizedText;
    std::vector<core::Finding> findings;
    core::EntitySummary summary;
};

struct StructureResult
{
    Json::Value anonymizedValue;
    std::vector<core::Finding> findings;
    core::EntitySummary summary;
};

struct AnalysisResult
{
    std::vector<core::Finding> findings;
    core::EntitySummary summary;
};

struct AnnotationResult
{
    std::vector<anonymize::AnnotationSegment> segments;
    core::EntitySummary summary;
};

class AnonymizerService
{
public:
    /**
     * @brief Service over the registry described by @p settings.
     * @throw core::ConfigError on invalid recognizer settings.
     */
    explicit AnonymizerService(std::shared_ptr<const config::AnonymizerConfig> settings)
        : AnonymizerService(settings,
                            std::make_shared<detection::RegistryDetectionEngine>(
                                recognizers::RecognizerRegistry::fromConfig(requireSettings(settings))))
    {
    }

    /**
     * @brief Service over an externally supplied engine (e.g. an NER backend).
     * @throw core::ConfigError if either argument is null.
     */
    AnonymizerService(std::shared_ptr<const config::AnonymizerConfig> settings,
                      std::shared_ptr<const detection::DetectionEngine> engine)
        : settings_(std::move(settings))
        , adapter_(engine)
    {
        requireSettings(settings_);
        const std::vector<std::string> supported = engine->supportedEntities();
        supported_.insert(supported.begin(), supported.end());
    }

    /**
     * @brief Detection settings used when a request supplies none: the configured default
     *        entities the engine supports, and the configured threshold.
     */
    core::RecognizerConfig defaultRecognizerConfig() const
    {
        core::RecognizerConfig rc;
        std::set<std::string> entities;
        for (const auto &e : settings_->defaultEntities) {
            if (supported_.count(e)) {
                entities.insert(e);
            }
        }
        rc.entities = std::move(entities);
        rc.scoreThreshold = settings_->scoreThreshold;
        return rc;
    }

    /// Sorted entity types the engine supports, GENERIC_PII included.
    std::vector<std::string> listSupportedEntities() const
    {
        return std::vector<std::string>(supported_.begin(), supported_.end());
    }

    /**
     * @throw core::InvalidRequestError, core::DetectionEngineError.
     */
    AnalysisResult analyze(const std::string &text, const core::RecognizerConfig &config) const
    {
        checkConfig(config);
        AnalysisResult result;
        result.findings = adapter_.detect(text, config);
        result.summary = core::summarize(result.findings);
        util::logger::debug("analyze: " + std::to_string(result.findings.size()) + " findings in " +
                            std::to_string(text.size()) + " bytes");
        return result;
    }

    /**
     * @brief Detect and rewrite @p text with @p op. A fresh TokenCache is used per call.
     *        The reported findings are the non-overlapping spans the operator was applied to.
     * @throw the operator errors, core::InvalidRequestError, core::DetectionEngineError.
     */
    TextResult anonymizeText(const std::string &text,
                             const core::RecognizerConfig &config,
                             const anonymize::OperatorSpec &op) const
    {
        anonymize::OperatorEngine::validate(op);
        checkConfig(config);

        TextResult result;
        result.findings = anonymize::OperatorEngine::resolveOverlaps(adapter_.detect(text, config));
        anonymize::TokenCache cache;
        result.anonymizedText = anonymize::OperatorEngine::apply(text, result.findings, op, cache);
        result.summary = core::summarize(result.findings);
        util::logger::info("anonymizeText: operator=" + anonymize::toString(op.kind) + ", " +
                           std::to_string(result.findings.size()) + " findings, " +
                           std::to_string(result.summary.size()) + " entity types");
        return result;
    }

    /**
     * @brief Anonymize every string leaf of @p value with tokens from one request-wide cache.
     *        @p op is accepted for interface symmetry and ignored.
     * @throw core::DepthExceededError, core::UnsupportedTypeError, core::InvalidRequestError,
     *        core::DetectionEngineError.
     */
    StructureResult anonymizeStructure(const Json::Value &value,
                                       const core::RecognizerConfig &config,
                                       const anonymize::OperatorSpec &op,
                                       anonymize::TokenStrategy strategy = anonymize::TokenStrategy::Replace) const
    {
        checkConfig(config);
        if (op.kind != anonymize::OperatorKind::Replace) {
            util::logger::debug("anonymizeStructure: operator '" + anonymize::toString(op.kind) +
                                "' ignored, structure mode always writes tokens");
        }

        anonymize::TokenCache cache(strategy);
        anonymize::StructureWalker walker(adapter_, config, settings_->maxDepth, cache);

        StructureResult result;
        result.anonymizedValue = walker.walk(value);
        result.findings = walker.takeFindings();
        result.summary = core::summarize(result.findings);
        util::logger::info("anonymizeStructure: " + std::to_string(result.findings.size()) + " findings, " +
                           std::to_string(cache.size()) + " distinct values tokenized");
        return result;
    }

    /**
     * @brief Labeled segments of @p text for client-side highlighting.
     */
    AnnotationResult annotate(const std::string &text, const core::RecognizerConfig &config) const
    {
        checkConfig(config);
        std::vector<core::Finding> findings = adapter_.detect(text, config);

        AnnotationResult result;
        result.segments = anonymize::OperatorEngine::annotate(text, findings);
        result.summary = core::summarize(findings);
        return result;
    }

    const config::AnonymizerConfig& settings() const
    {
        return *settings_;
    }

private:
    static const config::AnonymizerConfig& requireSettings(const std::shared_ptr<const config::AnonymizerConfig> &s)
    {
        if (!s) {
            throw core::ConfigError("AnonymizerService: settings must not be null");
        }
        return *s;
    }

    void checkConfig(const core::RecognizerConfig &config) const
    {
        if (!(config.scoreThreshold >= 0.0 && config.scoreThreshold <= 1.0)) {
            throw core::InvalidRequestError("score_threshold must be within [0, 1]");
        }
        if (!config.entities) {
            return;
        }
        for (const auto &e : *config.entities) {
            if (!supported_.count(e)) {
                throw core::InvalidRequestError("unsupported entity type '" + e + "'");
            }
        }
    }

    std::shared_ptr<const config::AnonymizerConfig> settings_;
    detection::DetectionAdapter adapter_;
    std::set<std::string> supported_;
};

} // namespace service
} // namespace piianon

#endif // PIIANON_SERVICE_ANONYMIZER_SERVICE_HPP
