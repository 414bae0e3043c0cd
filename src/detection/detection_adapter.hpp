#ifndef PIIANON_DETECTION_DETECTION_ADAPTER_HPP
#define PIIANON_DETECTION_DETECTION_ADAPTER_HPP

#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <exception>
#include "detection_engine.hpp"
#include "explanation_assembler.hpp"
#include "../core/finding.hpp"
#include "../core/errors.hpp"

/**
 * @file detection_adapter.hpp
 * @brief Turns raw engine results for one string into the findings the core works with.
 *
 * Pipeline for detect(text, config):
 *   1. engine.analyze(text, entities, returnExplanation); any fault -> DetectionEngineError
 *   2. drop results below config.scoreThreshold
 *   3. inject deny-list substrings as GENERIC_PII at score 1.0 (threshold does not apply)
 *   4. resolve overlaps between findings of the same entity type
 *      (higher score, then longer span, then earlier start wins)
 *   5. drop findings whose exact text is in config.allowList
 *   6. sort by start ascending, longer span first on ties
 *
 * Findings of different entity types may still overlap; the operator engine resolves
 * those when it splices text.
 *
 * The adapter is stateless apart from its engine and may be shared by concurrent requests.
 */

namespace piianon {
namespace detection {

class DetectionAdapter
{
public:
    /**
     * @throw core::ConfigError if @p engine is null.
     */
    explicit DetectionAdapter(std::shared_ptr<const DetectionEngine> engine)
        : engine_(std::move(engine))
    {
        if (!engine_) {
            throw core::ConfigError("DetectionAdapter: engine must not be null");
        }
    }

    /**
     * @throw core::DetectionEngineError if the engine fails or reports an invalid span.
     */
    std::vector<core::Finding> detect(const std::string &text, const core::RecognizerConfig &config) const
    {
        if (text.empty()) {
            return {};
        }

        std::vector<recognizers::RecognizerResult> raw;
        try {
            raw = engine_->analyze(text, config.entities, config.returnExplanation);
        }
        catch (const core::DetectionEngineError &) {
            throw;
        }
        catch (const std::exception &ex) {
            throw core::DetectionEngineError(std::string("detection engine failure: ") + ex.what());
        }

        std::vector<core::Finding> findings;
        findings.reserve(raw.size());
        for (const auto &r : raw) {
            if (r.start >= r.end || r.end > text.size()) {
                throw core::DetectionEngineError("detection engine returned invalid span [" +
                                                 std::to_string(r.start) + ", " + std::to_string(r.end) +
                                                 ") for text of length " + std::to_string(text.size()));
            }
            if (r.score < config.scoreThreshold) {
                continue;
            }
            findings.push_back(makeFinding(text, r, config.returnExplanation));
        }

        injectDenyList(text, config, findings);
        findings = resolveSameTypeConflicts(std::move(findings));

        if (!config.allowList.empty()) {
            findings.erase(std::remove_if(findings.begin(), findings.end(),
                                          [&](const core::Finding &f) { return config.allowList.count(f.text) > 0; }),
                           findings.end());
        }

        sortFindings(findings);
        return findings;
    }

    std::vector<std::string> supportedEntities() const
    {
        return engine_->supportedEntities();
    }

    /**
     * @brief Among overlapping findings of one entity type keep a single winner:
     *        higher score, then longer span, then earlier start.
     */
    static std::vector<core::Finding> resolveSameTypeConflicts(std::vector<core::Finding> findings)
    {
        std::stable_sort(findings.begin(), findings.end(), [](const core::Finding &a, const core::Finding &b) {
            if (a.score != b.score) {
                return a.score > b.score;
            }
            if (a.length() != b.length()) {
                return a.length() > b.length();
            }
            return a.start < b.start;
        });

        std::vector<core::Finding> kept;
        kept.reserve(findings.size());
        for (auto &f : findings) {
            bool conflict = std::any_of(kept.begin(), kept.end(), [&](const core::Finding &k) {
                return k.entityType == f.entityType && k.overlaps(f);
            });
            if (!conflict) {
                kept.push_back(std::move(f));
            }
        }
        return kept;
    }

    /**
     * @brief start ascending; on equal start the longer span first, then entity type name.
     */
    static void sortFindings(std::vector<core::Finding> &findings)
    {
        std::stable_sort(findings.begin(), findings.end(), [](const core::Finding &a, const core::Finding &b) {
            if (a.start != b.start) {
                return a.start < b.start;
            }
            if (a.end != b.end) {
                return a.end > b.end;
            }
            return a.entityType < b.entityType;
        });
    }

private:
    static core::Finding makeFinding(const std::string &text, const recognizers::RecognizerResult &r,
                                     bool withExplanation)
    {
        core::Finding f;
        f.entityType = r.entityType;
        f.start = r.start;
        f.end = r.end;
        f.text = text.substr(r.start, r.end - r.start);
        f.score = r.score;
        if (withExplanation) {
            core::Explanation explanation = ExplanationAssembler::assemble(r.explanation);
            ExplanationAssembler::ensureTextualExplanation(explanation, r.entityType);
            f.explanation = std::move(explanation);
        }
        return f;
    }

    static void injectDenyList(const std::string &text, const core::RecognizerConfig &config,
                               std::vector<core::Finding> &findings)
    {
        for (const auto &word : config.denyList) {
            if (word.empty()) {
                continue;
            }
            std::size_t pos = text.find(word);
            while (pos != std::string::npos) {
                recognizers::RecognizerResult r;
                r.entityType = core::kGenericPii;
                r.start = pos;
                r.end = pos + word.size();
                r.score = 1.0;
                r.explanation = Json::Value(Json::objectValue);
                r.explanation["recognizer"] = "DenyListRecognizer";
                r.explanation["original_score"] = 1.0;
                r.explanation["score"] = 1.0;
                r.explanation["textual_explanation"] = "Matched a deny-list entry";
                findings.push_back(makeFinding(text, r, config.returnExplanation));
                pos = text.find(word, pos + word.size());
            }
        }
    }

    std::shared_ptr<const DetectionEngine> engine_;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_DETECTION_ADAPTER_HPP
