#ifndef PIIANON_DETECTION_DETECTION_ENGINE_HPP
#define PIIANON_DETECTION_DETECTION_ENGINE_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include "../recognizers/recognizer.hpp"
#include "../recognizers/recognizer_registry.hpp"
#include "../core/errors.hpp"

/**
 * @file detection_engine.hpp
 * @brief Narrow contract between the anonymization core and an entity-detection engine.
 *
 * The core never looks inside an engine. It asks for raw results on one string and
 * applies thresholds, allow/deny lists and conflict resolution itself
 * (see detection_adapter.hpp). An NER-backed engine plugs in by implementing
 * DetectionEngine; RegistryDetectionEngine is the pattern/term-list engine shipped here.
 *
 * Engines must be safe to call concurrently through a const reference.
 */

namespace piianon {
namespace detection {

class DetectionEngine
{
public:
    virtual ~DetectionEngine() = default;

    /**
     * @brief Raw results for @p text.
     * @param entities Entity types to report; nullopt means all.
     * @param returnExplanation When false, explanations may be left null.
     * @throw core::DetectionEngineError (or any std::exception) on an internal fault.
     */
    virtual std::vector<recognizers::RecognizerResult> analyze(
        const std::string &text,
        const std::optional<std::set<std::string>> &entities,
        bool returnExplanation) const = 0;

    /// Entity types the engine can report, fixed for its lifetime.
    virtual std::vector<std::string> supportedEntities() const = 0;
};

/**
 * @class RegistryDetectionEngine
 * @brief Runs every applicable recognizer of an immutable RecognizerRegistry.
 */
class RegistryDetectionEngine : public DetectionEngine
{
public:
    /**
     * @throw core::ConfigError if @p registry is null.
     */
    explicit RegistryDetectionEngine(std::shared_ptr<const recognizers::RecognizerRegistry> registry)
        : registry_(std::move(registry))
    {
        if (!registry_) {
            throw core::ConfigError("RegistryDetectionEngine: registry must not be null");
        }
    }

    std::vector<recognizers::RecognizerResult> analyze(
        const std::string &text,
        const std::optional<std::set<std::string>> &entities,
        bool returnExplanation) const override
    {
        std::vector<recognizers::RecognizerResult> results;
        for (const recognizers::Recognizer *r : registry_->recognizersFor(entities)) {
            for (auto &res : r->analyze(text)) {
                if (entities && !entities->count(res.entityType)) {
                    continue;
                }
                if (!returnExplanation) {
                    res.explanation = Json::Value();
                }
                results.push_back(std::move(res));
            }
        }
        return results;
    }

    std::vector<std::string> supportedEntities() const override
    {
        return registry_->supportedEntities();
    }

    const recognizers::RecognizerRegistry& registry() const
    {
        return *registry_;
    }

private:
    std::shared_ptr<const recognizers::RecognizerRegistry> registry_;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_DETECTION_ENGINE_HPP
