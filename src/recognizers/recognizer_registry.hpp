#ifndef PIIANON_RECOGNIZERS_RECOGNIZER_REGISTRY_HPP
#define PIIANON_RECOGNIZERS_RECOGNIZER_REGISTRY_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include <algorithm>
#include "recognizer.hpp"
#include "pattern_recognizer.hpp"
#include "term_recognizer.hpp"
#include "predefined_recognizers.hpp"
#include "../core/errors.hpp"
#include "../core/finding.hpp"
#include "../../config/anonymizer_config.hpp"
#include "../util/logger.hpp"

/**
 * @file recognizer_registry.hpp
 * @brief Immutable set of recognizers shared by all requests.
 *
 * DESIGN GOALS:
 *   - Built once at process start (fromConfig) and never modified afterwards, so
 *     concurrent requests can share it through std::shared_ptr<const RecognizerRegistry>
 *     without locking.
 *   - Registers the predefined pattern recognizers, then term lists (terms.<ENTITY>),
 *     then ad-hoc regex recognizers (recognizer.<name>.*), honouring disabled_recognizers.
 *   - Recognizer names are unique; a duplicate is a configuration error.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piianon::config::AnonymizerConfig settings;
 *   settings.termLists["PERSON"] = {"Alice Johnson", "Bob Smith"};
 *   auto registry = piianon::recognizers::RecognizerRegistry::fromConfig(settings);
 *   auto names = registry->supportedEntities(); // ..., "GENERIC_PII", ..., "PERSON", ...
 *   @endcode
 */

namespace piianon {
namespace recognizers {

class RecognizerRegistry
{
public:
    /**
     * @throw core::ConfigError on a null recognizer or a duplicate name.
     */
    explicit RecognizerRegistry(std::vector<std::shared_ptr<const Recognizer>> recognizers)
        : recognizers_(std::move(recognizers))
    {
        std::set<std::string> names;
        for (const auto &r : recognizers_) {
            if (!r) {
                throw core::ConfigError("RecognizerRegistry: null recognizer");
            }
            if (!names.insert(r->name()).second) {
                throw core::ConfigError("RecognizerRegistry: duplicate recognizer name '" + r->name() + "'");
            }
            for (const auto &entity : r->supportedEntities()) {
                entities_.insert(entity);
            }
        }
        entities_.insert(core::kGenericPii);
    }

    /**
     * @brief Build the registry described by @p settings.
     * @throw core::ConfigError on an invalid custom recognizer.
     */
    static std::shared_ptr<const RecognizerRegistry> fromConfig(const config::AnonymizerConfig &settings)
    {
        ContextSettings ctx;
        ctx.boost = settings.contextBoost;
        ctx.prefixCount = settings.contextPrefixCount;
        ctx.suffixCount = settings.contextSuffixCount;

        std::vector<std::shared_ptr<const Recognizer>> all;
        for (auto &r : predefinedRecognizers(ctx, settings.phoneContext)) {
            if (std::find(settings.disabledRecognizers.begin(), settings.disabledRecognizers.end(),
                          r->name()) != settings.disabledRecognizers.end()) {
                util::logger::info("RecognizerRegistry: " + r->name() + " disabled by configuration");
                continue;
            }
            all.push_back(std::move(r));
        }

        for (const auto &kv : settings.termLists) {
            if (kv.second.empty()) {
                continue;
            }
            all.push_back(std::make_shared<TermRecognizer>(kv.first, kv.second, settings.termsScore));
        }

        for (const auto &kv : settings.customRecognizers) {
            const auto &custom = kv.second;
            if (custom.entity.empty() || custom.regex.empty()) {
                throw core::ConfigError("RecognizerRegistry: recognizer '" + kv.first +
                                        "' needs both entity and regex");
            }
            all.push_back(std::make_shared<PatternRecognizer>(
                kv.first, custom.entity,
                std::vector<Pattern>{{kv.first, custom.regex, custom.score}},
                custom.context, ctx));
        }

        std::shared_ptr<const RecognizerRegistry> registry =
            std::make_shared<RecognizerRegistry>(std::move(all));
        util::logger::info("RecognizerRegistry: " + std::to_string(registry->size()) +
                           " recognizers covering " + std::to_string(registry->supportedEntities().size()) +
                           " entity types");
        return registry;
    }

    const std::vector<std::shared_ptr<const Recognizer>>& recognizers() const
    {
        return recognizers_;
    }

    std::size_t size() const
    {
        return recognizers_.size();
    }

    /**
     * @brief Sorted entity type names, GENERIC_PII included.
     */
    std::vector<std::string> supportedEntities() const
    {
        return std::vector<std::string>(entities_.begin(), entities_.end());
    }

    /**
     * @brief Recognizers reporting at least one of @p entities (all when nullopt).
     */
    std::vector<const Recognizer*> recognizersFor(const std::optional<std::set<std::string>> &entities) const
    {
        std::vector<const Recognizer*> out;
        for (const auto &r : recognizers_) {
            if (!entities) {
                out.push_back(r.get());
                continue;
            }
            for (const auto &e : r->supportedEntities()) {
                if (entities->count(e)) {
                    out.push_back(r.get());
                    break;
                }
            }
        }
        return out;
    }

private:
    std::vector<std::shared_ptr<const Recognizer>> recognizers_;
    std::set<std::string> entities_;
};

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_RECOGNIZER_REGISTRY_HPP
