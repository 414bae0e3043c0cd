#ifndef PIIANON_ANONYMIZE_STRUCTURE_WALKER_HPP
#define PIIANON_ANONYMIZE_STRUCTURE_WALKER_HPP

#include <string>
#include <vector>
#include <utility>
#include <cmath>
#include <algorithm>
#include <cstddef>
#include <json/json.h>
#include "token_cache.hpp"
#include "operator_engine.hpp"
#include "../detection/detection_adapter.hpp"
#include "../core/finding.hpp"
#include "../core/errors.hpp"
#include "../util/json_writer.hpp"

/**
 * @file structure_walker.hpp
 * @brief Anonymizes every string leaf of a JSON value, leaving its shape untouched.
 *
 * DESIGN:
 *   - Numbers, booleans and null pass through unchanged.
 *   - Object keys are copied verbatim and never scanned. Members are visited in the
 *     order of the parsed document and keep its offsets, so util::json::writeCompact
 *     writes them back in that order. Arrays keep element order.
 *   - Every string leaf goes through the DetectionAdapter and is rewritten with tokens
 *     from one TokenCache, so the same value gets the same token anywhere in the document.
 *   - Findings carry the JSON Pointer (RFC 6901) of the leaf they came from. A finding
 *     dropped by cross-type overlap resolution left no token and is not reported.
 *   - Containers nested deeper than maxDepth raise DepthExceededError; a root container
 *     is at depth 1. NaN and infinities raise UnsupportedTypeError.
 *
 * A walker is used for a single request and is not thread-safe.
 *
 * USAGE:
 *   @code
 *   TokenCache cache;
 *   StructureWalker walker(adapter, recognizerConfig, 256, cache);
 *   Json::Value out = walker.walk(payload);
 *   const auto &found = walker.findings();
 *   @endcode
 */

namespace piianon {
namespace anonymize {

constexpr std::size_t kDefaultMaxDepth = 256;

struct PayloadStats
{
    std::size_t totalStrings = 0;
    std::size_t totalObjects = 0;
    std::size_t totalArrays = 0;
    std::size_t totalPrimitives = 0;
    std::size_t maxDepth = 0;
};

/**
 * @brief Escape one reference token of a JSON Pointer ("~" -> "~0", "/" -> "~1").
 */
inline std::string escapePointerToken(const std::string &token)
{
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        }
        else if (c == '/') {
            out += "~1";
        }
        else {
            out.push_back(c);
        }
    }
    return out;
}

class StructureWalker
{
public:
    StructureWalker(const detection::DetectionAdapter &adapter,
                    const core::RecognizerConfig &config,
                    std::size_t maxDepth,
                    TokenCache &cache)
        : adapter_(adapter)
        , config_(config)
        , maxDepth_(maxDepth)
        , cache_(cache)
    {
    }

    /**
     * @brief Anonymized copy of @p value. Findings accumulate across calls.
     * @throw core::DepthExceededError, core::UnsupportedTypeError, core::DetectionEngineError.
     */
    Json::Value walk(const Json::Value &value)
    {
        return visit(value, std::string(), 0);
    }

    const std::vector<core::Finding>& findings() const
    {
        return findings_;
    }

    std::vector<core::Finding> takeFindings()
    {
        return std::move(findings_);
    }

private:
    Json::Value visit(const Json::Value &value, const std::string &path, std::size_t depth)
    {
        switch (value.type()) {
        case Json::nullValue:
        case Json::booleanValue:
        case Json::intValue:
        case Json::uintValue:
            return value;
        case Json::realValue:
            if (!std::isfinite(value.asDouble())) {
                throw core::UnsupportedTypeError("non-finite number at '" + path + "' has no JSON representation");
            }
            return value;
        case Json::stringValue:
            return Json::Value(anonymizeLeaf(value.asString(), path));
        case Json::arrayValue: {
            enter(depth + 1, path);
            Json::Value out(Json::arrayValue);
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                out.append(visit(value[i], path + "/" + std::to_string(i), depth + 1));
            }
            return out;
        }
        case Json::objectValue: {
            enter(depth + 1, path);
            Json::Value out(Json::objectValue);
            for (const auto &key : util::json::memberNamesInDocumentOrder(value)) {
                const Json::Value &member = value[key];
                Json::Value &slot = out[key];
                slot = visit(member, path + "/" + escapePointerToken(key), depth + 1);
                util::json::copyOffsets(slot, member);
            }
            return out;
        }
        }
        throw core::UnsupportedTypeError("unsupported value type at '" + path + "'");
    }

    void enter(std::size_t depth, const std::string &path) const
    {
        if (depth > maxDepth_) {
            throw core::DepthExceededError("nesting depth " + std::to_string(depth) + " at '" + path +
                                           "' exceeds limit " + std::to_string(maxDepth_));
        }
    }

    std::string anonymizeLeaf(const std::string &text, const std::string &path)
    {
        std::vector<core::Finding> found = adapter_.detect(text, config_);
        if (found.empty()) {
            return text;
        }
        OperatorSpec tokens;
        tokens.kind = OperatorKind::Replace;
        std::string out = OperatorEngine::apply(text, found, tokens, cache_);
        // Only spans that were actually replaced are reported.
        for (auto &f : OperatorEngine::resolveOverlaps(found)) {
            f.path = path;
            findings_.push_back(std::move(f));
        }
        return out;
    }

    const detection::DetectionAdapter &adapter_;
    const core::RecognizerConfig &config_;
    std::size_t maxDepth_;
    TokenCache &cache_;
    std::vector<core::Finding> findings_;
};

/**
 * @brief Shape statistics of @p value. Iterative, so any depth jsoncpp can hold is fine.
 */
inline PayloadStats computePayloadStats(const Json::Value &value)
{
    PayloadStats stats;
    std::vector<std::pair<const Json::Value*, std::size_t>> pending;
    pending.emplace_back(&value, 0);
    while (!pending.empty()) {
        const Json::Value *v = pending.back().first;
        std::size_t depth = pending.back().second;
        pending.pop_back();

        if (v->isObject() || v->isArray()) {
            if (v->isObject()) {
                ++stats.totalObjects;
            }
            else {
                ++stats.totalArrays;
            }
            stats.maxDepth = std::max(stats.maxDepth, depth + 1);
            for (auto it = v->begin(); it != v->end(); ++it) {
                pending.emplace_back(&*it, depth + 1);
            }
        }
        else if (v->isString()) {
            ++stats.totalStrings;
        }
        else {
            ++stats.totalPrimitives;
        }
    }
    return stats;
}

} // namespace anonymize
} // namespace piianon

#endif // PIIANON_ANONYMIZE_STRUCTURE_WALKER_HPP
