#ifndef PIIANON_DETECTION_EXPLANATION_ASSEMBLER_HPP
#define PIIANON_DETECTION_EXPLANATION_ASSEMBLER_HPP

#include <string>
#include <cstdint>
#include <variant>
#include <json/json.h>
#include "../core/finding.hpp"
#include "../util/json_writer.hpp"

/**
 * @file explanation_assembler.hpp
 * @brief Converts an engine's raw explanation object into a core::Explanation.
 *
 * Every member of the raw object is copied by iterating the object itself. There is
 * no hand-written field list, so fields an engine adds later come through unchanged.
 * Null members are omitted, never stored as placeholders. Nested arrays/objects are
 * kept as their compact JSON text.
 */

namespace piianon {
namespace detection {

class ExplanationAssembler
{
public:
    /**
     * @brief Copy every non-null member of @p raw. A non-object @p raw yields an empty Explanation.
     */
    static core::Explanation assemble(const Json::Value &raw)
    {
        core::Explanation out;
        if (!raw.isObject()) {
            return out;
        }
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            const Json::Value &v = *it;
            const std::string name = it.name();
            switch (v.type()) {
            case Json::nullValue:
                break;
            case Json::booleanValue:
                out.set(name, v.asBool());
                break;
            case Json::intValue:
                out.set(name, static_cast<std::int64_t>(v.asInt64()));
                break;
            case Json::uintValue:
                if (v.isInt64()) {
                    out.set(name, static_cast<std::int64_t>(v.asInt64()));
                }
                else {
                    out.set(name, v.asDouble());
                }
                break;
            case Json::realValue:
                out.set(name, v.asDouble());
                break;
            case Json::stringValue:
                out.set(name, v.asString());
                break;
            case Json::arrayValue:
            case Json::objectValue:
                out.set(name, compact(v));
                break;
            }
        }
        return out;
    }

    /**
     * @brief Add textual_explanation when the engine left it out:
     *        "Identified as <type> by <recognizer>[ using pattern `<pattern_name>`]".
     */
    static void ensureTextualExplanation(core::Explanation &explanation, const std::string &entityType)
    {
        auto existing = explanation.get<std::string>("textual_explanation");
        if (existing && !existing->empty()) {
            return;
        }
        std::string recognizer = explanation.get<std::string>("recognizer").value_or("Unknown");
        std::string text = "Identified as " + entityType + " by " + recognizer;
        auto pattern = explanation.get<std::string>("pattern_name");
        if (pattern && !pattern->empty()) {
            text += " using pattern `" + *pattern + "`";
        }
        explanation.set("textual_explanation", text);
    }

    /**
     * @brief Render an Explanation back into a JSON object (for responses).
     */
    static Json::Value toJson(const core::Explanation &explanation)
    {
        Json::Value out(Json::objectValue);
        for (const auto &kv : explanation.fields()) {
            std::visit([&](const auto &value) { assignField(out[kv.first], value); }, kv.second);
        }
        return out;
    }

private:
    static void assignField(Json::Value &slot, bool value) { slot = value; }
    static void assignField(Json::Value &slot, std::int64_t value) { slot = Json::Int64(value); }
    static void assignField(Json::Value &slot, double value) { slot = value; }
    static void assignField(Json::Value &slot, const std::string &value) { slot = value; }

    static std::string compact(const Json::Value &v)
    {
        return util::json::writeCompact(v);
    }
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_EXPLANATION_ASSEMBLER_HPP
