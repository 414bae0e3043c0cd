#ifndef PIIANON_SERVICE_RESPONSE_HPP
#define PIIANON_SERVICE_RESPONSE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <json/json.h>
#include "anonymizer_service.hpp"
#include "../anonymize/operator_engine.hpp"
#include "../anonymize/structure_walker.hpp"
#include "../detection/explanation_assembler.hpp"
#include "../core/finding.hpp"
#include "../util/json_writer.hpp"

/**
 * @file response.hpp
 * @brief Builds the JSON response document returned for one request.
 *
 * DESIGN GOALS:
 *   - A "Response" carries a status code, a short message and a result object.
 *   - toJson() serializes it compactly with util::json::writeCompact, so an
 *     anonymized payload keeps the member order of the request:
 *       {"message":"OK","result":{...},"status":200}
 *   - Render helpers turn findings, summaries, segments and payload statistics into
 *     JSON. Explanations are emitted only for findings that carry one.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piianon::service;
 *
 *   Response resp(200, "OK", renderTextResult(result));
 *   std::string out = resp.toJson();
 *
 *   Response bad(400, "unknown operator 'shred'");
 *   @endcode
 */

namespace piianon {
namespace service {

/**
 * @struct Response
 * @brief Outcome of one request: HTTP-like status, reason and result body.
 */
struct Response
{
    int statusCode;
    std::string message;
    Json::Value result;

    Response(int code = 200, const std::string &msg = "OK", const Json::Value &body = Json::Value())
        : statusCode(code), message(msg), result(body)
    {
    }

    bool ok() const
    {
        return statusCode >= 200 && statusCode < 300;
    }

    Json::Value toValue() const
    {
        Json::Value out(Json::objectValue);
        out["status"] = statusCode;
        out["message"] = message;
        out["result"] = result;
        return out;
    }

    std::string toJson() const
    {
        return util::json::writeCompact(toValue());
    }
};

inline Json::Value renderFinding(const core::Finding &f)
{
    Json::Value out(Json::objectValue);
    out["entity_type"] = f.entityType;
    out["text"] = f.text;
    out["start"] = Json::UInt64(f.start);
    out["end"] = Json::UInt64(f.end);
    out["score"] = f.score;
    if (!f.path.empty()) {
        out["path"] = f.path;
    }
    if (f.explanation) {
        out["explanation"] = detection::ExplanationAssembler::toJson(*f.explanation);
    }
    return out;
}

inline Json::Value renderFindings(const std::vector<core::Finding> &findings)
{
    Json::Value out(Json::arrayValue);
    for (const auto &f : findings) {
        out.append(renderFinding(f));
    }
    return out;
}

inline Json::Value renderSummary(const core::EntitySummary &summary)
{
    Json::Value out(Json::objectValue);
    for (const auto &kv : summary) {
        out[kv.first] = Json::UInt64(kv.second);
    }
    return out;
}

inline Json::Value renderSegments(const std::vector<anonymize::AnnotationSegment> &segments)
{
    Json::Value out(Json::arrayValue);
    for (const auto &s : segments) {
        Json::Value seg(Json::objectValue);
        seg["text"] = s.text;
        seg["start"] = Json::UInt64(s.start);
        seg["end"] = Json::UInt64(s.end);
        if (s.entityType) {
            seg["entity_type"] = *s.entityType;
        }
        out.append(seg);
    }
    return out;
}

inline Json::Value renderPayloadStats(const anonymize::PayloadStats &stats)
{
    Json::Value out(Json::objectValue);
    out["total_strings"] = Json::UInt64(stats.totalStrings);
    out["total_objects"] = Json::UInt64(stats.totalObjects);
    out["total_arrays"] = Json::UInt64(stats.totalArrays);
    out["total_primitives"] = Json::UInt64(stats.totalPrimitives);
    out["max_depth"] = Json::UInt64(stats.maxDepth);
    return out;
}

inline Json::Value renderTextResult(const TextResult &r)
{
    Json::Value out(Json::objectValue);
    out["anonymized_text"] = r.anonymizedText;
    out["findings"] = renderFindings(r.findings);
    out["summary"] = renderSummary(r.summary);
    return out;
}

inline Json::Value renderStructureResult(const StructureResult &r, const anonymize::PayloadStats &stats)
{
    Json::Value out(Json::objectValue);
    out["anonymized_payload"] = r.anonymizedValue;
    out["findings"] = renderFindings(r.findings);
    out["summary"] = renderSummary(r.summary);
    out["stats"] = renderPayloadStats(stats);
    return out;
}

inline Json::Value renderAnalysisResult(const AnalysisResult &r)
{
    Json::Value out(Json::objectValue);
    out["findings"] = renderFindings(r.findings);
    out["summary"] = renderSummary(r.summary);
    return out;
}

inline Json::Value renderAnnotationResult(const AnnotationResult &r)
{
    Json::Value out(Json::objectValue);
    out["segments"] = renderSegments(r.segments);
    out["summary"] = renderSummary(r.summary);
    return out;
}

inline Json::Value renderEntities(const std::vector<std::string> &entities)
{
    Json::Value out(Json::objectValue);
    Json::Value list(Json::arrayValue);
    for (const auto &e : entities) {
        list.append(e);
    }
    out["entities"] = list;
    return out;
}

} // namespace service
} // namespace piianon

#endif // PIIANON_SERVICE_RESPONSE_HPP
