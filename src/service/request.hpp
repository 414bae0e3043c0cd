#ifndef PIIANON_SERVICE_REQUEST_HPP
#define PIIANON_SERVICE_REQUEST_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <sstream>
#include <cstdint>
#include <json/json.h>
#include "../anonymize/operator_engine.hpp"
#include "../anonymize/token_cache.hpp"
#include "../core/finding.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file request.hpp
 * @brief Parses a JSON request document into a Request the service can execute.
 *
 * DESIGN GOALS:
 *   - One document describes one call:
 *       mode, payload or text, detection settings and operator parameters.
 *   - Parsing uses jsoncpp in strict mode; any malformed document or field raises
 *     core::InvalidRequestError (an unknown operator name raises core::InvalidOperatorError).
 *   - Fields the caller leaves out keep the defaults handed to parseRequest().
 *   - Unknown top-level keys are logged by name and ignored.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piianon::service;
 *
 *   std::string incoming = R"({
 *       "mode": "anonymize_text",
 *       "text": "Call 555-1234",
 *       "operator": "mask",
 *       "number_of_chars": 4
 *   })";
 *
 *   Request req = parseRequest(incoming, service.defaultRecognizerConfig());
 *   // req.mode == RequestMode::AnonymizeText, req.operatorSpec.kind == OperatorKind::Mask
 *   @endcode
 */

namespace piianon {
namespace service {

enum class RequestMode
{
    Anonymize,      ///< JSON payload, token semantics
    AnonymizeText,  ///< free text, any operator
    Analyze,        ///< findings only
    Annotate,       ///< labeled segments
    Entities        ///< list supported entity types
};

/**
 * @struct Request
 * @brief A fully parsed call, ready for AnonymizerService.
 */
struct Request
{
    RequestMode mode = RequestMode::Anonymize;
    Json::Value payload;
    std::string text;
    core::RecognizerConfig recognizerConfig;
    anonymize::OperatorSpec operatorSpec;
    anonymize::TokenStrategy strategy = anonymize::TokenStrategy::Replace;
};

inline RequestMode parseRequestMode(const std::string &name)
{
    if (name == "anonymize") {
        return RequestMode::Anonymize;
    }
    if (name == "anonymize_text") {
        return RequestMode::AnonymizeText;
    }
    if (name == "analyze") {
        return RequestMode::Analyze;
    }
    if (name == "annotate") {
        return RequestMode::Annotate;
    }
    if (name == "entities") {
        return RequestMode::Entities;
    }
    throw core::InvalidRequestError("unknown mode '" + name + "'");
}

namespace detail {

/**
 * @brief Strict UTF-8 check: no overlong forms, no surrogates, nothing above U+10FFFF.
 */
inline bool isValidUtf8(const std::string &bytes)
{
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        }
        else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) {
                lo = 0xA0;
            }
            else if (c == 0xED) {
                hi = 0x9F;
            }
        }
        else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) {
                lo = 0x90;
            }
            else if (c == 0xF4) {
                hi = 0x8F;
            }
        }
        else {
            return false;
        }

        if (n - i <= extra) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

inline std::string requireString(const Json::Value &v, const char *field)
{
    if (!v.isString()) {
        throw core::InvalidRequestError(std::string("'") + field + "' must be a string");
    }
    return v.asString();
}

inline std::set<std::string> requireStringSet(const Json::Value &v, const char *field)
{
    if (!v.isArray()) {
        throw core::InvalidRequestError(std::string("'") + field + "' must be an array of strings");
    }
    std::set<std::string> out;
    for (const auto &item : v) {
        if (!item.isString()) {
            throw core::InvalidRequestError(std::string("'") + field + "' must be an array of strings");
        }
        out.insert(item.asString());
    }
    return out;
}

} // namespace detail

/**
 * @brief Parse @p document into a Request.
 * @param defaults Detection settings used for every field the document leaves out.
 * @throw core::InvalidRequestError, core::InvalidOperatorError.
 */
inline Request parseRequest(const std::string &document, const core::RecognizerConfig &defaults)
{
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    if (!detail::isValidUtf8(document)) {
        throw core::InvalidRequestError("Invalid UTF-8 encoding in request body");
    }

    Json::Value root;
    std::string errs;
    if (!reader->parse(document.data(), document.data() + document.size(), &root, &errs)) {
        throw core::InvalidRequestError("request is not valid JSON: " + errs);
    }
    if (!root.isObject()) {
        throw core::InvalidRequestError("request must be a JSON object");
    }

    Request req;
    req.recognizerConfig = defaults;

    for (const auto &key : root.getMemberNames()) {
        const Json::Value &v = root[key];
        if (key == "mode") {
            req.mode = parseRequestMode(detail::requireString(v, "mode"));
        }
        else if (key == "payload") {
            req.payload = v;
        }
        else if (key == "text") {
            req.text = detail::requireString(v, "text");
        }
        else if (key == "operator") {
            req.operatorSpec.kind = anonymize::parseOperatorKind(detail::requireString(v, "operator"));
        }
        else if (key == "strategy") {
            std::string s = detail::requireString(v, "strategy");
            if (s == "replace") {
                req.strategy = anonymize::TokenStrategy::Replace;
            }
            else if (s == "hash") {
                req.strategy = anonymize::TokenStrategy::Hash;
            }
            else {
                throw core::InvalidRequestError("unknown strategy '" + s + "', expected replace or hash");
            }
        }
        else if (key == "entities") {
            std::set<std::string> entities = detail::requireStringSet(v, "entities");
            if (entities.empty()) {
                req.recognizerConfig.entities.reset();
            }
            else {
                req.recognizerConfig.entities = std::move(entities);
            }
        }
        else if (key == "score_threshold") {
            if (!v.isNumeric()) {
                throw core::InvalidRequestError("'score_threshold' must be a number");
            }
            req.recognizerConfig.scoreThreshold = v.asDouble();
        }
        else if (key == "allow_list") {
            req.recognizerConfig.allowList = detail::requireStringSet(v, "allow_list");
        }
        else if (key == "deny_list") {
            req.recognizerConfig.denyList = detail::requireStringSet(v, "deny_list");
        }
        else if (key == "return_decision_process") {
            if (!v.isBool()) {
                throw core::InvalidRequestError("'return_decision_process' must be a boolean");
            }
            req.recognizerConfig.returnExplanation = v.asBool();
        }
        else if (key == "mask_char") {
            std::string c = detail::requireString(v, "mask_char");
            if (c.size() != 1) {
                throw core::InvalidRequestError("'mask_char' must be a single character");
            }
            req.operatorSpec.maskChar = c[0];
        }
        else if (key == "number_of_chars") {
            if (!v.isInt()) {
                throw core::InvalidRequestError("'number_of_chars' must be an integer");
            }
            req.operatorSpec.numberOfChars = v.asInt();
        }
        else if (key == "encrypt_key") {
            std::string k = detail::requireString(v, "encrypt_key");
            req.operatorSpec.encryptKey = std::vector<uint8_t>(k.begin(), k.end());
        }
        else {
            util::logger::debug("parseRequest: ignoring unknown key '" + key + "'");
        }
    }

    switch (req.mode) {
    case RequestMode::Anonymize:
        if (!root.isMember("payload")) {
            throw core::InvalidRequestError("mode 'anonymize' needs a 'payload'");
        }
        break;
    case RequestMode::AnonymizeText:
    case RequestMode::Analyze:
    case RequestMode::Annotate:
        if (!root.isMember("text")) {
            throw core::InvalidRequestError("this mode needs a 'text' string");
        }
        break;
    case RequestMode::Entities:
        break;
    }
    return req;
}

} // namespace service
} // namespace piianon

#endif // PIIANON_SERVICE_REQUEST_HPP
