// test/unit/test_anonymizer_service.cpp
// -----------------------------------------------------------
// AnonymizerService entry points, request parsing, status mapping in
// handleRequest, and isolation of concurrent requests on the ThreadPool.

#include <gtest/gtest.h>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

#include "anonymize/operator_engine.hpp"
#include "anonymize/token_cache.hpp"
#include "config/anonymizer_config.hpp"
#include "core/errors.hpp"
#include "detection/detection_engine.hpp"
#include "service/anonymizer_service.hpp"
#include "service/request.hpp"
#include "service/request_handler.hpp"
#include "service/response.hpp"
#include "util/thread_pool.hpp"

namespace {

using piianon::anonymize::OperatorKind;
using piianon::anonymize::OperatorSpec;
using piianon::anonymize::TokenStrategy;
using piianon::service::AnonymizerService;
using piianon::service::Request;
using piianon::service::RequestMode;
using piianon::service::Response;

std::shared_ptr<piianon::config::AnonymizerConfig> makeSettings() {
    auto settings = std::make_shared<piianon::config::AnonymizerConfig>();
    settings->termLists["PERSON"] = {"Alice Johnson", "Bob Smith"};
    return settings;
}

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value out;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
        throw std::runtime_error("test JSON did not parse: " + errs);
    }
    return out;
}

class BrokenEngine : public piianon::detection::DetectionEngine {
public:
    std::vector<piianon::recognizers::RecognizerResult> analyze(
        const std::string&, const std::optional<std::set<std::string>>&, bool) const override {
        throw std::runtime_error("NER backend crashed");
    }

    std::vector<std::string> supportedEntities() const override { return {"GENERIC_PII", "PERSON"}; }
};

// -----------------------------------------------------------
// AnonymizerService
// -----------------------------------------------------------

TEST(AnonymizerServiceTest, AnonymizeTextWithReplace) {
    AnonymizerService service(makeSettings());
    auto result = service.anonymizeText("Call Alice Johnson at 555-1234",
                                        service.defaultRecognizerConfig(), OperatorSpec());

    EXPECT_EQ(result.anonymizedText, "Call <PERSON_1> at <PHONE_NUMBER_1>");
    ASSERT_EQ(result.findings.size(), (size_t)2);
    EXPECT_EQ(result.findings[0].text, "Alice Johnson");
    EXPECT_EQ(result.findings[1].text, "555-1234");
    EXPECT_EQ(result.summary.at("PERSON"), (size_t)1);
    EXPECT_EQ(result.summary.at("PHONE_NUMBER"), (size_t)1);
}

TEST(AnonymizerServiceTest, FreshTokensPerCall) {
    AnonymizerService service(makeSettings());
    auto config = service.defaultRecognizerConfig();
    auto first = service.anonymizeText("Bob Smith", config, OperatorSpec());
    auto second = service.anonymizeText("Alice Johnson", config, OperatorSpec());
    EXPECT_EQ(first.anonymizedText, "<PERSON_1>");
    EXPECT_EQ(second.anonymizedText, "<PERSON_1>");
}

TEST(AnonymizerServiceTest, AnonymizeTextHonoursOperator) {
    AnonymizerService service(makeSettings());
    OperatorSpec mask;
    mask.kind = OperatorKind::Mask;
    mask.numberOfChars = 4;
    auto result = service.anonymizeText("Bob Smith here", service.defaultRecognizerConfig(), mask);
    EXPECT_EQ(result.anonymizedText, "**** here");
}

TEST(AnonymizerServiceTest, StructureModeAlwaysUsesTokens) {
    AnonymizerService service(makeSettings());
    OperatorSpec mask;
    mask.kind = OperatorKind::Mask;

    Json::Value payload = parse(R"({"a": "Bob Smith", "b": ["Bob Smith", 1]})");
    auto result = service.anonymizeStructure(payload, service.defaultRecognizerConfig(), mask);
    EXPECT_EQ(result.anonymizedValue["a"].asString(), "<PERSON_1>");
    EXPECT_EQ(result.anonymizedValue["b"][0].asString(), "<PERSON_1>");
    EXPECT_EQ(result.anonymizedValue["b"][1].asInt(), 1);
    EXPECT_EQ(result.summary.at("PERSON"), (size_t)2);

    auto hashed = service.anonymizeStructure(payload, service.defaultRecognizerConfig(), OperatorSpec(),
                                             TokenStrategy::Hash);
    EXPECT_EQ(hashed.anonymizedValue["a"].asString(),
              piianon::anonymize::TokenCache::hashToken("PERSON", "Bob Smith"));
}

TEST(AnonymizerServiceTest, EndToEndStructure) {
    AnonymizerService service(makeSettings());
    piianon::core::RecognizerConfig config;
    config.entities = std::set<std::string>{"PERSON"};

    Json::Value payload = parse(R"({
        "users": ["Alice Johnson", "Bob Smith", "Alice Johnson"],
        "message": "Alice Johnson sent a message to Bob Smith"
    })");
    Json::Value expected = parse(R"({
        "users": ["<PERSON_1>", "<PERSON_2>", "<PERSON_1>"],
        "message": "<PERSON_1> sent a message to <PERSON_2>"
    })");
    auto result = service.anonymizeStructure(payload, config, OperatorSpec());
    EXPECT_EQ(result.anonymizedValue, expected);
    EXPECT_EQ(result.summary.at("PERSON"), (size_t)5);

    auto ages = service.anonymizeStructure(parse(R"({"age": 30})"), config, OperatorSpec());
    EXPECT_EQ(ages.anonymizedValue["age"].asInt(), 30);
}

TEST(AnonymizerServiceTest, MaskLengthIgnoresMatchLength) {
    AnonymizerService service(makeSettings());
    auto result = service.anonymizeText("My SSN is 123-45-6789", service.defaultRecognizerConfig(),
                                        OperatorSpec{OperatorKind::Mask});
    EXPECT_EQ(result.anonymizedText, "My SSN is " + std::string(15, '*'));
}

TEST(AnonymizerServiceTest, AllowAndDenyLists) {
    auto settings = makeSettings();
    settings->termLists["PERSON"].push_back("May");
    AnonymizerService service(settings);

    auto config = service.defaultRecognizerConfig();
    config.allowList.insert("May");
    for (const auto& f : service.analyze("May attended the meeting", config).findings) {
        EXPECT_NE(f.text, "May");
    }

    config.denyList.insert("BlueHawk");
    auto denied = service.analyze("The project codename is BlueHawk", config);
    ASSERT_EQ(denied.findings.size(), (size_t)1);
    EXPECT_EQ(denied.findings[0].entityType, "GENERIC_PII");
    EXPECT_EQ(denied.findings[0].text, "BlueHawk");
    EXPECT_DOUBLE_EQ(denied.findings[0].score, 1.0);
}

TEST(AnonymizerServiceTest, LongTextDoesNotExhaustStack) {
    AnonymizerService service(makeSettings());
    auto config = service.defaultRecognizerConfig();

    const std::string letters(1000000, 'a');
    auto plain = service.anonymizeText(letters, config, OperatorSpec());
    EXPECT_EQ(plain.anonymizedText, letters);
    EXPECT_TRUE(plain.findings.empty());

    auto link = service.anonymizeText("see http://example.com/" + std::string(50000, 'a'), config, OperatorSpec());
    EXPECT_EQ(link.anonymizedText, "see <URL_1>");
}

TEST(AnonymizerServiceTest, TextFindingsAreTheReplacedSpans) {
    AnonymizerService service(makeSettings());
    auto config = service.defaultRecognizerConfig();
    config.denyList.insert("Smith");

    auto result = service.anonymizeText("Hi Bob Smith", config, OperatorSpec());
    EXPECT_EQ(result.anonymizedText, "Hi Bob <GENERIC_PII_1>");
    ASSERT_EQ(result.findings.size(), (size_t)1);
    EXPECT_EQ(result.findings[0].entityType, "GENERIC_PII");
    EXPECT_EQ(result.summary.count("PERSON"), (size_t)0);

    // analyze still reports both overlapping types
    EXPECT_EQ(service.analyze("Hi Bob Smith", config).findings.size(), (size_t)2);
}

TEST(AnonymizerServiceTest, AnalyzeAndAnnotate) {
    AnonymizerService service(makeSettings());
    auto config = service.defaultRecognizerConfig();

    auto analysis = service.analyze("Bob Smith, bob@example.com", config);
    ASSERT_EQ(analysis.findings.size(), (size_t)2);
    EXPECT_EQ(analysis.summary.at("EMAIL_ADDRESS"), (size_t)1);

    auto annotation = service.annotate("Hi Bob Smith!", config);
    ASSERT_EQ(annotation.segments.size(), (size_t)3);
    EXPECT_EQ(annotation.segments[1].text, "Bob Smith");
    EXPECT_EQ(annotation.segments[1].entityType.value(), "PERSON");
    EXPECT_EQ(annotation.summary.at("PERSON"), (size_t)1);
}

TEST(AnonymizerServiceTest, SupportedEntitiesAndDefaults) {
    AnonymizerService service(makeSettings());
    auto entities = service.listSupportedEntities();
    EXPECT_EQ(entities, service.listSupportedEntities());
    std::set<std::string> asSet(entities.begin(), entities.end());
    EXPECT_EQ(asSet.count("PERSON"), (size_t)1);
    EXPECT_EQ(asSet.count("GENERIC_PII"), (size_t)1);

    // LOCATION is a default entity but nothing recognizes it here
    auto defaults = service.defaultRecognizerConfig();
    ASSERT_TRUE(defaults.entities.has_value());
    EXPECT_EQ(defaults.entities->count("LOCATION"), (size_t)0);
    EXPECT_EQ(defaults.entities->count("PERSON"), (size_t)1);
    EXPECT_DOUBLE_EQ(defaults.scoreThreshold, 0.35);
}

TEST(AnonymizerServiceTest, InvalidRequestsRejected) {
    AnonymizerService service(makeSettings());

    piianon::core::RecognizerConfig unknownEntity;
    unknownEntity.entities = std::set<std::string>{"SHOE_SIZE"};
    EXPECT_THROW(service.analyze("x", unknownEntity), piianon::core::InvalidRequestError);

    piianon::core::RecognizerConfig badThreshold;
    badThreshold.scoreThreshold = 1.5;
    EXPECT_THROW(service.analyze("x", badThreshold), piianon::core::InvalidRequestError);

    OperatorSpec noKey;
    noKey.kind = OperatorKind::Encrypt;
    EXPECT_THROW(service.anonymizeText("Bob Smith", service.defaultRecognizerConfig(), noKey),
                 piianon::core::MissingKeyError);
}

TEST(AnonymizerServiceTest, EngineFaultPropagates) {
    AnonymizerService service(makeSettings(), std::make_shared<BrokenEngine>());
    EXPECT_THROW(service.anonymizeText("Bob", service.defaultRecognizerConfig(), OperatorSpec()),
                 piianon::core::DetectionEngineError);
}

TEST(AnonymizerServiceTest, ConcurrentRequestsAreIsolated) {
    AnonymizerService service(makeSettings());
    piianon::util::ThreadPool pool(4);

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 16; ++i) {
        const std::string text = (i % 2 == 0) ? "Bob Smith met Alice Johnson" : "Alice Johnson met Bob Smith";
        results.push_back(pool.enqueue([&service, text] {
            return service.anonymizeText(text, service.defaultRecognizerConfig(), OperatorSpec())
                .anonymizedText;
        }));
    }
    for (auto& f : results) {
        EXPECT_EQ(f.get(), "<PERSON_1> met <PERSON_2>");
    }
}

// -----------------------------------------------------------
// Request parsing
// -----------------------------------------------------------

TEST(RequestTest, ParsesAllFields) {
    piianon::core::RecognizerConfig defaults;
    Request req = piianon::service::parseRequest(R"({
        "mode": "anonymize_text",
        "text": "hello",
        "operator": "encrypt",
        "encrypt_key": "WmZq4t7w!z%C&F)J",
        "entities": ["PERSON", "EMAIL_ADDRESS"],
        "score_threshold": 0.6,
        "allow_list": ["May"],
        "deny_list": ["BlueHawk"],
        "mask_char": "#",
        "number_of_chars": 4,
        "return_decision_process": true
    })", defaults);

    EXPECT_EQ(req.mode, RequestMode::AnonymizeText);
    EXPECT_EQ(req.text, "hello");
    EXPECT_EQ(req.operatorSpec.kind, OperatorKind::Encrypt);
    ASSERT_TRUE(req.operatorSpec.encryptKey.has_value());
    EXPECT_EQ(req.operatorSpec.encryptKey->size(), (size_t)16);
    ASSERT_TRUE(req.recognizerConfig.entities.has_value());
    EXPECT_EQ(req.recognizerConfig.entities->size(), (size_t)2);
    EXPECT_DOUBLE_EQ(req.recognizerConfig.scoreThreshold, 0.6);
    EXPECT_EQ(req.recognizerConfig.allowList.count("May"), (size_t)1);
    EXPECT_EQ(req.recognizerConfig.denyList.count("BlueHawk"), (size_t)1);
    EXPECT_EQ(req.operatorSpec.maskChar, '#');
    EXPECT_EQ(req.operatorSpec.numberOfChars, 4);
    EXPECT_TRUE(req.recognizerConfig.returnExplanation);
}

TEST(RequestTest, DefaultsAndEmptyEntityList) {
    piianon::core::RecognizerConfig defaults;
    defaults.entities = std::set<std::string>{"PERSON"};
    defaults.scoreThreshold = 0.4;

    Request req = piianon::service::parseRequest(R"({"payload": {"k": "v"}})", defaults);
    EXPECT_EQ(req.mode, RequestMode::Anonymize);
    EXPECT_EQ(req.strategy, TokenStrategy::Replace);
    EXPECT_DOUBLE_EQ(req.recognizerConfig.scoreThreshold, 0.4);
    EXPECT_EQ(req.recognizerConfig.entities->count("PERSON"), (size_t)1);

    Request all = piianon::service::parseRequest(R"({"payload": 1, "entities": [], "strategy": "hash"})", defaults);
    EXPECT_FALSE(all.recognizerConfig.entities.has_value());
    EXPECT_EQ(all.strategy, TokenStrategy::Hash);
}

TEST(RequestTest, InvalidUtf8Rejected) {
    piianon::core::RecognizerConfig defaults;
    using piianon::core::InvalidRequestError;
    using piianon::service::parseRequest;

    EXPECT_THROW(parseRequest(std::string("{\"payload\": {\"a\": \"x\xff\xfe") + "y\"}}", defaults),
                 InvalidRequestError);
    // truncated sequence, overlong '/', UTF-16 surrogate
    EXPECT_THROW(parseRequest(std::string("{\"text\": \"caf\xc3\"}"), defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(std::string("{\"text\": \"\xc0\xaf\"}"), defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(std::string("{\"text\": \"\xed\xa0\x80\"}"), defaults), InvalidRequestError);

    Request ok = parseRequest(std::string("{\"mode\": \"analyze\", \"text\": \"Zo\xc3\xab \xe2\x82\xac \xf0\x9f\x98\x80\"}"),
                              defaults);
    EXPECT_EQ(ok.text, "Zo\xc3\xab \xe2\x82\xac \xf0\x9f\x98\x80");
}

TEST(RequestTest, MalformedDocumentsRejected) {
    piianon::core::RecognizerConfig defaults;
    using piianon::core::InvalidRequestError;
    using piianon::service::parseRequest;

    EXPECT_THROW(parseRequest("not json", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest("[1, 2]", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"mode": "explode"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"mode": "analyze"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"mode": "anonymize"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"payload": 1, "strategy": "random"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"payload": 1, "entities": "PERSON"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"payload": 1, "mask_char": "##"})", defaults), InvalidRequestError);
    EXPECT_THROW(parseRequest(R"({"payload": 1, "operator": "shred"})", defaults),
                 piianon::core::InvalidOperatorError);
}

// -----------------------------------------------------------
// handleRequest status mapping
// -----------------------------------------------------------

TEST(RequestHandlerTest, SuccessfulModes) {
    AnonymizerService service(makeSettings());
    using piianon::service::handleRequest;

    Response text = handleRequest(service, R"({"mode": "anonymize_text", "text": "Bob Smith", "operator": "redact"})");
    EXPECT_EQ(text.statusCode, 200);
    EXPECT_EQ(text.result["anonymized_text"].asString(), "");
    EXPECT_EQ(text.result["summary"]["PERSON"].asUInt64(), (Json::UInt64)1);

    Response structure = handleRequest(service, R"({"payload": {"who": ["Bob Smith"]}})");
    EXPECT_EQ(structure.statusCode, 200);
    EXPECT_EQ(structure.result["anonymized_payload"]["who"][0].asString(), "<PERSON_1>");
    EXPECT_EQ(structure.result["findings"][0]["path"].asString(), "/who/0");
    EXPECT_EQ(structure.result["stats"]["total_strings"].asUInt64(), (Json::UInt64)1);

    Response explained = handleRequest(
        service, R"({"mode": "analyze", "text": "call 555-1234", "return_decision_process": true})");
    EXPECT_EQ(explained.statusCode, 200);
    const Json::Value& ex = explained.result["findings"][0]["explanation"];
    EXPECT_EQ(ex["recognizer"].asString(), "PhoneRecognizer");
    EXPECT_EQ(ex["supportive_context_word"].asString(), "call");

    Response entities = handleRequest(service, R"({"mode": "entities"})");
    EXPECT_EQ(entities.statusCode, 200);
    EXPECT_TRUE(entities.result["entities"].isArray());

    Json::Value rendered = parse(entities.toJson());
    EXPECT_EQ(rendered["status"].asInt(), 200);
    EXPECT_EQ(rendered["message"].asString(), "OK");
}

TEST(RequestHandlerTest, PayloadKeepsDocumentOrder) {
    AnonymizerService service(makeSettings());
    Response r = piianon::service::handleRequest(
        service, R"({"payload": {"zeta": "Bob Smith", "alpha": "Alice Johnson", "n": 0.1}})");
    ASSERT_EQ(r.statusCode, 200);

    const std::string out = r.toJson();
    EXPECT_NE(out.find(R"("anonymized_payload":{"zeta":"<PERSON_1>","alpha":"<PERSON_2>","n":0.1})"),
              std::string::npos)
        << out;
}

TEST(RequestHandlerTest, NumbersUseShortestForm) {
    Json::Value body(Json::objectValue);
    body["score"] = 0.85;
    body["ratio"] = 0.1;
    body["whole"] = 2.0;
    body["count"] = 7;
    Response r(200, "OK", body);
    EXPECT_EQ(r.toJson(),
              R"({"message":"OK","result":{"count":7,"ratio":0.1,"score":0.85,"whole":2.0},"status":200})");
}

TEST(RequestHandlerTest, InvalidUtf8Is400) {
    AnonymizerService service(makeSettings());
    Response r = piianon::service::handleRequest(
        service, std::string("{\"payload\": {\"a\": \"x\xff\xfe") + "y\"}}");
    EXPECT_EQ(r.statusCode, 400);
    EXPECT_EQ(r.message, "Invalid UTF-8 encoding in request body");
}

TEST(RequestHandlerTest, ClientErrorsMapTo400) {
    AnonymizerService service(makeSettings());
    using piianon::service::handleRequest;

    EXPECT_EQ(handleRequest(service, "{").statusCode, 400);
    EXPECT_EQ(handleRequest(service, R"({"text": "x", "mode": "anonymize_text", "operator": "shred"})").statusCode, 400);
    EXPECT_EQ(handleRequest(service, R"({"text": "x", "mode": "anonymize_text", "operator": "encrypt"})").statusCode, 400);
    EXPECT_EQ(handleRequest(service, R"({"text": "x", "mode": "anonymize_text", "operator": "mask", "number_of_chars": -2})").statusCode, 400);
    EXPECT_EQ(handleRequest(service, R"({"text": "x", "mode": "analyze", "entities": ["SHOE_SIZE"]})").statusCode, 400);

    std::string deep = "{\"payload\": ";
    for (int i = 0; i < 300; ++i) {
        deep += "[";
    }
    for (int i = 0; i < 300; ++i) {
        deep += "]";
    }
    deep += "}";
    Response tooDeep = handleRequest(service, deep);
    EXPECT_EQ(tooDeep.statusCode, 400);
}

TEST(RequestHandlerTest, OversizedDocumentIs413) {
    auto settings = makeSettings();
    settings->maxRequestBytes = 32;
    AnonymizerService service(settings);
    Response r = piianon::service::handleRequest(
        service, R"({"mode": "anonymize_text", "text": "this document is longer than thirty-two bytes"})");
    EXPECT_EQ(r.statusCode, 413);
}

TEST(RequestHandlerTest, EngineFaultIs500) {
    AnonymizerService service(makeSettings(), std::make_shared<BrokenEngine>());
    Response r = piianon::service::handleRequest(service, R"({"mode": "analyze", "text": "Bob"})");
    EXPECT_EQ(r.statusCode, 500);
    EXPECT_FALSE(r.ok());
}

} // anonymous namespace
