// test/unit/test_util.cpp
// -----------------------------------------------------------
// Hashing, crypto, compact JSON writing, log-level parsing and ThreadPool.

#include <gtest/gtest.h>
#include <atomic>
#include <cstdlib>
#include <memory>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

#include "util/crypto.hpp"
#include "util/hashing.hpp"
#include "util/json_writer.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace {

using namespace piianon::util;

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(HashingTest, Sha256KnownVectors) {
    EXPECT_EQ(hashing::sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hashing::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingTest, ShortDigestIsPrefix) {
    EXPECT_EQ(hashing::shortDigest("abc"), "ba7816bf");
    EXPECT_EQ(hashing::shortDigest("abc", 4), "ba78");
    EXPECT_EQ(hashing::shortDigest("abc").size(), hashing::kShortDigestLength);
}

TEST(CryptoTest, Base64Encode) {
    EXPECT_EQ(crypto::base64Encode({}), "");
    EXPECT_EQ(crypto::base64Encode(bytes("f")), "Zg==");
    EXPECT_EQ(crypto::base64Encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(crypto::base64Encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(CryptoTest, AesRejectsBadKeySize) {
    EXPECT_THROW(crypto::aesEncryptToBase64("x", bytes("short")), std::invalid_argument);
    EXPECT_THROW(crypto::aesEncryptToBase64("x", bytes("seventeen bytes!!")), std::invalid_argument);
}

TEST(CryptoTest, AesOutputLength) {
    // 16-byte IV plus one padded block, base64-encoded
    const std::string out = crypto::aesEncryptToBase64("555-1234", bytes("WmZq4t7w!z%C&F)J"));
    EXPECT_EQ(out.size(), (size_t)44);
}

TEST(JsonWriterTest, ParsedMembersKeepDocumentOrder) {
    const std::string text = R"({"b": 1, "a": {"z": null, "y": [true, "s"]}, "c": -2})";
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value doc;
    std::string errs;
    ASSERT_TRUE(reader->parse(text.data(), text.data() + text.size(), &doc, &errs)) << errs;

    EXPECT_EQ(json::writeCompact(doc), R"({"b":1,"a":{"z":null,"y":[true,"s"]},"c":-2})");

    Json::Value copy = doc;
    EXPECT_EQ(json::memberNamesInDocumentOrder(copy), (std::vector<std::string>{"b", "a", "c"}));
}

TEST(JsonWriterTest, BuiltObjectsUseNameOrder) {
    Json::Value v(Json::objectValue);
    v["zeta"] = "caf\xc3\xa9";
    v["alpha"] = Json::Value(Json::arrayValue);
    EXPECT_EQ(json::writeCompact(v), "{\"alpha\":[],\"zeta\":\"caf\xc3\xa9\"}");
}

TEST(JsonWriterTest, ShortestRealThatRoundTrips) {
    EXPECT_EQ(json::formatReal(0.1), "0.1");
    EXPECT_EQ(json::formatReal(0.85), "0.85");
    EXPECT_EQ(json::formatReal(3.0), "3.0");
    const double third = 1.0 / 3.0;
    EXPECT_EQ(std::strtod(json::formatReal(third).c_str(), nullptr), third);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(logger::parseLogLevel("debug"), logger::LogLevel::DEBUG);
    EXPECT_EQ(logger::parseLogLevel("Warning"), logger::LogLevel::WARN);
    EXPECT_EQ(logger::parseLogLevel("CRITICAL"), logger::LogLevel::CRITICAL);
    EXPECT_THROW(logger::parseLogLevel("verbose"), std::invalid_argument);
}

TEST(ThreadPoolTest, RunsAllTasks) {
    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), (size_t)3);
        for (int i = 0; i < 50; ++i) {
            results.push_back(pool.enqueue([&counter, i] {
                ++counter;
                return i * 2;
            }));
        }
        for (int i = 0; i < 50; ++i) {
            EXPECT_EQ(results[i].get(), i * 2);
        }
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

} // anonymous namespace
