// test/test_keycodec.cpp
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

#include "../src/errors/CacheErrors.hpp"
#include "../src/key/KeyCodec.hpp"

namespace {
    struct GeoQuery {
        double lat;
        double lon;
        std::string country;
    };

    void to_json(nlohmann::json& j, const GeoQuery& q) {
        j = nlohmann::json{{"lat", q.lat}, {"lon", q.lon}, {"country", q.country}};
    }

    struct Unserializable {
        int id;
    };

    void to_json(nlohmann::json& /* j */, const Unserializable& /* u */) {
        throw std::runtime_error("no stable representation");
    }
}

TEST(KeyCodecTest, SameArgumentsGiveSameKey) {
    KeyCodec codec("lookup");
    auto first = codec.encode(42, std::string("US"), true);
    auto second = codec.encode(42, std::string("US"), true);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.hash, second.hash);
    EXPECT_EQ(std::hash<CacheKey>{}(first), first.hash);
}

TEST(KeyCodecTest, StringLiteralAndStdStringAreTheSameArgument) {
    KeyCodec codec;
    EXPECT_EQ(codec.encode("abc"), codec.encode(std::string("abc")));
    const char* pointer = "abc";
    EXPECT_EQ(codec.encode(pointer), codec.encode(std::string("abc")));
}

TEST(KeyCodecTest, DifferentArgumentsGiveDifferentKeys) {
    KeyCodec codec;
    EXPECT_NE(codec.encode(1, 2), codec.encode(2, 1));
    EXPECT_NE(codec.encode(1), codec.encode(1, 1));
    EXPECT_NE(codec.encode(std::string("a,b")), codec.encode(std::string("a"), std::string("b")));
}

TEST(KeyCodecTest, ArgumentTypesAreDistinguished) {
    KeyCodec codec;
    EXPECT_NE(codec.encode(1), codec.encode(std::string("1")));
    EXPECT_NE(codec.encode(1), codec.encode(true));
    EXPECT_NE(codec.encode(1), codec.encode(1.5));
    EXPECT_NE(codec.encode(nullptr), codec.encode(0));
}

TEST(KeyCodecTest, NamespaceSeparatesProducers) {
    KeyCodec users("users");
    KeyCodec orders("orders");
    EXPECT_NE(users.encode(7), orders.encode(7));
    EXPECT_EQ(users.nameSpace(), "users");
}

TEST(KeyCodecTest, ZeroArgumentsIsAValidKey) {
    KeyCodec codec("config");
    EXPECT_EQ(codec.encode(), codec.encode());
    EXPECT_EQ(codec.encode().canonical, R"(["config",[]])");
}

TEST(KeyCodecTest, MapsAreCanonicalRegardlessOfInsertionOrder) {
    KeyCodec codec;
    std::unordered_map<std::string, int> first;
    first["zeta"] = 1;
    first["alpha"] = 2;
    first["mid"] = 3;
    std::map<std::string, int> second = {{"mid", 3}, {"alpha", 2}, {"zeta", 1}};
    EXPECT_EQ(codec.encode(first), codec.encode(second));
}

TEST(KeyCodecTest, ContainersAndTuples) {
    KeyCodec codec;
    std::vector<int> ids = {3, 1, 2};
    auto key = codec.encode(ids, std::make_tuple(1, std::string("x")));
    EXPECT_EQ(key.canonical, R"(["",[[3,1,2],[1,"x"]]])");
    EXPECT_NE(key, codec.encode(std::vector<int>{1, 2, 3}, std::make_tuple(1, std::string("x"))));
}

TEST(KeyCodecTest, UserTypesWithToJson) {
    KeyCodec codec("geo");
    GeoQuery query{52.5, 13.4, "DE"};
    EXPECT_EQ(codec.encode(query), codec.encode(GeoQuery{52.5, 13.4, "DE"}));
    EXPECT_NE(codec.encode(query), codec.encode(GeoQuery{52.5, 13.4, "AT"}));
}

TEST(KeyCodecTest, NonFiniteNumbersAreRejected) {
    KeyCodec codec;
    EXPECT_THROW(codec.encode(std::numeric_limits<double>::quiet_NaN()), KeyEncodingError);
    EXPECT_THROW(codec.encode(1, std::numeric_limits<double>::infinity()), KeyEncodingError);
    EXPECT_THROW(codec.encode(std::vector<double>{1.0, -std::numeric_limits<double>::infinity()}), KeyEncodingError);
    EXPECT_THROW(codec.encode(GeoQuery{std::nan(""), 0.0, "XX"}), KeyEncodingError);
}

TEST(KeyCodecTest, InvalidUtf8IsRejected) {
    KeyCodec codec;
    std::string broken = "caf\xC3";
    EXPECT_THROW(codec.encode(broken), KeyEncodingError);
}

TEST(KeyCodecTest, ThrowingSerializerIsReportedAsEncodingError) {
    KeyCodec codec;
    EXPECT_THROW(codec.encode(Unserializable{1}), KeyEncodingError);
}

TEST(KeyCodecTest, KeyEncodingErrorIsAnInvalidArgument) {
    KeyCodec codec;
    EXPECT_THROW(codec.encode(std::numeric_limits<float>::quiet_NaN()), std::invalid_argument);
}

TEST(KeyCodecTest, KeysWorkInUnorderedContainers) {
    KeyCodec codec;
    std::unordered_set<CacheKey> keys;
    keys.insert(codec.encode(1));
    keys.insert(codec.encode(1));
    keys.insert(codec.encode(2));
    EXPECT_EQ(keys.size(), 2u);
}

TEST(CacheKeyTest, EqualHashWithDifferentTextIsNotEqual) {
    CacheKey forged_a{12345, "[\"\",[1]]"};
    CacheKey forged_b{12345, "[\"\",[2]]"};
    EXPECT_NE(forged_a, forged_b);
}
