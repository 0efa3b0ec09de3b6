#include <catch2/catch_test_macros.hpp>
#include "keyferry/encoding/base64_url.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
using namespace keyferry::onboarding;
using keyferry::onboarding::encoding::Base64Url;
TEST_CASE("Base64Url - Encoding", "[encoding][base64]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("RFC 4648 vectors without padding") {
        const std::vector<uint8_t> f = {'f'};
        const std::vector<uint8_t> fo = {'f', 'o'};
        const std::vector<uint8_t> foo = {'f', 'o', 'o'};
        REQUIRE(Base64Url::Encode(f) == "Zg");
        REQUIRE(Base64Url::Encode(fo) == "Zm8");
        REQUIRE(Base64Url::Encode(foo) == "Zm9v");
    }
    SECTION("URL-safe alphabet") {
        const std::vector<uint8_t> data = {0xFB, 0xFF, 0xBF};
        REQUIRE(Base64Url::Encode(data) == "-_-_");
    }
    SECTION("Empty input") {
        REQUIRE(Base64Url::Encode({}).empty());
        auto decoded = Base64Url::Decode("");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().empty());
    }
}
TEST_CASE("Base64Url - Decoding", "[encoding][base64]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Round trip of binary data") {
        std::vector<uint8_t> data(257);
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<uint8_t>(i);
        }
        REQUIRE(Base64Url::Decode(Base64Url::Encode(data)).Unwrap() == data);
    }
    SECTION("Rejects padding") {
        auto result = Base64Url::Decode("Zg==");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Decode);
    }
    SECTION("Rejects the standard alphabet") {
        REQUIRE(Base64Url::Decode("+/+/").IsErr());
    }
    SECTION("Rejects whitespace and trailing garbage") {
        REQUIRE(Base64Url::Decode("Zm9v ").IsErr());
        REQUIRE(Base64Url::Decode("Zm9v!").IsErr());
    }
}
