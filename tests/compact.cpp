#include <doctest/doctest.h>
#include "jwsign/compact.hpp"
#include "test_keys.hpp"

using namespace jwsign;

TEST_CASE("Compact: Serialize layout") {
    Header header = {{"alg", "HS256"}};
    Payload payload = {{"claim", "x"}};
    auto key = Key::fromSecret("secret");

    std::string token = compact::serialize(header, payload, key);
    std::string prefix = "eyJhbGciOiJIUzI1NiJ9.eyJjbGFpbSI6IngifQ.";
    REQUIRE(token.starts_with(prefix));

    auto signature = sign(header, payload, key);
    CHECK(token.substr(prefix.size()) == base64UrlEncode(signature));
}

TEST_CASE("Compact: Parse without verifying") {
    Header header = {{"alg", "ES256"}, {"kid", "k1"}};
    Payload payload = {{"sub", "alice"}};
    std::string token = compact::serialize(header, payload, test_keys::ec());

    auto jws = compact::parse(token);
    CHECK(jws.header == header);
    CHECK(jws.payload == payload);
    CHECK(jws.signature.size() == 64);
    CHECK(token.starts_with(jws.signingInput + "."));
}

TEST_CASE("Compact: Verify round trip") {
    for (const char* alg : {"HS384", "RS256", "ES512"}) {
        CAPTURE(alg);
        Header header = {{"alg", alg}, {"typ", "JWT"}};
        Payload payload = {{"scope", "read"}};
        auto keys = test_keys::pairFor(alg);

        std::string token = compact::serialize(header, payload, keys.signing);
        auto jws = compact::verify(token, keys.verifying);
        CHECK(jws.payload == payload);
    }
}

TEST_CASE("Compact: Tampered segments are rejected") {
    Header header = {{"alg", "HS256"}};
    auto key = Key::fromSecret("secret");
    std::string token = compact::serialize(header, {{"role", "user"}}, key);
    auto first_dot = token.find('.');
    auto second_dot = token.find('.', first_dot + 1);

    std::string forged_payload = token.substr(0, first_dot + 1) +
                                 codec::encodeSegment({{"role", "admin"}}) +
                                 token.substr(second_dot);
    CHECK_THROWS_AS(compact::verify(forged_payload, key), SignatureError);

    // Swapping alg for none is an unknown algorithm, not a valid token
    std::string forged_alg = codec::encodeSegment({{"alg", "none"}}) + token.substr(first_dot);
    CHECK_THROWS_AS(compact::verify(forged_alg, key), AlgorithmNotImplementedError);

    CHECK_THROWS_AS(compact::verify(token, Key::fromSecret("badsecret")), SignatureError);
}

TEST_CASE("Compact: Non-canonical signature encodings are rejected") {
    const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    auto key = Key::fromSecret("secret");
    std::string token = compact::serialize({{"alg", "HS256"}}, {{"claim", "x"}}, key);

    // A 32 byte MAC leaves two unused bits in the last character
    std::string altered = token;
    altered.back() = alphabet[alphabet.find(token.back()) ^ 1];
    REQUIRE(altered != token);
    CHECK_THROWS_AS(compact::verify(altered, key), InvalidBase64Error);

    CHECK_THROWS_AS(compact::verify(token + "=", key), InvalidBase64Error);
    CHECK_NOTHROW(compact::verify(token, key));
}

TEST_CASE("Compact: Transmitted bytes are verified") {
    // Same JSON with different key order still has to match the signed bytes
    Header header = {{"alg", "HS256"}};
    auto key = Key::fromSecret("secret");
    std::string token = compact::serialize(header, {{"a", 1}, {"b", 2}}, key);
    auto first_dot = token.find('.');
    auto second_dot = token.find('.', first_dot + 1);

    std::string reordered = token.substr(0, first_dot + 1) +
                            base64UrlEncode(std::string_view(R"({"b":2,"a":1})")) +
                            token.substr(second_dot);
    auto parsed = compact::parse(reordered);
    CHECK(parsed.payload == Payload{{"a", 1}, {"b", 2}});
    CHECK_THROWS_AS(compact::verify(reordered, key), SignatureError);
}

TEST_CASE("Compact: Malformed tokens") {
    CHECK_THROWS_AS(compact::parse(""), DecodeError);
    CHECK_THROWS_AS(compact::parse("abc"), DecodeError);
    CHECK_THROWS_AS(compact::parse("a.b"), DecodeError);
    CHECK_THROWS_AS(compact::parse("a.b.c.d"), DecodeError);
    CHECK_THROWS_AS(compact::parse("eyJhbGciOiJIUzI1NiJ9..c2ln"), DecodeError);
    CHECK_THROWS_AS(compact::parse("eyJhbGciOiJIUzI1NiJ9.eyJ9.@@@@"), DecodeError);
    CHECK_THROWS_AS(compact::parse("eyJhbGciOiJIUzI1NiJ9.e30.@@@@"), InvalidBase64Error);
}

TEST_CASE("Compact: Engine configuration applies") {
    auto engine = JwsEngine().withAllowedAlgorithms({"ES256"});
    auto key = Key::fromSecret("secret");

    CHECK_THROWS_AS(compact::serialize({{"alg", "HS256"}}, {{"claim", "x"}}, key, engine),
                    AlgorithmNotAllowedError);

    std::string token = compact::serialize({{"alg", "HS256"}}, {{"claim", "x"}}, key);
    CHECK_THROWS_AS(compact::verify(token, key, engine), AlgorithmNotAllowedError);
}
