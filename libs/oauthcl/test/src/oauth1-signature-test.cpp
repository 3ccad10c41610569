#include <catch2/catch_all.hpp>

#include "oauthcl/oauth1-signature.hpp"

#include <regex>
#include <string>
#include <thread>
#include <vector>

using namespace oauthcl;
using namespace oauthcl::oauth1;

namespace
{

Parameters requiredParams(std::string const& method = "HMAC-SHA1")
{
    return {
        {"oauth_consumer_key", "ck"},
        {"oauth_timestamp", "1"},
        {"oauth_nonce", "n"},
        {"oauth_version", "1.0"},
        {"oauth_signature_method", method},
    };
}

std::string testKey(std::string const& name)
{
    return std::string(OAUTHCL_TEST_DATA_DIR) + "/" + name;
}

}

TEST_CASE("OAuth1 signature method names", "[oauth1][method]") {

    SECTION("Known names round-trip") {
        REQUIRE(toString(SignatureMethod::HmacSha1) == "HMAC-SHA1");
        REQUIRE(toString(SignatureMethod::RsaSha1) == "RSA-SHA1");
        REQUIRE(toString(SignatureMethod::Plaintext) == "PLAINTEXT");
        REQUIRE(parseSignatureMethod("RSA-SHA1") == SignatureMethod::RsaSha1);
    }

    SECTION("Unknown names are rejected with the offending value") {
        REQUIRE_THROWS_AS(
            parseSignatureMethod("HMAC-SHA256"),
            ValidationError);
        REQUIRE_THROWS_WITH(
            parseSignatureMethod("HMAC-SHA256"),
            Catch::Matchers::ContainsSubstring("HMAC-SHA256"));

        // Method names are case sensitive
        REQUIRE_THROWS_AS(parseSignatureMethod("hmac-sha1"), ValidationError);
    }
}

TEST_CASE("OAuth1 percent encoding", "[oauth1][encoding]") {
    REQUIRE(percentEncode("AZaz09-._~") == "AZaz09-._~");
    REQUIRE(percentEncode("a b") == "a%20b");
    REQUIRE(percentEncode("a+b") == "a%2Bb");
    REQUIRE(percentEncode("https://x/y?z=1&w") == "https%3A%2F%2Fx%2Fy%3Fz%3D1%26w");
    REQUIRE(percentEncode("\xC3\x9F") == "%C3%9F");
    REQUIRE(percentEncode("") == "");
}

TEST_CASE("OAuth1 signature base string", "[oauth1][base-string]") {

    SECTION("Parameters are sorted by key and encoded twice") {
        auto params = requiredParams();
        params["z"] = "last one";
        params["a"] = "~tilde";

        auto base = buildSignatureBaseString("post", "https://api.example.com/token", params);

        REQUIRE(base ==
            "POST&https%3A%2F%2Fapi.example.com%2Ftoken&"
            "a%3D~tilde%26"
            "oauth_consumer_key%3Dck%26oauth_nonce%3Dn%26oauth_signature_method%3DHMAC-SHA1%26"
            "oauth_timestamp%3D1%26oauth_version%3D1.0%26"
            "z%3Dlast%2520one");
    }

    SECTION("Byte-wise ordering puts uppercase keys first") {
        Parameters params{{"b", "1"}, {"B", "2"}, {"a", "3"}};
        auto base = buildSignatureBaseString("GET", "http://h/", params);
        REQUIRE(base == "GET&http%3A%2F%2Fh%2F&B%3D2%26a%3D3%26b%3D1");
    }

    SECTION("oauth_signature is excluded") {
        auto params = requiredParams();
        auto withoutSignature = buildSignatureBaseString("POST", "https://h/", params);
        params["oauth_signature"] = "c2lnbmF0dXJl";
        REQUIRE(buildSignatureBaseString("POST", "https://h/", params) == withoutSignature);
    }
}

TEST_CASE("OAuth1 HMAC-SHA1 signature", "[oauth1][hmac]") {

    SECTION("Pinned signature for a minimal request") {
        auto signature = sign("POST", "https://api.example.com/token", requiredParams(), "secret", "");
        REQUIRE(signature == "2vDQh6eJSaiwEAd6lCqropP2pms=");
    }

    SECTION("Published reference vector with token secret") {
        Parameters params{
            {"status", "Hello Ladies + Gentlemen, a signed OAuth request!"},
            {"include_entities", "true"},
            {"oauth_consumer_key", "xvz1evFS4wEEPTGEFPHBog"},
            {"oauth_nonce", "kYjzVBB8Y0ZFabxSWbWovY3uYSQ2pTgmZeNu2VS4cg"},
            {"oauth_signature_method", "HMAC-SHA1"},
            {"oauth_timestamp", "1318622958"},
            {"oauth_token", "370773112-GmHxMAgYyLbNEtIKZeRNFsMKPR9EyMZeS9weJAEb"},
            {"oauth_version", "1.0"},
        };

        auto signature = sign(
            "POST",
            "https://api.twitter.com/1.1/statuses/update.json",
            params,
            "kAcSOqF21Fu85e7zjz7ZN2U4ZRhfV3WpwPAoE3Z7kBw",
            "LswwdoUaIvS8ltyTt5jkRh4J50vUPVVHtR2YPi5kE");

        REQUIRE(signature == "hCtSmYh+iHYCEqBWrE7C7hYmtUk=");
    }

    SECTION("Insertion order does not matter") {
        Parameters forward;
        forward.emplace("oauth_consumer_key", "ck");
        forward.emplace("oauth_timestamp", "1");
        forward.emplace("oauth_nonce", "n");
        forward.emplace("oauth_version", "1.0");
        forward.emplace("oauth_signature_method", "HMAC-SHA1");
        forward.emplace("extra", "x");

        Parameters backward;
        backward.emplace("extra", "x");
        backward.emplace("oauth_signature_method", "HMAC-SHA1");
        backward.emplace("oauth_version", "1.0");
        backward.emplace("oauth_nonce", "n");
        backward.emplace("oauth_timestamp", "1");
        backward.emplace("oauth_consumer_key", "ck");

        REQUIRE(sign("GET", "https://h/r", forward, "cs", "ts") ==
                sign("GET", "https://h/r", backward, "cs", "ts"));
    }

    SECTION("Re-signing with a previous signature attached yields the same result") {
        auto params = requiredParams();
        auto first = sign("POST", "https://h/r", params, "cs", "ts");
        params["oauth_signature"] = first;
        REQUIRE(sign("POST", "https://h/r", params, "cs", "ts") == first);
    }

    SECTION("Secrets are part of the key") {
        auto params = requiredParams();
        auto a = sign("POST", "https://h/r", params, "secret1");
        auto b = sign("POST", "https://h/r", params, "secret2");
        auto c = sign("POST", "https://h/r", params, "secret1", "token");
        REQUIRE(a != b);
        REQUIRE(a != c);
        REQUIRE(std::regex_match(a, std::regex("^[A-Za-z0-9+/]+=*$")));
    }

    SECTION("Method given by name") {
        REQUIRE(sign("POST", "https://api.example.com/token", requiredParams(), "secret", "", "HMAC-SHA1")
            == "2vDQh6eJSaiwEAd6lCqropP2pms=");
    }

    SECTION("Concurrent signing is deterministic") {
        auto params = requiredParams();
        std::vector<std::string> results(8);
        std::vector<std::thread> workers;
        for (auto i = 0u; i < results.size(); ++i) {
            workers.emplace_back([&, i]() {
                results[i] = sign("POST", "https://api.example.com/token", params, "secret");
            });
        }
        for (auto& worker : workers)
            worker.join();

        for (auto const& result : results)
            REQUIRE(result == "2vDQh6eJSaiwEAd6lCqropP2pms=");
    }
}

TEST_CASE("OAuth1 PLAINTEXT signature", "[oauth1][plaintext]") {
    auto signature = sign(
        "POST", "https://api.example.com/token", requiredParams(), "secret", "", SignatureMethod::Plaintext);

    // base64 of the base string, not the RFC 5849 "secret&token" form
    REQUIRE(signature ==
        "UE9TVCZodHRwcyUzQSUyRiUyRmFwaS5leGFtcGxlLmNvbSUyRnRva2VuJm9hdXRoX2NvbnN1bWVyX2tleSUzRGNrJTI2b2F1"
        "dGhfbm9uY2UlM0RuJTI2b2F1dGhfc2lnbmF0dXJlX21ldGhvZCUzREhNQUMtU0hBMSUyNm9hdXRoX3RpbWVzdGFtcCUzRDEl"
        "MjZvYXV0aF92ZXJzaW9uJTNEMS4w");
}

TEST_CASE("OAuth1 RSA-SHA1 signature", "[oauth1][rsa]") {
    auto params = requiredParams("RSA-SHA1");
    const std::string expected =
        "O/9LUmHunXzDeKOdvv4v2R6s2iAqiMlXTfv+G5E1AuDt+3fSiGOvxLzXfiG2pW8ETegGeDXsGS+oDzObI35u6yfnP+FmeMDQ"
        "2lVPucsVgfsZyoRiRkUaqDk7vSwBsIJ8tbYXDsuWJm7VdlrvUWSK85IZTcPuiMpM54sEAt2jY60=";

    SECTION("Unencrypted key") {
        auto signature = sign(
            "POST", "https://api.example.com/token", params,
            testKey("rsa-private.pem"), "", SignatureMethod::RsaSha1);
        REQUIRE(signature == expected);
    }

    SECTION("Encrypted key with passphrase") {
        auto signature = sign(
            "POST", "https://api.example.com/token", params,
            testKey("rsa-private-encrypted.pem"), "hunter2", SignatureMethod::RsaSha1);
        REQUIRE(signature == expected);
    }

    SECTION("Wrong passphrase") {
        REQUIRE_THROWS_AS(
            sign("POST", "https://api.example.com/token", params,
                 testKey("rsa-private-encrypted.pem"), "wrong", SignatureMethod::RsaSha1),
            CryptoError);
    }

    SECTION("Missing passphrase for an encrypted key") {
        REQUIRE_THROWS_AS(
            sign("POST", "https://api.example.com/token", params,
                 testKey("rsa-private-encrypted.pem"), "", SignatureMethod::RsaSha1),
            CryptoError);
    }

    SECTION("Missing key file") {
        REQUIRE_THROWS_AS(
            sign("POST", "https://api.example.com/token", params,
                 testKey("does-not-exist.pem"), "", SignatureMethod::RsaSha1),
            CryptoError);
        REQUIRE_THROWS_WITH(
            sign("POST", "https://api.example.com/token", params,
                 testKey("does-not-exist.pem"), "", SignatureMethod::RsaSha1),
            Catch::Matchers::ContainsSubstring("does-not-exist.pem"));
    }

    SECTION("Public key is not a private key") {
        REQUIRE_THROWS_AS(
            sign("POST", "https://api.example.com/token", params,
                 testKey("rsa-public.pem"), "", SignatureMethod::RsaSha1),
            CryptoError);
    }
}

TEST_CASE("OAuth1 parameter validation", "[oauth1][validation]") {

    SECTION("Each required parameter is checked") {
        for (auto const& missing : {"oauth_consumer_key", "oauth_timestamp", "oauth_nonce",
                                    "oauth_version", "oauth_signature_method"}) {
            auto params = requiredParams();
            params.erase(missing);
            REQUIRE_THROWS_AS(
                sign("POST", "https://h/", params, "secret"),
                ValidationError);
            REQUIRE_THROWS_WITH(
                sign("POST", "https://h/", params, "secret"),
                Catch::Matchers::ContainsSubstring(missing));
        }
    }

    SECTION("Validation precedes key loading") {
        auto params = requiredParams();
        params.erase("oauth_nonce");
        REQUIRE_THROWS_AS(
            sign("POST", "https://h/", params, testKey("does-not-exist.pem"), "", SignatureMethod::RsaSha1),
            ValidationError);
    }

    SECTION("Unknown method name") {
        REQUIRE_THROWS_AS(
            sign("POST", "https://h/", requiredParams(), "secret", "", "MD5"),
            ValidationError);
        REQUIRE_THROWS_WITH(
            sign("POST", "https://h/", requiredParams(), "secret", "", "MD5"),
            Catch::Matchers::ContainsSubstring("MD5"));
    }
}

TEST_CASE("OAuth1 nonce and timestamp", "[oauth1][nonce]") {

    SECTION("Nonce length and alphabet") {
        auto nonce = generateNonce(32);
        REQUIRE(nonce.length() == 32);
        REQUIRE(std::regex_match(nonce, std::regex("^[A-Za-z0-9]+$")));
        REQUIRE(generateNonce() != generateNonce());
    }

    SECTION("Reject invalid nonce lengths") {
        REQUIRE_THROWS_AS(generateNonce(7), ValidationError);
        REQUIRE_THROWS_AS(generateNonce(65), ValidationError);
    }

    SECTION("Timestamp is numeric") {
        auto timestamp = generateTimestamp();
        REQUIRE(std::regex_match(timestamp, std::regex("^[0-9]+$")));
        REQUIRE(std::stoll(timestamp) > 1600000000);
    }

    SECTION("Protocol parameters can be signed directly") {
        auto params = protocolParameters("consumer", "", SignatureMethod::HmacSha1);
        REQUIRE(params.at("oauth_consumer_key") == "consumer");
        REQUIRE(params.at("oauth_signature_method") == "HMAC-SHA1");
        REQUIRE(params.at("oauth_version") == "1.0");
        REQUIRE(params.at("oauth_nonce").length() == 16);
        REQUIRE(params.count("oauth_token") == 0);
        REQUIRE_NOTHROW(sign("GET", "https://h/", params, "secret", "", SignatureMethod::HmacSha1));

        auto withToken = protocolParameters("consumer", "token", SignatureMethod::RsaSha1);
        REQUIRE(withToken.at("oauth_token") == "token");
        REQUIRE(withToken.at("oauth_signature_method") == "RSA-SHA1");
    }
}
