#include "oauthcl/oauth1-signature.hpp"
#include "oauthcl/log.hpp"
#include "oauthcl/uri.hpp"

#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>

#include "stx/format.h"

namespace oauthcl
{
namespace oauth1
{

namespace
{

constexpr std::array<const char*, 5> REQUIRED_PARAMETERS{{
    "oauth_consumer_key",
    "oauth_timestamp",
    "oauth_nonce",
    "oauth_version",
    "oauth_signature_method"
}};

constexpr const char* SIGNATURE_PARAMETER = "oauth_signature";

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/**
 * Pop the most recent OpenSSL error as human-readable text.
 */
std::string opensslError()
{
    unsigned long code = 0;
    unsigned long last = 0;
    while ((code = ERR_get_error()) != 0)
        last = code;
    if (!last)
        return "unknown OpenSSL error";

    char buffer[256];
    ERR_error_string_n(last, buffer, sizeof(buffer));
    return buffer;
}

/**
 * Base64 encode using OpenSSL.
 */
std::string base64Encode(const unsigned char* input, size_t length)
{
    if (length == 0)
        return {};

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(b64);
        BIO_free(mem);
        throw logRuntimeError<CryptoError>("[oauth1::base64Encode] Could not allocate BIO");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BioPtr bio(BIO_push(b64, mem));

    if (BIO_write(bio.get(), input, static_cast<int>(length)) != static_cast<int>(length) ||
        BIO_flush(bio.get()) != 1)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::base64Encode] {}", opensslError()));

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio.get(), &bufferPtr);

    return std::string(bufferPtr->data, bufferPtr->length);
}

std::string base64Encode(const std::string& input)
{
    return base64Encode(reinterpret_cast<const unsigned char*>(input.data()), input.size());
}

std::string hmacSha1(const std::string& key, const std::string& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    auto result = HMAC(EVP_sha1(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &digestLen);
    if (!result)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::hmacSha1] {}", opensslError()));

    return std::string(reinterpret_cast<char*>(digest), digestLen);
}

int passphraseCallback(char* buf, int size, int /*rwflag*/, void* userdata)
{
    auto const* passphrase = static_cast<std::string const*>(userdata);
    if (!passphrase || passphrase->empty() || size <= 0)
        return 0;

    auto length = std::min(static_cast<int>(passphrase->size()), size);
    std::copy_n(passphrase->data(), length, buf);
    return length;
}

PKeyPtr loadPrivateKey(const std::string& keyPath, const std::string& passphrase)
{
    std::ifstream keyFile(keyPath, std::ios::binary);
    if (!keyFile)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::sign] Could not read private key file '{}'", keyPath));

    std::stringstream pem;
    pem << keyFile.rdbuf();
    auto const pemData = pem.str();

    BioPtr bio(BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size())));
    if (!bio)
        throw logRuntimeError<CryptoError>("[oauth1::sign] Could not allocate BIO");

    PKeyPtr key(PEM_read_bio_PrivateKey(
        bio.get(), nullptr, passphraseCallback, const_cast<std::string*>(&passphrase)));
    if (!key)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::sign] Could not parse private key '{}': {}", keyPath, opensslError()));

    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::sign] Private key '{}' is not an RSA key", keyPath));

    return key;
}

std::string rsaSha1(const std::string& keyPath, const std::string& passphrase, const std::string& data)
{
    auto key = loadPrivateKey(keyPath, passphrase);

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx)
        throw logRuntimeError<CryptoError>("[oauth1::rsaSha1] Could not allocate digest context");

    size_t signatureLen = 0;
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha1(), nullptr, key.get()) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestSignFinal(ctx.get(), nullptr, &signatureLen) != 1)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::rsaSha1] {}", opensslError()));

    std::string signature(signatureLen, '\0');
    if (EVP_DigestSignFinal(
            ctx.get(), reinterpret_cast<unsigned char*>(&signature[0]), &signatureLen) != 1)
        throw logRuntimeError<CryptoError>(
            stx::format("[oauth1::rsaSha1] {}", opensslError()));

    signature.resize(signatureLen);
    return signature;
}

}  // namespace

std::string toString(SignatureMethod method)
{
    switch (method) {
    case SignatureMethod::HmacSha1:
        return "HMAC-SHA1";
    case SignatureMethod::RsaSha1:
        return "RSA-SHA1";
    case SignatureMethod::Plaintext:
        return "PLAINTEXT";
    }
    throw logRuntimeError<ValidationError>(
        stx::format("Unknown signature method selected {}.", static_cast<int>(method)));
}

SignatureMethod parseSignatureMethod(const std::string& name)
{
    for (auto method : {SignatureMethod::HmacSha1, SignatureMethod::RsaSha1, SignatureMethod::Plaintext}) {
        if (toString(method) == name)
            return method;
    }
    throw logRuntimeError<ValidationError>(
        stx::format("Unknown signature method selected {}.", name));
}

std::string percentEncode(const std::string& input)
{
    return URIComponents::encodeComponent(input);
}

std::string generateNonce(int length)
{
    if (length < 8 || length > 64)
        throw logRuntimeError<ValidationError>(
            stx::format("Nonce length must be between 8 and 64, got {}.", length));

    static const char alphabet[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    constexpr unsigned alphabetSize = sizeof(alphabet) - 1;

    // Bytes >= 248 are redrawn so each character is equally likely.
    std::string nonce;
    nonce.reserve(length);
    unsigned char random[64];
    while (nonce.size() < static_cast<std::size_t>(length)) {
        if (RAND_bytes(random, sizeof(random)) != 1)
            throw logRuntimeError<CryptoError>("[oauth1::generateNonce] RAND_bytes failed.");
        for (auto byte : random) {
            if (byte >= 256u - 256u % alphabetSize)
                continue;
            nonce.push_back(alphabet[byte % alphabetSize]);
            if (nonce.size() == static_cast<std::size_t>(length))
                break;
        }
    }
    return nonce;
}

std::string generateTimestamp()
{
    auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch).count());
}

Parameters protocolParameters(
    const std::string& consumerKey,
    const std::string& token,
    SignatureMethod signatureMethod)
{
    Parameters result{
        {"oauth_consumer_key", consumerKey},
        {"oauth_nonce", generateNonce()},
        {"oauth_signature_method", toString(signatureMethod)},
        {"oauth_timestamp", generateTimestamp()},
        {"oauth_version", "1.0"},
    };
    if (!token.empty())
        result["oauth_token"] = token;
    return result;
}

std::string buildSignatureBaseString(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params)
{
    // Parameters is ordered by byte-wise key comparison already.
    std::string paramString;
    for (const auto& [key, value] : params) {
        if (key == SIGNATURE_PARAMETER)
            continue;
        if (!paramString.empty())
            paramString += "&";
        paramString += percentEncode(key) + "=" + percentEncode(value);
    }

    std::string method = httpMethod;
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    return method + "&" + percentEncode(url) + "&" + percentEncode(paramString);
}

std::string sign(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params,
    const std::string& clientSecret,
    const std::string& tokenSecret,
    SignatureMethod signatureMethod)
{
    for (auto const* required : REQUIRED_PARAMETERS) {
        if (params.find(required) == params.end())
            throw logRuntimeError<ValidationError>(
                stx::format("Parameter \"{}\" must be set.", required));
    }

    auto baseString = buildSignatureBaseString(httpMethod, url, params);
    log().debug("[oauth1::sign] Signing {} {} using {}", httpMethod, url, toString(signatureMethod));
    log().trace("[oauth1::sign]   Base string: {}", baseString);

    switch (signatureMethod) {
    case SignatureMethod::HmacSha1:
        return base64Encode(hmacSha1(percentEncode(clientSecret) + "&" + percentEncode(tokenSecret), baseString));
    case SignatureMethod::RsaSha1:
        return base64Encode(rsaSha1(clientSecret, tokenSecret, baseString));
    case SignatureMethod::Plaintext:
        return base64Encode(baseString);
    }

    throw logRuntimeError<ValidationError>(
        stx::format("Unknown signature method selected {}.", static_cast<int>(signatureMethod)));
}

std::string sign(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params,
    const std::string& clientSecret,
    const std::string& tokenSecret,
    const std::string& signatureMethod)
{
    return sign(httpMethod, url, params, clientSecret, tokenSecret, parseSignatureMethod(signatureMethod));
}

}  // namespace oauth1
}  // namespace oauthcl
