#pragma once

#include <string>
#include <map>
#include <stdexcept>

namespace oauthcl
{

/**
 * Raised when a request cannot be signed because its parameters
 * or the requested signature method are invalid.
 */
struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Raised when key material cannot be loaded or a signature
 * cannot be produced by OpenSSL.
 */
struct CryptoError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * OAuth 1.0 request signing utilities for RFC 5849.
 */
namespace oauth1
{

using Parameters = std::map<std::string, std::string>;

enum class SignatureMethod {
    HmacSha1,
    RsaSha1,
    Plaintext
};

/**
 * Wire name of a signature method, e.g. "HMAC-SHA1".
 */
std::string toString(SignatureMethod method);

/**
 * Parse a wire name into a SignatureMethod.
 * Throws ValidationError for unsupported names.
 */
SignatureMethod parseSignatureMethod(const std::string& name);

/**
 * RFC 3986 percent encoding of a single value.
 */
std::string percentEncode(const std::string& input);

/**
 * Alphanumeric nonce of 8 to 64 characters drawn from the OpenSSL CSPRNG.
 * Throws ValidationError for other lengths.
 */
std::string generateNonce(int length = 16);

/**
 * Seconds since the epoch.
 */
std::string generateTimestamp();

/**
 * The oauth_* parameters every signed request carries, with a fresh nonce
 * and timestamp. oauth_token is only set for a non-empty token. The result
 * is ready to be extended with request parameters and passed to sign().
 */
Parameters protocolParameters(
    const std::string& consumerKey,
    const std::string& token,
    SignatureMethod signatureMethod);

/**
 * Build the signature base string according to RFC 5849 Section 3.4.1:
 * METHOD&encoded(url)&encoded(sorted-parameter-string).
 * An oauth_signature entry in params is ignored.
 */
std::string buildSignatureBaseString(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params);

/**
 * Sign a request.
 *
 * The parameters must contain oauth_consumer_key, oauth_timestamp,
 * oauth_nonce, oauth_version and oauth_signature_method, otherwise
 * ValidationError is thrown. An existing oauth_signature is not signed.
 *
 * @param httpMethod HTTP method (e.g., "POST")
 * @param url Full URL (without query string)
 * @param params All request parameters (OAuth params + body/query params)
 * @param clientSecret HMAC-SHA1: client secret.
 *        RSA-SHA1: path to a PEM-encoded private key.
 * @param tokenSecret HMAC-SHA1: token secret (may be empty).
 *        RSA-SHA1: passphrase of the private key (may be empty).
 * @param signatureMethod Method to sign with.
 * @return Base64-encoded signature. PLAINTEXT yields base64(baseString).
 */
std::string sign(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params,
    const std::string& clientSecret,
    const std::string& tokenSecret = "",
    SignatureMethod signatureMethod = SignatureMethod::HmacSha1);

/**
 * Same as above, with the method given by its wire name.
 */
std::string sign(
    const std::string& httpMethod,
    const std::string& url,
    const Parameters& params,
    const std::string& clientSecret,
    const std::string& tokenSecret,
    const std::string& signatureMethod);

}  // namespace oauth1
}  // namespace oauthcl
