#pragma once

#include <string>
#include <map>
#include <stdexcept>
#include <cstdint>

namespace oauthcl
{

struct URIError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct URIComponents
{
    std::string scheme;
    std::string host;
    std::string path;
    std::uint16_t port = 0u;
    std::string query; /* Still percent-encoded */
    std::multimap<std::string, std::string> queryVars;

    /**
     * Split RFC3986 URI into parts.
     *
     * See https://tools.ietf.org/html/rfc3986
     *
     * Throws URIError.
     */
    static URIComponents fromStrRfc3986(std::string const& uriString);

    /**
     * Extract the path and query URI components from a string. No leading
     * scheme, host or port info must be present.
     *
     * Throws URIError.
     */
    static URIComponents fromStrPath(std::string const& pathAndQueryString);

    /**
     * Append one or multiple path-parts ("/a/b/c") to the URIs
     * path.
     */
    void appendPath(const std::string& part);

    /**
     * Add a query-var key-value pair.
     */
    void addQuery(std::string key, std::string value);

    /**
     * Build the final URI string.
     *
     * Throws URIError.
     */
    std::string build() const; /* Full URI */
    std::string buildPath() const; /* URI path + query */
    std::string buildHost() const; /* Scheme + host */

    /**
     * Percent-encode a path segment. Sub-delimiters are kept.
     */
    static std::string encode(std::string const& str);

    /**
     * Percent-encode a single URI component (RFC 3986 section 2.3):
     * everything except A-Z, a-z, 0-9 and "-._~" is escaped with
     * uppercase hex digits. Space becomes "%20".
     */
    static std::string encodeComponent(std::string const& str);
};

}
