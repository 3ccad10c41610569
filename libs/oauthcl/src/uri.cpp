#include "uri.hpp"

#include <cctype>
#include <cstdlib>

#include "oauthcl/log.hpp"
#include "stx/format.h"

namespace oauthcl
{

namespace
{

bool isUnreserved(unsigned char c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool isSubDelim(unsigned char c)
{
    return c == '!' || c == '$' || c == '&' || c == '\'' || c == '(' ||
        c == ')' || c == '*' || c == '+' || c == ',' || c == ';' || c == '=';
}

bool isPChar(unsigned char c)
{
    return isUnreserved(c) || c == '%' || isSubDelim(c) || c == ':' || c == '@';
}

template <typename Keep>
std::string percentEncodeIf(std::string const& str, Keep&& keep)
{
    static const char hexDigits[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        if (keep(c)) {
            result.push_back(static_cast<char>(c));
            continue;
        }
        result.push_back('%');
        result.push_back(hexDigits[c >> 4]);
        result.push_back(hexDigits[c & 0x0f]);
    }
    return result;
}

/**
 * Parse scheme
 *
 * https://tools.ietf.org/html/rfc3986#section-3.1
 */
bool parseScheme(const char*& str, std::string& out)
{
    if (!std::isalpha(static_cast<unsigned char>(*str)))
        return false;

    while (std::isalnum(static_cast<unsigned char>(*str)) ||
           *str == '-' || *str == '+' || *str == '.')
        out.push_back(*str++);

    return *str++ == ':';
}

/**
 * Parse authority + port. User information is skipped.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.2
 */
bool parseAuthority(const char*& str, std::string& host, uint16_t& port)
{
    if (str[0] != '/' || str[1] != '/')
        return false;
    str += 2;

    std::string authority;
    while (*str && *str != '/' && *str != '?' && *str != '#')
        authority.push_back(*str++);

    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority.erase(0, at + 1);

    std::string::size_type portSep = std::string::npos;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos)
            return false;
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':')
                return false;
            portSep = close + 1;
        }
    }
    else {
        portSep = authority.find(':');
    }

    host = authority.substr(0, portSep);
    if (host.empty())
        return false;

    if (portSep != std::string::npos) {
        unsigned long value = 0;
        for (auto i = portSep + 1; i < authority.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(authority[i])))
                return false;
            value = value * 10u + static_cast<unsigned long>(authority[i] - '0');
            if (value > 0xffffu)
                return false;
        }
        port = static_cast<uint16_t>(value);
    }

    return true;
}

void decodePctEncoded(const char*& str, std::string& out)
{
    if (std::isxdigit(static_cast<unsigned char>(str[1])) &&
        std::isxdigit(static_cast<unsigned char>(str[2]))) {
        const char hex[3] = {str[1], str[2], '\0'};
        out.push_back(static_cast<char>(std::strtol(hex, nullptr, 16)));
        str += 3;
    }
    else
        ++str;
}

/**
 * Parse path.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.3
 */
bool parsePath(const char*& str, std::string& path)
{
    while (isPChar(static_cast<unsigned char>(*str)) || *str == '/') {
        if (*str == '%')
            decodePctEncoded(str, path);
        else
            path.push_back(*str++);
    }

    /* Path must end with either EOF, '?' or '#' */
    return *str == '\0' || *str == '?' || *str == '#';
}

/**
 * Parse query. The query is kept percent-encoded, decoding it would
 * turn escaped '&' and '=' into separators.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.4
 */
bool parseQuery(const char*& str, std::string& query)
{
    while (isPChar(static_cast<unsigned char>(*str)) || *str == '/' || *str == '?')
        query.push_back(*str++);

    /* Query must end with either EOF or '#' (fragment indicator) */
    return *str == '\0' || *str == '#';
}

}

URIComponents URIComponents::fromStrRfc3986(std::string const& uri)
{
    URIComponents result;
    const auto* c = uri.c_str();
    std::string error;

    if (!parseScheme(c, result.scheme))
        error = "Error parsing scheme";
    else if (!parseAuthority(c, result.host, result.port))
        error = "Error parsing authority";
    else if (!parsePath(c, result.path))
        error = "Error parsing path";
    else if (*c == '?' && !parseQuery(++c, result.query))
        error = "Error parsing query";

    if (!error.empty()) {
        throw logRuntimeError<URIError>(stx::format("[URIComponents::fromStrRfc3986] {} of URI '{}'", error, uri));
    }

    return result;
}

URIComponents URIComponents::fromStrPath(std::string const& pathAndQueryString)
{
    URIComponents result;
    const auto* c = pathAndQueryString.c_str();

    if (!parsePath(c, result.path))
        throw logRuntimeError<URIError>(
            stx::format("[URIComponents::fromStrPath] Error parsing path from '{}'", pathAndQueryString));

    if (*c == '?' && !parseQuery(++c, result.query))
        throw logRuntimeError<URIError>(
            stx::format("[URIComponents::fromStrPath] Error parsing query from '{}'", pathAndQueryString));

    return result;
}

void URIComponents::appendPath(const std::string& part)
{
    std::string::size_type partBegin = 0u;
    for (;;) {
        auto partEnd = part.find('/', partBegin);
        auto partLength = partEnd == std::string::npos
            ? std::string::npos
            : partEnd - partBegin;

        if (partLength == 0) {
            ++partBegin;
            continue;
        }

        if (path.empty() || path.back() != '/')
            path.push_back('/');
        path += encode(part.substr(partBegin, partLength));
        if (partEnd == std::string::npos)
            break;

        partBegin = partEnd + 1u;
    }
}

void URIComponents::addQuery(std::string key, std::string value)
{
    queryVars.insert(std::make_pair(std::move(key),
                                    std::move(value)));
}

std::string URIComponents::build() const
{
    return buildHost() + buildPath();
}

std::string URIComponents::buildHost() const
{
    if (scheme.empty())
        throw logRuntimeError<URIError>("[URIComponents::buildHost] Missing scheme");

    if (host.empty())
        throw logRuntimeError<URIError>("[URIComponents::buildHost] Missing host");

    return scheme + "://" +
           host +
           (port > 0 ? std::string(":") + std::to_string(port) : "");
}

std::string URIComponents::buildPath() const
{
    std::string uri = path;

    std::string queryStr = query.empty()
        ? std::string()
        : "?" + percentEncodeIf(query, [](unsigned char c) {
              return isPChar(c) || c == '/' || c == '?';
          });
    for (const auto& queryPair : queryVars) {
        queryStr.push_back(queryStr.empty() ? '?': '&');
        queryStr += encodeComponent(queryPair.first) + "=" +
            encodeComponent(queryPair.second);
    }

    return uri + queryStr;
}

std::string URIComponents::encode(std::string const& str)
{
    return percentEncodeIf(str, [](unsigned char c) {
        return isUnreserved(c) || isSubDelim(c);
    });
}

std::string URIComponents::encodeComponent(std::string const& str)
{
    return percentEncodeIf(str, isUnreserved);
}

}
