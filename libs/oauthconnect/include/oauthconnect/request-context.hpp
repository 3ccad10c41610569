#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "oauthcl/uri.hpp"

namespace oauthconnect
{

using RouteParameters = std::map<std::string, std::string>;

/**
 * Generates URLs for named application routes.
 */
class IRouter
{
public:
    virtual ~IRouter() = default;

    virtual std::string generate(
        std::string const& routeName,
        RouteParameters const& params,
        bool absolute) = 0;
};

/**
 * Authentication state of the current principal.
 */
class IAuthorizationChecker
{
public:
    virtual ~IAuthorizationChecker() = default;

    /**
     * True if the principal is fully authenticated or
     * authenticated through a remember-me token.
     */
    virtual bool isAuthenticatedAtLeastRemembered() const = 0;
};

/**
 * Resolves local paths against the base URL of the current request.
 */
class IRequestContext
{
public:
    virtual ~IRequestContext() = default;

    virtual std::string resolveAbsoluteFromPath(std::string const& path) const = 0;
};

/**
 * Request context with a fixed base URL, e.g. "https://example.com/app".
 */
class BaseUrlRequestContext : public IRequestContext
{
public:
    /**
     * Throws oauthcl::URIError if baseUrl is not an absolute URI.
     */
    explicit BaseUrlRequestContext(std::string const& baseUrl);

    std::string resolveAbsoluteFromPath(std::string const& path) const override;

private:
    oauthcl::URIComponents base_;
};

class MockRouter : public IRouter
{
public:
    struct Call {
        std::string routeName;
        RouteParameters params;
        bool absolute;
    };

    std::function<std::string(std::string const& /* routeName */,
                              RouteParameters const& /* params */,
                              bool /* absolute */)> generateFun;
    std::vector<Call> calls;

    std::string generate(
        std::string const& routeName,
        RouteParameters const& params,
        bool absolute) override;
};

class MockAuthorizationChecker : public IAuthorizationChecker
{
public:
    bool authenticated = false;
    mutable int checkCount = 0;

    bool isAuthenticatedAtLeastRemembered() const override;
};

}
