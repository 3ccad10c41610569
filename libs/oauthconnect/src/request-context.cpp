#include "request-context.hpp"

namespace oauthconnect
{

BaseUrlRequestContext::BaseUrlRequestContext(std::string const& baseUrl)
    : base_(oauthcl::URIComponents::fromStrRfc3986(baseUrl))
{
    base_.query.clear();
}

std::string BaseUrlRequestContext::resolveAbsoluteFromPath(std::string const& path) const
{
    auto target = oauthcl::URIComponents::fromStrPath(path);

    auto result = base_;
    result.appendPath(target.path);
    result.query = target.query;
    return result.build();
}

std::string MockRouter::generate(
    std::string const& routeName,
    RouteParameters const& params,
    bool absolute)
{
    calls.push_back({routeName, params, absolute});
    if (generateFun)
        return generateFun(routeName, params, absolute);

    oauthcl::URIComponents uri;
    uri.scheme = "https";
    uri.host = "app.example";
    uri.appendPath(routeName);
    for (auto const& [key, value] : params)
        uri.addQuery(key, value);
    return absolute ? uri.build() : uri.buildPath();
}

bool MockAuthorizationChecker::isAuthenticatedAtLeastRemembered() const
{
    ++checkCount;
    return authenticated;
}

}
