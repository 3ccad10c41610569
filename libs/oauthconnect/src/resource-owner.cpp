#include "resource-owner.hpp"

#include "oauthcl/log.hpp"

namespace oauthconnect
{

GenericOAuth2ResourceOwner::GenericOAuth2ResourceOwner(Options options)
    : options_(std::move(options))
    , endpoint_(oauthcl::URIComponents::fromStrRfc3986(options_.authorizationUrl))
{
}

std::string GenericOAuth2ResourceOwner::getAuthorizationUrl(
    std::string const& redirectUrl,
    Parameters const& extraParameters)
{
    Parameters query{
        {"response_type", "code"},
        {"client_id", options_.clientId},
        {"redirect_uri", redirectUrl},
    };
    if (!options_.scope.empty())
        query["scope"] = options_.scope;

    for (auto const& [key, value] : extraParameters)
        query[key] = value;

    auto uri = endpoint_;
    for (auto const& [key, value] : query)
        uri.addQuery(key, value);

    auto result = uri.build();
    oauthcl::log().debug("[GenericOAuth2ResourceOwner] Authorization URL: {}", result);
    return result;
}

std::string MockResourceOwner::getAuthorizationUrl(
    std::string const& redirectUrl,
    Parameters const& extraParameters)
{
    calls.push_back({redirectUrl, extraParameters});
    if (authorizationUrlFun)
        return authorizationUrlFun(redirectUrl, extraParameters);
    return "https://provider.example/authorize?redirect_uri=" +
        oauthcl::URIComponents::encodeComponent(redirectUrl);
}

}
