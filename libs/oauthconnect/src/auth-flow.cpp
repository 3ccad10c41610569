#include "auth-flow.hpp"

#include "oauthcl/log.hpp"
#include "stx/format.h"

using oauthcl::logRuntimeError;

namespace oauthconnect
{

AuthFlowCoordinator::AuthFlowCoordinator(
    std::shared_ptr<ResourceOwnerMap const> ownerMap,
    IRouter& router,
    IAuthorizationChecker& authorizationChecker,
    IRequestContext& request,
    bool connect)
    : ownerMap_(std::move(ownerMap))
    , router_(router)
    , authorizationChecker_(authorizationChecker)
    , request_(request)
    , connect_(connect)
{
    if (!ownerMap_)
        throw logRuntimeError<std::invalid_argument>("[AuthFlowCoordinator] Missing resource owner map.");
}

AuthFlowCoordinator AuthFlowCoordinator::fromSettings(
    Settings const& settings,
    std::map<std::string, std::shared_ptr<ResourceOwnerMap const>> const& ownerMaps,
    IRouter& router,
    IAuthorizationChecker& authorizationChecker,
    IRequestContext& request)
{
    auto ownerMap = ownerMaps.find(settings.firewallName);
    if (ownerMap == ownerMaps.end())
        throw logRuntimeError<LookupError>(stx::format(
            "[AuthFlowCoordinator::fromSettings] No resource owner map for firewall '{}'.",
            settings.firewallName));

    oauthcl::log().debug("[AuthFlowCoordinator] Using firewall '{}' (connect={})", settings.firewallName, settings.connect);
    return AuthFlowCoordinator(ownerMap->second, router, authorizationChecker, request, settings.connect);
}

std::vector<std::string> AuthFlowCoordinator::listProviders() const
{
    return ownerMap_->names();
}

std::string AuthFlowCoordinator::buildAuthorizationUrl(
    std::string const& name,
    std::optional<std::string> const& redirectUrl,
    Parameters const& extraParameters) const
{
    auto& owner = resourceOwner(name);
    auto checkPath = ownerMap_->checkPath(name).value_or(std::string());

    std::string effectiveRedirectUrl;
    if (!connect_ || !authorizationChecker_.isAuthenticatedAtLeastRemembered()) {
        effectiveRedirectUrl = generateUri(checkPath);
        oauthcl::log().debug("[AuthFlowCoordinator] '{}': redirecting to check path {}", name, effectiveRedirectUrl);
    }
    else if (!redirectUrl) {
        effectiveRedirectUrl = router_.generate(CONNECT_SERVICE_ROUTE, {{"service", name}}, true);
        oauthcl::log().debug("[AuthFlowCoordinator] '{}': redirecting to connect route {}", name, effectiveRedirectUrl);
    }
    else {
        effectiveRedirectUrl = *redirectUrl;
        oauthcl::log().debug("[AuthFlowCoordinator] '{}': redirecting to caller URL {}", name, effectiveRedirectUrl);
    }

    return owner.getAuthorizationUrl(effectiveRedirectUrl, extraParameters);
}

std::string AuthFlowCoordinator::buildLoginUrl(std::string const& name) const
{
    // Only checks that the owner exists
    resourceOwner(name);

    return router_.generate(SERVICE_REDIRECT_ROUTE, {{"service", name}}, false);
}

IResourceOwner& AuthFlowCoordinator::resourceOwner(std::string const& name) const
{
    auto owner = ownerMap_->resourceOwnerByName(name);
    if (!owner)
        throw logRuntimeError<LookupError>(stx::format("No resource owner with name '{}'.", name));
    return *owner;
}

std::string AuthFlowCoordinator::generateUri(std::string const& path) const
{
    if (path.empty() || path.compare(0, 4, "http") == 0)
        return path;

    if (path.front() == '/')
        return request_.resolveAbsoluteFromPath(path);

    return router_.generate(path, {}, true);
}

}
