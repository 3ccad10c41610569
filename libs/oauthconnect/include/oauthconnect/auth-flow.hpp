#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "request-context.hpp"
#include "resource-owner-map.hpp"
#include "resource-owner.hpp"
#include "settings.hpp"

namespace oauthconnect
{

/**
 * Raised for unknown resource owner or firewall names.
 */
struct LookupError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Decides where a login or connect attempt for a resource owner
 * should be sent, and asks the owner for the final URL.
 */
class AuthFlowCoordinator
{
public:
    static constexpr const char* CONNECT_SERVICE_ROUTE = "connect-service";
    static constexpr const char* SERVICE_REDIRECT_ROUTE = "service-redirect";

    AuthFlowCoordinator(
        std::shared_ptr<ResourceOwnerMap const> ownerMap,
        IRouter& router,
        IAuthorizationChecker& authorizationChecker,
        IRequestContext& request,
        bool connect);

    /**
     * Bind the owner map of the firewall named in settings.firewallName,
     * using settings.connect. Throws LookupError for an unknown firewall.
     */
    static AuthFlowCoordinator fromSettings(
        Settings const& settings,
        std::map<std::string, std::shared_ptr<ResourceOwnerMap const>> const& ownerMaps,
        IRouter& router,
        IAuthorizationChecker& authorizationChecker,
        IRequestContext& request);

    /**
     * Names of all resource owners, in registration order.
     */
    std::vector<std::string> listProviders() const;

    /**
     * Authorization URL of the named resource owner.
     *
     * Outside of connect mode, or without an authenticated user, the owner
     * redirects back to its check path. Otherwise it redirects to
     * redirectUrl, or to the connect-service route if none is given.
     *
     * Throws LookupError if the owner is unknown.
     */
    std::string buildAuthorizationUrl(
        std::string const& name,
        std::optional<std::string> const& redirectUrl = std::nullopt,
        Parameters const& extraParameters = {}) const;

    /**
     * Relative URL of the service-redirect route for the named owner.
     * Throws LookupError if the owner is unknown.
     */
    std::string buildLoginUrl(std::string const& name) const;

    bool connect() const { return connect_; }

private:
    IResourceOwner& resourceOwner(std::string const& name) const;
    std::string generateUri(std::string const& path) const;

    std::shared_ptr<ResourceOwnerMap const> ownerMap_;
    IRouter& router_;
    IAuthorizationChecker& authorizationChecker_;
    IRequestContext& request_;
    bool connect_;
};

}
