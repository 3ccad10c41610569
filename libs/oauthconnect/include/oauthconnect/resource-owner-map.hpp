#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "resource-owner.hpp"
#include "settings.hpp"
#include "user-response.hpp"

namespace oauthconnect
{

/**
 * Resource owners of one firewall, with the check path each
 * provider redirects back to. Keeps registration order.
 */
class ResourceOwnerMap
{
public:
    struct Entry {
        std::string name;
        std::shared_ptr<IResourceOwner> owner;
        std::string checkPath;
        PathMap paths;
    };

    using SuppliedOwners = std::map<std::string, std::shared_ptr<IResourceOwner>>;

    /**
     * Throws ConfigError on duplicate names or missing owners.
     */
    explicit ResourceOwnerMap(std::vector<Entry> entries);

    /**
     * Bind every resource owner of the firewall to the supplied owner of
     * the same name, or to a GenericOAuth2ResourceOwner if the entry has
     * an authorization URL. Throws ConfigError if neither is available.
     */
    static std::shared_ptr<ResourceOwnerMap const> fromSettings(
        Settings::Firewall const& firewall,
        SuppliedOwners const& suppliedOwners = {});

    /**
     * Build the maps of all firewalls in the settings, keyed by firewall name.
     */
    static std::map<std::string, std::shared_ptr<ResourceOwnerMap const>> fromSettings(
        Settings const& settings,
        SuppliedOwners const& suppliedOwners = {});

    std::vector<std::string> names() const;

    /**
     * Owner registered under name, nullptr if unknown.
     */
    IResourceOwner* resourceOwnerByName(std::string const& name) const;

    std::optional<std::string> checkPath(std::string const& name) const;

    /**
     * Name of the resource owner whose check path equals path.
     */
    std::optional<std::string> resourceOwnerByCheckPath(std::string const& path) const;

    /**
     * Fresh user response for the named owner, with the owner's
     * configured field paths applied. nullptr if unknown.
     */
    std::unique_ptr<PathUserResponse> userResponse(std::string const& name) const;

private:
    Entry const* find(std::string const& name) const;

    std::vector<Entry> entries_;
};

}
