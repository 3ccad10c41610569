#include "resource-owner-map.hpp"

#include <set>

#include "oauthcl/log.hpp"
#include "stx/format.h"

using oauthcl::logRuntimeError;

namespace oauthconnect
{

ResourceOwnerMap::ResourceOwnerMap(std::vector<Entry> entries)
    : entries_(std::move(entries))
{
    std::set<std::string> seen;
    for (auto const& entry : entries_) {
        if (!seen.insert(entry.name).second)
            throw logRuntimeError<ConfigError>(
                stx::format("[ResourceOwnerMap] Resource owner '{}' is registered twice.", entry.name));
        if (!entry.owner)
            throw logRuntimeError<ConfigError>(
                stx::format("[ResourceOwnerMap] Resource owner '{}' has no implementation.", entry.name));
    }
}

std::shared_ptr<ResourceOwnerMap const> ResourceOwnerMap::fromSettings(
    Settings::Firewall const& firewall,
    SuppliedOwners const& suppliedOwners)
{
    std::vector<Entry> entries;
    for (auto const& config : firewall.resourceOwners) {
        std::shared_ptr<IResourceOwner> owner;
        auto supplied = suppliedOwners.find(config.name);
        if (supplied != suppliedOwners.end()) {
            owner = supplied->second;
        }
        else if (config.oauth2) {
            oauthcl::log().debug("[ResourceOwnerMap] Using generic OAuth2 owner for '{}'", config.name);
            owner = std::make_shared<GenericOAuth2ResourceOwner>(*config.oauth2);
        }
        else {
            throw logRuntimeError<ConfigError>(stx::format(
                "[ResourceOwnerMap::fromSettings] No implementation for resource owner '{}' of firewall '{}'.",
                config.name, firewall.name));
        }
        entries.push_back({config.name, std::move(owner), config.checkPath, config.paths});
    }
    return std::make_shared<ResourceOwnerMap>(std::move(entries));
}

std::map<std::string, std::shared_ptr<ResourceOwnerMap const>> ResourceOwnerMap::fromSettings(
    Settings const& settings,
    SuppliedOwners const& suppliedOwners)
{
    std::map<std::string, std::shared_ptr<ResourceOwnerMap const>> result;
    for (auto const& firewall : settings.firewalls)
        result[firewall.name] = fromSettings(firewall, suppliedOwners);
    return result;
}

std::vector<std::string> ResourceOwnerMap::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto const& entry : entries_)
        result.push_back(entry.name);
    return result;
}

IResourceOwner* ResourceOwnerMap::resourceOwnerByName(std::string const& name) const
{
    auto entry = find(name);
    return entry ? entry->owner.get() : nullptr;
}

std::optional<std::string> ResourceOwnerMap::checkPath(std::string const& name) const
{
    if (auto entry = find(name))
        return entry->checkPath;
    return {};
}

std::optional<std::string> ResourceOwnerMap::resourceOwnerByCheckPath(std::string const& path) const
{
    for (auto const& entry : entries_) {
        if (entry.checkPath == path)
            return entry.name;
    }
    return {};
}

std::unique_ptr<PathUserResponse> ResourceOwnerMap::userResponse(std::string const& name) const
{
    auto entry = find(name);
    if (!entry)
        return nullptr;

    auto response = std::make_unique<PathUserResponse>();
    response->setPaths(entry->paths);
    return response;
}

ResourceOwnerMap::Entry const* ResourceOwnerMap::find(std::string const& name) const
{
    for (auto const& entry : entries_) {
        if (entry.name == name)
            return &entry;
    }
    return nullptr;
}

}
