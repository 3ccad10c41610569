#include "settings.hpp"

#include <cstdlib>
#include <filesystem>

#include "oauthcl/log.hpp"
#include "stx/format.h"
#include "yaml-cpp/yaml.h"

using namespace oauthconnect;
using oauthcl::logRuntimeError;

namespace YAML
{

template <>
struct convert<PathMap>
{
    static Node encode(const PathMap& paths)
    {
        Node node(NodeType::Map);
        for (auto const& [field, path] : paths) {
            if (path)
                node[field] = *path;
            else
                node[field] = Node(NodeType::Null);
        }
        return node;
    }

    static bool decode(const Node& node, PathMap& paths)
    {
        if (!node.IsMap())
            return false;

        for (auto const& entry : node) {
            auto field = entry.first.as<std::string>();
            if (entry.second.IsNull())
                paths[field] = std::nullopt;
            else if (entry.second.IsScalar())
                paths[field] = entry.second.as<std::string>();
            else
                return false;
        }
        return true;
    }
};

template <>
struct convert<Settings::ResourceOwner>
{
    static Node encode(const Settings::ResourceOwner& owner)
    {
        Node node;
        node["name"] = owner.name;
        node["check-path"] = owner.checkPath;
        if (owner.oauth2) {
            node["authorization-url"] = owner.oauth2->authorizationUrl;
            node["client-id"] = owner.oauth2->clientId;
            if (!owner.oauth2->scope.empty())
                node["scope"] = owner.oauth2->scope;
        }
        if (!owner.paths.empty())
            node["paths"] = owner.paths;
        return node;
    }

    static bool decode(const Node& node, Settings::ResourceOwner& owner)
    {
        if (!node.IsMap())
            return false;

        const auto& name = node["name"];
        const auto& checkPath = node["check-path"];
        if (!name || !checkPath)
            return false;

        owner.name = name.as<std::string>();
        owner.checkPath = checkPath.as<std::string>();

        if (auto authorizationUrl = node["authorization-url"]) {
            GenericOAuth2ResourceOwner::Options options;
            options.authorizationUrl = authorizationUrl.as<std::string>();
            if (auto clientId = node["client-id"])
                options.clientId = clientId.as<std::string>();
            if (auto scope = node["scope"])
                options.scope = scope.as<std::string>();
            owner.oauth2 = options;
        }

        if (auto paths = node["paths"])
            owner.paths = paths.as<PathMap>();

        return true;
    }
};

}

namespace
{

Settings settingsFromNode(YAML::Node const& document)
{
    Settings result;

    auto root = document["oauth-settings"];
    if (!root)
        return result;

    if (auto connect = root["connect"])
        result.connect = connect.as<bool>();

    if (auto firewallName = root["firewall-name"])
        result.firewallName = firewallName.as<std::string>();

    if (auto firewalls = root["firewalls"]) {
        if (!firewalls.IsMap())
            throw YAML::RepresentationException(firewalls.Mark(), "'firewalls' must be a map");

        for (auto const& entry : firewalls) {
            Settings::Firewall firewall;
            firewall.name = entry.first.as<std::string>();
            if (entry.second.IsDefined() && !entry.second.IsNull())
                firewall.resourceOwners = entry.second.as<std::vector<Settings::ResourceOwner>>();
            result.firewalls.push_back(std::move(firewall));
        }
    }

    return result;
}

YAML::Node settingsToNode(Settings const& settings)
{
    YAML::Node root;
    root["connect"] = settings.connect;
    root["firewall-name"] = settings.firewallName;

    YAML::Node firewalls(YAML::NodeType::Map);
    for (auto const& firewall : settings.firewalls) {
        YAML::Node owners(YAML::NodeType::Sequence);
        for (auto const& owner : firewall.resourceOwners)
            owners.push_back(owner);
        firewalls[firewall.name] = owners;
    }
    root["firewalls"] = firewalls;

    YAML::Node document;
    document["oauth-settings"] = root;
    return document;
}

}

Settings::Settings(std::string const& yamlConf)
{
    try {
        *this = settingsFromNode(YAML::Load(yamlConf));
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<ConfigError>(stx::format("[Settings] Invalid OAuth settings: {}", e.what()));
    }
}

void Settings::load()
{
    auto settingsFile = std::getenv("OAUTH_SETTINGS_FILE");
    if (!settingsFile || std::string(settingsFile).empty()) {
        oauthcl::log().debug("OAUTH_SETTINGS_FILE environment variable is empty.");
        return;
    }

    if (!std::filesystem::is_regular_file(settingsFile)) {
        oauthcl::log().debug("The OAUTH_SETTINGS_FILE path '{}' is not a file.", settingsFile);
        return;
    }

    try {
        oauthcl::log().debug("Loading OAuth settings from '{}'...", settingsFile);
        *this = settingsFromNode(YAML::LoadFile(settingsFile));
        oauthcl::log().debug("  ...Done.");
    }
    catch (const YAML::Exception& e) {
        oauthcl::log().error("Failed to parse OAuth settings at '{}': {}", settingsFile, e.what());
    }
}

Settings::Firewall const* Settings::firewall(std::string const& name) const
{
    for (auto const& candidate : firewalls) {
        if (candidate.name == name)
            return &candidate;
    }
    return nullptr;
}

std::string Settings::toYaml() const
{
    return YAML::Dump(settingsToNode(*this));
}
