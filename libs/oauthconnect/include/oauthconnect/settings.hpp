#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "resource-owner.hpp"
#include "user-response.hpp"

namespace oauthconnect
{

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * OAuth login settings, usually loaded from OAUTH_SETTINGS_FILE:
 *
 *   oauth-settings:
 *     connect: true
 *     firewall-name: main
 *     firewalls:
 *       main:
 *         - name: github
 *           check-path: /login/check-github
 *           authorization-url: https://github.com/login/oauth/authorize
 *           client-id: abc
 *           scope: "user:email"
 *           paths:
 *             identifier: id
 */
struct Settings
{
    struct ResourceOwner {
        std::string name;
        std::string checkPath;
        std::optional<GenericOAuth2ResourceOwner::Options> oauth2;
        PathMap paths;
    };

    struct Firewall {
        std::string name;
        std::vector<ResourceOwner> resourceOwners;
    };

    Settings() = default;

    /**
     * Parse settings from a YAML document. Throws ConfigError.
     */
    explicit Settings(std::string const& yamlConf);

    /**
     * Replace the current settings with the contents of the file named
     * by OAUTH_SETTINGS_FILE. Missing or unreadable files keep the
     * current settings; the problem is logged.
     */
    void load();

    /**
     * Firewall by name, nullptr if unknown.
     */
    Firewall const* firewall(std::string const& name) const;

    /**
     * Convert these settings to a YAML string, which may be passed
     * to the respective `Settings(yamlConf)` constructor.
     */
    std::string toYaml() const;

    bool connect = false;
    std::string firewallName;
    std::vector<Firewall> firewalls;
};

}
