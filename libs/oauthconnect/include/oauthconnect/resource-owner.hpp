#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "oauthcl/uri.hpp"

namespace oauthconnect
{

using Parameters = std::map<std::string, std::string>;

/**
 * A provider definition which knows how to send a user
 * to the provider's authorization page.
 */
class IResourceOwner
{
public:
    virtual ~IResourceOwner() = default;

    virtual std::string getAuthorizationUrl(
        std::string const& redirectUrl,
        Parameters const& extraParameters) = 0;
};

/**
 * Resource owner for providers which follow the OAuth2
 * authorization code grant (RFC 6749 section 4.1.1).
 */
class GenericOAuth2ResourceOwner : public IResourceOwner
{
public:
    struct Options {
        std::string authorizationUrl;
        std::string clientId;
        std::string scope; // optional
    };

    /**
     * Throws oauthcl::URIError if the authorization URL is malformed.
     */
    explicit GenericOAuth2ResourceOwner(Options options);

    std::string getAuthorizationUrl(
        std::string const& redirectUrl,
        Parameters const& extraParameters) override;

    Options const& options() const { return options_; }

private:
    Options options_;
    oauthcl::URIComponents endpoint_;
};

class MockResourceOwner : public IResourceOwner
{
public:
    struct Call {
        std::string redirectUrl;
        Parameters extraParameters;
    };

    std::function<std::string(std::string const& /* redirectUrl */,
                              Parameters const& /* extraParameters */)> authorizationUrlFun;
    std::vector<Call> calls;

    std::string getAuthorizationUrl(
        std::string const& redirectUrl,
        Parameters const& extraParameters) override;
};

}
