#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "yaml-cpp/yaml.h"

namespace oauthconnect
{

/**
 * Raised when a provider response cannot be interpreted.
 */
struct AuthenticationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Field name -> dot-delimited path into a provider response.
 * An empty optional marks a field as unset.
 */
using PathMap = std::map<std::string, std::optional<std::string>>;

/**
 * Merge overrides into base. Entries in overrides win, all other
 * entries of base are kept.
 */
PathMap mergePaths(PathMap base, PathMap const& overrides);

struct OAuthToken
{
    std::string accessToken;
    std::string refreshToken;
    std::optional<int64_t> expiresIn;
    std::string tokenSecret;
};

/**
 * Normalized view on the user profile returned by a provider.
 */
class IUserResponse
{
public:
    virtual ~IUserResponse() = default;

    virtual std::optional<YAML::Node> getUsername() const = 0;
    virtual std::optional<YAML::Node> getNickname() const = 0;
    virtual std::optional<YAML::Node> getRealName() const = 0;
    virtual std::optional<YAML::Node> getEmail() const = 0;
    virtual std::optional<YAML::Node> getFirstName() const = 0;
    virtual std::optional<YAML::Node> getLastName() const = 0;
    virtual std::optional<YAML::Node> getProfilePicture() const = 0;
};

class AbstractUserResponse : public IUserResponse
{
public:
    /**
     * Use an already parsed response.
     */
    void setResponse(YAML::Node response);

    /**
     * Parse a JSON response body. Throws AuthenticationError if the body
     * is not a JSON object or array.
     */
    void setResponse(std::string const& body);

    YAML::Node const& getResponse() const { return response_; }

    void setOAuthToken(OAuthToken token) { token_ = std::move(token); }
    OAuthToken const& getOAuthToken() const { return token_; }

    std::string const& getAccessToken() const { return token_.accessToken; }
    std::string const& getRefreshToken() const { return token_.refreshToken; }
    std::optional<int64_t> getExpiresIn() const { return token_.expiresIn; }
    std::string const& getTokenSecret() const { return token_.tokenSecret; }

protected:
    YAML::Node response_;
    OAuthToken token_;
};

/**
 * Reads user fields from the response through configurable dot-paths,
 * e.g. "user.login" or "emails.0.value".
 */
class PathUserResponse : public AbstractUserResponse
{
public:
    std::optional<YAML::Node> getUsername() const override;
    std::optional<YAML::Node> getNickname() const override;
    std::optional<YAML::Node> getRealName() const override;
    std::optional<YAML::Node> getEmail() const override;
    std::optional<YAML::Node> getFirstName() const override;
    std::optional<YAML::Node> getLastName() const override;
    std::optional<YAML::Node> getProfilePicture() const override;

    PathMap const& getPaths() const { return paths_; }
    void setPaths(PathMap const& paths);

    /**
     * Resolve the path configured for the given field. Returns an empty
     * optional if no response is loaded, the path is unset, or a step
     * of the path does not exist.
     */
    std::optional<YAML::Node> getValueForPath(std::string const& name) const;

private:
    PathMap paths_{
        {"identifier", std::nullopt},
        {"nickname", std::nullopt},
        {"realname", std::nullopt},
        {"email", std::nullopt},
        {"profilepicture", std::nullopt},
    };
};

}
