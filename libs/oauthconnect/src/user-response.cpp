#include "user-response.hpp"

#include <algorithm>
#include <cctype>

#include "oauthcl/log.hpp"
#include "stx/format.h"

using oauthcl::logRuntimeError;

namespace oauthconnect
{

namespace
{

bool hasContent(YAML::Node const& node)
{
    if (!node.IsDefined() || node.IsNull())
        return false;
    if (node.IsMap() || node.IsSequence())
        return node.size() > 0;
    return !node.Scalar().empty();
}

std::optional<std::size_t> parseIndex(std::string const& step)
{
    if (step.empty() || !std::all_of(step.begin(), step.end(), [](unsigned char c) { return std::isdigit(c); }))
        return {};
    try {
        return static_cast<std::size_t>(std::stoull(step));
    }
    catch (std::out_of_range const&) {
        return {};
    }
}

}

PathMap mergePaths(PathMap base, PathMap const& overrides)
{
    for (auto const& [field, path] : overrides)
        base[field] = path;
    return base;
}

void AbstractUserResponse::setResponse(YAML::Node response)
{
    response_.reset(response);
}

void AbstractUserResponse::setResponse(std::string const& body)
{
    YAML::Node parsed;
    try {
        parsed = YAML::Load(body);
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<AuthenticationError>(
            stx::format("[AbstractUserResponse::setResponse] Response is not valid JSON: {}", e.what()));
    }

    if (!parsed.IsMap() && !parsed.IsSequence())
        throw logRuntimeError<AuthenticationError>(
            "[AbstractUserResponse::setResponse] Response is not a JSON object.");

    response_.reset(parsed);
}

void PathUserResponse::setPaths(PathMap const& paths)
{
    paths_ = mergePaths(std::move(paths_), paths);
}

std::optional<YAML::Node> PathUserResponse::getValueForPath(std::string const& name) const
{
    if (!hasContent(response_))
        return {};

    auto pathIt = paths_.find(name);
    if (pathIt == paths_.end() || !pathIt->second || pathIt->second->empty())
        return {};

    auto const& path = *pathIt->second;
    YAML::Node current(response_);

    std::string::size_type stepBegin = 0;
    for (;;) {
        auto stepEnd = path.find('.', stepBegin);
        auto step = path.substr(stepBegin, stepEnd == std::string::npos ? std::string::npos : stepEnd - stepBegin);

        YAML::Node const& view = current;
        std::optional<YAML::Node> next;
        if (view.IsMap()) {
            next.emplace(view[step]);
        }
        else if (view.IsSequence()) {
            if (auto index = parseIndex(step))
                next.emplace(view[*index]);
        }
        else {
            oauthcl::log().trace("[PathUserResponse] '{}': cannot descend into scalar at '{}' of path '{}'", name, step, path);
            return {};
        }

        if (!next || !next->IsDefined()) {
            oauthcl::log().trace("[PathUserResponse] '{}': no key '{}' in path '{}'", name, step, path);
            return {};
        }
        current.reset(*next);

        if (stepEnd == std::string::npos)
            break;
        stepBegin = stepEnd + 1;
    }

    return current;
}

std::optional<YAML::Node> PathUserResponse::getUsername() const
{
    return getValueForPath("identifier");
}

std::optional<YAML::Node> PathUserResponse::getNickname() const
{
    return getValueForPath("nickname");
}

std::optional<YAML::Node> PathUserResponse::getRealName() const
{
    return getValueForPath("realname");
}

std::optional<YAML::Node> PathUserResponse::getEmail() const
{
    return getValueForPath("email");
}

std::optional<YAML::Node> PathUserResponse::getFirstName() const
{
    return getValueForPath("first_name");
}

std::optional<YAML::Node> PathUserResponse::getLastName() const
{
    return getValueForPath("last_name");
}

std::optional<YAML::Node> PathUserResponse::getProfilePicture() const
{
    return getValueForPath("profilepicture");
}

}
