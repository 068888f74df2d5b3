#pragma once
#include <map>
#include <string>
#include <vector>

namespace mcpdoctor::client
{

/// A parsed target descriptor: either a server URL or a command to launch.
struct Target
{
    enum class Kind
    {
        Url,
        Command
    };

    Kind kind{Kind::Command};
    std::string raw;
    std::string url;                                ///< Kind::Url only
    std::vector<std::string> argv;                  ///< Kind::Command only
    std::map<std::string, std::string> inline_env;  ///< From `export K=V &&` prefixes

    bool is_url() const
    {
        return kind == Kind::Url;
    }

    /// argv joined for display
    std::string command_line() const;
};

/// True for http:// and https:// descriptors.
bool looks_like_url(const std::string& descriptor);

/// Split an already shell-split "NAME=value" word into its parts. The value is
/// taken verbatim; quoting was resolved by the shell split.
/// @return false when the word is not a valid assignment
bool parse_assignment(const std::string& word, std::string& name, std::string& value);

/// Parse a target descriptor. Commands may be prefixed by `export K=V && ...`
/// segments and leading `K=V` words; the remainder is split shell-style.
/// An empty command yields an empty argv (the launcher rejects it).
/// @throws LaunchError on unbalanced quotes or a prefix segment that is not an assignment
Target parse_target(const std::string& descriptor);

} // namespace mcpdoctor::client
