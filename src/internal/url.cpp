#include "url.hpp"

#include <cctype>
#include <stdexcept>

namespace mcpdoctor::internal
{

std::string ParsedUrl::origin() const
{
    return scheme + "://" + host + ":" + std::to_string(port);
}

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        for (auto& c : result.scheme)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme +
                                    " (only http and https are allowed)");

    const bool is_https = result.scheme == "https";

    auto path_pos = remaining.find_first_of("/?#");
    std::string authority = remaining.substr(0, path_pos);
    if (path_pos == std::string::npos)
        result.path = "/";
    else
    {
        result.path = remaining.substr(path_pos);
        auto hash = result.path.find('#');
        if (hash != std::string::npos)
            result.path.erase(hash);
        if (result.path.empty() || result.path[0] != '/')
            result.path.insert(result.path.begin(), '/');
    }

    // Drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    auto colon_pos = authority.rfind(':');
    auto bracket = authority.rfind(']');
    if (colon_pos != std::string::npos && (bracket == std::string::npos || colon_pos > bracket))
    {
        result.host = authority.substr(0, colon_pos);
        std::string port_str = authority.substr(colon_pos + 1);
        try
        {
            result.port = port_str.empty() ? (is_https ? 443 : 80) : std::stoi(port_str);
        }
        catch (const std::exception&)
        {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
    }
    else
    {
        result.host = authority;
        result.port = is_https ? 443 : 80;
    }

    if (result.host.empty())
        throw std::invalid_argument("URL has no host: " + url);
    return result;
}

std::string resolve_reference(const ParsedUrl& base, const std::string& reference)
{
    if (reference.rfind("http://", 0) == 0 || reference.rfind("https://", 0) == 0)
        return reference;

    if (!reference.empty() && reference[0] == '/')
        return base.origin() + reference;

    std::string base_dir = "/";
    std::string base_path = base.path.substr(0, base.path.find('?'));
    auto last_slash = base_path.rfind('/');
    if (last_slash != std::string::npos)
        base_dir = base_path.substr(0, last_slash + 1);
    return base.origin() + base_dir + reference;
}

} // namespace mcpdoctor::internal
