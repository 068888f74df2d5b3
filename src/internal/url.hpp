// URL splitting shared by the HTTP-speaking components

#pragma once

#include <string>

namespace mcpdoctor::internal
{

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port = 80;
    std::string path; // includes leading '/', keeps query string

    /// scheme://host:port, suitable for httplib::Client
    std::string origin() const;
};

/// @throws std::invalid_argument for schemes other than http/https
ParsedUrl parse_url(const std::string& url);

/// Resolve an endpoint announced by a server (absolute URL, absolute path or
/// relative path) against the URL it was announced from.
std::string resolve_reference(const ParsedUrl& base, const std::string& reference);

} // namespace mcpdoctor::internal
