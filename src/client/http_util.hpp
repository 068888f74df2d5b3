// httplib client helpers shared by the HTTP transports

#pragma once

#include <chrono>
#include <httplib.h>
#include <map>
#include <string>

namespace mcpdoctor::client::detail
{

inline void set_timeouts(httplib::Client& cli, std::chrono::milliseconds connect,
                         std::chrono::milliseconds read)
{
    cli.set_connection_timeout(static_cast<time_t>(connect.count() / 1000),
                               static_cast<time_t>((connect.count() % 1000) * 1000));
    cli.set_read_timeout(static_cast<time_t>(read.count() / 1000),
                         static_cast<time_t>((read.count() % 1000) * 1000));
    cli.set_write_timeout(static_cast<time_t>(read.count() / 1000),
                          static_cast<time_t>((read.count() % 1000) * 1000));
}

inline httplib::Headers to_headers(const std::map<std::string, std::string>& headers)
{
    httplib::Headers out;
    for (const auto& [k, v] : headers)
        out.emplace(k, v);
    return out;
}

} // namespace mcpdoctor::client::detail
