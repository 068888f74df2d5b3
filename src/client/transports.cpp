#include "mcpdoctor/client/transports.hpp"

#include "../internal/url.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/json.hpp"
#include "mcpdoctor/version.hpp"
#include "http_util.hpp"
#include "sse_parser.hpp"

#include <httplib.h>
#include <set>
#include <spdlog/spdlog.h>
#include <thread>

namespace mcpdoctor::client
{

namespace
{

using Clock = std::chrono::steady_clock;

std::string error_message(const Json& reply)
{
    const auto& err = reply["error"];
    if (err.is_object())
        return util::json::string_field(err, "message", "Unknown error");
    if (err.is_string())
        return err.get<std::string>();
    return "Unknown error";
}

/// Pick the reply carrying `id` out of an SSE-framed or batched body.
std::optional<Json> select_reply(const std::vector<Json>& messages, int64_t id)
{
    for (const auto& msg : messages)
    {
        if (!msg.is_object() || !msg.contains("id"))
            continue;
        const auto& mid = msg["id"];
        if ((mid.is_number_integer() && mid.get<int64_t>() == id) ||
            (mid.is_string() && mid.get<std::string>() == std::to_string(id)))
            return msg;
    }
    return std::nullopt;
}

} // namespace

// =============================================================================
// RpcTransport
// =============================================================================

RpcTransport::RpcTransport(TransportOptions options) : options_(std::move(options))
{
    if (options_.client_version.empty())
        options_.client_version = mcpdoctor::VERSION_STRING;
}

RpcTransport::~RpcTransport() = default;

void RpcTransport::handshake_timed_out(const std::string& detail)
{
    throw ConnectionError("Handshake timed out: " + detail);
}

Json RpcTransport::call(const std::string& method, const Json& params,
                        std::chrono::milliseconds timeout)
{
    Json request = {{"jsonrpc", "2.0"}, {"id", next_id()}, {"method", method}, {"params", params}};
    Json reply = exchange(request, timeout);
    if (!reply.is_object() || (!reply.contains("result") && !reply.contains("error")))
        throw TransportFault("Malformed JSON-RPC envelope in reply to " + method);
    return reply;
}

ServerInfo RpcTransport::connect()
{
    auto expected = SessionState::NotStarted;
    if (!state_.compare_exchange_strong(expected, SessionState::Starting))
    {
        if (expected == SessionState::Ready)
            return info_;
        throw ConnectionError(std::string("Cannot connect a transport in state ") +
                              to_string(expected));
    }

    open_channel();

    Json params = {{"protocolVersion", kProtocolVersion},
                   {"capabilities", Json::object()},
                   {"clientInfo",
                    {{"name", mcpdoctor::CLIENT_NAME}, {"version", options_.client_version}}}};
    Json reply;
    try
    {
        reply = call("initialize", params, handshake_timeout());
    }
    catch (const RequestTimeoutError& e)
    {
        handshake_timed_out(e.what());
    }
    catch (const TransportFault& e)
    {
        throw ProtocolError(std::string("initialize failed: ") + e.what());
    }

    if (reply.contains("error"))
        throw ProtocolError("initialize rejected: " + error_message(reply));
    info_ = ServerInfo::from_initialize_result(reply["result"]);

    send_notification({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

    state_.store(SessionState::Ready);
    spdlog::info("Connected to {} {} (protocol {})", info_.name.empty() ? "server" : info_.name,
                 info_.version, info_.protocol_version);
    return info_;
}

void RpcTransport::require_ready(const char* what) const
{
    auto s = state_.load();
    if (s != SessionState::Ready)
        throw TransportFault(std::string(what) + " requires a ready session (state: " +
                             to_string(s) + ")");
}

std::vector<Operation> RpcTransport::discover()
{
    require_ready("tools/list");

    std::vector<Operation> catalog;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;
    do
    {
        Json params = Json::object();
        if (cursor)
            params["cursor"] = *cursor;

        Json reply = call("tools/list", params, options_.request_timeout);
        if (reply.contains("error"))
            throw ProtocolError("tools/list failed: " + error_message(reply));

        const auto& result = reply["result"];
        if (!result.is_object() || !result.contains("tools"))
            throw ProtocolError("tools/list result has no tools array");
        auto page = parse_catalog_page(result["tools"]);
        catalog.insert(catalog.end(), std::make_move_iterator(page.begin()),
                       std::make_move_iterator(page.end()));

        cursor.reset();
        if (result.contains("nextCursor") && result["nextCursor"].is_string())
        {
            auto next = result["nextCursor"].get<std::string>();
            if (!next.empty() && seen_cursors.insert(next).second)
                cursor = std::move(next);
            else if (!next.empty())
                spdlog::warn("tools/list repeated cursor '{}', stopping pagination", next);
        }
    } while (cursor);

    spdlog::info("Discovered {} tools", catalog.size());
    return catalog;
}

InvocationResult RpcTransport::invoke(const std::string& operation, const Json& arguments)
{
    require_ready("tools/call");

    Json params = {{"name", operation},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    auto started = Clock::now();
    Json reply = call("tools/call", params, options_.request_timeout);
    Seconds elapsed = Clock::now() - started;

    if (reply.contains("error"))
        return InvocationResult::from_rpc_error(operation, reply["error"], elapsed);
    return InvocationResult::from_call_result(operation, reply["result"], elapsed);
}

void RpcTransport::close()
{
    auto previous = state_.exchange(SessionState::Terminated);
    if (previous == SessionState::Terminated)
        return;
    close_channel();
}

// =============================================================================
// HttpTransport
// =============================================================================

HttpTransport::HttpTransport(std::string url, TransportOptions options)
    : RpcTransport(std::move(options)), url_(std::move(url))
{
    try
    {
        auto parsed = internal::parse_url(url_);
        origin_ = parsed.origin();
        path_ = parsed.path;
    }
    catch (const std::invalid_argument& e)
    {
        throw ConnectionError(e.what());
    }
}

HttpTransport::~HttpTransport()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Error closing HTTP transport: {}", e.what());
    }
}

std::string HttpTransport::session_id() const
{
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

void HttpTransport::capture_session_id(const std::string& value)
{
    if (value.empty())
        return;
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = value;
}

std::map<std::string, std::string> HttpTransport::request_headers() const
{
    std::map<std::string, std::string> headers = options_.headers;
    headers["Accept"] = "application/json, text/event-stream";
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_id_.empty())
        headers["Mcp-Session-Id"] = session_id_;
    return headers;
}

void HttpTransport::open_channel()
{
    // Any HTTP answer proves the endpoint is reachable; only refused or
    // timed-out connections are retried.
    for (int attempt = 1; attempt <= std::max(1, options_.connect_attempts); ++attempt)
    {
        httplib::Client cli(origin_);
        detail::set_timeouts(cli, options_.connect_timeout, options_.connect_timeout);
        cli.set_follow_location(false);
        auto res = cli.Head(path_);
        if (res)
        {
            spdlog::debug("{} reachable (HEAD {})", url_, res->status);
            return;
        }
        spdlog::debug("Connection attempt {}/{} to {} failed: {}", attempt,
                      options_.connect_attempts, url_, httplib::to_string(res.error()));
        if (attempt < options_.connect_attempts)
            std::this_thread::sleep_for(std::chrono::milliseconds(250 * attempt));
    }
    throw ConnectionError("Cannot reach " + url_ + " after " +
                          std::to_string(options_.connect_attempts) + " attempts");
}

Json HttpTransport::exchange(const Json& request, std::chrono::milliseconds timeout)
{
    const int64_t id = request["id"].get<int64_t>();
    const std::string method = util::json::string_field(request, "method");

    httplib::Client cli(origin_);
    detail::set_timeouts(cli, options_.connect_timeout, timeout);
    cli.set_keep_alive(false);
    cli.set_follow_location(false);

    auto headers = detail::to_headers(request_headers());

    auto started = Clock::now();
    auto res = cli.Post(path_, headers, util::json::dump(request), "application/json");
    if (!res)
    {
        if (Clock::now() - started >= timeout)
            throw RequestTimeoutError(method + " timed out after " +
                                      std::to_string(timeout.count()) + " ms");
        throw TransportFault(method + ": HTTP request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300)
        throw TransportFault(method + ": HTTP error " + std::to_string(res->status));

    capture_session_id(res->get_header_value("Mcp-Session-Id"));

    std::vector<Json> messages;
    const auto content_type = res->get_header_value("Content-Type");
    if (content_type.find("text/event-stream") != std::string::npos)
    {
        detail::SseParser parser(
            [&messages](const detail::SseEvent& ev)
            {
                if (auto j = util::json::try_parse(ev.data))
                    messages.push_back(std::move(*j));
            });
        parser.feed(res->body.data(), res->body.size());
        parser.finish();
    }
    else
    {
        auto parsed = util::json::try_parse(res->body);
        if (!parsed)
            throw TransportFault(method + ": response body is not JSON");
        if (parsed->is_array())
            messages.assign(parsed->begin(), parsed->end());
        else
            messages.push_back(std::move(*parsed));
    }

    if (auto reply = select_reply(messages, id))
        return *reply;
    throw TransportFault(method + ": no reply with id " + std::to_string(id) + " in response");
}

void HttpTransport::send_notification(const Json& notification)
{
    httplib::Client cli(origin_);
    detail::set_timeouts(cli, options_.connect_timeout, options_.request_timeout);
    cli.set_follow_location(false);

    auto headers = detail::to_headers(request_headers());

    auto res = cli.Post(path_, headers, util::json::dump(notification), "application/json");
    if (!res)
        spdlog::warn("Notification {} not delivered: {}", util::json::string_field(notification, "method"),
                     httplib::to_string(res.error()));
    else if (res->status < 200 || res->status >= 300)
        spdlog::warn("Notification {} answered with HTTP {}", util::json::string_field(notification, "method"),
                     res->status);
}

void HttpTransport::close_channel()
{
    auto sid = session_id();
    if (sid.empty())
        return;

    // Ask the server to drop the session; failures are irrelevant at this point.
    httplib::Client cli(origin_);
    detail::set_timeouts(cli, std::chrono::milliseconds(1000), std::chrono::milliseconds(2000));
    cli.set_follow_location(false);
    httplib::Headers headers = {{"Mcp-Session-Id", sid}};
    auto res = cli.Delete(path_, headers);
    if (res)
        spdlog::debug("Session {} closed (HTTP {})", sid, res->status);
}

} // namespace mcpdoctor::client
