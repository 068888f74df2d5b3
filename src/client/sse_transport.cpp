#include "../internal/url.hpp"
#include "http_util.hpp"
#include "mcpdoctor/client/transports.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/json.hpp"
#include "mcpdoctor/util/strings.hpp"
#include "pending_requests.hpp"
#include "sse_parser.hpp"

#include <spdlog/spdlog.h>

namespace mcpdoctor::client
{

namespace
{
// Idle SSE streams rely on server keep-alives; allow long gaps between events.
constexpr auto kStreamReadTimeout = std::chrono::seconds(300);

std::string session_id_from(const std::string& endpoint)
{
    auto pos = endpoint.find("session_id=");
    if (pos == std::string::npos)
        return {};
    pos += std::string("session_id=").size();
    auto end = endpoint.find_first_of("&#", pos);
    return endpoint.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}
} // namespace

SseTransport::SseTransport(std::string sse_url, TransportOptions options)
    : RpcTransport(std::move(options)), sse_url_(std::move(sse_url)),
      pending_(std::make_unique<detail::PendingRequests>())
{
    try
    {
        (void)internal::parse_url(sse_url_);
    }
    catch (const std::invalid_argument& e)
    {
        throw ConnectionError(e.what());
    }
}

SseTransport::~SseTransport()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Error closing SSE transport: {}", e.what());
    }
    stop_listener();
}

std::string SseTransport::session_id() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::string SseTransport::endpoint() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}

void SseTransport::open_channel()
{
    running_.store(true);
    listener_ = std::thread([this] { listen(); });

    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, options_.connect_timeout,
                              [this] { return !endpoint_.empty() || stream_ended_; });
    if (ready && !endpoint_.empty())
    {
        spdlog::debug("SSE endpoint: {}", endpoint_);
        return;
    }

    std::string reason;
    if (!listen_error_.empty())
        reason = listen_error_;
    else if (stream_open_)
        reason = "no endpoint event within " + std::to_string(options_.connect_timeout.count()) +
                 " ms";
    else
        reason = "stream did not open within " +
                 std::to_string(options_.connect_timeout.count()) + " ms";
    lock.unlock();
    stop_listener();
    throw ConnectionError("SSE connection to " + sse_url_ + " failed: " + reason);
}

void SseTransport::listen()
{
    try
    {
        auto url = internal::parse_url(sse_url_);
        auto headers = detail::to_headers(options_.headers);
        headers.emplace("Accept", "text/event-stream");

        detail::SseParser parser([this](const detail::SseEvent& ev) { handle_event(ev.event, ev.data); });

        const int attempts = std::max(1, options_.connect_attempts);
        for (int attempt = 1; attempt <= attempts; ++attempt)
        {
            auto cli = std::make_shared<httplib::Client>(url.origin());
            detail::set_timeouts(*cli, options_.connect_timeout, kStreamReadTimeout);
            cli->set_keep_alive(true);
            cli->set_follow_location(false);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_.load())
                    break;
                listener_client_ = cli;
            }

            int status = 0;
            auto res = cli->Get(
                url.path, headers,
                [this, &status](const httplib::Response& r)
                {
                    status = r.status;
                    if (r.status < 200 || r.status >= 300)
                        return false;
                    std::lock_guard<std::mutex> lock(mutex_);
                    stream_open_ = true;
                    return true;
                },
                [this, &parser](const char* data, size_t len)
                {
                    parser.feed(data, len);
                    return running_.load();
                });
            (void)res;

            bool opened;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                opened = stream_open_;
                if (!opened && status != 0)
                    listen_error_ = "HTTP " + std::to_string(status) + " from " + sse_url_;
            }
            if (opened || status != 0 || !running_.load())
                break;

            spdlog::debug("SSE connection attempt {}/{} to {} failed: {}", attempt, attempts, sse_url_,
                          httplib::to_string(res.error()));
            if (attempt < attempts)
                std::this_thread::sleep_for(std::chrono::milliseconds(250 * attempt));
            else
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listen_error_ = "cannot reach " + sse_url_;
            }
        }
        parser.finish();
    }
    catch (const std::exception& e)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listen_error_ = e.what();
    }

    bool was_open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_open = stream_open_;
        stream_ended_ = true;
        listener_done_ = true;
    }
    cv_.notify_all();

    if (running_.load() && was_open)
    {
        spdlog::warn("SSE stream from {} ended", sse_url_);
        pending_->fail_all(std::make_exception_ptr(TransportFault("SSE stream closed by server")));
    }
}

void SseTransport::handle_event(const std::string& event, const std::string& data)
{
    if (event == "endpoint")
    {
        std::string resolved = internal::resolve_reference(internal::parse_url(sse_url_),
                                                           util::trim(data));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            endpoint_ = resolved;
            session_id_ = session_id_from(resolved);
        }
        cv_.notify_all();
        return;
    }
    if (event == "ping" || event == "heartbeat")
        return;

    auto message = util::json::try_parse(data);
    if (!message || !message->is_object())
    {
        spdlog::debug("Ignoring unparsable SSE data");
        return;
    }
    if (message->contains("result") || message->contains("error"))
    {
        if (!pending_->resolve(*message))
            spdlog::debug("Ignoring SSE reply with unknown id");
        return;
    }
    if (message->contains("method"))
        spdlog::debug("Ignoring server message {}", util::json::string_field(*message, "method"));
}

void SseTransport::post(const Json& message, int& status, std::string& body)
{
    std::string target = endpoint();
    if (target.empty())
        throw TransportFault("SSE endpoint not known");

    internal::ParsedUrl url;
    try
    {
        url = internal::parse_url(target);
    }
    catch (const std::invalid_argument& e)
    {
        throw TransportFault(std::string("Bad SSE endpoint: ") + e.what());
    }

    httplib::Client cli(url.origin());
    detail::set_timeouts(cli, options_.connect_timeout, options_.request_timeout);
    cli.set_follow_location(false);

    auto res = cli.Post(url.path, detail::to_headers(options_.headers), util::json::dump(message),
                        "application/json");
    if (!res)
        throw TransportFault("POST to " + target + " failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw TransportFault("POST to " + target + " returned HTTP " +
                             std::to_string(res->status));
    status = res->status;
    body = res->body;
}

Json SseTransport::exchange(const Json& request, std::chrono::milliseconds timeout)
{
    const int64_t id = request["id"].get<int64_t>();
    const std::string method = util::json::string_field(request, "method");

    auto future = pending_->add(id);
    int status = 0;
    std::string body;
    try
    {
        post(request, status, body);
    }
    catch (const TransportFault&)
    {
        pending_->remove(id);
        throw;
    }

    // Some servers answer inline instead of on the stream
    if (status == 200 && !body.empty())
    {
        auto inline_reply = util::json::try_parse(body);
        if (inline_reply && detail::PendingRequests::id_of(*inline_reply) == id &&
            (inline_reply->contains("result") || inline_reply->contains("error")))
        {
            pending_->remove(id);
            return *inline_reply;
        }
    }

    return pending_->await(future, id, timeout, method);
}

void SseTransport::send_notification(const Json& notification)
{
    int status = 0;
    std::string body;
    try
    {
        post(notification, status, body);
    }
    catch (const TransportFault& e)
    {
        spdlog::warn("Notification {} not delivered: {}", util::json::string_field(notification, "method"),
                     e.what());
    }
}

void SseTransport::stop_listener()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    if (!listener_.joinable())
        return;

    // stop() only interrupts a socket that is already open, so repeat until
    // the listener has noticed.
    while (true)
    {
        std::shared_ptr<httplib::Client> cli;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (listener_done_)
                break;
            cli = listener_client_;
        }
        if (cli)
            cli->stop();
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(50), [this] { return listener_done_; });
    }
    listener_.join();
}

void SseTransport::close_channel()
{
    stop_listener();
    pending_->fail_all(std::make_exception_ptr(TransportFault("SSE transport closed")));
}

} // namespace mcpdoctor::client
