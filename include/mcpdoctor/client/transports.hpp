#pragma once
/// @file client/transports.hpp
/// @brief JSON-RPC transports: streamable HTTP, HTTP+SSE and stdio.

#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace httplib
{
class Client;
}

namespace mcpdoctor::launcher
{
class ServerProcess;
}

namespace mcpdoctor::client
{

namespace detail
{
class PendingRequests;
}

/// MCP protocol revision sent in initialize.
inline constexpr const char* kProtocolVersion = "2024-11-05";

/// The four operations every transport offers.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Open the channel and perform the initialize handshake
    /// @throws ConnectionError, ProtocolError, StartupTimeoutError
    virtual ServerInfo connect() = 0;

    /// Full tool catalog, following pagination
    /// @throws ProtocolError when the server cannot list tools
    virtual std::vector<Operation> discover() = 0;

    /// Call one tool. Tool-level errors come back as failure results.
    /// @throws TransportFault, RequestTimeoutError
    virtual InvocationResult invoke(const std::string& operation, const Json& arguments) = 0;

    /// Release the channel. Idempotent.
    virtual void close() = 0;
};

struct TransportOptions
{
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    int connect_attempts = 3;
    std::map<std::string, std::string> headers; ///< Extra HTTP headers (HTTP/SSE only)
    std::string client_version;                 ///< Defaults to the library version
};

/// JSON-RPC 2.0 session logic shared by all transports. Subclasses only
/// move envelopes; ids, handshake, pagination and result classification live here.
class RpcTransport : public ITransport
{
  public:
    ~RpcTransport() override;

    ServerInfo connect() override;
    std::vector<Operation> discover() override;
    InvocationResult invoke(const std::string& operation, const Json& arguments) override;
    void close() override;

    SessionState state() const
    {
        return state_.load();
    }
    const ServerInfo& server_info() const
    {
        return info_;
    }

  protected:
    explicit RpcTransport(TransportOptions options);

    /// Establish the underlying channel (socket, stream, pipes)
    virtual void open_channel() = 0;
    /// Send a request envelope and return the reply carrying the same id
    virtual Json exchange(const Json& request, std::chrono::milliseconds timeout) = 0;
    virtual void send_notification(const Json& notification) = 0;
    virtual void close_channel() = 0;

    /// Deadline for the initialize round trip
    virtual std::chrono::milliseconds handshake_timeout() const
    {
        return options_.request_timeout;
    }
    /// What a handshake that never completes means for this transport
    [[noreturn]] virtual void handshake_timed_out(const std::string& detail);

    /// Build the envelope, exchange it and check the reply's shape
    Json call(const std::string& method, const Json& params, std::chrono::milliseconds timeout);

    int64_t next_id()
    {
        return next_id_.fetch_add(1);
    }

    TransportOptions options_;

  private:
    void require_ready(const char* what) const;

    std::atomic<int64_t> next_id_{1};
    std::atomic<SessionState> state_{SessionState::NotStarted};
    ServerInfo info_;
};

/// Streamable HTTP: one POST per message to a single endpoint.
class HttpTransport : public RpcTransport
{
  public:
    explicit HttpTransport(std::string url, TransportOptions options = {});
    ~HttpTransport() override;

    std::string session_id() const;

  protected:
    void open_channel() override;
    Json exchange(const Json& request, std::chrono::milliseconds timeout) override;
    void send_notification(const Json& notification) override;
    void close_channel() override;

  private:
    std::map<std::string, std::string> request_headers() const;
    void capture_session_id(const std::string& value);

    std::string url_;
    std::string origin_;
    std::string path_;
    mutable std::mutex session_mutex_;
    std::string session_id_;
};

/// HTTP+SSE: a long-lived GET stream carries replies; requests are POSTed
/// to the endpoint the stream announces.
class SseTransport : public RpcTransport
{
  public:
    explicit SseTransport(std::string sse_url, TransportOptions options = {});
    ~SseTransport() override;

    std::string session_id() const;
    /// POST target announced by the server (empty before connect)
    std::string endpoint() const;

  protected:
    void open_channel() override;
    Json exchange(const Json& request, std::chrono::milliseconds timeout) override;
    void send_notification(const Json& notification) override;
    void close_channel() override;

  private:
    void listen();
    void handle_event(const std::string& event, const std::string& data);
    void post(const Json& message, int& status, std::string& body);
    void stop_listener();

    std::string sse_url_;
    std::unique_ptr<detail::PendingRequests> pending_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string endpoint_;
    std::string session_id_;
    std::string listen_error_;
    bool stream_open_ = false;
    bool stream_ended_ = false;
    bool listener_done_ = false;
    std::shared_ptr<httplib::Client> listener_client_; ///< Stoppable from close()

    std::atomic<bool> running_{false};
    std::thread listener_;
};

/// Line-delimited JSON-RPC over a launched child's stdin/stdout.
/// If the child closes stdout the transport fails every waiter and
/// terminates the child itself.
class StdioTransport : public RpcTransport
{
  public:
    StdioTransport(std::shared_ptr<launcher::ServerProcess> process, TransportOptions options = {},
                   std::chrono::milliseconds startup_timeout = std::chrono::seconds(30));
    ~StdioTransport() override;

    bool faulted() const
    {
        return faulted_.load();
    }

  protected:
    void open_channel() override;
    Json exchange(const Json& request, std::chrono::milliseconds timeout) override;
    void send_notification(const Json& notification) override;
    void close_channel() override;

    std::chrono::milliseconds handshake_timeout() const override
    {
        return startup_timeout_;
    }
    [[noreturn]] void handshake_timed_out(const std::string& detail) override;

  private:
    void read_loop();
    void answer_server_request(const Json& message);
    void stop_reader();

    std::shared_ptr<launcher::ServerProcess> process_;
    std::chrono::milliseconds startup_timeout_;
    std::unique_ptr<detail::PendingRequests> pending_;
    std::atomic<bool> running_{false};
    std::atomic<bool> faulted_{false};
    std::thread reader_;
};

} // namespace mcpdoctor::client
