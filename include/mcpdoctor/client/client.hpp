#pragma once
/// @file client/client.hpp
/// @brief ProtocolClient: one façade over every transport and launch mode.

#include "mcpdoctor/client/target.hpp"
#include "mcpdoctor/client/transports.hpp"
#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/launcher/environment.hpp"
#include "mcpdoctor/settings.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpdoctor::launcher
{
class ServerProcess;
}

namespace mcpdoctor::client
{

enum class TransportKind
{
    Auto,
    Http,
    Sse,
    Stdio
};

const char* to_string(TransportKind kind);

/// @throws std::invalid_argument for unknown names
TransportKind parse_transport_kind(const std::string& name);

struct ClientOptions
{
    TransportKind transport = TransportKind::Auto;
    TransportOptions transport_options;
    launcher::Environment env_overrides;
    std::optional<std::string> working_directory;
    std::optional<int> port;
    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds shutdown_grace{5000};
    bool log_env_vars = true;
    std::vector<std::string> sensitive_env_patterns = default_sensitive_env_patterns();

    static ClientOptions from_settings(const Settings& settings);
};

/// Picks the transport once (in connect) from the target's shape, launches the
/// server first when the target is a command, and owns both for the session.
class ProtocolClient
{
  public:
    explicit ProtocolClient(std::string target, ClientOptions options = {});

    /// Use an already-built transport (and optionally the process behind it)
    ProtocolClient(std::unique_ptr<ITransport> transport,
                   std::shared_ptr<launcher::ServerProcess> process = nullptr,
                   std::string identity = "injected://transport");

    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /// Launch (if needed), select the transport and handshake.
    /// Any failure closes the client before propagating.
    void connect();

    /// Tool catalog, fetched once per session. Connects first if needed.
    std::vector<Operation> discover();

    /// @throws TransportFault when the session is not ready or the channel broke
    InvocationResult invoke(const std::string& operation, const Json& arguments);

    /// Adapter first, process second; both attempted. Idempotent.
    void close();

    SessionState state() const
    {
        return state_.load();
    }
    const std::string& server_identity() const
    {
        return identity_;
    }
    const ServerInfo& server_info() const
    {
        return info_;
    }
    TransportKind transport_kind() const
    {
        return kind_;
    }
    std::shared_ptr<launcher::ServerProcess> process() const
    {
        return process_;
    }

    /// Classify a URL endpoint as streamable HTTP or SSE
    static TransportKind probe_url(const std::string& url, const TransportOptions& options);

  private:
    void connect_locked();
    void establish();
    void close_locked();

    std::string target_;
    ClientOptions options_;
    std::string identity_;
    TransportKind kind_ = TransportKind::Auto;

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<launcher::ServerProcess> process_;
    ServerInfo info_;

    std::mutex mutex_;
    std::atomic<SessionState> state_{SessionState::NotStarted};
    std::optional<std::vector<Operation>> catalog_;
};

} // namespace mcpdoctor::client
