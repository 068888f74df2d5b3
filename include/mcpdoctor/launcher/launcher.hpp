#pragma once
/// @file launcher/launcher.hpp
/// @brief Start a tool server as a child process and tear it down reliably.

#include "mcpdoctor/client/target.hpp"
#include "mcpdoctor/launcher/environment.hpp"
#include "mcpdoctor/types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpdoctor::process
{
class Process;
}

namespace mcpdoctor::launcher
{

/// How the child is expected to talk to us.
enum class LaunchMode
{
    Stdio, ///< JSON-RPC over the child's stdin/stdout
    Http   ///< Child serves HTTP/SSE on a local port it announces
};

struct LaunchSpec
{
    std::vector<std::string> argv;
    Environment inline_env; ///< Assignments parsed from the command prefix
    Environment overrides;  ///< Explicit overrides; win over everything
    std::optional<std::string> working_directory;
    LaunchMode mode = LaunchMode::Stdio;
    std::optional<int> port; ///< HTTP mode: probe this port if nothing is announced
    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds shutdown_grace{5000};
    bool log_env_vars = true;

    static LaunchSpec from_target(const client::Target& target);
};

/// Scan one line of server output for an announced local URL.
/// Bare port numbers ("port 3000", "localhost:3000") become http://localhost:PORT.
std::optional<std::string> extract_server_url(const std::string& line);

/// Outcome of a timed read from the child's stdout.
enum class LineStatus
{
    Line,
    Timeout,
    Eof
};

/// A running child server. Owned through shared_ptr by the launcher's caller
/// and the stdio transport. terminate() is idempotent and thread-safe.
class ServerProcess
{
    /// Only ProcessLauncher can name this, so only it can construct
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    ServerProcess(PrivateTag, std::unique_ptr<process::Process> proc, LaunchMode mode,
                  std::string command_line, std::chrono::milliseconds grace);
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    int pid() const
    {
        return pid_;
    }
    const std::string& command_line() const
    {
        return command_line_;
    }
    LaunchMode mode() const
    {
        return mode_;
    }

    bool running();
    std::optional<int> exit_code();

    /// URL the child announced on stdout/stderr (HTTP mode)
    std::optional<std::string> announced_url() const;

    /// Last lines the child wrote to stderr (and stdout in HTTP mode)
    std::string output_tail() const;

    /// Stdio mode: write one line to the child's stdin. Writes are serialised.
    /// @throws TransportFault when stdin is closed or the pipe is broken
    void write_line(const std::string& line);

    /// Stdio mode: read one line from the child's stdout.
    /// Only one thread may read at a time.
    LineStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    /// Close stdin, SIGTERM the process group, wait the grace period,
    /// SIGKILL if still alive, reap. Safe to call any number of times.
    void terminate();

    bool terminated() const
    {
        return terminated_.load();
    }

  private:
    friend class ProcessLauncher;

    void start_pumps();
    void pump(bool from_stdout);
    void record_output(const std::string& line);
    void close_stdin();

    std::unique_ptr<process::Process> proc_;
    LaunchMode mode_;
    std::string command_line_;
    std::chrono::milliseconds grace_;
    int pid_ = 0;

    mutable std::mutex state_mutex_; ///< try_wait/kill on proc_
    std::mutex write_mutex_;
    std::mutex terminate_mutex_;
    std::atomic<bool> terminated_{false};
    std::atomic<bool> stop_pumps_{false};

    mutable std::mutex output_mutex_;
    std::deque<std::string> tail_;
    std::optional<std::string> announced_url_;

    std::vector<std::thread> pumps_;
};

/// Spawns children described by a LaunchSpec and waits for readiness.
class ProcessLauncher
{
  public:
    explicit ProcessLauncher(EnvRedactor redactor = EnvRedactor{},
                             Environment inherited = inherited_environment());

    /// @throws LaunchError when the command is empty, cannot be executed, or exits early
    /// @throws StartupTimeoutError when the child never becomes ready (it is terminated first)
    std::shared_ptr<ServerProcess> launch(const LaunchSpec& spec) const;

    const EnvRedactor& redactor() const
    {
        return redactor_;
    }

  private:
    void log_launch(const LaunchSpec& spec, const Environment& merged) const;
    std::string wait_for_http(ServerProcess& server, const LaunchSpec& spec) const;

    EnvRedactor redactor_;
    Environment inherited_;
};

} // namespace mcpdoctor::launcher
