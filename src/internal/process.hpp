// Subprocess management for the mcpdoctor process launcher (POSIX)

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpdoctor::process
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Outcome of a timed line read
enum class ReadStatus
{
    Line,
    Timeout,
    Eof
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Read one newline-terminated line (newline and trailing \r stripped).
    /// A final unterminated line is returned before Eof.
    /// @param timeout_ms Maximum wait; negative waits forever
    ReadStatus read_line(std::string& line, int timeout_ms = -1);

    /// Check if data is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    bool has_data(int timeout_ms = 0);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
    std::string buffer_;
    bool eof_ = false;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write data to the pipe
    size_t write(const char* data, size_t size);

    /// Write string to the pipe
    size_t write(const std::string& data);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    /// Complete child environment when inherit_environment is false,
    /// otherwise entries layered over the parent's environment.
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = true;
    /// Put the child in its own process group so signals reach its children too
    bool new_process_group = true;
};

/// Subprocess handle. Signals go to the child's process group when one was created.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process; argv[0] is resolved through PATH
    void spawn(const std::vector<std::string>& argv, const ProcessOptions& options = {});

    /// Get stdin pipe (only valid if redirect_stdin was true)
    WritePipe& stdin_pipe();

    /// Get stdout pipe (only valid if redirect_stdout was true)
    ReadPipe& stdout_pipe();

    /// Get stderr pipe (only valid if redirect_stderr was true)
    ReadPipe& stderr_pipe();

    /// Check if process is still running (reaps it if it has exited)
    bool is_running();

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    int wait();

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    /// Get process ID
    int pid() const;

    /// Exit code once reaped
    std::optional<int> exit_code() const;

  private:
    void signal(int sig);

    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

} // namespace mcpdoctor::process
