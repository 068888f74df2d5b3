// POSIX implementation of subprocess process management

#include "process.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpdoctor::process
{

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool own_group = false;
    int exit_code = -1;
};

namespace
{

std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

void close_pair(int (&fds)[2])
{
    for (int& fd : fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Writing to a child that already exited must surface as EPIPE, not kill us.
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos)
                continue;
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged)
        out.push_back(key + "=" + value);
    return out;
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
    }
}

ReadStatus ReadPipe::read_line(std::string& line, int timeout_ms)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);

    while (true)
    {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos)
        {
            line.assign(buffer_, 0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return ReadStatus::Line;
        }

        if (eof_ || !is_open())
        {
            if (buffer_.empty())
                return ReadStatus::Eof;
            line.swap(buffer_);
            buffer_.clear();
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return ReadStatus::Line;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0)
        {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now())
                    .count();
            if (remaining <= 0)
                return ReadStatus::Timeout;
            wait_ms = static_cast<int>(remaining);
        }

        if (!has_data(wait_ms))
        {
            if (timeout_ms >= 0)
                continue;
        }

        char chunk[4096];
        size_t n = read(chunk, sizeof(chunk));
        if (n == 0)
            eof_ = true;
        else
            buffer_.append(chunk, n);
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result;
    do
    {
        result = ::poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0)
        throw ProcessError("poll failed: " + get_errno_message());

    // POLLHUP counts as readable so the caller observes EOF
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (handle_ && is_running())
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::vector<std::string>& args, const ProcessOptions& options)
{
    if (args.empty() || args.front().empty())
        throw ProcessError("No executable given");

    ignore_sigpipe();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_strings = args;
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1);
    for (auto& arg : argv_strings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    int stdin_fds[2] = {-1, -1};
    int stdout_fds[2] = {-1, -1};
    int stderr_fds[2] = {-1, -1};
    int error_fds[2] = {-1, -1};

    auto close_all = [&]()
    {
        close_pair(stdin_fds);
        close_pair(stdout_fds);
        close_pair(stderr_fds);
        close_pair(error_fds);
    };

    if (options.redirect_stdin && pipe(stdin_fds) != 0)
    {
        close_all();
        throw ProcessError("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && pipe(stdout_fds) != 0)
    {
        close_all();
        throw ProcessError("Failed to create stdout pipe: " + get_errno_message());
    }
    if (options.redirect_stderr && pipe(stderr_fds) != 0)
    {
        close_all();
        throw ProcessError("Failed to create stderr pipe: " + get_errno_message());
    }
    // Error pipe for detecting exec failures
    if (pipe(error_fds) != 0)
    {
        close_all();
        throw ProcessError("Failed to create error pipe: " + get_errno_message());
    }
    fcntl(error_fds[1], F_SETFD, FD_CLOEXEC);
    for (int fd : {stdin_fds[1], stdout_fds[0], stderr_fds[0]})
        if (fd >= 0)
            fcntl(fd, F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_all();
        throw ProcessError("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        auto fail = [&](int err)
        {
            (void)::write(error_fds[1], &err, sizeof(err));
            _exit(127);
        };

        if (options.new_process_group && setpgid(0, 0) != 0)
            fail(errno);

        if (options.redirect_stdin && dup2(stdin_fds[0], STDIN_FILENO) < 0)
            fail(errno);
        if (options.redirect_stdout && dup2(stdout_fds[1], STDOUT_FILENO) < 0)
            fail(errno);
        if (options.redirect_stderr && dup2(stderr_fds[1], STDERR_FILENO) < 0)
            fail(errno);

        for (int fd : {stdin_fds[0], stdin_fds[1], stdout_fds[0], stdout_fds[1], stderr_fds[0],
                       stderr_fds[1]})
            if (fd > STDERR_FILENO)
                ::close(fd);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            fail(errno);

        ::signal(SIGPIPE, SIG_DFL);
        environ = envp.data();
        execvp(argv[0], argv.data());
        fail(errno);
    }

    // Parent process
    if (options.new_process_group)
        setpgid(pid, pid); // may race with the child's own call; either wins

    ::close(error_fds[1]);
    error_fds[1] = -1;
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    close_pair(error_fds);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        close_all();
        throw ProcessError("Failed to execute '" + args.front() +
                           "': " + get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_fds[0]);
        stdin_->handle_->fd = stdin_fds[1];
    }
    if (options.redirect_stdout)
    {
        ::close(stdout_fds[1]);
        stdout_->handle_->fd = stdout_fds[0];
    }
    if (options.redirect_stderr)
    {
        ::close(stderr_fds[1]);
        stderr_->handle_->fd = stderr_fds[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->own_group = options.new_process_group;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;
    return !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    if (errno == ECHILD)
    {
        handle_->running = false;
        return handle_->exit_code;
    }
    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::signal(int sig)
{
    if (!handle_ || handle_->pid <= 0 || !handle_->running)
        return;
    if (handle_->own_group && ::kill(-handle_->pid, sig) == 0)
        return;
    ::kill(handle_->pid, sig);
}

void Process::terminate()
{
    signal(SIGTERM);
}

void Process::kill()
{
    signal(SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

std::optional<int> Process::exit_code() const
{
    if (!handle_ || handle_->running || handle_->pid == 0)
        return std::nullopt;
    return handle_->exit_code;
}

} // namespace mcpdoctor::process
