#include "mcpdoctor/launcher/launcher.hpp"

#include "../internal/process.hpp"
#include "../internal/url.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/strings.hpp"

#include <cctype>
#include <httplib.h>
#include <regex>
#include <spdlog/spdlog.h>

namespace mcpdoctor::launcher
{

namespace
{

constexpr size_t kTailLines = 40;
constexpr auto kPumpPoll = std::chrono::milliseconds(200);
constexpr auto kReadyPoll = std::chrono::milliseconds(100);
constexpr auto kProgressEvery = std::chrono::seconds(5);

const std::vector<std::regex>& url_patterns()
{
    static const std::vector<std::regex> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"((?:server|mcp)\s+(?:running|started|listening)\s+(?:on|at)?\s*(https?://\S+))",
                       flags),
            std::regex(R"((?:available|serving)\s+(?:on|at)?\s*(https?://\S+))", flags),
            std::regex(R"(url:\s*(https?://\S+))", flags),
            std::regex(R"(listening\s+(?:on|at)?\s*(https?://\S+))", flags),
            std::regex(R"((https?://(?:localhost|127\.0\.0\.1):\d+(?:/\S*)?))", flags),
            std::regex(R"((http://[^\s:]+:\d+(?:/\S*)?))", flags),
            std::regex(R"(port\s+(\d+))", flags),
            std::regex(R"((?:localhost|127\.0\.0\.1):(\d+))", flags),
        };
    }();
    return patterns;
}

bool is_local_url(const std::string& url)
{
    return (util::starts_with(url, "http://") || util::starts_with(url, "https://")) &&
           (url.find("localhost") != std::string::npos ||
            url.find("127.0.0.1") != std::string::npos) &&
           url.find(':', url.find("://") + 3) != std::string::npos;
}

/// Any HTTP answer at all means something is listening.
bool endpoint_answers(const std::string& url)
{
    try
    {
        auto parsed = internal::parse_url(url);
        httplib::Client cli(parsed.origin());
        cli.set_connection_timeout(1, 0);
        cli.set_read_timeout(2, 0);
        cli.set_follow_location(false);
        // Stop after the headers; an SSE endpoint would stream forever
        bool answered = false;
        (void)cli.Get(
            parsed.path,
            [&answered](const httplib::Response&)
            {
                answered = true;
                return false;
            },
            [](const char*, size_t) { return false; });
        return answered;
    }
    catch (const std::exception& e)
    {
        spdlog::debug("Readiness probe of {} failed: {}", url, e.what());
        return false;
    }
}

} // namespace

LaunchSpec LaunchSpec::from_target(const client::Target& target)
{
    LaunchSpec spec;
    spec.argv = target.argv;
    spec.inline_env = target.inline_env;
    return spec;
}

std::optional<std::string> extract_server_url(const std::string& line)
{
    for (const auto& pattern : url_patterns())
    {
        std::smatch match;
        if (!std::regex_search(line, match, pattern))
            continue;

        std::string found = match[1].str();
        while (!found.empty() && (found.back() == '.' || found.back() == ',' || found.back() == ';'))
            found.pop_back();

        bool digits = !found.empty();
        for (unsigned char c : found)
            digits = digits && std::isdigit(c);

        std::string url = digits ? "http://localhost:" + found : found;
        if (is_local_url(url))
            return url;
    }
    return std::nullopt;
}

// =============================================================================
// ServerProcess
// =============================================================================

ServerProcess::ServerProcess(PrivateTag, std::unique_ptr<process::Process> proc, LaunchMode mode,
                             std::string command_line, std::chrono::milliseconds grace)
    : proc_(std::move(proc)), mode_(mode), command_line_(std::move(command_line)), grace_(grace)
{
    pid_ = proc_->pid();
}

ServerProcess::~ServerProcess()
{
    terminate();
}

void ServerProcess::start_pumps()
{
    pumps_.emplace_back([this] { pump(false); });
    if (mode_ == LaunchMode::Http)
        pumps_.emplace_back([this] { pump(true); });
}

void ServerProcess::pump(bool from_stdout)
{
    try
    {
        auto& pipe = from_stdout ? proc_->stdout_pipe() : proc_->stderr_pipe();
        std::string line;
        while (!stop_pumps_.load())
        {
            auto status = pipe.read_line(line, static_cast<int>(kPumpPoll.count()));
            if (status == process::ReadStatus::Eof)
                break;
            if (status == process::ReadStatus::Timeout)
                continue;
            record_output(line);
        }
    }
    catch (const process::ProcessError& e)
    {
        spdlog::debug("Output pump for pid {} stopped: {}", pid_, e.what());
    }
}

void ServerProcess::record_output(const std::string& line)
{
    if (util::trim(line).empty())
        return;
    spdlog::debug("[server {}] {}", pid_, line);

    std::lock_guard<std::mutex> lock(output_mutex_);
    tail_.push_back(line);
    while (tail_.size() > kTailLines)
        tail_.pop_front();

    if (mode_ == LaunchMode::Http && !announced_url_)
    {
        if (auto url = extract_server_url(line))
        {
            spdlog::info("Server announced {}", *url);
            announced_url_ = std::move(url);
        }
    }
}

bool ServerProcess::running()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return proc_->is_running();
}

std::optional<int> ServerProcess::exit_code()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (proc_->is_running())
        return std::nullopt;
    return proc_->exit_code();
}

std::optional<std::string> ServerProcess::announced_url() const
{
    std::lock_guard<std::mutex> lock(output_mutex_);
    return announced_url_;
}

std::string ServerProcess::output_tail() const
{
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::string out;
    for (const auto& l : tail_)
    {
        out += l;
        out += '\n';
    }
    return out;
}

void ServerProcess::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (terminated_.load())
        throw TransportFault("Server process has been terminated");
    try
    {
        auto& in = proc_->stdin_pipe();
        in.write(line);
        in.write("\n", 1);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportFault(std::string("Cannot write to server stdin: ") + e.what());
    }
}

LineStatus ServerProcess::read_line(std::string& line, std::chrono::milliseconds timeout)
{
    try
    {
        switch (proc_->stdout_pipe().read_line(line, static_cast<int>(timeout.count())))
        {
        case process::ReadStatus::Line:
            return LineStatus::Line;
        case process::ReadStatus::Timeout:
            return LineStatus::Timeout;
        case process::ReadStatus::Eof:
            return LineStatus::Eof;
        }
    }
    catch (const process::ProcessError& e)
    {
        spdlog::debug("stdout of pid {} unreadable: {}", pid_, e.what());
    }
    return LineStatus::Eof;
}

void ServerProcess::close_stdin()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        proc_->stdin_pipe().close();
    }
    catch (const process::ProcessError&)
    {
        // Not redirected or already closed
    }
}

void ServerProcess::terminate()
{
    std::lock_guard<std::mutex> guard(terminate_mutex_);
    if (terminated_.exchange(true))
        return;

    close_stdin();

    bool alive;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        alive = proc_->is_running();
        if (alive)
        {
            spdlog::debug("Sending SIGTERM to server pid {}", pid_);
            proc_->terminate();
        }
    }

    if (alive)
    {
        auto deadline = std::chrono::steady_clock::now() + grace_;
        while (std::chrono::steady_clock::now() < deadline)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!proc_->is_running())
                {
                    alive = false;
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (alive && proc_->is_running())
        {
            spdlog::warn("Server pid {} ignored SIGTERM for {} ms, killing", pid_, grace_.count());
            proc_->kill();
        }
        try
        {
            int code = proc_->wait();
            spdlog::info("Server pid {} stopped (exit code {})", pid_, code);
        }
        catch (const process::ProcessError& e)
        {
            spdlog::warn("Could not reap server pid {}: {}", pid_, e.what());
        }
    }

    stop_pumps_.store(true);
    for (auto& t : pumps_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
            t.join();
}

// =============================================================================
// ProcessLauncher
// =============================================================================

ProcessLauncher::ProcessLauncher(EnvRedactor redactor, Environment inherited)
    : redactor_(std::move(redactor)), inherited_(std::move(inherited))
{
}

void ProcessLauncher::log_launch(const LaunchSpec& spec, const Environment& merged) const
{
    spdlog::info("Starting server: {}", util::join(spec.argv));
    if (spec.working_directory)
        spdlog::info("Working directory: {}", *spec.working_directory);

    if (!spec.log_env_vars)
    {
        spdlog::debug("Environment variable logging disabled");
        return;
    }
    spdlog::info("Environment variables: {}", redactor_.summary(merged));
    auto explicit_vars = merge_environment({}, spec.inline_env, spec.overrides);
    for (const auto& [k, v] : redactor_.redact_all(explicit_vars))
        spdlog::debug("  {}={}", k, v);
}

std::shared_ptr<ServerProcess> ProcessLauncher::launch(const LaunchSpec& spec) const
{
    if (spec.argv.empty() || util::trim(spec.argv.front()).empty())
        throw LaunchError("Empty command: nothing to launch");

    auto merged = merge_environment(inherited_, spec.inline_env, spec.overrides);
    log_launch(spec, merged);

    process::ProcessOptions options;
    options.environment = merged;
    options.inherit_environment = false;
    options.new_process_group = true;
    if (spec.working_directory)
        options.working_directory = *spec.working_directory;

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(spec.argv, options);
    }
    catch (const process::ProcessError& e)
    {
        throw LaunchError(e.what());
    }

    auto server = std::make_shared<ServerProcess>(ServerProcess::PrivateTag{}, std::move(proc),
                                                  spec.mode, util::join(spec.argv),
                                                  spec.shutdown_grace);
    spdlog::info("Process started with PID: {}", server->pid());
    server->start_pumps();

    if (spec.mode == LaunchMode::Stdio)
    {
        if (!server->running())
        {
            auto code = server->exit_code();
            std::string tail = server->output_tail();
            server->terminate();
            throw LaunchError("Server exited immediately (exit code " +
                              std::to_string(code.value_or(-1)) + ")\n" + tail);
        }
        return server;
    }

    auto url = wait_for_http(*server, spec);
    spdlog::info("Server ready at {}", url);
    return server;
}

std::string ProcessLauncher::wait_for_http(ServerProcess& server, const LaunchSpec& spec) const
{
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + spec.startup_timeout;
    auto next_progress = start + kProgressEvery;

    spdlog::info("Waiting for server to start (timeout: {} ms)", spec.startup_timeout.count());
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (!server.running())
        {
            // Let the pumps catch the last words
            std::this_thread::sleep_for(kPumpPoll);
            auto code = server.exit_code();
            std::string tail = server.output_tail();
            server.terminate();
            throw LaunchError("Server process terminated unexpectedly (exit code " +
                              std::to_string(code.value_or(-1)) + ")\n" + tail);
        }

        if (auto url = server.announced_url())
        {
            if (endpoint_answers(*url))
                return *url;
        }
        else if (spec.port)
        {
            std::string url = "http://localhost:" + std::to_string(*spec.port);
            if (endpoint_answers(url))
            {
                std::lock_guard<std::mutex> lock(server.output_mutex_);
                server.announced_url_ = url;
                return url;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_progress)
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
            spdlog::info("Still waiting for server... ({}s elapsed)", elapsed);
            next_progress = now + kProgressEvery;
        }
        std::this_thread::sleep_for(kReadyPoll);
    }

    std::string tail = server.output_tail();
    server.terminate();
    throw StartupTimeoutError("Timed out after " + std::to_string(spec.startup_timeout.count()) +
                              " ms waiting for '" + server.command_line() +
                              "' to become ready. Output:\n" +
                              (tail.empty() ? std::string("(none)") : tail));
}

} // namespace mcpdoctor::launcher
