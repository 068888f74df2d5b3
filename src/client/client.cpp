#include "mcpdoctor/client/client.hpp"

#include "../internal/url.hpp"
#include "http_util.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/launcher/launcher.hpp"
#include "mcpdoctor/util/strings.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpdoctor::client
{

const char* to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::Auto:
        return "auto";
    case TransportKind::Http:
        return "http";
    case TransportKind::Sse:
        return "sse";
    case TransportKind::Stdio:
        return "stdio";
    }
    return "unknown";
}

TransportKind parse_transport_kind(const std::string& name)
{
    auto n = util::to_lower(util::trim(name));
    if (n == "auto")
        return TransportKind::Auto;
    if (n == "http" || n == "streamable-http" || n == "streamable_http")
        return TransportKind::Http;
    if (n == "sse")
        return TransportKind::Sse;
    if (n == "stdio")
        return TransportKind::Stdio;
    throw std::invalid_argument("Unknown transport: " + name + " (expected auto, http, sse or stdio)");
}

ClientOptions ClientOptions::from_settings(const Settings& settings)
{
    ClientOptions o;
    o.transport_options.request_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.request_timeout);
    o.startup_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.startup_timeout);
    o.shutdown_grace = std::chrono::duration_cast<std::chrono::milliseconds>(settings.shutdown_grace);
    o.log_env_vars = settings.log_env_vars;
    o.sensitive_env_patterns = settings.sensitive_env_patterns;
    return o;
}

ProtocolClient::ProtocolClient(std::string target, ClientOptions options)
    : target_(std::move(target)), options_(std::move(options)), identity_(target_),
      kind_(options_.transport)
{
}

ProtocolClient::ProtocolClient(std::unique_ptr<ITransport> transport,
                               std::shared_ptr<launcher::ServerProcess> process,
                               std::string identity)
    : identity_(std::move(identity)), transport_(std::move(transport)), process_(std::move(process))
{
    if (!transport_)
        throw std::invalid_argument("ProtocolClient needs a transport");
}

ProtocolClient::~ProtocolClient()
{
    close();
}

TransportKind ProtocolClient::probe_url(const std::string& url, const TransportOptions& options)
{
    internal::ParsedUrl parsed;
    try
    {
        parsed = internal::parse_url(url);
    }
    catch (const std::invalid_argument& e)
    {
        throw ConnectionError(e.what());
    }

    auto path = parsed.path.substr(0, parsed.path.find('?'));
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    if (util::ends_with(path, "/sse"))
        return TransportKind::Sse;

    httplib::Client cli(parsed.origin());
    detail::set_timeouts(cli, std::chrono::milliseconds(5000), std::chrono::milliseconds(5000));
    cli.set_follow_location(false);

    auto head = cli.Head(parsed.path, detail::to_headers(options.headers));
    if (head)
    {
        if (head->status == 406)
        {
            spdlog::info("HEAD {} returned 406 requiring text/event-stream; using SSE", url);
            return TransportKind::Sse;
        }
        if (util::contains_ci(head->get_header_value("Content-Type"), "text/event-stream"))
            return TransportKind::Sse;
    }

    // Read only the status line and headers; an SSE stream would never end.
    int status = 0;
    std::string content_type;
    detail::set_timeouts(cli, std::chrono::milliseconds(5000), std::chrono::milliseconds(3000));
    (void)cli.Get(parsed.path, detail::to_headers(options.headers),
                  [&](const httplib::Response& r)
                  {
                      status = r.status;
                      content_type = r.get_header_value("Content-Type");
                      return false;
                  },
                  [](const char*, size_t) { return false; });
    if (util::contains_ci(content_type, "text/event-stream") || status == 406)
    {
        spdlog::info("Detected SSE endpoint at {}", url);
        return TransportKind::Sse;
    }
    return TransportKind::Http;
}

void ProtocolClient::connect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    connect_locked();
}

void ProtocolClient::connect_locked()
{
    auto s = state_.load();
    if (s == SessionState::Ready)
        return;
    if (s != SessionState::NotStarted)
        throw ConnectionError(std::string("Cannot connect a client in state ") + to_string(s));

    state_.store(SessionState::Starting);
    try
    {
        establish();
    }
    catch (...)
    {
        close_locked();
        throw;
    }
    state_.store(SessionState::Ready);
}

void ProtocolClient::establish()
{
    if (!transport_)
    {
        auto target = parse_target(target_);
        if (target.is_url())
        {
            identity_ = target.url;
            if (kind_ == TransportKind::Auto)
                kind_ = probe_url(target.url, options_.transport_options);
            if (kind_ == TransportKind::Stdio)
                throw ConnectionError("The stdio transport needs a command, not a URL: " +
                                      target.url);
        }
        else
        {
            launcher::LaunchSpec spec = launcher::LaunchSpec::from_target(target);
            spec.overrides = options_.env_overrides;
            spec.working_directory = options_.working_directory;
            spec.port = options_.port;
            spec.startup_timeout = options_.startup_timeout;
            spec.shutdown_grace = options_.shutdown_grace;
            spec.log_env_vars = options_.log_env_vars;
            spec.mode = (kind_ == TransportKind::Http || kind_ == TransportKind::Sse)
                            ? launcher::LaunchMode::Http
                            : launcher::LaunchMode::Stdio;

            launcher::ProcessLauncher launcher{launcher::EnvRedactor(options_.sensitive_env_patterns)};
            process_ = launcher.launch(spec);

            if (spec.mode == launcher::LaunchMode::Stdio)
            {
                kind_ = TransportKind::Stdio;
                identity_ = "stdio://" + target.command_line();
            }
            else
            {
                auto url = process_->announced_url();
                if (!url)
                    throw LaunchError("Server is ready but announced no URL");
                identity_ = *url;
            }
        }

        switch (kind_)
        {
        case TransportKind::Sse:
            transport_ = std::make_unique<SseTransport>(identity_, options_.transport_options);
            break;
        case TransportKind::Stdio:
            transport_ = std::make_unique<StdioTransport>(process_, options_.transport_options,
                                                          options_.startup_timeout);
            break;
        default:
            transport_ = std::make_unique<HttpTransport>(identity_, options_.transport_options);
            break;
        }
        spdlog::info("Using {} transport for {}", to_string(kind_), identity_);
    }

    info_ = transport_->connect();
}

std::vector<Operation> ProtocolClient::discover()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (catalog_)
        return *catalog_;

    if (state_.load() == SessionState::NotStarted)
        connect_locked();
    if (state_.load() != SessionState::Ready)
        throw TransportFault(std::string("Cannot list tools: session is ") +
                             to_string(state_.load()));

    try
    {
        catalog_ = transport_->discover();
    }
    catch (...)
    {
        close_locked();
        throw;
    }
    return *catalog_;
}

InvocationResult ProtocolClient::invoke(const std::string& operation, const Json& arguments)
{
    auto s = state_.load();
    if (s != SessionState::Ready)
        throw TransportFault("Cannot call " + operation + ": session is " + to_string(s));
    return transport_->invoke(operation, arguments);
}

void ProtocolClient::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void ProtocolClient::close_locked()
{
    if (state_.exchange(SessionState::Terminated) == SessionState::Terminated)
        return;

    if (transport_)
    {
        try
        {
            transport_->close();
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Closing transport for {} failed: {}", identity_, e.what());
        }
    }
    if (process_)
    {
        try
        {
            process_->terminate();
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Terminating server for {} failed: {}", identity_, e.what());
        }
    }
    spdlog::debug("Session with {} closed", identity_);
}

} // namespace mcpdoctor::client
