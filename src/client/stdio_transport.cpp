#include "mcpdoctor/client/transports.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/launcher/launcher.hpp"
#include "mcpdoctor/util/json.hpp"
#include "pending_requests.hpp"

#include <spdlog/spdlog.h>

namespace mcpdoctor::client
{

namespace
{
constexpr auto kReadPoll = std::chrono::milliseconds(200);
}

StdioTransport::StdioTransport(std::shared_ptr<launcher::ServerProcess> process,
                               TransportOptions options, std::chrono::milliseconds startup_timeout)
    : RpcTransport(std::move(options)), process_(std::move(process)),
      startup_timeout_(startup_timeout), pending_(std::make_unique<detail::PendingRequests>())
{
    if (!process_)
        throw LaunchError("Stdio transport needs a launched process");
}

StdioTransport::~StdioTransport()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Error closing stdio transport: {}", e.what());
    }
    stop_reader();
}

void StdioTransport::handshake_timed_out(const std::string& detail)
{
    throw StartupTimeoutError("Server '" + process_->command_line() +
                              "' did not answer initialize: " + detail);
}

void StdioTransport::open_channel()
{
    running_.store(true);
    reader_ = std::thread([this] { read_loop(); });
}

void StdioTransport::read_loop()
{
    std::string line;
    while (running_.load())
    {
        auto status = process_->read_line(line, kReadPoll);
        if (status == launcher::LineStatus::Timeout)
            continue;
        if (status == launcher::LineStatus::Eof)
        {
            if (!running_.load())
                break;
            spdlog::warn("Server '{}' closed its output stream", process_->command_line());
            faulted_.store(true);
            pending_->fail_all(std::make_exception_ptr(
                TransportFault("Server process closed its output stream")));
            process_->terminate();
            break;
        }

        auto message = util::json::try_parse(line);
        if (!message || !message->is_object())
        {
            spdlog::debug("Ignoring non-JSON line from server: {}", line);
            continue;
        }
        if (message->contains("result") || message->contains("error"))
        {
            if (!pending_->resolve(*message))
                spdlog::debug("Ignoring reply with unknown id");
            continue;
        }
        if (message->contains("method") && message->contains("id"))
            answer_server_request(*message);
    }
}

void StdioTransport::answer_server_request(const Json& message)
{
    const auto method = util::json::string_field(message, "method");
    Json reply = {{"jsonrpc", "2.0"}, {"id", message["id"]}};
    if (method == "ping")
        reply["result"] = Json::object();
    else
        reply["error"] = {{"code", -32601}, {"message", "Method not supported: " + method}};
    try
    {
        process_->write_line(util::json::dump(reply));
    }
    catch (const TransportFault& e)
    {
        spdlog::debug("Could not answer server request {}: {}", method, e.what());
    }
}

Json StdioTransport::exchange(const Json& request, std::chrono::milliseconds timeout)
{
    if (faulted_.load())
        throw TransportFault("Server process closed its output stream");

    const int64_t id = request["id"].get<int64_t>();
    auto future = pending_->add(id);
    try
    {
        process_->write_line(util::json::dump(request));
    }
    catch (const TransportFault&)
    {
        pending_->remove(id);
        throw;
    }
    return pending_->await(future, id, timeout, util::json::string_field(request, "method"));
}

void StdioTransport::send_notification(const Json& notification)
{
    process_->write_line(util::json::dump(notification));
}

void StdioTransport::stop_reader()
{
    running_.store(false);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
        reader_.join();
}

void StdioTransport::close_channel()
{
    stop_reader();
    pending_->fail_all(std::make_exception_ptr(TransportFault("Stdio transport closed")));
}

} // namespace mcpdoctor::client
