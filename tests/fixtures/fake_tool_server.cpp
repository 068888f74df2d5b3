// Line-delimited JSON-RPC tool server used by the launcher/stdio tests.
//
// Flags:
//   --slow <ms>               delay every tools/call reply
//   --page-size <n>           paginate tools/list
//   --close-stdout-on-call    close stdout on the first tools/call and hang
//   --never-ready             read requests but never answer
//   --exit <code>             print to stderr and exit immediately
//   --announce <text>         print a line to stdout before serving

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace
{

using Json = nlohmann::json;

struct Flags
{
    int slow_ms = 0;
    std::size_t page_size = 0;
    bool close_stdout_on_call = false;
    bool never_ready = false;
};

std::mutex out_mutex;

void send(const Json& msg)
{
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cout << msg.dump() << std::endl;
}

Json tool_list()
{
    return Json::array({
        Json{{"name", "search"},
             {"description", "Search the record store"},
             {"inputSchema",
              {{"type", "object"},
               {"properties",
                {{"query", {{"type", "string"}}}, {"limit", {{"type", "integer"}}}}},
               {"required", Json::array({"query"})}}}},
        Json{{"name", "echo"},
             {"description", "Echo a message back"},
             {"inputSchema",
              {{"type", "object"},
               {"properties",
                {{"message", {{"type", "string"}}}, {"delay_ms", {{"type", "integer"}}}}},
               {"required", Json::array({"message"})}}}},
        Json{{"name", "get_env"},
             {"description", "Read an environment variable of the server process"},
             {"inputSchema",
              {{"type", "object"},
               {"properties", {{"name", {{"type", "string"}}}}},
               {"required", Json::array({"name"})}}}},
        Json{{"name", "fail"},
             {"description", "Always fails"},
             {"inputSchema", {{"type", "object"}, {"properties", Json::object()}}}},
    });
}

Json text_result(const std::string& text, bool is_error = false)
{
    Json r = {{"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
    if (is_error)
        r["isError"] = true;
    return r;
}

Json error_reply(const Json& id, int code, const std::string& message, Json data = nullptr)
{
    Json err = {{"code", code}, {"message", message}};
    if (!data.is_null())
        err["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", err}};
}

Json call_tool(const Json& id, const Json& params)
{
    const std::string name = params.value("name", std::string());
    const Json args = params.contains("arguments") ? params["arguments"] : Json::object();

    if (name == "search")
    {
        if (!args.contains("query") || !args["query"].is_string())
            return error_reply(id, -32602, "Invalid params: 'query' is required",
                               Json{{"field", "query"}});
        int limit = 5;
        if (args.contains("limit") && args["limit"].is_number_integer())
            limit = args["limit"].get<int>();
        Json records = Json::array();
        for (int i = 0; i < limit; ++i)
            records.push_back(Json{{"id", "record-" + std::to_string(i)},
                                   {"title", args["query"].get<std::string>() + " #" +
                                                 std::to_string(i)}});
        return Json{{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", text_result(Json{{"results", records}}.dump())}};
    }
    if (name == "echo")
    {
        if (!args.contains("message"))
            return error_reply(id, -32602, "Invalid params: 'message' is required");
        if (args.contains("delay_ms") && args["delay_ms"].is_number_integer())
            std::this_thread::sleep_for(std::chrono::milliseconds(args["delay_ms"].get<int>()));
        return Json{{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", text_result(args["message"].dump())}};
    }
    if (name == "get_env")
    {
        const char* value = std::getenv(args.value("name", std::string()).c_str());
        return Json{{"jsonrpc", "2.0"},
                    {"id", id},
                    {"result", text_result(value ? value : "")}};
    }
    if (name == "fail")
        return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", text_result("backend down", true)}};

    return error_reply(id, -32602, "Unknown tool: " + name);
}

} // namespace

int main(int argc, char** argv)
{
    Flags flags;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--slow" && i + 1 < argc)
            flags.slow_ms = std::atoi(argv[++i]);
        else if (arg == "--page-size" && i + 1 < argc)
            flags.page_size = static_cast<std::size_t>(std::atoi(argv[++i]));
        else if (arg == "--close-stdout-on-call")
            flags.close_stdout_on_call = true;
        else if (arg == "--never-ready")
            flags.never_ready = true;
        else if (arg == "--exit" && i + 1 < argc)
        {
            std::cerr << "fatal: configuration missing" << std::endl;
            return std::atoi(argv[++i]);
        }
        else if (arg == "--announce" && i + 1 < argc)
            std::cout << argv[++i] << std::endl;
    }

    std::vector<std::thread> workers;
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        Json msg = Json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object())
            continue;
        if (flags.never_ready)
            continue;
        if (!msg.contains("id"))
            continue; // notification

        const Json id = msg["id"];
        const std::string method = msg.value("method", std::string());
        const Json params = msg.contains("params") ? msg["params"] : Json::object();

        if (method == "initialize")
        {
            send(Json{{"jsonrpc", "2.0"},
                      {"id", id},
                      {"result",
                       {{"protocolVersion", params.value("protocolVersion", "2024-11-05")},
                        {"capabilities", {{"tools", Json::object()}}},
                        {"serverInfo", {{"name", "fake-tool-server"}, {"version", "1.0.0"}}}}}});
        }
        else if (method == "tools/list")
        {
            Json all = tool_list();
            std::size_t start = 0;
            if (params.contains("cursor") && params["cursor"].is_string())
                start = static_cast<std::size_t>(std::stoul(params["cursor"].get<std::string>()));
            std::size_t count = flags.page_size ? flags.page_size : all.size();
            Json page = Json::array();
            for (std::size_t i = start; i < all.size() && i < start + count; ++i)
                page.push_back(all[i]);
            Json result = {{"tools", page}};
            if (start + count < all.size())
                result["nextCursor"] = std::to_string(start + count);
            send(Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
        }
        else if (method == "tools/call")
        {
            if (flags.close_stdout_on_call)
            {
                {
                    std::lock_guard<std::mutex> lock(out_mutex);
                    std::cout.flush();
                    ::close(STDOUT_FILENO);
                }
                for (;;)
                    std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            // Each call answers on its own thread so replies can overtake each other
            workers.emplace_back(
                [id, params, slow = flags.slow_ms]
                {
                    if (slow > 0)
                        std::this_thread::sleep_for(std::chrono::milliseconds(slow));
                    send(call_tool(id, params));
                });
        }
        else if (method == "ping")
        {
            send(Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", Json::object()}});
        }
        else
        {
            send(error_reply(id, -32601, "Method not found: " + method));
        }
    }

    for (auto& w : workers)
        w.join();
    return 0;
}
