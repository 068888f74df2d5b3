// Argument corrector against a local Messages API stand-in

#include "mcpdoctor/analysis/corrector.hpp"
#include "mcpdoctor/exceptions.hpp"

#include <atomic>
#include <cassert>
#include <httplib.h>
#include <iostream>
#include <string>
#include <thread>

using namespace mcpdoctor;
using namespace mcpdoctor::analysis;

namespace
{

enum class Mode
{
    BusyThenOk,
    BadRequest,
    ErrorPayload,
    AlwaysBusy,
    NoObject
};

std::atomic<int> g_mode{static_cast<int>(Mode::BusyThenOk)};
std::atomic<int> g_requests{0};

Json text_reply(const std::string& text)
{
    return Json{{"type", "message"},
                {"role", "assistant"},
                {"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
}

} // namespace

int main()
{
    httplib::Server svr;
    svr.Post("/v1/messages",
             [](const httplib::Request& req, httplib::Response& res)
             {
                 const int n = ++g_requests;
                 assert(req.get_header_value("x-api-key") == "test-key");
                 assert(req.get_header_value("anthropic-version") == "2023-06-01");
                 auto body = Json::parse(req.body);
                 assert(body["messages"][0]["role"] == "user");

                 switch (static_cast<Mode>(g_mode.load()))
                 {
                 case Mode::BusyThenOk:
                     if (n == 1)
                     {
                         res.status = 529;
                         res.set_header("Retry-After", "0");
                         res.set_content("{\"type\":\"error\"}", "application/json");
                         return;
                     }
                     res.set_content(
                         text_reply("Here you go:\n{\"query\": \"fixed\", \"limit\": 5}\nDone.")
                             .dump(),
                         "application/json");
                     return;
                 case Mode::BadRequest:
                     res.status = 400;
                     res.set_content("{\"error\":\"bad\"}", "application/json");
                     return;
                 case Mode::ErrorPayload:
                     res.set_content(Json{{"type", "error"},
                                          {"error", {{"type", "overloaded_error"},
                                                     {"message", "try later"}}}}
                                         .dump(),
                                     "application/json");
                     return;
                 case Mode::AlwaysBusy:
                     res.status = 503;
                     return;
                 case Mode::NoObject:
                     res.set_content(text_reply("I cannot fix this.").dump(), "application/json");
                     return;
                 }
             });

    int port = svr.bind_to_any_port("127.0.0.1");
    std::thread th([&] { svr.listen_after_bind(); });
    svr.wait_until_ready();

    AnthropicOptions options;
    options.api_key = "test-key";
    options.base_url = "http://127.0.0.1:" + std::to_string(port);
    options.max_attempts = 3;
    options.base_delay = std::chrono::milliseconds(10);
    options.timeout = std::chrono::milliseconds(5000);

    auto op = client::Operation::from_json(
        Json{{"name", "search"},
             {"description", "Search records"},
             {"inputSchema",
              {{"type", "object"},
               {"properties", {{"query", {{"type", "string"}}}}},
               {"required", Json::array({"query"})}}}});
    auto failure = client::InvocationResult::from_rpc_error(
        "search", Json{{"code", -32602}, {"message", "query is required"}}, Seconds(0));

    std::cout << "Test: retry then extract arguments...\n";
    {
        AnthropicCorrector corrector(options);
        assert(corrector.available());
        auto fixed = corrector.correct(op, Json::object(), failure);
        assert(fixed);
        assert((*fixed)["query"] == "fixed");
        assert((*fixed)["limit"] == 5);
        assert(g_requests.load() == 2);
        std::cout << "  [PASS] retry then extract arguments\n";
    }

    std::cout << "Test: non-retriable status...\n";
    {
        g_requests = 0;
        g_mode = static_cast<int>(Mode::BadRequest);
        AnthropicCorrector corrector(options);
        bool threw = false;
        try
        {
            corrector.correct(op, Json::object(), failure);
        }
        catch (const Error& e)
        {
            threw = true;
            assert(std::string(e.what()).find("400") != std::string::npos);
        }
        assert(threw);
        assert(g_requests.load() == 1);
        std::cout << "  [PASS] non-retriable status\n";
    }

    std::cout << "Test: error payload...\n";
    {
        g_mode = static_cast<int>(Mode::ErrorPayload);
        AnthropicCorrector corrector(options);
        bool threw = false;
        try
        {
            corrector.correct(op, Json::object(), failure);
        }
        catch (const Error& e)
        {
            threw = true;
            assert(std::string(e.what()).find("try later") != std::string::npos);
        }
        assert(threw);
        std::cout << "  [PASS] error payload\n";
    }

    std::cout << "Test: attempts exhausted...\n";
    {
        g_requests = 0;
        g_mode = static_cast<int>(Mode::AlwaysBusy);
        AnthropicCorrector corrector(options);
        bool threw = false;
        try
        {
            corrector.correct(op, Json::object(), failure);
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);
        assert(g_requests.load() == 3);
        std::cout << "  [PASS] attempts exhausted\n";
    }

    std::cout << "Test: reply without an object...\n";
    {
        g_mode = static_cast<int>(Mode::NoObject);
        AnthropicCorrector corrector(options);
        assert(!corrector.correct(op, Json::object(), failure));
        std::cout << "  [PASS] reply without an object\n";
    }

    std::cout << "Test: helpers...\n";
    {
        assert(AnthropicCorrector::is_retriable(429));
        assert(AnthropicCorrector::is_retriable(529));
        assert(AnthropicCorrector::is_retriable(502));
        assert(!AnthropicCorrector::is_retriable(400));
        assert(!AnthropicCorrector::is_retriable(401));

        auto prompt = AnthropicCorrector::build_prompt(op, Json{{"q", 1}}, failure);
        assert(prompt.find("\"search\"") != std::string::npos);
        assert(prompt.find("Search records") != std::string::npos);
        assert(prompt.find("query is required") != std::string::npos);

        bool threw = false;
        try
        {
            AnthropicCorrector::reply_text(Json{{"content", Json::array()}});
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);

        AnthropicCorrector keyless(AnthropicOptions{});
        assert(!keyless.available());
        assert(!keyless.correct(op, Json::object(), failure));

        NullCorrector null_corrector;
        assert(!null_corrector.available());
        assert(!null_corrector.correct(op, Json::object(), failure));
        std::cout << "  [PASS] helpers\n";
    }

    svr.stop();
    if (th.joinable())
        th.join();

    std::cout << "\n[OK] corrector tests passed\n";
    return 0;
}
