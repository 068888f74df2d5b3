// Stdio transport end to end against the fake tool server fixture

#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/launcher/launcher.hpp"
#include "mcpdoctor/util/json.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>

using namespace mcpdoctor;
using namespace mcpdoctor::client;

static std::shared_ptr<launcher::ServerProcess> launch_fake(std::vector<std::string> extra = {})
{
    launcher::LaunchSpec spec;
    spec.argv.push_back(MCPDOCTOR_FAKE_SERVER_PATH);
    for (auto& a : extra)
        spec.argv.push_back(std::move(a));
    spec.shutdown_grace = std::chrono::milliseconds(1000);
    spec.log_env_vars = false;
    return launcher::ProcessLauncher{}.launch(spec);
}

static std::string text_of(const InvocationResult& r)
{
    return r.payload()["content"][0]["text"].get<std::string>();
}

int main()
{
    std::cout << "Test: handshake and paginated discovery...\n";
    {
        ClientOptions options;
        options.log_env_vars = false;
        options.shutdown_grace = std::chrono::milliseconds(1000);
        ProtocolClient client(std::string(MCPDOCTOR_FAKE_SERVER_PATH) + " --page-size 1", options);
        client.connect();
        assert(client.state() == SessionState::Ready);
        assert(client.transport_kind() == TransportKind::Stdio);
        assert(client.server_info().name == "fake-tool-server");
        assert(client.server_info().protocol_version == kProtocolVersion);
        assert(client.server_identity().rfind("stdio://", 0) == 0);

        auto tools = client.discover();
        assert(tools.size() == 4);
        assert(tools[0].name == "search");
        assert(tools[3].name == "fail");
        assert(tools[0].required().size() == 1);

        auto process = client.process();
        assert(process && process->running());
        client.close();
        assert(process->terminated());
        std::cout << "  [PASS] handshake and paginated discovery\n";
    }

    std::cout << "Test: call outcomes...\n";
    {
        StdioTransport transport(launch_fake());
        transport.connect();

        auto ok = transport.invoke("search", Json{{"query", "cats"}, {"limit", 2}});
        assert(ok.ok());
        auto body = util::json::try_parse(text_of(ok));
        assert(body && (*body)["results"].size() == 2);

        auto invalid = transport.invoke("search", Json::object());
        assert(invalid.status() == InvocationStatus::ValidationFailure);

        auto failed = transport.invoke("fail", Json::object());
        assert(failed.status() == InvocationStatus::ToolFailure);
        assert(failed.error_message() == "backend down");

        transport.close();
        transport.close();
        assert(transport.state() == SessionState::Terminated);
        std::cout << "  [PASS] call outcomes\n";
    }

    std::cout << "Test: replies matched by id out of order...\n";
    {
        StdioTransport transport(launch_fake());
        transport.connect();

        auto slow = std::async(std::launch::async,
                               [&]
                               {
                                   return transport.invoke(
                                       "echo", Json{{"message", "slow"}, {"delay_ms", 600}});
                               });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto fast = transport.invoke("echo", Json{{"message", "fast"}});
        auto slow_result = slow.get();

        assert(text_of(fast) == "\"fast\"");
        assert(text_of(slow_result) == "\"slow\"");
        assert(fast.elapsed() < slow_result.elapsed());
        transport.close();
        std::cout << "  [PASS] replies matched by id out of order\n";
    }

    std::cout << "Test: server closing stdout faults the transport...\n";
    {
        auto process = launch_fake({"--close-stdout-on-call"});
        StdioTransport transport(process);
        transport.connect();

        bool threw = false;
        try
        {
            transport.invoke("echo", Json{{"message", "hi"}});
        }
        catch (const TransportFault&)
        {
            threw = true;
        }
        assert(threw);
        assert(transport.faulted());

        // The transport tears the child down by itself
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!process->terminated() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        assert(process->terminated());

        bool again = false;
        try
        {
            transport.invoke("echo", Json{{"message", "hi"}});
        }
        catch (const TransportFault&)
        {
            again = true;
        }
        assert(again);
        std::cout << "  [PASS] server closing stdout faults the transport\n";
    }

    std::cout << "Test: silent server times out the handshake...\n";
    {
        auto process = launch_fake({"--never-ready"});
        StdioTransport transport(process, TransportOptions{}, std::chrono::milliseconds(500));
        bool threw = false;
        try
        {
            transport.connect();
        }
        catch (const StartupTimeoutError&)
        {
            threw = true;
        }
        assert(threw);
        transport.close();
        process->terminate();
        assert(process->terminated());
        std::cout << "  [PASS] silent server times out the handshake\n";
    }

    std::cout << "\n[OK] stdio transport tests passed\n";
    return 0;
}
