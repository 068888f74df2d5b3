// ProtocolClient lifecycle over an instrumented in-memory transport

#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/exceptions.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace mcpdoctor;
using namespace mcpdoctor::client;

struct Counters
{
    int connects = 0;
    int discovers = 0;
    int invokes = 0;
    int closes = 0;
};

class RecordingTransport : public ITransport
{
  public:
    RecordingTransport(std::shared_ptr<Counters> counters, bool fail_connect = false)
        : counters_(std::move(counters)), fail_connect_(fail_connect)
    {
    }

    ServerInfo connect() override
    {
        ++counters_->connects;
        if (fail_connect_)
            throw ConnectionError("refused");
        ServerInfo info;
        info.name = "recording";
        info.version = "0.0.1";
        return info;
    }

    std::vector<Operation> discover() override
    {
        ++counters_->discovers;
        return {Operation::from_json(Json("alpha")), Operation::from_json(Json("beta"))};
    }

    InvocationResult invoke(const std::string& operation, const Json& arguments) override
    {
        ++counters_->invokes;
        return InvocationResult::success(operation, Json{{"echo", arguments}}, Seconds(0.01));
    }

    void close() override
    {
        ++counters_->closes;
    }

  private:
    std::shared_ptr<Counters> counters_;
    bool fail_connect_;
};

int main()
{
    std::cout << "Test: invoke before connect...\n";
    {
        auto counters = std::make_shared<Counters>();
        ProtocolClient client(std::make_unique<RecordingTransport>(counters));
        assert(client.state() == SessionState::NotStarted);

        bool threw = false;
        try
        {
            client.invoke("alpha", Json::object());
        }
        catch (const TransportFault&)
        {
            threw = true;
        }
        assert(threw);
        assert(counters->invokes == 0);
        std::cout << "  [PASS] invoke before connect\n";
    }

    std::cout << "Test: discovery is fetched once...\n";
    {
        auto counters = std::make_shared<Counters>();
        ProtocolClient client(std::make_unique<RecordingTransport>(counters), nullptr,
                              "memory://one");
        auto first = client.discover();
        auto second = client.discover();
        assert(first.size() == 2);
        assert(second.size() == 2);
        assert(second[1].name == "beta");
        assert(counters->connects == 1);
        assert(counters->discovers == 1);
        assert(client.state() == SessionState::Ready);
        assert(client.server_info().name == "recording");
        assert(client.server_identity() == "memory://one");

        auto result = client.invoke("alpha", Json{{"x", 1}});
        assert(result.ok());
        assert(result.payload()["echo"]["x"] == 1);
        std::cout << "  [PASS] discovery is fetched once\n";
    }

    std::cout << "Test: close is idempotent...\n";
    {
        auto counters = std::make_shared<Counters>();
        {
            ProtocolClient client(std::make_unique<RecordingTransport>(counters));
            client.connect();
            client.connect(); // already ready, no second handshake
            assert(counters->connects == 1);
            client.close();
            client.close();
            assert(client.state() == SessionState::Terminated);

            bool threw = false;
            try
            {
                client.invoke("alpha", Json::object());
            }
            catch (const TransportFault&)
            {
                threw = true;
            }
            assert(threw);
        }
        // destructor closes again; still one transport close
        assert(counters->closes == 1);
        std::cout << "  [PASS] close is idempotent\n";
    }

    std::cout << "Test: failed connect closes the session...\n";
    {
        auto counters = std::make_shared<Counters>();
        ProtocolClient client(std::make_unique<RecordingTransport>(counters, true));
        bool threw = false;
        try
        {
            client.connect();
        }
        catch (const ConnectionError&)
        {
            threw = true;
        }
        assert(threw);
        assert(counters->closes == 1);
        assert(client.state() == SessionState::Terminated);

        bool reconnect_refused = false;
        try
        {
            client.connect();
        }
        catch (const ConnectionError&)
        {
            reconnect_refused = true;
        }
        assert(reconnect_refused);
        assert(counters->connects == 1);
        std::cout << "  [PASS] failed connect closes the session\n";
    }

    std::cout << "Test: transport names...\n";
    {
        assert(parse_transport_kind("HTTP") == TransportKind::Http);
        assert(parse_transport_kind("streamable-http") == TransportKind::Http);
        assert(parse_transport_kind(" sse ") == TransportKind::Sse);
        assert(parse_transport_kind("stdio") == TransportKind::Stdio);
        bool threw = false;
        try
        {
            parse_transport_kind("carrier-pigeon");
        }
        catch (const std::invalid_argument&)
        {
            threw = true;
        }
        assert(threw);
        assert(std::string(to_string(TransportKind::Auto)) == "auto");
        assert(ProtocolClient::probe_url("http://localhost:1/sse/", TransportOptions{}) ==
               TransportKind::Sse);
        std::cout << "  [PASS] transport names\n";
    }

    std::cout << "\n[OK] protocol client tests passed\n";
    return 0;
}
