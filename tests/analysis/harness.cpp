// Harness scheduling, correction, isolation and abort handling over a
// scripted in-memory transport

#include "mcpdoctor/analysis/harness.hpp"
#include "mcpdoctor/cache/tool_call_cache.hpp"
#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcpdoctor;
using namespace mcpdoctor::analysis;
using client::InvocationResult;
using client::InvocationStatus;
using client::Operation;

namespace
{

Json text_result(const std::string& text)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
}

Operation make_op(const std::string& name, Json properties = Json::object(),
                  Json required = Json::array())
{
    return Operation::from_json(Json{
        {"name", name},
        {"inputSchema",
         {{"type", "object"}, {"properties", std::move(properties)}, {"required", required}}}});
}

/// Behaviour keyed by operation name:
///   slow_*    succeed after 20 ms
///   strict    validation failure unless arguments carry "fixed": true
///   stubborn  always a validation failure
///   broken    tool failure
///   dies      transport fault
///   huge      oversized text
///   listing   collection without pagination or filters
///   audit     record dominated by timestamps and debug fields
///   clipped   oversized text that announces more data
///   anything else succeeds with a short text
class ScriptedTransport : public client::ITransport
{
  public:
    explicit ScriptedTransport(std::vector<Operation> catalog) : catalog_(std::move(catalog)) {}

    client::ServerInfo connect() override
    {
        client::ServerInfo info;
        info.name = "scripted";
        return info;
    }

    std::vector<Operation> discover() override
    {
        return catalog_;
    }

    InvocationResult invoke(const std::string& operation, const Json& arguments) override
    {
        const int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now))
        {
        }
        ++invocations;
        {
            std::lock_guard<std::mutex> lock(mutex);
            calls_per_operation[operation]++;
        }
        struct Leave
        {
            std::atomic<int>& counter;
            ~Leave()
            {
                --counter;
            }
        } leave{in_flight};

        const Seconds elapsed(0.01);
        if (operation.rfind("slow_", 0) == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return InvocationResult::success(operation, text_result("done"), elapsed);
        }
        if (operation == "strict")
        {
            if (arguments.value("fixed", false))
                return InvocationResult::success(operation, text_result("accepted"), elapsed);
            return InvocationResult::from_rpc_error(
                operation, Json{{"code", -32602}, {"message", "Invalid params: query"}}, elapsed);
        }
        if (operation == "stubborn")
            return InvocationResult::from_rpc_error(
                operation, Json{{"code", -32602}, {"message", "Invalid params"}}, elapsed);
        if (operation == "broken")
            return InvocationResult::from_call_result(
                operation, Json{{"isError", true}, {"content", text_result("boom")["content"]}},
                elapsed);
        if (operation == "dies")
            throw TransportFault("connection reset by peer");
        if (operation == "huge")
            return InvocationResult::success(operation, text_result(std::string(120000, 'x')),
                                             elapsed);
        if (operation == "listing")
        {
            Json items = Json::array();
            for (int i = 0; i < 3; ++i)
                items.push_back(Json{{"name", "entry " + std::to_string(i)}});
            return InvocationResult::success(operation,
                                             text_result(Json{{"items", items}}.dump()), elapsed);
        }
        if (operation == "audit")
            return InvocationResult::success(
                operation,
                text_result(Json{{"id", 7},
                                 {"created_at", "2024-01-01T00:00:00Z"},
                                 {"updated_at", "2024-01-02T00:00:00Z"},
                                 {"debug", {{"trace", "abc"}}}}
                                .dump()),
                elapsed);
        if (operation == "clipped")
            return InvocationResult::success(
                operation,
                text_result(Json{{"body", std::string(120000, 'y')}, {"has_more", true}}.dump()),
                elapsed);
        return InvocationResult::success(operation, text_result("ok"), elapsed);
    }

    void close() override
    {
        ++closes;
    }

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> invocations{0};
    std::atomic<int> closes{0};
    std::mutex mutex;
    std::map<std::string, int> calls_per_operation;

  private:
    std::vector<Operation> catalog_;
};

class ScriptedCorrector : public ICorrector
{
  public:
    bool available() const override
    {
        return true;
    }

    std::optional<Json> correct(const Operation& operation, const Json& failed_args,
                                const InvocationResult& failure) override
    {
        assert(failure.status() == InvocationStatus::ValidationFailure);
        ++calls;
        Json fixed = failed_args;
        if (operation.name == "strict")
            fixed["fixed"] = true;
        else
            fixed["still"] = "wrong";
        return fixed;
    }

    std::atomic<int> calls{0};
};

class RecordingSink : public cache::IResultSink
{
  public:
    void record(const cache::CallRecord& call) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back(call);
    }

    std::mutex mutex;
    std::vector<cache::CallRecord> records;
};

} // namespace

int main()
{
    std::cout << "Test: concurrency stays within the limit...\n";
    {
        std::vector<Operation> catalog;
        for (int i = 0; i < 10; ++i)
            catalog.push_back(make_op("slow_" + std::to_string(i)));
        auto transport = std::make_unique<ScriptedTransport>(catalog);
        auto* raw = transport.get();
        client::ProtocolClient client(std::move(transport), nullptr, "memory://slow");

        HarnessOptions options;
        options.concurrency = 3;
        Harness harness(client, options);
        auto report = harness.run();

        assert(raw->invocations.load() == 30);
        assert(raw->max_in_flight.load() <= 3);
        assert(raw->max_in_flight.load() >= 1);
        assert(report.operations.size() == 10);
        assert(report.operations[0].operation == "slow_0");
        assert(report.operations[9].operation == "slow_9");
        for (const auto& op : report.operations)
        {
            assert(op.scenarios.size() == 3);
            assert(op.scenarios[0].scenario == "minimal");
            assert(op.scenarios[1].scenario == "typical");
            assert(op.scenarios[2].scenario == "large");
            assert(op.failure_count == 0);
        }
        auto stats = report.statistics();
        assert(stats["total_tools"] == 10);
        assert(stats["tools_analyzed"] == 10);
        assert(stats["scenarios_total"] == 30);
        assert(stats["scenarios_failed"] == 0);
        assert(!report.aborted);
        std::cout << "  [PASS] concurrency stays within the limit\n";
    }

    std::cout << "Test: validation failures get one corrected retry...\n";
    {
        auto query = Json{{"query", {{"type", "string"}}}};
        std::vector<Operation> catalog = {make_op("strict", query, Json::array({"query"})),
                                          make_op("stubborn", query, Json::array({"query"}))};
        auto transport = std::make_unique<ScriptedTransport>(catalog);
        auto* raw = transport.get();
        client::ProtocolClient client(std::move(transport), nullptr, "memory://strict");

        auto corrector = std::make_shared<ScriptedCorrector>();
        RecordingSink sink;
        Harness harness(client, HarnessOptions{}, corrector, &sink);
        auto report = harness.run();

        assert(corrector->calls.load() == 6);
        assert(raw->calls_per_operation["strict"] == 6);
        assert(raw->calls_per_operation["stubborn"] == 6);

        const auto* strict = report.find("strict");
        assert(strict);
        for (const auto& s : strict->scenarios)
        {
            assert(s.outcome == ScenarioOutcome::CorrectedSuccess);
            assert(s.corrected_arguments && (*s.corrected_arguments)["fixed"] == true);
            assert(s.succeeded());
        }

        const auto* stubborn = report.find("stubborn");
        assert(stubborn);
        assert(stubborn->failure_count == 3);
        for (const auto& s : stubborn->scenarios)
        {
            assert(s.outcome == ScenarioOutcome::ValidationFailure);
            assert(s.error && !s.error->empty());
            assert(s.corrected_arguments);
        }

        assert(sink.records.size() == 3);
        for (const auto& r : sink.records)
        {
            assert(r.operation == "strict");
            assert(r.corrected);
            assert(r.input_params["fixed"] == true);
            assert(r.server_identity == "memory://strict");
        }
        assert(report.statistics()["corrected_successes"] == 3);
        std::cout << "  [PASS] validation failures get one corrected retry\n";
    }

    std::cout << "Test: correction disabled...\n";
    {
        std::vector<Operation> catalog = {make_op("strict")};
        auto transport = std::make_unique<ScriptedTransport>(catalog);
        auto* raw = transport.get();
        client::ProtocolClient client(std::move(transport));

        auto corrector = std::make_shared<ScriptedCorrector>();
        HarnessOptions options;
        options.correction_enabled = false;
        auto report = Harness(client, options, corrector).run();
        assert(corrector->calls.load() == 0);
        assert(raw->invocations.load() == 3);
        assert(report.operations[0].failure_count == 3);
        std::cout << "  [PASS] correction disabled\n";
    }

    std::cout << "Test: failures stay with their scenario...\n";
    {
        std::vector<Operation> catalog = {make_op("broken"), make_op("fine"), make_op("huge"),
                                          make_op("listing")};
        client::ProtocolClient client(std::make_unique<ScriptedTransport>(catalog));
        RecordingSink sink;
        Harness harness(client, HarnessOptions{}, nullptr, &sink);
        auto report = harness.run();

        const auto* broken = report.find("broken");
        assert(broken->failure_count == 3);
        assert(broken->scenarios[0].outcome == ScenarioOutcome::ToolFailure);
        assert(*broken->scenarios[0].error == "boom");
        assert(broken->issues.empty());

        const auto* fine = report.find("fine");
        assert(fine->failure_count == 0);
        assert(fine->issues.empty());
        assert(fine->avg_tokens > 0);

        const auto* huge = report.find("huge");
        assert(huge->flags.oversized_response);
        assert(huge->flags.missing_truncation);
        assert(huge->issues.size() == 6);
        assert(huge->issues[0].kind == IssueKind::OversizedResponse);
        assert(huge->issues[0].severity == Severity::Warning);
        assert(huge->issues[0].scenario == std::optional<std::string>("minimal"));
        assert(huge->issues[1].kind == IssueKind::MissingTruncation);
        assert(huge->issues[1].severity == Severity::Info);
        assert(!huge->scenarios[0].truncated);
        assert(huge->max_tokens > 25000);

        const auto* listing = report.find("listing");
        assert(listing->flags.missing_pagination);
        assert(listing->flags.missing_filtering);
        assert(!listing->flags.verbose_identifiers);

        // 9 successful calls reached the sink, none of the failures
        assert(sink.records.size() == 9);
        for (const auto& r : sink.records)
            assert(r.operation != "broken");

        auto stats = report.statistics();
        assert(stats["tools_with_issues"] == 2);
        assert(stats["warnings"] == 3);
        assert(stats["tools_exceeding_limit"] == 1);

        auto recs = report.recommendations();
        assert(recs.size() == 5);
        assert(recs[0] == "Implement response size limits for 1 tools with oversized responses "
                          "(>25k tokens)");
        assert(recs[1] == "Add pagination support to 1 tools that return collections");
        assert(recs[2] == "Add filtering capabilities to 1 tools to reduce response size");
        assert(recs[3] == "Truncate oversized output and signal continuation in 1 tools");
        assert(recs[4].rfind("Consider implementing global response size limits", 0) == 0);

        auto j = report.to_json();
        assert(j["server"] == "injected://transport");
        assert(j["aborted"] == false);
        assert(j["tool_metrics"].size() == 4);
        assert(j["issues"].size() == 8);
        assert(j["issues"][0]["issue_type"] == "oversized_response");
        std::cout << "  [PASS] failures stay with their scenario\n";
    }

    std::cout << "Test: redundant data, truncation and format control...\n";
    {
        auto detail = Operation::from_json(
            Json{{"name", "get_profile"},
                 {"description", "Fetch a user profile"},
                 {"inputSchema", {{"type", "object"}, {"properties", {{"user", {{"type", "string"}}}}}}}});
        auto with_format = Operation::from_json(
            Json{{"name", "get_summary"},
                 {"inputSchema",
                  {{"type", "object"},
                   {"properties", {{"response_format", {{"type", "string"}}}}}}}});
        std::vector<Operation> catalog = {detail, with_format, make_op("audit"),
                                          make_op("clipped")};
        client::ProtocolClient client(std::make_unique<ScriptedTransport>(catalog));
        auto report = Harness(client, HarnessOptions{}).run();

        const auto* profile = report.find("get_profile");
        assert(profile->flags.no_response_format_control);
        assert(profile->issues.size() == 1);
        assert(profile->issues[0].kind == IssueKind::NoResponseFormatControl);
        assert(profile->issues[0].message ==
               "Tool could benefit from response format control options");

        const auto* summary = report.find("get_summary");
        assert(!summary->flags.no_response_format_control);
        assert(summary->issues.empty());

        const auto* audit = report.find("audit");
        assert(audit->flags.redundant_data);
        assert(audit->scenarios[0].low_value_data);
        assert(audit->issues.size() == 1);
        assert(audit->issues[0].kind == IssueKind::RedundantData);
        assert(audit->issues[0].message ==
               "Responses contain potentially redundant or low-value data");

        const auto* clipped = report.find("clipped");
        assert(clipped->flags.oversized_response);
        assert(!clipped->flags.missing_truncation);
        for (const auto& s : clipped->scenarios)
            assert(s.truncated);

        auto recs = report.recommendations();
        assert(std::find(recs.begin(), recs.end(),
                         "Add response format control (concise/detailed) to 1 tools") != recs.end());
        assert(std::find(recs.begin(), recs.end(),
                         "Trim low-value fields (timestamps, metadata, debug data) from 1 tools") !=
               recs.end());
        auto j = report.to_json();
        assert(j["tool_metrics"][2]["measurements"][0]["low_value_data"] == true);
        assert(j["tool_metrics"][3]["flags"]["missing_truncation"] == false);
        std::cout << "  [PASS] redundant data, truncation and format control\n";
    }

    std::cout << "Test: clean report recommendation...\n";
    {
        client::ProtocolClient client(std::make_unique<ScriptedTransport>(
            std::vector<Operation>{make_op("fine")}));
        auto report = Harness(client, HarnessOptions{}).run();
        auto recs = report.recommendations();
        assert(recs.size() == 1);
        assert(recs[0] ==
               "All tools show good token efficiency! Consider monitoring response sizes over time.");
        std::cout << "  [PASS] clean report recommendation\n";
    }

    std::cout << "Test: transport fault aborts with a partial report...\n";
    {
        std::vector<Operation> catalog = {make_op("first"), make_op("dies"), make_op("last")};
        auto transport = std::make_unique<ScriptedTransport>(catalog);
        auto* raw = transport.get();
        client::ProtocolClient client(std::move(transport), nullptr, "memory://dies");

        HarnessOptions options;
        options.concurrency = 1;
        bool aborted = false;
        try
        {
            Harness(client, options).run();
        }
        catch (const AnalysisAbortedError& e)
        {
            aborted = true;
            assert(std::string(e.what()).find("connection reset by peer") != std::string::npos);
            assert(e.partial_report);
            const auto& report = *e.partial_report;
            assert(report.aborted);
            assert(report.abort_reason == std::optional<std::string>("connection reset by peer"));
            assert(report.operations.size() == 3);

            const auto* first = report.find("first");
            for (const auto& s : first->scenarios)
                assert(s.outcome == ScenarioOutcome::Success);

            const auto* dies = report.find("dies");
            for (const auto& s : dies->scenarios)
                assert(s.outcome == ScenarioOutcome::TransportFailure);

            const auto* last = report.find("last");
            for (const auto& s : last->scenarios)
            {
                assert(s.outcome == ScenarioOutcome::TransportFailure);
                assert(s.error->find("Session terminated") != std::string::npos);
            }
            assert(report.to_json()["abort_reason"] == "connection reset by peer");
        }
        assert(aborted);
        assert(raw->invocations.load() == 4);
        assert(raw->closes.load() == 1);
        assert(client.state() == client::SessionState::Terminated);
        std::cout << "  [PASS] transport fault aborts with a partial report\n";
    }

    std::cout << "\n[OK] harness tests passed\n";
    return 0;
}
