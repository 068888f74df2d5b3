#include "mcpdoctor/analysis/harness.hpp"

#include "mcpdoctor/analysis/metrics.hpp"
#include "mcpdoctor/cache/tool_call_cache.hpp"
#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <spdlog/spdlog.h>

namespace mcpdoctor::analysis
{

namespace
{

std::string with_commas(std::size_t n)
{
    auto digits = std::to_string(n);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        if (count > 0 && count % 3 == 0)
            out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

std::string short_threshold(std::size_t threshold)
{
    if (threshold >= 1000 && threshold % 1000 == 0)
        return std::to_string(threshold / 1000) + "k";
    return with_commas(threshold);
}

ScenarioOutcome outcome_of(client::InvocationStatus status)
{
    switch (status)
    {
    case client::InvocationStatus::Success:
        return ScenarioOutcome::Success;
    case client::InvocationStatus::ValidationFailure:
        return ScenarioOutcome::ValidationFailure;
    default:
        return ScenarioOutcome::ToolFailure;
    }
}

} // namespace

// =============================================================================
// Value types
// =============================================================================

HarnessOptions HarnessOptions::from_settings(const Settings& settings)
{
    HarnessOptions opts;
    opts.concurrency = settings.concurrency;
    opts.oversized_token_threshold = settings.oversized_token_threshold;
    opts.correction_enabled = settings.correction_enabled;
    opts.heuristics = Heuristics::from_json(settings.heuristics);
    return opts;
}

const char* to_string(ScenarioOutcome outcome)
{
    switch (outcome)
    {
    case ScenarioOutcome::Success:
        return "success";
    case ScenarioOutcome::ValidationFailure:
        return "validation_failure";
    case ScenarioOutcome::ToolFailure:
        return "tool_failure";
    case ScenarioOutcome::CorrectedSuccess:
        return "corrected_success";
    case ScenarioOutcome::TransportFailure:
        return "transport_failure";
    }
    return "unknown";
}

const char* to_string(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::OversizedResponse:
        return "oversized_response";
    case IssueKind::MissingPagination:
        return "no_pagination";
    case IssueKind::VerboseIdentifiers:
        return "verbose_identifiers";
    case IssueKind::MissingFiltering:
        return "missing_filtering";
    case IssueKind::RedundantData:
        return "redundant_data";
    case IssueKind::MissingTruncation:
        return "missing_truncation";
    case IssueKind::NoResponseFormatControl:
        return "no_response_format_control";
    }
    return "unknown";
}

const char* to_string(Severity severity)
{
    switch (severity)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

Json ScenarioMetric::to_json() const
{
    Json j = {{"scenario", scenario},
              {"arguments", arguments},
              {"outcome", to_string(outcome)},
              {"token_estimate", token_estimate},
              {"response_time_seconds", response_time_seconds},
              {"response_size_bytes", response_size_bytes},
              {"verbose_identifiers", verbose_identifiers},
              {"collection_shaped", collection_shaped},
              {"low_value_data", low_value_data},
              {"truncated", truncated}};
    if (corrected_arguments)
        j["corrected_arguments"] = *corrected_arguments;
    if (error)
        j["error"] = *error;
    return j;
}

Json Issue::to_json() const
{
    Json j = {{"tool_name", operation},
              {"issue_type", to_string(kind)},
              {"severity", to_string(severity)},
              {"message", message},
              {"suggestion", suggestion}};
    if (scenario)
        j["scenario"] = *scenario;
    if (measured_tokens)
        j["measured_tokens"] = *measured_tokens;
    return j;
}

Json IssueFlags::to_json() const
{
    return Json{{"oversized_response", oversized_response},
                {"missing_pagination", missing_pagination},
                {"verbose_identifiers", verbose_identifiers},
                {"missing_filtering", missing_filtering},
                {"redundant_data", redundant_data},
                {"missing_truncation", missing_truncation},
                {"no_response_format_control", no_response_format_control}};
}

// =============================================================================
// OperationMetrics
// =============================================================================

OperationMetrics OperationMetrics::build(const client::Operation& operation,
                                         std::vector<ScenarioMetric> scenarios,
                                         const HarnessOptions& options)
{
    OperationMetrics m;
    m.operation = operation.name;
    m.scenarios = std::move(scenarios);

    const auto& h = options.heuristics;
    std::size_t total = 0;
    std::size_t measured = 0;
    bool collection = false;

    for (const auto& s : m.scenarios)
    {
        if (!s.succeeded())
        {
            ++m.failure_count;
            continue;
        }
        m.flags.verbose_identifiers = m.flags.verbose_identifiers || s.verbose_identifiers;
        m.flags.redundant_data = m.flags.redundant_data || s.low_value_data;
        collection = collection || s.collection_shaped;
        if (s.token_estimate == 0)
            continue;

        total += s.token_estimate;
        m.min_tokens = measured == 0 ? s.token_estimate : std::min(m.min_tokens, s.token_estimate);
        m.max_tokens = std::max(m.max_tokens, s.token_estimate);
        ++measured;

        if (s.token_estimate > options.oversized_token_threshold)
        {
            m.flags.oversized_response = true;
            m.issues.push_back(Issue{
                m.operation, IssueKind::OversizedResponse, Severity::Warning,
                "Response contains " + with_commas(s.token_estimate) + " tokens (>" +
                    with_commas(options.oversized_token_threshold) + " recommended)",
                "Consider implementing pagination, filtering, or truncation to reduce response "
                "size",
                s.scenario, s.token_estimate});
            if (!s.truncated)
            {
                m.flags.missing_truncation = true;
                m.issues.push_back(Issue{
                    m.operation, IssueKind::MissingTruncation, Severity::Info,
                    "Oversized response carries no truncation or continuation marker",
                    "Consider truncating large responses and telling the caller how to fetch "
                    "the rest (e.g. has_more, next_page)",
                    s.scenario, s.token_estimate});
            }
        }
    }
    if (measured > 0)
        m.avg_tokens = static_cast<double>(total) / static_cast<double>(measured);

    bool declares_pagination = false;
    bool declares_filter = false;
    bool declares_format_control = false;
    for (const auto& item : operation.properties().items())
    {
        declares_pagination = declares_pagination || h.is_pagination_param(item.key());
        declares_filter = declares_filter || h.is_filter_param(item.key());
        declares_format_control = declares_format_control || h.is_format_control_param(item.key());
    }
    const bool fetches_detail =
        h.mentions_detail(operation.name) ||
        (operation.description && h.mentions_detail(*operation.description));

    if (collection && !declares_pagination)
    {
        m.flags.missing_pagination = true;
        m.issues.push_back(Issue{
            m.operation, IssueKind::MissingPagination, Severity::Info,
            "Tool returns collections but doesn't support pagination",
            "Consider adding pagination parameters (limit, offset, page) to control response size",
            std::nullopt, std::nullopt});
    }
    if (m.flags.verbose_identifiers)
    {
        m.issues.push_back(Issue{
            m.operation, IssueKind::VerboseIdentifiers, Severity::Info,
            "Responses contain verbose technical identifiers (UUIDs, hashes)",
            "Consider using semantic identifiers or provide response format options to exclude "
            "technical IDs",
            std::nullopt, std::nullopt});
    }
    if (collection && !declares_filter)
    {
        m.flags.missing_filtering = true;
        m.issues.push_back(Issue{m.operation, IssueKind::MissingFiltering, Severity::Info,
                                 "Tool would benefit from filtering capabilities to reduce "
                                 "response size",
                                 "Consider adding filtering parameters to allow users to specify "
                                 "exactly what data they need",
                                 std::nullopt, std::nullopt});
    }
    if (m.flags.redundant_data)
    {
        m.issues.push_back(Issue{m.operation, IssueKind::RedundantData, Severity::Info,
                                 "Responses contain potentially redundant or low-value data",
                                 "Review response format to prioritize high-signal information",
                                 std::nullopt, std::nullopt});
    }
    if (fetches_detail && !declares_format_control)
    {
        m.flags.no_response_format_control = true;
        m.issues.push_back(Issue{m.operation, IssueKind::NoResponseFormatControl, Severity::Info,
                                 "Tool could benefit from response format control options",
                                 "Consider adding response_format parameter (e.g., 'concise', "
                                 "'detailed') to control output verbosity",
                                 std::nullopt, std::nullopt});
    }
    return m;
}

const ScenarioMetric* OperationMetrics::find(const std::string& scenario) const
{
    for (const auto& s : scenarios)
        if (s.scenario == scenario)
            return &s;
    return nullptr;
}

Json OperationMetrics::to_json() const
{
    Json measurements = Json::array();
    for (const auto& s : scenarios)
        measurements.push_back(s.to_json());
    Json issue_list = Json::array();
    for (const auto& i : issues)
        issue_list.push_back(i.to_json());
    return Json{{"tool_name", operation},
                {"measurements", measurements},
                {"avg_tokens", avg_tokens},
                {"min_tokens", min_tokens},
                {"max_tokens", max_tokens},
                {"failure_count", failure_count},
                {"flags", flags.to_json()},
                {"issues", issue_list}};
}

// =============================================================================
// AnalysisReport
// =============================================================================

std::vector<Issue> AnalysisReport::issues() const
{
    std::vector<Issue> all;
    for (const auto& op : operations)
        all.insert(all.end(), op.issues.begin(), op.issues.end());
    return all;
}

const OperationMetrics* AnalysisReport::find(const std::string& operation) const
{
    for (const auto& op : operations)
        if (op.operation == operation)
            return &op;
    return nullptr;
}

Json AnalysisReport::statistics() const
{
    std::size_t analyzed = 0, with_issues = 0, exceeding = 0;
    std::size_t errors = 0, warnings = 0, info = 0;
    std::size_t token_sum = 0, token_samples = 0, max_tokens = 0;
    std::size_t scenarios_total = 0, scenarios_failed = 0, corrected = 0;

    for (const auto& op : operations)
    {
        const bool reached = std::any_of(op.scenarios.begin(), op.scenarios.end(),
                                         [](const ScenarioMetric& s)
                                         { return s.outcome != ScenarioOutcome::TransportFailure; });
        if (reached)
            ++analyzed;
        if (!op.issues.empty())
            ++with_issues;
        if (op.max_tokens > oversized_token_threshold)
            ++exceeding;

        for (const auto& issue : op.issues)
        {
            if (issue.severity == Severity::Error)
                ++errors;
            else if (issue.severity == Severity::Warning)
                ++warnings;
            else
                ++info;
        }
        for (const auto& s : op.scenarios)
        {
            ++scenarios_total;
            if (!s.succeeded())
                ++scenarios_failed;
            if (s.outcome == ScenarioOutcome::CorrectedSuccess)
                ++corrected;
            if (s.succeeded() && s.token_estimate > 0)
            {
                token_sum += s.token_estimate;
                ++token_samples;
                max_tokens = std::max(max_tokens, s.token_estimate);
            }
        }
    }

    return Json{{"total_tools", operations.size()},
                {"tools_analyzed", analyzed},
                {"tools_with_issues", with_issues},
                {"errors", errors},
                {"warnings", warnings},
                {"info", info},
                {"avg_tokens_per_response", token_samples ? token_sum / token_samples : 0},
                {"max_tokens_observed", max_tokens},
                {"tools_exceeding_limit", exceeding},
                {"scenarios_total", scenarios_total},
                {"scenarios_failed", scenarios_failed},
                {"corrected_successes", corrected}};
}

std::vector<std::string> AnalysisReport::recommendations() const
{
    std::map<IssueKind, std::size_t> tools_per_kind;
    for (const auto& op : operations)
    {
        std::map<IssueKind, bool> seen;
        for (const auto& issue : op.issues)
            if (!seen[issue.kind])
            {
                seen[issue.kind] = true;
                ++tools_per_kind[issue.kind];
            }
    }

    std::vector<std::string> out;
    if (auto n = tools_per_kind[IssueKind::OversizedResponse])
        out.push_back("Implement response size limits for " + std::to_string(n) +
                      " tools with oversized responses (>" +
                      short_threshold(oversized_token_threshold) + " tokens)");
    if (auto n = tools_per_kind[IssueKind::MissingPagination])
        out.push_back("Add pagination support to " + std::to_string(n) +
                      " tools that return collections");
    if (auto n = tools_per_kind[IssueKind::MissingFiltering])
        out.push_back("Add filtering capabilities to " + std::to_string(n) +
                      " tools to reduce response size");
    if (auto n = tools_per_kind[IssueKind::VerboseIdentifiers])
        out.push_back("Replace verbose technical identifiers with semantic ones in " +
                      std::to_string(n) + " tools");
    if (auto n = tools_per_kind[IssueKind::NoResponseFormatControl])
        out.push_back("Add response format control (concise/detailed) to " + std::to_string(n) +
                      " tools");
    if (auto n = tools_per_kind[IssueKind::RedundantData])
        out.push_back("Trim low-value fields (timestamps, metadata, debug data) from " +
                      std::to_string(n) + " tools");
    if (auto n = tools_per_kind[IssueKind::MissingTruncation])
        out.push_back("Truncate oversized output and signal continuation in " + std::to_string(n) +
                      " tools");

    auto max_observed = statistics()["max_tokens_observed"].get<std::size_t>();
    if (max_observed > oversized_token_threshold)
        out.push_back("Consider implementing global response size limits - observed max: " +
                      with_commas(max_observed) + " tokens");

    if (out.empty())
        out.push_back(
            "All tools show good token efficiency! Consider monitoring response sizes over time.");
    return out;
}

Json AnalysisReport::to_json() const
{
    Json ops = Json::array();
    for (const auto& op : operations)
        ops.push_back(op.to_json());
    Json issue_list = Json::array();
    for (const auto& issue : issues())
        issue_list.push_back(issue.to_json());

    Json j = {{"server", server_identity},
              {"aborted", aborted},
              {"oversized_token_threshold", oversized_token_threshold},
              {"statistics", statistics()},
              {"recommendations", recommendations()},
              {"issues", issue_list},
              {"tool_metrics", ops}};
    if (abort_reason)
        j["abort_reason"] = *abort_reason;
    return j;
}

// =============================================================================
// Harness
// =============================================================================

struct Harness::RunState
{
    std::atomic<bool> aborted{false};
    std::mutex mutex;
    std::string reason;
};

Harness::Harness(client::ProtocolClient& client, HarnessOptions options,
                 std::shared_ptr<ICorrector> corrector, cache::IResultSink* sink)
    : client_(client), options_(std::move(options)), corrector_(std::move(corrector)), sink_(sink)
{
}

std::optional<client::InvocationResult> Harness::attempt(const std::string& operation,
                                                         const Json& arguments, RunState& state,
                                                         std::string& error)
{
    try
    {
        return client_.invoke(operation, arguments);
    }
    catch (const RequestTimeoutError& e)
    {
        error = e.what();
    }
    catch (const TransportFault& e)
    {
        error = e.what();
        if (!state.aborted.exchange(true))
        {
            {
                std::lock_guard<std::mutex> lock(state.mutex);
                state.reason = e.what();
            }
            spdlog::error("Session lost while calling {}: {}", operation, e.what());
            client_.close();
        }
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }
    return std::nullopt;
}

void Harness::record_success(const Scenario& scenario, const ScenarioMetric& metric,
                             const client::InvocationResult& result)
{
    if (!sink_)
        return;
    cache::CallRecord record;
    record.operation = scenario.operation;
    record.server_identity = client_.server_identity();
    record.scenario = scenario.name;
    record.input_params = metric.corrected_arguments ? *metric.corrected_arguments : scenario.arguments;
    record.output_response = result.payload();
    record.token_count = metric.token_estimate;
    record.response_time_seconds = metric.response_time_seconds;
    record.response_size_bytes = metric.response_size_bytes;
    record.corrected = metric.outcome == ScenarioOutcome::CorrectedSuccess;
    sink_->record(record);
}

ScenarioMetric Harness::execute(const client::Operation& operation, const Scenario& scenario,
                                RunState& state)
{
    ScenarioMetric metric;
    metric.scenario = scenario.name;
    metric.arguments = scenario.arguments;

    auto transport_failure = [&](std::string message)
    {
        metric.outcome = ScenarioOutcome::TransportFailure;
        metric.error = std::move(message);
        spdlog::warn("Failed to execute {} with scenario {}: {}", operation.name, scenario.name,
                     *metric.error);
        return metric;
    };

    if (state.aborted.load())
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        return transport_failure("Session terminated before the scenario ran: " + state.reason);
    }

    std::string error;
    auto result = attempt(operation.name, scenario.arguments, state, error);
    if (!result)
        return transport_failure(error);

    bool corrected = false;
    if (result->status() == client::InvocationStatus::ValidationFailure &&
        options_.correction_enabled && corrector_ && corrector_->available())
    {
        std::optional<Json> fixed;
        try
        {
            spdlog::info("Requesting corrected arguments for {} ({})", operation.name,
                         scenario.name);
            fixed = corrector_->correct(operation, scenario.arguments, *result);
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Argument correction for {} failed: {}", operation.name, e.what());
        }

        if (fixed && fixed->is_object())
        {
            metric.corrected_arguments = *fixed;
            auto retry = attempt(operation.name, *fixed, state, error);
            if (!retry)
                return transport_failure(error);
            result = std::move(retry);
            corrected = true;
        }
    }

    metric.response_time_seconds = result->elapsed().count();
    if (result->ok())
    {
        metric.outcome = corrected ? ScenarioOutcome::CorrectedSuccess : ScenarioOutcome::Success;
        metric.token_estimate = result->token_estimate();
        metric.response_size_bytes = result->size_bytes();
        metric.verbose_identifiers =
            has_verbose_identifiers(result->payload(), options_.heuristics);
        metric.collection_shaped = is_collection_shaped(result->payload(), options_.heuristics);
        metric.low_value_data = has_low_value_data(result->payload(), options_.heuristics);
        metric.truncated = is_truncated(result->payload(), options_.heuristics);
        spdlog::debug("Tool {} scenario {}: {} tokens", operation.name, scenario.name,
                      metric.token_estimate);
        record_success(scenario, metric, *result);
    }
    else
    {
        metric.outcome = outcome_of(result->status());
        metric.error = result->error_message();
        spdlog::warn("Failed to execute {} with scenario {}: {}", operation.name, scenario.name,
                     result->error_message());
    }
    return metric;
}

AnalysisReport Harness::run()
{
    const auto operations = client_.discover();
    spdlog::info("Starting analysis of {} tools on {}", operations.size(),
                 client_.server_identity());

    ArgumentSynthesizer synthesizer(options_.heuristics);
    std::vector<std::vector<Scenario>> plan;
    plan.reserve(operations.size());
    for (const auto& op : operations)
        plan.push_back(synthesizer.scenarios(op));

    RunState state;
    std::mutex results_mutex;
    std::map<std::pair<std::size_t, std::size_t>, ScenarioMetric> results;
    std::vector<std::future<void>> pending;

    {
        detail::WorkerPool pool(options_.concurrency);
        for (std::size_t i = 0; i < operations.size(); ++i)
        {
            for (std::size_t j = 0; j < plan[i].size(); ++j)
            {
                pending.push_back(pool.submit(
                    [&, i, j]
                    {
                        ScenarioMetric metric;
                        try
                        {
                            metric = execute(operations[i], plan[i][j], state);
                        }
                        catch (const std::exception& e)
                        {
                            metric.scenario = plan[i][j].name;
                            metric.arguments = plan[i][j].arguments;
                            metric.outcome = ScenarioOutcome::TransportFailure;
                            metric.error = e.what();
                        }
                        std::lock_guard<std::mutex> lock(results_mutex);
                        results[{i, j}] = std::move(metric);
                    }));
            }
        }
        for (auto& f : pending)
            f.get();
    }

    AnalysisReport report;
    report.server_identity = client_.server_identity();
    report.oversized_token_threshold = options_.oversized_token_threshold;
    for (std::size_t i = 0; i < operations.size(); ++i)
    {
        std::vector<ScenarioMetric> scenarios;
        for (std::size_t j = 0; j < plan[i].size(); ++j)
            scenarios.push_back(std::move(results[{i, j}]));
        report.operations.push_back(
            OperationMetrics::build(operations[i], std::move(scenarios), options_));
    }

    if (state.aborted.load())
    {
        report.aborted = true;
        report.abort_reason = state.reason;
        throw AnalysisAbortedError("Analysis aborted: " + state.reason,
                                   std::make_shared<const AnalysisReport>(std::move(report)));
    }

    spdlog::info("Analysis finished: {} tools, {} issues", report.operations.size(),
                 report.issues().size());
    return report;
}

} // namespace mcpdoctor::analysis
