#pragma once
/// @file analysis/harness.hpp
/// @brief Runs every scenario of every operation and rolls the results up.

#include "mcpdoctor/analysis/corrector.hpp"
#include "mcpdoctor/analysis/heuristics.hpp"
#include "mcpdoctor/analysis/synthesizer.hpp"
#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/settings.hpp"
#include "mcpdoctor/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpdoctor::client
{
class ProtocolClient;
}

namespace mcpdoctor::cache
{
class IResultSink;
}

namespace mcpdoctor::analysis
{

struct HarnessOptions
{
    std::size_t concurrency{3};
    std::size_t oversized_token_threshold{25000};
    bool correction_enabled{true};
    Heuristics heuristics;

    static HarnessOptions from_settings(const Settings& settings);
};

enum class ScenarioOutcome
{
    Success,
    ValidationFailure,
    ToolFailure,
    CorrectedSuccess,
    TransportFailure
};

const char* to_string(ScenarioOutcome outcome);

/// Measurements for one executed scenario.
struct ScenarioMetric
{
    std::string scenario;
    Json arguments = Json::object();
    ScenarioOutcome outcome{ScenarioOutcome::Success};
    std::size_t token_estimate{0};
    double response_time_seconds{0.0};
    std::size_t response_size_bytes{0};
    bool verbose_identifiers{false};
    bool collection_shaped{false};
    bool low_value_data{false};
    bool truncated{false};
    std::optional<Json> corrected_arguments;
    std::optional<std::string> error;

    bool succeeded() const
    {
        return outcome == ScenarioOutcome::Success || outcome == ScenarioOutcome::CorrectedSuccess;
    }
    Json to_json() const;
};

enum class IssueKind
{
    OversizedResponse,
    MissingPagination,
    VerboseIdentifiers,
    MissingFiltering,
    RedundantData,
    MissingTruncation,
    NoResponseFormatControl
};

enum class Severity
{
    Error,
    Warning,
    Info
};

const char* to_string(IssueKind kind);
const char* to_string(Severity severity);

struct Issue
{
    std::string operation;
    IssueKind kind{IssueKind::OversizedResponse};
    Severity severity{Severity::Info};
    std::string message;
    std::string suggestion;
    std::optional<std::string> scenario;
    std::optional<std::size_t> measured_tokens;

    Json to_json() const;
};

struct IssueFlags
{
    bool oversized_response{false};
    bool missing_pagination{false};
    bool verbose_identifiers{false};
    bool missing_filtering{false};
    bool redundant_data{false};
    bool missing_truncation{false};
    bool no_response_format_control{false};

    bool any() const
    {
        return oversized_response || missing_pagination || verbose_identifiers ||
               missing_filtering || redundant_data || missing_truncation ||
               no_response_format_control;
    }
    Json to_json() const;
};

/// Per-operation rollup, rebuilt from the scenario list.
struct OperationMetrics
{
    std::string operation;
    std::vector<ScenarioMetric> scenarios;
    double avg_tokens{0.0};
    std::size_t min_tokens{0};
    std::size_t max_tokens{0};
    std::size_t failure_count{0};
    IssueFlags flags;
    std::vector<Issue> issues;

    /// Aggregate the scenarios and classify issues against the operation's schema
    static OperationMetrics build(const client::Operation& operation,
                                  std::vector<ScenarioMetric> scenarios,
                                  const HarnessOptions& options);

    const ScenarioMetric* find(const std::string& scenario) const;
    Json to_json() const;
};

struct AnalysisReport
{
    std::string server_identity;
    std::size_t oversized_token_threshold{25000};
    std::vector<OperationMetrics> operations;
    bool aborted{false};
    std::optional<std::string> abort_reason;

    std::vector<Issue> issues() const;
    const OperationMetrics* find(const std::string& operation) const;

    /// total_tools, tools_analyzed, tools_with_issues, errors, warnings, info,
    /// avg_tokens_per_response, max_tokens_observed, tools_exceeding_limit
    Json statistics() const;
    std::vector<std::string> recommendations() const;
    Json to_json() const;
};

/// Drives discover -> synthesize -> bounded concurrent invoke -> rollup.
class Harness
{
  public:
    /// @param corrector May be null (no correction)
    /// @param sink Receives successful calls; may be null
    Harness(client::ProtocolClient& client, HarnessOptions options,
            std::shared_ptr<ICorrector> corrector = nullptr, cache::IResultSink* sink = nullptr);

    /// @throws LaunchError, StartupTimeoutError, ConnectionError, ProtocolError from discovery
    /// @throws AnalysisAbortedError when the session was lost mid-run
    AnalysisReport run();

  private:
    struct RunState;

    ScenarioMetric execute(const client::Operation& operation, const Scenario& scenario,
                           RunState& state);
    /// Invoke once; channel loss is recorded in state and reported as a failure metric
    std::optional<client::InvocationResult> attempt(const std::string& operation,
                                                    const Json& arguments, RunState& state,
                                                    std::string& error);
    void record_success(const Scenario& scenario, const ScenarioMetric& metric,
                        const client::InvocationResult& result);

    client::ProtocolClient& client_;
    HarnessOptions options_;
    std::shared_ptr<ICorrector> corrector_;
    cache::IResultSink* sink_;
};

} // namespace mcpdoctor::analysis
