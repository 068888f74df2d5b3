#pragma once
#include <memory>
#include <stdexcept>
#include <string>

namespace mcpdoctor
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// The server process could not be started.
struct LaunchError : public Error
{
    using Error::Error;
};

/// The server process started but never became reachable.
struct StartupTimeoutError : public Error
{
    using Error::Error;
};

/// No transport could reach the target.
struct ConnectionError : public Error
{
    using Error::Error;
};

/// Target reachable but does not speak the catalog/invoke contract.
struct ProtocolError : public Error
{
    using Error::Error;
};

/// Tool-level argument rejection.
struct ValidationError : public Error
{
    using Error::Error;
};

/// Tool-level failure unrelated to argument validation.
struct ToolExecutionError : public Error
{
    using Error::Error;
};

/// Mid-session I/O failure; the session must be torn down.
struct TransportFault : public Error
{
    using Error::Error;
};

/// A single request exceeded its deadline. Scoped to that request.
struct RequestTimeoutError : public Error
{
    using Error::Error;
};

namespace analysis
{
struct AnalysisReport;
}

/// Raised by the harness when a TransportFault ended the run early.
/// The report holds every scenario recorded before the session went down.
struct AnalysisAbortedError : public TransportFault
{
    AnalysisAbortedError(const std::string& message,
                         std::shared_ptr<const analysis::AnalysisReport> partial)
        : TransportFault(message), partial_report(std::move(partial))
    {
    }

    std::shared_ptr<const analysis::AnalysisReport> partial_report;
};

} // namespace mcpdoctor
