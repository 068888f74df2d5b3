#pragma once
/// @file client/types.hpp
/// @brief Catalog entries, invocation outcomes and session state shared by the
///        transports, the protocol client and the harness.

#include "mcpdoctor/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcpdoctor::client
{

// ============================================================================
// Catalog
// ============================================================================

/// One callable operation as advertised by tools/list.
struct Operation
{
    std::string name;
    std::optional<std::string> description;
    Json input_schema; ///< Always an object schema; never null

    /// Parse a tools/list entry (object with inputSchema/parameters, or bare name)
    static Operation from_json(const Json& entry);
    Json to_json() const;

    /// The schema's "properties" object (empty object when absent)
    const Json& properties() const;
    /// Names listed in the schema's "required" array, in order
    std::vector<std::string> required() const;
    /// True when the schema declares a property with this name
    bool declares(const std::string& param) const;
};

/// Parse the "tools" array of one tools/list page.
/// @throws ProtocolError when the value is not an array
std::vector<Operation> parse_catalog_page(const Json& tools);

// ============================================================================
// Invocation outcome
// ============================================================================

enum class InvocationStatus
{
    Success,
    ValidationFailure,
    ToolFailure
};

const char* to_string(InvocationStatus status);

/// max(1, chars / 4) over the compact serialization; 0 for null.
std::size_t estimate_tokens(const Json& payload);

/// Heuristic: does this JSON-RPC error / tool error text describe rejected arguments?
bool is_validation_error(int code, const Json& data, const std::string& message);

/// Outcome of one tools/call. Immutable once built.
class InvocationResult
{
  public:
    static InvocationResult success(std::string operation, Json result, Seconds elapsed);
    static InvocationResult failure(std::string operation, InvocationStatus status, Json payload,
                                    std::string message, Seconds elapsed);

    /// Classify a JSON-RPC error object from a tools/call reply
    static InvocationResult from_rpc_error(std::string operation, const Json& error,
                                           Seconds elapsed);
    /// Classify a tools/call result object (isError: true means failure)
    static InvocationResult from_call_result(std::string operation, const Json& result,
                                             Seconds elapsed);

    const std::string& operation() const
    {
        return operation_;
    }
    InvocationStatus status() const
    {
        return status_;
    }
    bool ok() const
    {
        return status_ == InvocationStatus::Success;
    }
    /// Result object on success; error object or failed result otherwise
    const Json& payload() const
    {
        return payload_;
    }
    const std::string& error_message() const
    {
        return error_message_;
    }
    Seconds elapsed() const
    {
        return elapsed_;
    }
    std::size_t size_bytes() const
    {
        return size_bytes_;
    }
    std::size_t token_estimate() const
    {
        return token_estimate_;
    }

    /// Throw ValidationError / ToolExecutionError for failed results
    void raise_if_failed() const;

    Json to_json() const;

  private:
    InvocationResult(std::string operation, InvocationStatus status, Json payload,
                     std::string message, Seconds elapsed);

    std::string operation_;
    InvocationStatus status_{InvocationStatus::Success};
    Json payload_;
    std::string error_message_;
    Seconds elapsed_{0};
    std::size_t size_bytes_{0};
    std::size_t token_estimate_{0};
};

// ============================================================================
// Session
// ============================================================================

enum class SessionState
{
    NotStarted,
    Starting,
    Ready,
    Terminated
};

const char* to_string(SessionState state);

/// Data recorded from the initialize handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocol_version;
    Json capabilities = Json::object();
    std::optional<std::string> instructions;

    static ServerInfo from_initialize_result(const Json& result);
    Json to_json() const;
};

} // namespace mcpdoctor::client
