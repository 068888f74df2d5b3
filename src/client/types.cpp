#include "mcpdoctor/client/types.hpp"

#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/json.hpp"
#include "mcpdoctor/util/strings.hpp"

#include <algorithm>

namespace mcpdoctor::client
{

namespace
{

constexpr int kInvalidParams = -32602;

const char* const kValidationPhrases[] = {
    "validation",       "invalid argument", "invalid param",     "invalid_type",
    "is required",      "field required",   "required property", "missing required",
    "must be of type",
};

const char* const kStructuredErrorKeys[] = {
    "errors", "issues", "field", "fields", "path", "loc", "constraint", "expected", "schema",
};

bool has_structured_field_info(const Json& data)
{
    if (data.is_array())
        return !data.empty();
    if (!data.is_object())
        return false;
    for (const char* key : kStructuredErrorKeys)
        if (data.contains(key))
            return true;
    return false;
}

/// Text of every text content block, joined by newlines.
std::string content_text(const Json& result)
{
    std::string out;
    if (!result.is_object() || !result.contains("content") || !result["content"].is_array())
        return out;
    for (const auto& block : result["content"])
    {
        if (!block.is_object() || util::json::string_field(block, "type") != "text")
            continue;
        if (!out.empty())
            out += '\n';
        out += util::json::string_field(block, "text");
    }
    return out;
}

} // namespace

// ============================================================================
// Operation
// ============================================================================

Operation Operation::from_json(const Json& entry)
{
    Operation op;
    if (entry.is_string())
    {
        op.name = entry.get<std::string>();
    }
    else if (entry.is_object())
    {
        if (entry.contains("name") && !entry["name"].is_string())
            throw ProtocolError("tools/list entry has a non-string name");
        op.name = util::json::string_field(entry, "name");
        if (entry.contains("description") && entry["description"].is_string())
            op.description = entry["description"].get<std::string>();
        if (entry.contains("inputSchema") && entry["inputSchema"].is_object())
            op.input_schema = entry["inputSchema"];
        else if (entry.contains("parameters") && entry["parameters"].is_object())
            op.input_schema = entry["parameters"];
    }
    else
    {
        throw ProtocolError("tools/list entry is neither an object nor a name");
    }

    if (op.name.empty())
        throw ProtocolError("tools/list entry without a name");

    if (!op.input_schema.is_object())
        op.input_schema = Json::object();
    if (!op.input_schema.contains("type"))
        op.input_schema["type"] = "object";
    if (!op.input_schema.contains("properties") || !op.input_schema["properties"].is_object())
        op.input_schema["properties"] = Json::object();
    return op;
}

Json Operation::to_json() const
{
    Json j = {{"name", name}, {"inputSchema", input_schema}};
    if (description)
        j["description"] = *description;
    return j;
}

const Json& Operation::properties() const
{
    static const Json empty = Json::object();
    auto it = input_schema.find("properties");
    if (it == input_schema.end() || !it->is_object())
        return empty;
    return *it;
}

std::vector<std::string> Operation::required() const
{
    std::vector<std::string> out;
    auto it = input_schema.find("required");
    if (it == input_schema.end() || !it->is_array())
        return out;
    for (const auto& r : *it)
        if (r.is_string() && std::find(out.begin(), out.end(), r.get<std::string>()) == out.end())
            out.push_back(r.get<std::string>());
    return out;
}

bool Operation::declares(const std::string& param) const
{
    return properties().contains(param);
}

std::vector<Operation> parse_catalog_page(const Json& tools)
{
    if (!tools.is_array())
        throw ProtocolError("tools/list result has no tools array");
    std::vector<Operation> out;
    out.reserve(tools.size());
    for (const auto& entry : tools)
        out.push_back(Operation::from_json(entry));
    return out;
}

// ============================================================================
// Invocation outcome
// ============================================================================

const char* to_string(InvocationStatus status)
{
    switch (status)
    {
    case InvocationStatus::Success:
        return "success";
    case InvocationStatus::ValidationFailure:
        return "validation_failure";
    case InvocationStatus::ToolFailure:
        return "tool_failure";
    }
    return "unknown";
}

std::size_t estimate_tokens(const Json& payload)
{
    if (payload.is_null())
        return 0;
    auto chars = util::json::utf8_length(util::json::dump(payload));
    return std::max<std::size_t>(1, chars / 4);
}

bool is_validation_error(int code, const Json& data, const std::string& message)
{
    if (code == kInvalidParams)
        return true;
    if (has_structured_field_info(data))
        return true;
    auto lower = util::to_lower(message);
    for (const char* phrase : kValidationPhrases)
        if (lower.find(phrase) != std::string::npos)
            return true;
    return false;
}

InvocationResult::InvocationResult(std::string operation, InvocationStatus status, Json payload,
                                   std::string message, Seconds elapsed)
    : operation_(std::move(operation)), status_(status), payload_(std::move(payload)),
      error_message_(std::move(message)), elapsed_(elapsed)
{
    size_bytes_ = payload_.is_null() ? 0 : util::json::dump(payload_).size();
    token_estimate_ = estimate_tokens(payload_);
}

InvocationResult InvocationResult::success(std::string operation, Json result, Seconds elapsed)
{
    return InvocationResult(std::move(operation), InvocationStatus::Success, std::move(result), {},
                            elapsed);
}

InvocationResult InvocationResult::failure(std::string operation, InvocationStatus status,
                                           Json payload, std::string message, Seconds elapsed)
{
    return InvocationResult(std::move(operation), status, std::move(payload), std::move(message),
                            elapsed);
}

InvocationResult InvocationResult::from_rpc_error(std::string operation, const Json& error,
                                                  Seconds elapsed)
{
    int code = 0;
    std::string message = "Unknown error";
    Json data;
    if (error.is_object())
    {
        if (error.contains("code") && error["code"].is_number_integer())
            code = error["code"].get<int>();
        message = util::json::string_field(error, "message", message);
        if (error.contains("data"))
            data = error["data"];
    }
    else if (error.is_string())
    {
        message = error.get<std::string>();
    }
    auto status = is_validation_error(code, data, message) ? InvocationStatus::ValidationFailure
                                                           : InvocationStatus::ToolFailure;
    return failure(std::move(operation), status, error, std::move(message), elapsed);
}

InvocationResult InvocationResult::from_call_result(std::string operation, const Json& result,
                                                    Seconds elapsed)
{
    if (!result.is_object() || !util::json::flag_field(result, "isError"))
        return success(std::move(operation), result, elapsed);

    auto message = content_text(result);
    if (message.empty())
        message = "Tool reported an error";
    Json data;
    if (result.contains("structuredContent"))
        data = result["structuredContent"];
    auto status = is_validation_error(0, data, message) ? InvocationStatus::ValidationFailure
                                                        : InvocationStatus::ToolFailure;
    return failure(std::move(operation), status, result, std::move(message), elapsed);
}

void InvocationResult::raise_if_failed() const
{
    switch (status_)
    {
    case InvocationStatus::Success:
        return;
    case InvocationStatus::ValidationFailure:
        throw ValidationError(operation_ + ": " + error_message_);
    case InvocationStatus::ToolFailure:
        throw ToolExecutionError(operation_ + ": " + error_message_);
    }
}

Json InvocationResult::to_json() const
{
    Json j = {{"operation", operation_},
              {"status", to_string(status_)},
              {"elapsed_seconds", elapsed_.count()},
              {"size_bytes", size_bytes_},
              {"token_estimate", token_estimate_}};
    if (ok())
        j["result"] = payload_;
    else
    {
        j["error"] = error_message_;
        j["payload"] = payload_;
    }
    return j;
}

// ============================================================================
// Session
// ============================================================================

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::NotStarted:
        return "not_started";
    case SessionState::Starting:
        return "starting";
    case SessionState::Ready:
        return "ready";
    case SessionState::Terminated:
        return "terminated";
    }
    return "unknown";
}

ServerInfo ServerInfo::from_initialize_result(const Json& result)
{
    if (!result.is_object())
        throw ProtocolError("initialize returned a non-object result");

    ServerInfo info;
    if (result.contains("protocolVersion") && !result["protocolVersion"].is_string())
        throw ProtocolError("initialize returned a non-string protocolVersion");
    info.protocol_version = util::json::string_field(result, "protocolVersion");
    if (result.contains("serverInfo") && result["serverInfo"].is_object())
    {
        const auto& si = result["serverInfo"];
        if ((si.contains("name") && !si["name"].is_string()) ||
            (si.contains("version") && !si["version"].is_string()))
            throw ProtocolError("initialize returned a malformed serverInfo");
        info.name = util::json::string_field(si, "name");
        info.version = util::json::string_field(si, "version");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object())
        info.capabilities = result["capabilities"];
    if (result.contains("instructions") && result["instructions"].is_string())
        info.instructions = result["instructions"].get<std::string>();
    return info;
}

Json ServerInfo::to_json() const
{
    Json j = {{"name", name},
              {"version", version},
              {"protocolVersion", protocol_version},
              {"capabilities", capabilities}};
    if (instructions)
        j["instructions"] = *instructions;
    return j;
}

} // namespace mcpdoctor::client
