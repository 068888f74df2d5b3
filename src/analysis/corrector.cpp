#include "mcpdoctor/analysis/corrector.hpp"

#include "../client/http_util.hpp"
#include "../internal/url.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/json.hpp"

#include <algorithm>
#include <cstdlib>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace mcpdoctor::analysis
{

namespace
{

std::string env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::chrono::milliseconds retry_delay(const httplib::Result& res, int attempt,
                                      std::chrono::milliseconds base)
{
    auto delay = base * (1 << (attempt - 1));
    if (res && res->has_header("Retry-After"))
    {
        try
        {
            auto seconds = std::stod(res->get_header_value("Retry-After"));
            auto hinted = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
            delay = std::max(hinted, base);
        }
        catch (const std::exception&)
        {
            delay = base;
        }
    }
    return delay;
}

} // namespace

AnthropicOptions AnthropicOptions::from_env()
{
    AnthropicOptions opts;
    opts.api_key = env_or("ANTHROPIC_API_KEY", "");
    opts.base_url = env_or("ANTHROPIC_API_BASE", opts.base_url);
    opts.model = env_or("ANTHROPIC_MODEL", opts.model);
    opts.api_version = env_or("ANTHROPIC_API_VERSION", opts.api_version);
    return opts;
}

AnthropicCorrector::AnthropicCorrector(AnthropicOptions options) : options_(std::move(options)) {}

bool AnthropicCorrector::available() const
{
    return !options_.api_key.empty();
}

bool AnthropicCorrector::is_retriable(int status)
{
    switch (status)
    {
    case 408:
    case 409:
    case 429:
    case 522:
    case 524:
    case 529:
        return true;
    default:
        return status >= 500 && status < 600;
    }
}

std::string AnthropicCorrector::build_prompt(const client::Operation& operation,
                                             const Json& failed_args,
                                             const client::InvocationResult& failure)
{
    std::string prompt;
    prompt += "A call to the tool \"" + operation.name + "\" was rejected by the server.\n\n";
    if (operation.description)
        prompt += "Tool description:\n" + *operation.description + "\n\n";
    prompt += "Input schema:\n" + util::json::dump_pretty(operation.input_schema) + "\n\n";
    prompt += "Arguments sent:\n" + util::json::dump_pretty(failed_args) + "\n\n";
    prompt += "Error returned:\n" + failure.error_message() + "\n";
    if (!failure.payload().is_null())
        prompt += util::json::dump(failure.payload()) + "\n";
    prompt += "\nReply with a single JSON object containing corrected arguments that satisfy "
              "the schema. Do not include any other text.";
    return prompt;
}

std::string AnthropicCorrector::reply_text(const Json& reply)
{
    if (!reply.is_object() || !reply.contains("content") || !reply["content"].is_array())
        throw Error("Unexpected response format from Anthropic API");

    std::string text;
    for (const auto& block : reply["content"])
    {
        if (!block.is_object() || util::json::string_field(block, "type") != "text")
            continue;
        if (!text.empty())
            text += "\n";
        text += util::json::string_field(block, "text");
    }
    if (text.empty())
        throw Error("Anthropic response did not contain text content");
    return text;
}

Json AnthropicCorrector::post_messages(const Json& body)
{
    internal::ParsedUrl base;
    try
    {
        base = internal::parse_url(options_.base_url);
    }
    catch (const std::invalid_argument& e)
    {
        throw Error(std::string("Invalid ANTHROPIC_API_BASE: ") + e.what());
    }
    std::string path = base.path;
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    path += "/v1/messages";

    httplib::Headers headers = {{"x-api-key", options_.api_key},
                                {"anthropic-version", options_.api_version}};
    const std::string payload = util::json::dump(body);

    std::string last_error;
    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt)
    {
        httplib::Client cli(base.origin());
        client::detail::set_timeouts(cli, options_.timeout, options_.timeout);
        auto res = cli.Post(path, headers, payload, "application/json");

        if (!res)
        {
            last_error = httplib::to_string(res.error());
            auto delay = options_.base_delay * (1 << (attempt - 1));
            spdlog::warn("Anthropic API network error (attempt {}/{}). Retrying in {} ms: {}",
                         attempt, options_.max_attempts, delay.count(), last_error);
            if (attempt < options_.max_attempts)
                std::this_thread::sleep_for(delay);
            continue;
        }

        if (is_retriable(res->status))
        {
            last_error = std::to_string(res->status) + " " + res->body.substr(0, 200);
            auto delay = retry_delay(res, attempt, options_.base_delay);
            spdlog::warn("Anthropic API transient error {} (attempt {}/{}). Retrying in {} ms",
                         res->status, attempt, options_.max_attempts, delay.count());
            if (attempt < options_.max_attempts)
                std::this_thread::sleep_for(delay);
            continue;
        }

        if (res->status < 200 || res->status >= 300)
            throw Error("Anthropic API error: " + std::to_string(res->status) + " " +
                        res->body.substr(0, 200));

        auto reply = util::json::try_parse(res->body);
        if (!reply)
            throw Error("Anthropic API returned a non-JSON body");
        if (reply->is_object() && util::json::string_field(*reply, "type") == "error")
        {
            std::string message = "Unknown error";
            if (reply->contains("error") && (*reply)["error"].is_object())
                message = util::json::string_field((*reply)["error"], "message", message);
            throw Error("Anthropic API returned error payload: " + message);
        }
        return *reply;
    }
    throw Error("Anthropic API request failed after " + std::to_string(options_.max_attempts) +
                " attempts: " + last_error);
}

std::optional<Json> AnthropicCorrector::correct(const client::Operation& operation,
                                                const Json& failed_args,
                                                const client::InvocationResult& failure)
{
    if (!available())
        return std::nullopt;

    Json body = {{"model", options_.model},
                 {"max_tokens", options_.max_tokens},
                 {"messages", Json::array({Json{{"role", "user"},
                                                {"content", build_prompt(operation, failed_args,
                                                                         failure)}}})}};

    auto text = reply_text(post_messages(body));
    auto corrected = util::json::extract_first_object(text);
    if (!corrected || !corrected->is_object())
    {
        spdlog::debug("Corrector reply for {} held no JSON object", operation.name);
        return std::nullopt;
    }
    return corrected;
}

std::shared_ptr<ICorrector> make_corrector_from_env()
{
    auto options = AnthropicOptions::from_env();
    if (options.api_key.empty())
        return std::make_shared<NullCorrector>();
    return std::make_shared<AnthropicCorrector>(std::move(options));
}

} // namespace mcpdoctor::analysis
