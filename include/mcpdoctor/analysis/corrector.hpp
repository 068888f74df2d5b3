#pragma once
/// @file analysis/corrector.hpp
/// @brief Argument repair after a validation failure.

#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcpdoctor::analysis
{

/// Proposes replacement arguments for a call the server rejected.
class ICorrector
{
  public:
    virtual ~ICorrector() = default;

    /// False when the corrector cannot run (e.g. no credentials)
    virtual bool available() const = 0;

    /// @return Replacement argument object, or nullopt when no correction was produced
    /// @throws Error on backend failure (the harness logs it and keeps the failure)
    virtual std::optional<Json> correct(const client::Operation& operation,
                                        const Json& failed_args,
                                        const client::InvocationResult& failure) = 0;
};

/// Never available. Scenarios that fail validation stay failed.
class NullCorrector : public ICorrector
{
  public:
    bool available() const override
    {
        return false;
    }
    std::optional<Json> correct(const client::Operation&, const Json&,
                                const client::InvocationResult&) override
    {
        return std::nullopt;
    }
};

struct AnthropicOptions
{
    std::string api_key;
    std::string base_url{"https://api.anthropic.com"};
    std::string model{"claude-3-5-sonnet-20241022"};
    std::string api_version{"2023-06-01"};
    int max_tokens{1024};
    std::chrono::milliseconds timeout{60000};
    int max_attempts{5};
    std::chrono::milliseconds base_delay{500};

    /// ANTHROPIC_API_KEY, ANTHROPIC_API_BASE, ANTHROPIC_MODEL, ANTHROPIC_API_VERSION
    static AnthropicOptions from_env();
};

/// Asks a Messages API model for a corrected argument object.
class AnthropicCorrector : public ICorrector
{
  public:
    explicit AnthropicCorrector(AnthropicOptions options);

    bool available() const override;
    std::optional<Json> correct(const client::Operation& operation, const Json& failed_args,
                                const client::InvocationResult& failure) override;

    /// Prompt sent for one correction (exposed for tests)
    static std::string build_prompt(const client::Operation& operation, const Json& failed_args,
                                    const client::InvocationResult& failure);

    /// Joined text blocks of a Messages API reply
    /// @throws Error when the reply carries no text
    static std::string reply_text(const Json& reply);

    /// Statuses worth another attempt
    static bool is_retriable(int status);

  private:
    Json post_messages(const Json& body);

    AnthropicOptions options_;
};

/// AnthropicCorrector when ANTHROPIC_API_KEY is set, NullCorrector otherwise.
std::shared_ptr<ICorrector> make_corrector_from_env();

} // namespace mcpdoctor::analysis
