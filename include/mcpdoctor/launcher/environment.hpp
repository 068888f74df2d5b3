#pragma once
#include "mcpdoctor/settings.hpp"

#include <map>
#include <string>
#include <vector>

namespace mcpdoctor::launcher
{

using Environment = std::map<std::string, std::string>;

/// Snapshot of this process's environment.
Environment inherited_environment();

/// Later layers win: overrides > inline assignments > inherited.
Environment merge_environment(const Environment& inherited, const Environment& inline_env,
                              const Environment& overrides);

/// Hides values of environment variables whose names look sensitive.
/// Matching is a case-insensitive substring test against the pattern list.
class EnvRedactor
{
  public:
    static constexpr const char* kMarker = "***REDACTED***";

    explicit EnvRedactor(std::vector<std::string> patterns = default_sensitive_env_patterns());

    bool is_sensitive(const std::string& name) const;

    /// The value itself, or the marker for sensitive names
    std::string redact(const std::string& name, const std::string& value) const;

    /// Copy of env with sensitive values replaced by the marker
    Environment redact_all(const Environment& env) const;

    /// Names-only overview, e.g. "{safe: [HOME, PATH], sensitive: 2 hidden}".
    /// Lists at most five safe names before abbreviating.
    std::string summary(const Environment& env) const;

    const std::vector<std::string>& patterns() const
    {
        return patterns_;
    }

  private:
    std::vector<std::string> patterns_;
};

} // namespace mcpdoctor::launcher
