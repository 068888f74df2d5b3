#include "mcpdoctor/launcher/environment.hpp"

#include "mcpdoctor/util/strings.hpp"

extern "C" char** environ;

namespace mcpdoctor::launcher
{

Environment inherited_environment()
{
    Environment env;
    if (!environ)
        return env;
    for (char** entry = environ; *entry; ++entry)
    {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

Environment merge_environment(const Environment& inherited, const Environment& inline_env,
                              const Environment& overrides)
{
    Environment merged = inherited;
    for (const auto& [k, v] : inline_env)
        merged[k] = v;
    for (const auto& [k, v] : overrides)
        merged[k] = v;
    return merged;
}

EnvRedactor::EnvRedactor(std::vector<std::string> patterns)
{
    patterns_.reserve(patterns.size());
    for (auto& p : patterns)
    {
        auto lowered = util::to_lower(util::trim(p));
        if (!lowered.empty())
            patterns_.push_back(std::move(lowered));
    }
}

bool EnvRedactor::is_sensitive(const std::string& name) const
{
    auto lowered = util::to_lower(name);
    for (const auto& p : patterns_)
        if (lowered.find(p) != std::string::npos)
            return true;
    return false;
}

std::string EnvRedactor::redact(const std::string& name, const std::string& value) const
{
    return is_sensitive(name) ? std::string(kMarker) : value;
}

Environment EnvRedactor::redact_all(const Environment& env) const
{
    Environment out;
    for (const auto& [k, v] : env)
        out.emplace(k, redact(k, v));
    return out;
}

std::string EnvRedactor::summary(const Environment& env) const
{
    std::vector<std::string> safe;
    size_t hidden = 0;
    for (const auto& kv : env)
    {
        if (is_sensitive(kv.first))
            ++hidden;
        else
            safe.push_back(kv.first);
    }

    std::vector<std::string> parts;
    if (!safe.empty())
    {
        if (safe.size() <= 5)
            parts.push_back("safe: [" + util::join(safe, ", ") + "]");
        else
            parts.push_back("safe: [" +
                            util::join(std::vector<std::string>(safe.begin(), safe.begin() + 3),
                                       ", ") +
                            "] + " + std::to_string(safe.size() - 3) + " more");
    }
    if (hidden > 0)
        parts.push_back("sensitive: " + std::to_string(hidden) + " hidden");
    return "{" + util::join(parts, ", ") + "}";
}

} // namespace mcpdoctor::launcher
