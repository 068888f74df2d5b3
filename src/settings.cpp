#include "mcpdoctor/settings.hpp"

#include "mcpdoctor/util/strings.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace mcpdoctor
{

std::vector<std::string> default_sensitive_env_patterns()
{
    return {"api_key",  "apikey",  "key",    "secret",  "password",     "passwd",
            "pwd",      "token",   "auth",   "credential", "cred",      "private",
            "access",   "session", "cookie", "oauth",   "jwt",          "bearer",
            "signature", "database_url", "db_url", "connection_string", "dsn"};
}

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_bool(const std::string& raw, bool defv)
{
    auto v = util::to_lower(util::trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return defv;
}

static long parse_positive(const char* key, long defv)
{
    const char* raw = std::getenv(key);
    if (!raw)
        return defv;
    try
    {
        long v = std::stol(raw);
        if (v > 0)
            return v;
    }
    catch (const std::exception&)
    {
    }
    throw std::invalid_argument(std::string(key) + " must be a positive integer, got '" +
                                raw + "'");
}

static long long json_positive(const Json& j, const char* key)
{
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0)
        throw std::invalid_argument(std::string(key) + " must be a positive integer, got " +
                                    v.dump());
    return v.get<long long>();
}

std::filesystem::path Settings::default_cache_dir()
{
    std::filesystem::path home = getenv_str("HOME", ".");
    return home / ".mcp-doctor" / "tool-call-cache";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPDOCTOR_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;

    s.request_timeout = std::chrono::seconds(
        parse_positive("MCPDOCTOR_TIMEOUT", static_cast<long>(s.request_timeout.count())));
    s.startup_timeout = std::chrono::seconds(parse_positive(
        "MCPDOCTOR_STARTUP_TIMEOUT", static_cast<long>(s.startup_timeout.count())));
    s.concurrency = static_cast<std::size_t>(
        parse_positive("MCPDOCTOR_CONCURRENCY", static_cast<long>(s.concurrency)));
    s.oversized_token_threshold = static_cast<std::size_t>(parse_positive(
        "MCPDOCTOR_TOKEN_THRESHOLD", static_cast<long>(s.oversized_token_threshold)));

    s.correction_enabled =
        parse_bool(getenv_str("MCPDOCTOR_CORRECTION", ""), s.correction_enabled);
    s.log_env_vars = parse_bool(getenv_str("MCPDOCTOR_LOG_ENV_VARS", ""), s.log_env_vars);
    s.cache_enabled = parse_bool(getenv_str("MCPDOCTOR_CACHE", ""), s.cache_enabled);
    auto dir = getenv_str("MCPDOCTOR_CACHE_DIR", "");
    if (!dir.empty())
        s.cache_dir = dir;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("request_timeout"))
        s.request_timeout = std::chrono::seconds(json_positive(j, "request_timeout"));
    if (j.contains("startup_timeout"))
        s.startup_timeout = std::chrono::seconds(json_positive(j, "startup_timeout"));
    if (j.contains("shutdown_grace"))
        s.shutdown_grace = std::chrono::seconds(json_positive(j, "shutdown_grace"));
    if (j.contains("concurrency"))
        s.concurrency = static_cast<std::size_t>(json_positive(j, "concurrency"));
    if (j.contains("oversized_token_threshold"))
        s.oversized_token_threshold =
            static_cast<std::size_t>(json_positive(j, "oversized_token_threshold"));
    if (j.contains("correction_enabled"))
        s.correction_enabled = j.at("correction_enabled").get<bool>();
    if (j.contains("log_env_vars"))
        s.log_env_vars = j.at("log_env_vars").get<bool>();
    if (j.contains("sensitive_env_patterns"))
        s.sensitive_env_patterns =
            j.at("sensitive_env_patterns").get<std::vector<std::string>>();
    if (j.contains("cache_enabled"))
        s.cache_enabled = j.at("cache_enabled").get<bool>();
    if (j.contains("cache_dir"))
        s.cache_dir = j.at("cache_dir").get<std::string>();
    if (j.contains("heuristics"))
    {
        if (!j.at("heuristics").is_object())
            throw std::invalid_argument("heuristics must be an object");
        s.heuristics = j.at("heuristics");
    }
    return s;
}

} // namespace mcpdoctor
