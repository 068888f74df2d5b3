#pragma once
#include "mcpdoctor/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mcpdoctor
{

/// Substrings that mark an environment variable name as sensitive.
std::vector<std::string> default_sensitive_env_patterns();

struct Settings
{
    std::string log_level{"INFO"};
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds startup_timeout{30};
    std::chrono::seconds shutdown_grace{5};
    std::size_t concurrency{3};
    std::size_t oversized_token_threshold{25000};
    bool correction_enabled{true};
    bool log_env_vars{true};
    std::vector<std::string> sensitive_env_patterns{default_sensitive_env_patterns()};
    bool cache_enabled{true};
    std::filesystem::path cache_dir{default_cache_dir()};
    /// Overrides for analysis::Heuristics (name lists and thresholds)
    Json heuristics = Json::object();

    static std::filesystem::path default_cache_dir();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcpdoctor
