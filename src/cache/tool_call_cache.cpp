#include "mcpdoctor/cache/tool_call_cache.hpp"

#include "mcpdoctor/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <openssl/evp.h>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace mcpdoctor::cache
{

namespace
{

std::tm utc(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

long micros(std::chrono::system_clock::time_point tp)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    return static_cast<long>(us.count() % 1000000);
}

/// 2024-05-01T12:00:00.123456
std::string iso_timestamp(std::chrono::system_clock::time_point tp)
{
    auto tm = utc(tp);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
       << micros(tp);
    return os.str();
}

/// 20240501_120000_123456
std::string file_stamp(std::chrono::system_clock::time_point tp)
{
    auto tm = utc(tp);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0')
       << micros(tp);
    return os.str();
}

std::optional<Json> read_json(const fs::path& path)
{
    std::ifstream in(path);
    if (!in)
        return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    return util::json::try_parse(ss.str());
}

void write_json(const fs::path& path, const Json& value)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    out << util::json::dump_pretty(value);
    if (!out)
        throw std::runtime_error("write to " + path.string() + " failed");
}

bool is_record_file(const fs::path& p)
{
    auto name = p.filename().string();
    return p.extension() == ".json" && !name.empty() && name[0] != '_';
}

} // namespace

Json CallRecord::to_json() const
{
    return Json{{"tool_name", operation},
                {"server_url", server_identity},
                {"timestamp", iso_timestamp(timestamp)},
                {"scenario", scenario},
                {"input_params", input_params},
                {"output_response", output_response},
                {"metrics",
                 {{"token_count", token_count},
                  {"response_time_seconds", response_time_seconds},
                  {"response_size_bytes", response_size_bytes},
                  {"corrected", corrected}}}};
}

std::string ToolCallCache::hash_server(const std::string& server_identity)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(server_identity.data(), server_identity.size(), digest, &len, EVP_sha256(),
                   nullptr) != 1)
        throw std::runtime_error("SHA-256 digest failed");

    std::ostringstream os;
    for (unsigned int i = 0; i < len && i < 8; ++i)
        os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return os.str();
}

std::string ToolCallCache::sanitize_name(const std::string& operation)
{
    std::string out;
    for (char c : operation)
    {
        if (c == '/' || c == '\\' || c == ' ')
            out.push_back('_');
        else if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
            out.push_back(c);
    }
    return out.empty() ? std::string("unknown_tool") : out;
}

ToolCallCache::ToolCallCache(std::string server_identity, fs::path cache_dir)
    : server_identity_(std::move(server_identity)),
      root_(std::move(cache_dir) / hash_server(server_identity_))
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        spdlog::warn("Tool call cache unavailable at {}: {}", root_.string(), ec.message());
        return;
    }
    if (!fs::exists(root_ / "_metadata.json", ec))
    {
        try
        {
            write_metadata();
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Failed to write cache metadata: {}", e.what());
        }
    }
    spdlog::debug("Tool call cache initialized at {}", root_.string());
}

void ToolCallCache::write_metadata() const
{
    write_json(root_ / "_metadata.json",
               Json{{"server_url", server_identity_},
                    {"created_at", iso_timestamp(std::chrono::system_clock::now())},
                    {"description", "Cache of successful MCP tool calls from mcp-doctor runs"}});
}

void ToolCallCache::record(const CallRecord& call)
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        const auto dir = root_ / sanitize_name(call.operation);
        fs::create_directories(dir);

        const auto stem = call.scenario + "_" + file_stamp(call.timestamp);
        auto file = dir / (stem + ".json");
        for (int n = 1; fs::exists(file); ++n)
            file = dir / (stem + "_" + std::to_string(n) + ".json");

        Json data = call.to_json();
        if (data["server_url"].get<std::string>().empty())
            data["server_url"] = server_identity_;
        write_json(file, data);
        spdlog::debug("Cached successful call: {} ({}) -> {}", call.operation, call.scenario,
                      file.string());

        update_index(dir, call.operation);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Failed to cache tool call for {}: {}", call.operation, e.what());
    }
}

void ToolCallCache::update_index(const fs::path& dir, const std::string& operation) const
{
    try
    {
        const auto index_file = dir / "_index.json";
        const auto now = iso_timestamp(std::chrono::system_clock::now());

        Json index;
        if (auto existing = read_json(index_file); existing && existing->is_object())
            index = *existing;
        else
            index = Json{{"tool_name", operation},
                         {"total_cached_calls", 0},
                         {"first_cached", now},
                         {"scenarios", Json::object()}};

        index["total_cached_calls"] = index.value("total_cached_calls", 0) + 1;
        index["last_cached"] = now;

        std::map<std::string, int> counts;
        for (const auto& entry : fs::directory_iterator(dir))
        {
            if (!entry.is_regular_file() || !is_record_file(entry.path()))
                continue;
            if (auto data = read_json(entry.path()); data && data->is_object())
                ++counts[util::json::string_field(*data, "scenario", "unknown")];
        }
        index["scenarios"] = counts;

        write_json(index_file, index);
    }
    catch (const std::exception& e)
    {
        spdlog::debug("Failed to update tool index for {}: {}", operation, e.what());
    }
}

std::vector<Json> ToolCallCache::cached_calls(const std::string& operation,
                                              const std::optional<std::string>& scenario) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Json> calls;
    try
    {
        const auto dir = root_ / sanitize_name(operation);
        if (!fs::is_directory(dir))
            return calls;
        for (const auto& entry : fs::directory_iterator(dir))
        {
            if (!entry.is_regular_file() || !is_record_file(entry.path()))
                continue;
            auto data = read_json(entry.path());
            if (!data || !data->is_object())
            {
                spdlog::debug("Failed to read cached call {}", entry.path().string());
                continue;
            }
            if (!scenario || util::json::string_field(*data, "scenario") == *scenario)
                calls.push_back(std::move(*data));
        }
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Failed to retrieve cached calls for {}: {}", operation, e.what());
        return {};
    }

    std::stable_sort(calls.begin(), calls.end(),
                     [](const Json& a, const Json& b)
                     {
                         return util::json::string_field(a, "timestamp") >
                                util::json::string_field(b, "timestamp");
                     });
    return calls;
}

Json ToolCallCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Json tools = Json::object();
    int total_tools = 0;
    long long total_calls = 0;
    try
    {
        if (fs::is_directory(root_))
        {
            for (const auto& entry : fs::directory_iterator(root_))
            {
                auto name = entry.path().filename().string();
                if (!entry.is_directory() || name.empty() || name[0] == '_')
                    continue;
                auto index = read_json(entry.path() / "_index.json");
                if (!index || !index->is_object())
                    continue;
                tools[util::json::string_field(*index, "tool_name", name)] = *index;
                ++total_tools;
                total_calls += index->value("total_cached_calls", 0LL);
            }
        }
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Failed to get cache stats: {}", e.what());
        return Json{{"error", e.what()}};
    }

    return Json{{"server_url", server_identity_},
                {"cache_path", root_.string()},
                {"total_tools", total_tools},
                {"total_calls", total_calls},
                {"tools", tools}};
}

void ToolCallCache::clear(const std::optional<std::string>& operation)
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        if (operation)
        {
            fs::remove_all(root_ / sanitize_name(*operation));
            spdlog::info("Cleared cache for tool: {}", *operation);
            return;
        }
        fs::remove_all(root_);
        fs::create_directories(root_);
        write_metadata();
        spdlog::info("Cleared all cache for server: {}", server_identity_);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Failed to clear cache: {}", e.what());
    }
}

} // namespace mcpdoctor::cache
