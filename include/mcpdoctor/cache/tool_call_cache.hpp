#pragma once
/// @file cache/tool_call_cache.hpp
/// @brief On-disk record of successful tool calls, namespaced per server.

#include "mcpdoctor/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpdoctor::cache
{

/// One successful (or corrected) invocation as handed to a sink.
struct CallRecord
{
    std::string operation;
    std::string server_identity;
    std::string scenario;
    Json input_params = Json::object();
    Json output_response;
    std::size_t token_count{0};
    double response_time_seconds{0.0};
    std::size_t response_size_bytes{0};
    bool corrected{false};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    Json to_json() const;
};

/// Write-only persistence seam used by the harness.
class IResultSink
{
  public:
    virtual ~IResultSink() = default;
    /// Must not throw
    virtual void record(const CallRecord& call) = 0;
};

/// Layout:
///   <cache_dir>/<sha256(server)[0:16]>/_metadata.json
///   <cache_dir>/<sha256(server)[0:16]>/<operation>/_index.json
///   <cache_dir>/<sha256(server)[0:16]>/<operation>/<scenario>_<utc stamp>.json
/// All members are thread-safe. I/O failures are logged, never thrown.
class ToolCallCache : public IResultSink
{
  public:
    ToolCallCache(std::string server_identity, std::filesystem::path cache_dir);

    void record(const CallRecord& call) override;

    /// Cached records for one operation, newest first
    std::vector<Json> cached_calls(const std::string& operation,
                                   const std::optional<std::string>& scenario = std::nullopt) const;

    /// {server_url, cache_path, total_tools, total_calls, tools{name: index}}
    Json stats() const;

    /// Remove one operation's records, or everything for this server
    void clear(const std::optional<std::string>& operation = std::nullopt);

    const std::filesystem::path& root() const
    {
        return root_;
    }

    /// First 16 hex digits of SHA-256(server identity)
    static std::string hash_server(const std::string& server_identity);
    /// Directory-safe operation name
    static std::string sanitize_name(const std::string& operation);

  private:
    void write_metadata() const;
    void update_index(const std::filesystem::path& dir, const std::string& operation) const;

    std::string server_identity_;
    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace mcpdoctor::cache
