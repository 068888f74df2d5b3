// Correlates JSON-RPC replies with the requests waiting for them

#pragma once

#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/types.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpdoctor::client::detail
{

class PendingRequests
{
  public:
    /// Numeric correlation id of a message; integers and numeric strings are accepted
    static std::optional<int64_t> id_of(const Json& message)
    {
        if (!message.is_object() || !message.contains("id"))
            return std::nullopt;
        const auto& id = message.at("id");
        if (id.is_number_integer())
            return id.get<int64_t>();
        if (id.is_string())
        {
            const auto& s = id.get_ref<const std::string&>();
            if (s.empty())
                return std::nullopt;
            try
            {
                size_t used = 0;
                auto v = std::stoll(s, &used);
                if (used == s.size())
                    return v;
            }
            catch (const std::exception&)
            {
            }
        }
        return std::nullopt;
    }

    /// Register interest in a reply. Fails immediately once the channel is gone.
    std::future<Json> add(int64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::promise<Json> promise;
        auto future = promise.get_future();
        if (closed_)
            promise.set_exception(closed_);
        else
            pending_[id] = std::move(promise);
        return future;
    }

    /// Deliver a reply to its waiter. Returns false for unknown ids.
    bool resolve(const Json& message)
    {
        auto id = id_of(message);
        if (!id)
            return false;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(*id);
        if (it == pending_.end())
            return false;
        it->second.set_value(message);
        pending_.erase(it);
        return true;
    }

    void remove(int64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
    }

    /// Fail every waiter and every later add() with the given error
    void fail_all(std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_)
            closed_ = error;
        for (auto& [id, promise] : pending_)
            promise.set_exception(error);
        pending_.clear();
    }

    /// Wait for the reply to `id`; removes the entry on timeout.
    /// @throws RequestTimeoutError when the deadline passes
    Json await(std::future<Json>& future, int64_t id, std::chrono::milliseconds timeout,
               const std::string& method)
    {
        if (future.wait_for(timeout) == std::future_status::timeout)
        {
            remove(id);
            throw RequestTimeoutError(method + " timed out after " +
                                      std::to_string(timeout.count()) + " ms");
        }
        return future.get();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::unordered_map<int64_t, std::promise<Json>> pending_;
    std::exception_ptr closed_;
};

} // namespace mcpdoctor::client::detail
