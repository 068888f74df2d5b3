// Incremental text/event-stream parser

#pragma once

#include <functional>
#include <string>

namespace mcpdoctor::client::detail
{

struct SseEvent
{
    std::string event; // empty means "message"
    std::string data;  // data: lines joined with '\n'
    std::string id;
};

/// Feed raw bytes as they arrive; complete events are delivered to the callback.
/// Comment lines (":...") are skipped. Handles LF and CRLF line endings.
class SseParser
{
  public:
    using Callback = std::function<void(const SseEvent&)>;

    explicit SseParser(Callback on_event) : on_event_(std::move(on_event)) {}

    void feed(const char* data, size_t len)
    {
        buffer_.append(data, len);
        size_t pos = 0;
        while (true)
        {
            size_t nl = buffer_.find('\n', pos);
            if (nl == std::string::npos)
                break;
            std::string line = buffer_.substr(pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            handle_line(line);
        }
        if (pos > 0)
            buffer_.erase(0, pos);
    }

    /// Flush an event left unterminated at end of stream
    void finish()
    {
        if (!buffer_.empty())
        {
            std::string line;
            line.swap(buffer_);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            handle_line(line);
        }
        dispatch();
    }

  private:
    void handle_line(const std::string& line)
    {
        if (line.empty())
        {
            dispatch();
            return;
        }
        if (line[0] == ':')
            return;

        auto colon = line.find(':');
        std::string field = line.substr(0, colon);
        std::string value;
        if (colon != std::string::npos)
        {
            value = line.substr(colon + 1);
            if (!value.empty() && value[0] == ' ')
                value.erase(0, 1);
        }

        if (field == "event")
            current_.event = value;
        else if (field == "data")
        {
            if (has_data_)
                current_.data += '\n';
            current_.data += value;
            has_data_ = true;
        }
        else if (field == "id")
            current_.id = value;
    }

    void dispatch()
    {
        if (has_data_)
            on_event_(current_);
        current_ = SseEvent{};
        has_data_ = false;
    }

    Callback on_event_;
    std::string buffer_;
    SseEvent current_;
    bool has_data_ = false;
};

} // namespace mcpdoctor::client::detail
