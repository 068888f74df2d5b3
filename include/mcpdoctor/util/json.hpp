#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace mcpdoctor::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

/// Parse without throwing; nullopt on malformed input.
inline std::optional<json> try_parse(const std::string& s)
{
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

/// String member of a peer-supplied object; fallback when absent or not a string.
inline std::string string_field(const json& obj, const char* key, std::string fallback = {})
{
    if (!obj.is_object())
        return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

/// True only for a boolean `true` member.
inline bool flag_field(const json& obj, const char* key)
{
    if (!obj.is_object())
        return false;
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

/// Number of Unicode code points in a UTF-8 string.
inline std::size_t utf8_length(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++n;
    return n;
}

/// Extract the first balanced JSON object embedded in free text
/// (e.g. a model reply wrapped in prose or a code fence).
std::optional<json> extract_first_object(const std::string& text);

} // namespace mcpdoctor::util::json
