#include "mcpdoctor/analysis/heuristics.hpp"

#include "mcpdoctor/util/strings.hpp"

#include <algorithm>
#include <stdexcept>

namespace mcpdoctor::analysis
{

namespace
{
bool in_list(const std::vector<std::string>& list, const std::string& name)
{
    auto lowered = util::to_lower(name);
    return std::any_of(list.begin(), list.end(),
                       [&](const std::string& entry) { return util::to_lower(entry) == lowered; });
}

void read_list(const Json& j, const char* key, std::vector<std::string>& out)
{
    if (!j.contains(key))
        return;
    const auto& list = j[key];
    if (!list.is_array() ||
        !std::all_of(list.begin(), list.end(), [](const Json& v) { return v.is_string(); }))
        throw std::invalid_argument(std::string("heuristics.") + key +
                                    " must be an array of strings");
    out = list.get<std::vector<std::string>>();
}

template <typename T> void read_positive(const Json& j, const char* key, T& out)
{
    if (!j.contains(key))
        return;
    const auto& v = j[key];
    if (!v.is_number_integer() || v.get<long long>() <= 0)
        throw std::invalid_argument(std::string("heuristics.") + key +
                                    " must be a positive integer");
    out = static_cast<T>(v.get<long long>());
}
} // namespace

bool Heuristics::is_size_param(const std::string& name) const
{
    return in_list(size_params, name);
}

bool Heuristics::is_page_param(const std::string& name) const
{
    return in_list(page_params, name);
}

bool Heuristics::is_offset_param(const std::string& name) const
{
    return in_list(offset_params, name);
}

bool Heuristics::is_pagination_param(const std::string& name) const
{
    return is_size_param(name) || is_page_param(name) || is_offset_param(name) ||
           in_list(cursor_params, name);
}

bool Heuristics::is_filter_param(const std::string& name) const
{
    return in_list(filter_params, name);
}

bool Heuristics::is_collection_field(const std::string& name) const
{
    return in_list(collection_fields, name);
}

bool Heuristics::is_format_control_param(const std::string& name) const
{
    return in_list(format_control_params, name);
}

bool Heuristics::is_low_value_field(const std::string& name) const
{
    return in_list(low_value_fields, name);
}

bool Heuristics::mentions_detail(const std::string& text) const
{
    auto lowered = util::to_lower(text);
    return std::any_of(detail_indicators.begin(), detail_indicators.end(),
                       [&](const std::string& word)
                       { return lowered.find(util::to_lower(word)) != std::string::npos; });
}

Heuristics Heuristics::from_json(const Json& j)
{
    Heuristics h;
    if (!j.is_object())
        return h;
    read_list(j, "size_params", h.size_params);
    read_list(j, "page_params", h.page_params);
    read_list(j, "offset_params", h.offset_params);
    read_list(j, "cursor_params", h.cursor_params);
    read_list(j, "filter_params", h.filter_params);
    read_list(j, "collection_fields", h.collection_fields);
    read_list(j, "format_control_params", h.format_control_params);
    read_list(j, "detail_indicators", h.detail_indicators);
    read_list(j, "low_value_fields", h.low_value_fields);
    read_list(j, "truncation_markers", h.truncation_markers);
    read_positive(j, "typical_page_size", h.typical_page_size);
    read_positive(j, "large_page_size", h.large_page_size);
    read_positive(j, "hex_run_min_length", h.hex_run_min_length);
    read_positive(j, "opaque_token_min_length", h.opaque_token_min_length);
    if (j.contains("low_value_ratio"))
    {
        const auto& r = j["low_value_ratio"];
        if (!r.is_number() || r.get<double>() < 0.0 || r.get<double>() > 1.0)
            throw std::invalid_argument("heuristics.low_value_ratio must be a number in [0, 1]");
        h.low_value_ratio = r.get<double>();
    }
    return h;
}

Json Heuristics::to_json() const
{
    return Json{{"size_params", size_params},
                {"page_params", page_params},
                {"offset_params", offset_params},
                {"cursor_params", cursor_params},
                {"filter_params", filter_params},
                {"collection_fields", collection_fields},
                {"format_control_params", format_control_params},
                {"detail_indicators", detail_indicators},
                {"low_value_fields", low_value_fields},
                {"low_value_ratio", low_value_ratio},
                {"truncation_markers", truncation_markers},
                {"typical_page_size", typical_page_size},
                {"large_page_size", large_page_size},
                {"hex_run_min_length", hex_run_min_length},
                {"opaque_token_min_length", opaque_token_min_length}};
}

} // namespace mcpdoctor::analysis
