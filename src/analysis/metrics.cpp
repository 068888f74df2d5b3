#include "mcpdoctor/analysis/metrics.hpp"

#include "mcpdoctor/util/json.hpp"
#include "mcpdoctor/util/strings.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace mcpdoctor::analysis
{

namespace
{

const std::regex& uuid_pattern()
{
    static const std::regex re(
        "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}",
        std::regex::icase | std::regex::optimize);
    return re;
}

bool opaque_run(const std::string& run, const Heuristics& h)
{
    const bool all_hex = std::all_of(run.begin(), run.end(),
                                     [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (all_hex && run.size() >= h.hex_run_min_length)
        return true;
    if (run.size() < h.opaque_token_min_length)
        return false;
    const bool has_alpha =
        std::any_of(run.begin(), run.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
    const bool has_digit =
        std::any_of(run.begin(), run.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    return has_alpha && has_digit;
}

/// Count object fields and collect the distinct low-value names among them.
void scan_fields(const Json& node, const Heuristics& h, std::size_t& fields,
                 std::set<std::string>& low_value)
{
    if (node.is_object())
    {
        for (const auto& [key, value] : node.items())
        {
            ++fields;
            if (h.is_low_value_field(key))
                low_value.insert(util::to_lower(key));
            scan_fields(value, h, fields, low_value);
        }
    }
    else if (node.is_array())
    {
        for (const auto& value : node)
            scan_fields(value, h, fields, low_value);
    }
}

} // namespace

Json response_view(const Json& result)
{
    if (!result.is_object())
        return result;
    if (result.contains("structuredContent") && !result["structuredContent"].is_null())
        return result["structuredContent"];

    if (result.contains("content") && result["content"].is_array())
    {
        for (const auto& block : result["content"])
        {
            if (!block.is_object() || util::json::string_field(block, "type") != "text")
                continue;
            if (!block.contains("text") || !block["text"].is_string())
                continue;
            auto parsed = util::json::try_parse(block["text"].get<std::string>());
            if (parsed && (parsed->is_object() || parsed->is_array()))
                return *parsed;
        }
    }
    return result;
}

bool has_verbose_identifiers(const Json& payload, const Heuristics& heuristics)
{
    if (!payload.is_object() && !payload.is_array())
        return false;

    const std::string text = util::json::dump(payload);
    if (std::regex_search(text, uuid_pattern()))
        return true;

    std::string run;
    for (char c : text)
    {
        if (std::isalnum(static_cast<unsigned char>(c)))
        {
            run.push_back(c);
            continue;
        }
        if (opaque_run(run, heuristics))
            return true;
        run.clear();
    }
    return opaque_run(run, heuristics);
}

bool has_low_value_data(const Json& payload, const Heuristics& heuristics)
{
    const Json view = response_view(payload);
    if (!view.is_object() && !view.is_array())
        return false;

    std::size_t fields = 0;
    std::set<std::string> low_value;
    scan_fields(view, heuristics, fields, low_value);
    if (fields == 0)
        return false;
    return static_cast<double>(low_value.size()) / static_cast<double>(fields) >
           heuristics.low_value_ratio;
}

bool is_truncated(const Json& payload, const Heuristics& heuristics)
{
    const Json view = response_view(payload);
    if (!view.is_object() && !view.is_array())
        return false;

    const auto text = util::to_lower(util::json::dump(view));
    return std::any_of(heuristics.truncation_markers.begin(), heuristics.truncation_markers.end(),
                       [&](const std::string& marker)
                       { return text.find(util::to_lower(marker)) != std::string::npos; });
}

bool is_collection_shaped(const Json& payload, const Heuristics& heuristics)
{
    const Json view = response_view(payload);
    if (view.is_array())
        return true;
    if (!view.is_object())
        return false;

    for (const auto& [key, value] : view.items())
    {
        if (!value.is_array())
            continue;
        if (heuristics.is_collection_field(key))
            return true;
        if (util::ends_with(util::to_lower(key), "s") && !value.empty() &&
            std::all_of(value.begin(), value.end(), [](const Json& v) { return v.is_object(); }))
            return true;
    }
    return false;
}

} // namespace mcpdoctor::analysis
