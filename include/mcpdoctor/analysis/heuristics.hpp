#pragma once
#include "mcpdoctor/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mcpdoctor::analysis
{

/// Tunable name lists and thresholds behind scenario synthesis and issue
/// detection. Name matching is exact and case-insensitive.
struct Heuristics
{
    /// Page-size parameters: set to 10 (typical) or 1000 (large)
    std::vector<std::string> size_params{"limit", "count", "per_page", "page_size", "max_results",
                                         "top"};
    /// Page-number parameters: always 1
    std::vector<std::string> page_params{"page"};
    /// Offset parameters: always 0
    std::vector<std::string> offset_params{"offset", "start"};
    /// Opaque continuation parameters: never synthesized, but count as pagination
    std::vector<std::string> cursor_params{"cursor", "next_token", "continuation_token"};

    std::vector<std::string> filter_params{"filter", "where",  "query",  "search",
                                           "include", "exclude", "fields", "select",
                                           "only",    "except",  "type",   "status"};

    /// Parameters that let a caller choose how verbose the output is
    std::vector<std::string> format_control_params{"format",  "response_format", "detail_level",
                                                   "verbosity", "compact",       "full",
                                                   "summary", "detailed"};
    /// Substrings of a tool name or description marking a detail-fetching tool
    std::vector<std::string> detail_indicators{"get",      "fetch",  "retrieve", "details",
                                               "info",     "describe", "analyze", "report",
                                               "summary",  "profile"};

    /// Field names that usually carry bookkeeping rather than content
    std::vector<std::string> low_value_fields{"created_at", "updated_at", "metadata", "_internal",
                                              "debug"};
    /// Flag when distinct low-value fields exceed this share of all fields
    double low_value_ratio = 0.2;

    /// Substrings of a serialized response that mark it as cut short
    std::vector<std::string> truncation_markers{"truncated", "more_available", "has_more",
                                                "continuation_token", "next_page", "partial",
                                                "limited", "excerpt"};

    /// Object fields that usually hold a list of records
    std::vector<std::string> collection_fields{"items",   "results", "data",      "records",
                                               "entries", "rows",    "list",      "nodes",
                                               "hits",    "documents", "objects", "values"};

    int typical_page_size = 10;
    int large_page_size = 1000;

    std::size_t hex_run_min_length = 32;
    std::size_t opaque_token_min_length = 20;

    bool is_size_param(const std::string& name) const;
    bool is_page_param(const std::string& name) const;
    bool is_offset_param(const std::string& name) const;
    /// Any of size, page, offset or cursor
    bool is_pagination_param(const std::string& name) const;
    bool is_filter_param(const std::string& name) const;
    bool is_collection_field(const std::string& name) const;
    bool is_format_control_param(const std::string& name) const;
    bool is_low_value_field(const std::string& name) const;
    /// Case-insensitive substring match against detail_indicators
    bool mentions_detail(const std::string& text) const;

    /// Defaults overridden by any lists/numbers present in j
    static Heuristics from_json(const Json& j);
    Json to_json() const;
};

} // namespace mcpdoctor::analysis
