#pragma once
/// @file analysis/metrics.hpp
/// @brief Structural measurements taken from one tools/call response.

#include "mcpdoctor/analysis/heuristics.hpp"
#include "mcpdoctor/types.hpp"

namespace mcpdoctor::analysis
{

/// The data a tools/call result actually carries: structuredContent when
/// present, otherwise the first text content block that parses as a JSON
/// object or array, otherwise the result itself.
Json response_view(const Json& result);

/// UUIDs, long hex runs (MD5/SHA-1 and longer) or long mixed letter+digit
/// tokens anywhere in the serialized payload.
bool has_verbose_identifiers(const Json& payload, const Heuristics& heuristics = {});

/// True when the response view is an array, or an object holding an array
/// under a record-like field name, or under a plural field name whose
/// elements are objects.
bool is_collection_shaped(const Json& payload, const Heuristics& heuristics = {});

/// Distinct low-value field names (timestamps, metadata, debug) make up more
/// than heuristics.low_value_ratio of all object fields in the response view.
bool has_low_value_data(const Json& payload, const Heuristics& heuristics = {});

/// The serialized response view mentions a truncation or continuation marker.
bool is_truncated(const Json& payload, const Heuristics& heuristics = {});

} // namespace mcpdoctor::analysis
