#pragma once
#include <spdlog/spdlog.h>

#include <string>

namespace mcpdoctor::util::log
{

/// Map a level name (trace, debug, info, warn/warning, error, critical, off)
/// to spdlog's enum. Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

/// Install the process-wide "mcpdoctor" logger writing to stderr.
/// stdout stays free for results. Safe to call more than once.
void init(const std::string& level = "info");

} // namespace mcpdoctor::util::log
