#include "mcpdoctor/util/log.hpp"

#include "mcpdoctor/util/strings.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpdoctor::util::log
{

spdlog::level::level_enum parse_level(const std::string& name)
{
    auto lvl = to_lower(trim(name));
    if (lvl == "trace")
        return spdlog::level::trace;
    if (lvl == "debug")
        return spdlog::level::debug;
    if (lvl == "warn" || lvl == "warning")
        return spdlog::level::warn;
    if (lvl == "error")
        return spdlog::level::err;
    if (lvl == "critical")
        return spdlog::level::critical;
    if (lvl == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

void init(const std::string& level)
{
    auto logger = spdlog::get("mcpdoctor");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("mcpdoctor");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    logger->set_level(parse_level(level));
    spdlog::set_default_logger(logger);
}

} // namespace mcpdoctor::util::log
