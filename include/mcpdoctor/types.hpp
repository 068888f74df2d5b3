#pragma once
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace mcpdoctor
{

using Json = nlohmann::json;

/// Wall-clock measurements are reported in fractional seconds.
using Seconds = std::chrono::duration<double>;

} // namespace mcpdoctor
