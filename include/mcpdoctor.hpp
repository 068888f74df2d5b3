#pragma once

/// @file mcpdoctor.hpp
/// @brief Main header for mcpdoctor - includes the commonly used components
///
/// Usage:
/// @code
/// #include <mcpdoctor.hpp>
///
/// int main() {
///     mcpdoctor::client::ProtocolClient client("npx -y @acme/mcp-server");
///     mcpdoctor::analysis::Harness harness(client, {});
///     auto report = harness.run();
///     std::cout << report.to_json().dump(2) << "\n";
/// }
/// @endcode

// Core types and exceptions
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/settings.hpp"
#include "mcpdoctor/types.hpp"
#include "mcpdoctor/version.hpp"

// Client
#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/client/target.hpp"
#include "mcpdoctor/client/transports.hpp"
#include "mcpdoctor/client/types.hpp"

// Launcher
#include "mcpdoctor/launcher/environment.hpp"
#include "mcpdoctor/launcher/launcher.hpp"

// Analysis
#include "mcpdoctor/analysis/corrector.hpp"
#include "mcpdoctor/analysis/harness.hpp"
#include "mcpdoctor/analysis/heuristics.hpp"
#include "mcpdoctor/analysis/metrics.hpp"
#include "mcpdoctor/analysis/synthesizer.hpp"

// Cache
#include "mcpdoctor/cache/tool_call_cache.hpp"
