#pragma once

namespace mcpdoctor
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

/// Name sent as clientInfo.name during the MCP handshake.
constexpr const char* CLIENT_NAME = "mcp-doctor";

} // namespace mcpdoctor
