#pragma once

namespace mcphub {

inline constexpr const char *SERVICE_NAME = "mcp-hub";
inline constexpr const char *VERSION = "1.0.0";

} // namespace mcphub
