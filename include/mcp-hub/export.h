#ifndef MCP_HUB_EXPORT_H
#define MCP_HUB_EXPORT_H

#ifdef _WIN32
#ifdef mcp_hub_core_EXPORTS
#define MCP_HUB_API __declspec(dllexport)
#else
#define MCP_HUB_API __declspec(dllimport)
#endif
#else
#define MCP_HUB_API
#endif

#endif // MCP_HUB_EXPORT_H
