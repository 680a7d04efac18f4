// Model Context Protocol (JSON-RPC 2.0) handling for the screenshot tools.
// See modelcontextprotocol.io (protocol revision 2024-11-05).

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "capture_backend.h"

namespace snapmcp {

// JSON-RPC error codes used in replies.
namespace rpc_error {
int constexpr parse_error = -32700;
int constexpr invalid_request = -32600;
int constexpr method_not_found = -32601;
int constexpr invalid_params = -32602;
int constexpr internal_error = -32603;
}

// Answers MCP requests using a capture backend. Returned by make_mcp_server().
// *Internally synchronized* (if the backend is) for multithreaded access.
class McpServer {
  public:
    virtual ~McpServer() = default;

    // Handles one JSON-RPC message (or batch); returns the reply,
    // or {} if none is due (notifications, responses, empty batches).
    virtual std::optional<nlohmann::json> handle(nlohmann::json const&) = 0;

    // Handles one message as text (like a stdio line or HTTP body),
    // answering unparseable input with a parse error.
    virtual std::optional<std::string> handle_text(std::string const&) = 0;
};

// Creates a server offering the tools for the backend's variant.
std::unique_ptr<McpServer> make_mcp_server(ActiveBackend);

// JSON listings, as returned by list_monitors and list_windows.
void to_json(nlohmann::json&, CaptureOutput const&);
void to_json(nlohmann::json&, CaptureWindow const&);

}  // namespace snapmcp
