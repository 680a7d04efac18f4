// The MCP tools offered for each capture backend.

#pragma once

#include <string_view>
#include <vector>

#include "capture_backend.h"

namespace snapmcp {

// Description of one MCP tool, as advertised by "tools/list".
struct ToolSpec {
    std::string_view name;
    std::string_view description;
    std::string_view input_schema;  // JSON Schema text
};

// Returns the tools for a backend variant, in a fixed order.
// The KMS variant has no window tools (list_windows, take_screenshot_window).
std::vector<ToolSpec> const& tools_for(BackendVariant);

// Returns the named tool if the variant offers it, else nullptr.
ToolSpec const* find_tool(BackendVariant, std::string_view name);

}  // namespace snapmcp
