#include "tool_registry.h"

#include <stdexcept>

namespace snapmcp {

namespace {

constexpr ToolSpec take_screenshot = {
    "take_screenshot",
    "Take a screenshot of a monitor (the primary monitor if monitor_id is "
    "omitted). Returns the image as PNG and optionally saves it to a file.",
    R"({
        "type": "object",
        "properties": {
            "monitor_id": {
                "type": "integer", "minimum": 0, "maximum": 4294967295,
                "description": "Monitor id from list_monitors"
            },
            "save_path": {
                "type": "string",
                "description": "File path to also save the PNG to"
            }
        }
    })"
};

constexpr ToolSpec take_screenshot_region = {
    "take_screenshot_region",
    "Take a screenshot of a rectangle on a monitor. Coordinates are relative "
    "to the monitor's top left corner and the rectangle must lie entirely "
    "inside the monitor.",
    R"({
        "type": "object",
        "properties": {
            "x": {
                "type": "integer", "minimum": -2147483648,
                "maximum": 2147483647, "description": "Left edge"
            },
            "y": {
                "type": "integer", "minimum": -2147483648,
                "maximum": 2147483647, "description": "Top edge"
            },
            "width": {
                "type": "integer", "minimum": 0, "maximum": 4294967295,
                "description": "Width in pixels"
            },
            "height": {
                "type": "integer", "minimum": 0, "maximum": 4294967295,
                "description": "Height in pixels"
            },
            "monitor_id": {
                "type": "integer", "minimum": 0, "maximum": 4294967295,
                "description": "Monitor id from list_monitors"
            },
            "save_path": {
                "type": "string",
                "description": "File path to also save the PNG to"
            }
        },
        "required": ["x", "y", "width", "height"]
    })"
};

constexpr ToolSpec take_screenshot_window = {
    "take_screenshot_window",
    "Take a screenshot of one window (which must not be minimized).",
    R"({
        "type": "object",
        "properties": {
            "window_id": {
                "type": "integer", "minimum": 0, "maximum": 4294967295,
                "description": "Window id from list_windows"
            },
            "save_path": {
                "type": "string",
                "description": "File path to also save the PNG to"
            }
        },
        "required": ["window_id"]
    })"
};

constexpr ToolSpec list_windows = {
    "list_windows",
    "List top-level windows with their ids, titles, applications, "
    "geometry and state.",
    R"({"type": "object", "properties": {}})"
};

constexpr ToolSpec list_monitors = {
    "list_monitors",
    "List monitors with their ids, names, positions and sizes.",
    R"({"type": "object", "properties": {}})"
};

}  // anonymous namespace

std::vector<ToolSpec> const& tools_for(BackendVariant variant) {
    static std::vector<ToolSpec> const kms_tools = {
        take_screenshot, take_screenshot_region, list_monitors,
    };
    static std::vector<ToolSpec> const display_tools = {
        take_screenshot, take_screenshot_region, take_screenshot_window,
        list_windows, list_monitors,
    };

    switch (variant) {
        case BackendVariant::kms: return kms_tools;
        case BackendVariant::display: return display_tools;
    }
    throw std::invalid_argument("Bad backend variant");
}

ToolSpec const* find_tool(BackendVariant variant, std::string_view name) {
    for (auto const& tool : tools_for(variant)) {
        if (tool.name == name) return &tool;
    }
    return nullptr;
}

}  // namespace snapmcp
