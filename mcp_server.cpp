#include "mcp_server.h"

#include <cstdint>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "capture_error.h"
#include "image_encoder.h"
#include "logging_policy.h"
#include "tool_registry.h"

namespace snapmcp {

using json = nlohmann::json;

void to_json(json& j, CaptureOutput const& output) {
    j = {
        {"id", output.id},
        {"name", output.name},
        {"x", output.position.x},
        {"y", output.position.y},
        {"width", output.size.x},
        {"height", output.size.y},
        {"is_primary", output.is_primary},
    };
}

void to_json(json& j, CaptureWindow const& window) {
    j = {
        {"id", window.id},
        {"title", window.title},
        {"app_name", window.app_name},
        {"x", window.position.x},
        {"y", window.position.y},
        {"width", window.size.x},
        {"height", window.size.y},
        {"monitor_id", window.output_id},
        {"is_minimized", window.is_minimized},
        {"is_maximized", window.is_maximized},
    };
}

namespace {

auto const& mcp_logger() {
    static const auto logger = make_logger("mcp");
    return logger;
}

char const* const protocol_version = "2024-11-05";
char const* const server_name = "snapmcp";
char const* const server_version = "0.1.0";

// A failure to be answered as a JSON-RPC error.
class RpcError : public std::runtime_error {
  public:
    RpcError(int code, std::string const& what)
        : std::runtime_error(what), code(code) {}
    int const code;
};

// Window titles may hold invalid UTF-8; never let that fail a reply.
std::string dump(json const& j, int indent = -1) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json error_reply(json const& id, int code, std::string const& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

//
// Tool argument parsing
//

json const* find_arg(json const& args, char const* key) {
    auto const it = args.find(key);
    return (it == args.end() || it->is_null()) ? nullptr : &*it;
}

int64_t integer_arg(json const& value, char const* key, int64_t min, int64_t max) {
    std::optional<int64_t> v;
    if (value.is_number_unsigned()) {
        auto const u = value.get<uint64_t>();
        if (u <= uint64_t(INT64_MAX)) v = int64_t(u);
    } else if (value.is_number_integer()) {
        v = value.get<int64_t>();
    }
    CHECK_ARG(
        v && *v >= min && *v <= max,
        "\"{}\" must be an integer from {} to {}", key, min, max
    );
    return *v;
}

std::optional<uint32_t> optional_u32(json const& args, char const* key) {
    auto const* value = find_arg(args, key);
    if (!value) return {};
    return integer_arg(*value, key, 0, UINT32_MAX);
}

int64_t required_integer(
    json const& args, char const* key, int64_t min, int64_t max
) {
    auto const* value = find_arg(args, key);
    CHECK_ARG(value, "Missing argument \"{}\"", key);
    return integer_arg(*value, key, min, max);
}

std::optional<std::string> optional_string(json const& args, char const* key) {
    auto const* value = find_arg(args, key);
    if (!value) return {};
    CHECK_ARG(value->is_string(), "\"{}\" must be a string", key);
    return value->get<std::string>();
}

//
// Tool results
//

json text_result(std::string const& text, bool is_error = false) {
    json result = {{"content", json::array({
        json{{"type", "text"}, {"text", text}}
    })}};
    if (is_error) result["isError"] = true;
    return result;
}

json image_result(
    DecodedImage const& image, std::optional<std::string> const& save_path
) {
    auto const png = encode_png(image);
    if (save_path) save_file(*save_path, png);

    json content = json::array();
    content.push_back(json{
        {"type", "image"},
        {"mimeType", "image/png"},
        {"data", encode_base64(png)},
    });
    if (save_path) {
        auto const text = fmt::format("Screenshot saved to {}", *save_path);
        content.push_back(json{{"type", "text"}, {"text", text}});
    }
    return {{"content", std::move(content)}};
}

class McpServerDef : public McpServer {
  public:
    McpServerDef(ActiveBackend backend) : backend(std::move(backend)) {}

    virtual std::optional<json> handle(json const& message) final {
        if (message.is_array()) {
            if (message.empty()) {
                return error_reply(
                    nullptr, rpc_error::invalid_request, "Empty batch"
                );
            }
            json replies = json::array();
            for (auto const& item : message) {
                auto reply = handle_one(item);
                if (reply) replies.push_back(std::move(*reply));
            }
            if (replies.empty()) return {};
            return replies;
        }
        return handle_one(message);
    }

    virtual std::optional<std::string> handle_text(
        std::string const& text
    ) final {
        json message;
        try {
            message = json::parse(text);
        } catch (json::parse_error const& e) {
            logger->warn("Unparseable message: {}", e.what());
            return dump(error_reply(
                nullptr, rpc_error::parse_error,
                fmt::format("Parse error: {}", e.what())
            ));
        }

        auto const reply = handle(message);
        if (!reply) return {};
        return dump(*reply);
    }

  private:
    std::shared_ptr<log::logger> const logger = mcp_logger();
    ActiveBackend const backend;

    std::optional<json> handle_one(json const& message) {
        if (!message.is_object()) {
            return error_reply(
                nullptr, rpc_error::invalid_request, "Message is not an object"
            );
        }

        bool const is_notification = !message.contains("id");
        json const id = is_notification ? json() : message["id"];
        auto const method = message.find("method");
        if (method == message.end()) {
            // A response to a request we never send; nothing to answer.
            if (message.contains("result") || message.contains("error"))
                return {};
            return error_reply(id, rpc_error::invalid_request, "No method");
        }

        try {
            CHECK_ARG(method->is_string(), "Method is not a string");
            auto const name = method->get<std::string>();
            json const params = message.value("params", json::object());
            DEBUG(logger, "<< {} {}", name, is_notification ? "(notify)" : dump(id));

            auto result = dispatch(name, params, is_notification);
            if (is_notification) return {};
            return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
        } catch (RpcError const& e) {
            DEBUG(logger, ">> error {}: {}", e.code, e.what());
            if (is_notification) return {};
            return error_reply(id, e.code, e.what());
        } catch (std::invalid_argument const& e) {
            DEBUG(logger, ">> invalid: {}", e.what());
            if (is_notification) return {};
            return error_reply(id, rpc_error::invalid_params, e.what());
        } catch (std::exception const& e) {
            logger->error("Internal error: {}", e.what());
            if (is_notification) return {};
            return error_reply(id, rpc_error::internal_error, e.what());
        }
    }

    json dispatch(std::string const& method, json const& params, bool notify) {
        if (method == "initialize") return on_initialize(params);
        if (method == "ping") return json::object();
        if (method == "tools/list") return on_tools_list();
        if (method == "tools/call") return on_tools_call(params);
        if (notify) {
            TRACE(logger, "Ignoring notification {}", method);
            return {};
        }
        throw RpcError(
            rpc_error::method_not_found, fmt::format("Unknown method: {}", method)
        );
    }

    json on_initialize(json const& params) {
        auto const client = params.value("clientInfo", json::object());
        logger->info(
            "Client: {} {} (protocol {})",
            client.value("name", "?"), client.value("version", "?"),
            params.value("protocolVersion", "?")
        );
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", server_name}, {"version", server_version}}},
            {"instructions",
             "MCP server for taking screenshots, listing windows and monitors."},
        };
    }

    json on_tools_list() {
        json tools = json::array();
        for (auto const& tool : tools_for(backend.variant)) {
            tools.push_back(json{
                {"name", std::string(tool.name)},
                {"description", std::string(tool.description)},
                {"inputSchema", json::parse(tool.input_schema)},
            });
        }
        return {{"tools", std::move(tools)}};
    }

    json on_tools_call(json const& params) {
        CHECK_ARG(params.is_object(), "Params are not an object");
        auto const name_it = params.find("name");
        CHECK_ARG(
            name_it != params.end() && name_it->is_string(),
            "Missing tool name"
        );
        auto const name = name_it->get<std::string>();
        auto const* tool = find_tool(backend.variant, name);
        if (!tool) {
            throw RpcError(
                rpc_error::invalid_params, fmt::format("Unknown tool: {}", name)
            );
        }

        auto args = params.value("arguments", json::object());
        if (args.is_null()) args = json::object();
        CHECK_ARG(args.is_object(), "Tool arguments are not an object");

        logger->info("Tool: {} {}", name, dump(args));
        try {
            return run_tool(tool->name, args);
        } catch (std::system_error const& e) {
            if (e.code().category() != capture_category()) throw;
            if (
                e.code() == CaptureErrc::bounds ||
                e.code() == CaptureErrc::not_found
            ) {
                throw RpcError(rpc_error::invalid_params, e.what());
            }
            logger->warn("{} failed: {}", name, e.what());
            return text_result(e.what(), true);
        }
    }

    json run_tool(std::string_view name, json const& args) {
        if (name == "take_screenshot") {
            auto const monitor = optional_u32(args, "monitor_id");
            auto const save_path = optional_string(args, "save_path");
            return image_result(
                backend.capture->capture_output(monitor), save_path
            );
        }

        if (name == "take_screenshot_region") {
            Region region;
            region.origin.x = required_integer(args, "x", INT32_MIN, INT32_MAX);
            region.origin.y = required_integer(args, "y", INT32_MIN, INT32_MAX);
            region.size.x = required_integer(args, "width", 0, UINT32_MAX);
            region.size.y = required_integer(args, "height", 0, UINT32_MAX);
            auto const monitor = optional_u32(args, "monitor_id");
            auto const save_path = optional_string(args, "save_path");
            return image_result(
                backend.capture->capture_region(monitor, region), save_path
            );
        }

        if (name == "take_screenshot_window") {
            ASSERT(backend.windows);
            auto const window = required_integer(args, "window_id", 0, UINT32_MAX);
            auto const save_path = optional_string(args, "save_path");
            return image_result(
                backend.windows->capture_window(window), save_path
            );
        }

        if (name == "list_windows") {
            ASSERT(backend.windows);
            json const list = backend.windows->list_windows();
            return text_result(dump(list, 2));
        }

        if (name == "list_monitors") {
            json const list = backend.capture->list_outputs();
            return text_result(dump(list, 2));
        }

        throw std::logic_error(fmt::format("Unhandled tool: {}", name));
    }
};

}  // anonymous namespace

std::unique_ptr<McpServer> make_mcp_server(ActiveBackend backend) {
    ASSERT(backend.capture);
    if (backend.variant == BackendVariant::display) ASSERT(backend.windows);
    return std::make_unique<McpServerDef>(std::move(backend));
}

}  // namespace snapmcp
