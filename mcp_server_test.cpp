#include "mcp_server.h"

#include <stdlib.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <doctest/doctest.h>

#include "capture_error.h"

namespace snapmcp {

using json = nlohmann::json;

namespace {

// Backend with fixed monitors and windows that records what it was asked.
class FakeBackend : public WindowCaptureBackend {
  public:
    std::vector<CaptureOutput> outputs = {
        {0, "HDMI-1", {0, 0}, {4, 3}, true},
        {1, "DP-1", {4, 0}, {2, 2}, false},
    };
    std::vector<CaptureWindow> windows = {
        {77, "Terminal", "xterm", {10, 20}, {3, 2}, 0, false, true},
    };
    std::error_code fail_with;  // Thrown from captures if set
    int calls = 0;

    virtual std::vector<CaptureOutput> list_outputs() final {
        ++calls;
        return outputs;
    }

    virtual DecodedImage capture_output(std::optional<uint32_t> id) final {
        ++calls;
        if (fail_with) throw std::system_error(fail_with, "Fake failure");
        return solid(find_output(outputs, id).size);
    }

    virtual std::vector<CaptureWindow> list_windows() final {
        ++calls;
        return windows;
    }

    virtual DecodedImage capture_window(uint32_t id) final {
        ++calls;
        if (fail_with) throw std::system_error(fail_with, "Fake failure");
        for (auto const& w : windows) if (w.id == id) return solid(w.size);
        throw_capture(CaptureErrc::not_found, "No such window");
    }

  private:
    static DecodedImage solid(XY<int> size) {
        DecodedImage image;
        image.size = size;
        image.rgba.assign(size_t(size.x) * size.y * 4, 0x80);
        return image;
    }
};

struct ServerFixture {
    std::shared_ptr<FakeBackend> fake = std::make_shared<FakeBackend>();

    std::unique_ptr<McpServer> server(BackendVariant variant) {
        ActiveBackend backend;
        backend.variant = variant;
        backend.capture = fake;
        if (variant == BackendVariant::display) backend.windows = fake;
        return make_mcp_server(backend);
    }

    static json request(std::string const& method, json params = nullptr) {
        json r = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}};
        if (!params.is_null()) r["params"] = std::move(params);
        return r;
    }

    static json call(std::string const& tool, json args = json::object()) {
        return request("tools/call", {{"name", tool}, {"arguments", args}});
    }

    static int error_code(std::optional<json> const& reply) {
        REQUIRE(reply);
        REQUIRE(reply->contains("error"));
        return (*reply)["error"]["code"].get<int>();
    }
};

}  // anonymous namespace

TEST_CASE_FIXTURE(ServerFixture, "MCP initialize and ping") {
    auto const mcp = server(BackendVariant::kms);
    auto const init = mcp->handle(request("initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test"}, {"version", "1"}}},
        {"capabilities", json::object()},
    }));
    REQUIRE(init);
    CHECK((*init)["jsonrpc"] == "2.0");
    CHECK((*init)["id"] == 1);
    auto const& result = (*init)["result"];
    CHECK(result["protocolVersion"] == "2024-11-05");
    CHECK(result["serverInfo"]["name"] == "snapmcp");
    CHECK(result["capabilities"].contains("tools"));
    CHECK(result["instructions"].get<std::string>().find("screenshots") !=
          std::string::npos);

    auto const ping = mcp->handle(request("ping"));
    REQUIRE(ping);
    CHECK((*ping)["result"] == json::object());

    json const note = {
        {"jsonrpc", "2.0"}, {"method", "notifications/initialized"}
    };
    CHECK(!mcp->handle(note));
    CHECK(fake->calls == 0);
}

TEST_CASE_FIXTURE(ServerFixture, "MCP protocol errors") {
    auto const mcp = server(BackendVariant::display);
    CHECK(error_code(mcp->handle(request("resources/list"))) ==
          rpc_error::method_not_found);
    CHECK(error_code(mcp->handle(json(42))) == rpc_error::invalid_request);
    CHECK(error_code(mcp->handle(json{{"jsonrpc", "2.0"}, {"id", 3}})) ==
          rpc_error::invalid_request);
    CHECK(error_code(mcp->handle(json::array())) == rpc_error::invalid_request);

    auto const text = mcp->handle_text("{\"jsonrpc\": \"2.0\", \"id\": ");
    REQUIRE(text);
    auto const parsed = json::parse(*text);
    CHECK(parsed["error"]["code"] == rpc_error::parse_error);
    CHECK(parsed["id"].is_null());

    // Unknown notifications and responses get no reply
    CHECK(!mcp->handle_text(R"({"jsonrpc": "2.0", "method": "foo"})"));
    CHECK(!mcp->handle_text(R"({"jsonrpc": "2.0", "id": 9, "result": {}})"));

    auto const ping = mcp->handle_text(
        R"({"jsonrpc": "2.0", "id": "abc", "method": "ping"})"
    );
    REQUIRE(ping);
    CHECK(json::parse(*ping)["id"] == "abc");
}

TEST_CASE_FIXTURE(ServerFixture, "MCP batches") {
    auto const mcp = server(BackendVariant::kms);
    json batch = json::array();
    batch.push_back(request("ping"));
    batch.push_back({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    batch.push_back(request("bogus"));
    batch[2]["id"] = 2;

    auto const reply = mcp->handle(batch);
    REQUIRE(reply);
    REQUIRE(reply->is_array());
    REQUIRE(reply->size() == 2);
    CHECK((*reply)[0]["id"] == 1);
    CHECK((*reply)[1]["error"]["code"] == rpc_error::method_not_found);

    json notes = json::array();
    notes.push_back({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK(!mcp->handle(notes));
}

TEST_CASE_FIXTURE(ServerFixture, "MCP tools/list per backend") {
    auto const names = [](std::optional<json> const& reply) {
        std::vector<std::string> out;
        for (auto const& tool : (*reply)["result"]["tools"]) {
            CHECK(tool["inputSchema"]["type"] == "object");
            CHECK(tool["description"].is_string());
            out.push_back(tool["name"].get<std::string>());
        }
        return out;
    };

    std::vector<std::string> const kms = {
        "take_screenshot", "take_screenshot_region", "list_monitors",
    };
    CHECK(names(server(BackendVariant::kms)->handle(request("tools/list"))) == kms);

    std::vector<std::string> const display = {
        "take_screenshot", "take_screenshot_region", "take_screenshot_window",
        "list_windows", "list_monitors",
    };
    CHECK(
        names(server(BackendVariant::display)->handle(request("tools/list"))) ==
        display
    );
}

TEST_CASE_FIXTURE(ServerFixture, "MCP window tools are absent under KMS") {
    auto const mcp = server(BackendVariant::kms);
    for (auto const* tool : {"take_screenshot_window", "list_windows", "nope"}) {
        CAPTURE(tool);
        auto const reply = mcp->handle(call(tool, {{"window_id", 77}}));
        CHECK(error_code(reply) == rpc_error::invalid_params);
        CHECK((*reply)["error"]["message"].get<std::string>().find(tool) !=
              std::string::npos);
    }
    CHECK(fake->calls == 0);
}

TEST_CASE_FIXTURE(ServerFixture, "MCP take_screenshot") {
    auto const mcp = server(BackendVariant::kms);
    auto const reply = mcp->handle(call("take_screenshot"));
    REQUIRE(reply);
    auto const& result = (*reply)["result"];
    CHECK(!result.contains("isError"));
    REQUIRE(result["content"].size() == 1);
    auto const& image = result["content"][0];
    CHECK(image["type"] == "image");
    CHECK(image["mimeType"] == "image/png");
    CHECK(image["data"].get<std::string>().substr(0, 11) == "iVBORw0KGgo");

    auto const other = mcp->handle(call("take_screenshot", {{"monitor_id", 1}}));
    REQUIRE(other);
    CHECK((*other)["result"]["content"][0]["type"] == "image");

    CHECK(error_code(mcp->handle(call("take_screenshot", {{"monitor_id", 5}}))) ==
          rpc_error::invalid_params);
    CHECK(error_code(mcp->handle(call("take_screenshot", {{"monitor_id", -1}}))) ==
          rpc_error::invalid_params);
    CHECK(error_code(mcp->handle(call("take_screenshot", {{"monitor_id", "0"}}))) ==
          rpc_error::invalid_params);
    CHECK(error_code(mcp->handle(call("take_screenshot", {{"save_path", 3}}))) ==
          rpc_error::invalid_params);
}

TEST_CASE_FIXTURE(ServerFixture, "MCP take_screenshot save_path") {
    char dir_template[] = "/tmp/snapmcp_test.XXXXXX";
    std::string const dir = mkdtemp(dir_template);
    std::string const path = dir + "/shot.png";

    auto const mcp = server(BackendVariant::display);
    auto const reply = mcp->handle(call("take_screenshot", {{"save_path", path}}));
    REQUIRE(reply);
    auto const& content = (*reply)["result"]["content"];
    REQUIRE(content.size() == 2);
    CHECK(content[0]["type"] == "image");
    CHECK(content[1]["type"] == "text");
    CHECK(content[1]["text"].get<std::string>().find(path) != std::string::npos);
    CHECK(access(path.c_str(), R_OK) == 0);

    unlink(path.c_str());
    rmdir(dir.c_str());
}

TEST_CASE_FIXTURE(ServerFixture, "MCP take_screenshot_region") {
    auto const mcp = server(BackendVariant::kms);
    auto const ok = mcp->handle(call("take_screenshot_region", {
        {"x", 1}, {"y", 1}, {"width", 2}, {"height", 2}
    }));
    REQUIRE(ok);
    CHECK((*ok)["result"]["content"][0]["type"] == "image");

    int const calls_before = fake->calls;
    for (json const args : {
        json{{"x", 3}, {"y", 0}, {"width", 2}, {"height", 2}},      // Partial
        json{{"x", 100}, {"y", 100}, {"width", 2}, {"height", 2}},  // Outside
        json{{"x", 0}, {"y", 0}, {"width", 0}, {"height", 2}},      // Empty
        json{{"x", -1}, {"y", 0}, {"width", 2}, {"height", 2}},     // Negative
        json{{"x", 0}, {"y", 0}, {"width", 2}, {"height", 2}, {"monitor_id", 1},
             {"save_path", nullptr}},
    }) {
        CAPTURE(args.dump());
        auto const reply = mcp->handle(call("take_screenshot_region", args));
        if (args.contains("monitor_id")) {
            REQUIRE(reply);
            CHECK((*reply)["result"]["content"][0]["type"] == "image");
        } else {
            CHECK(error_code(reply) == rpc_error::invalid_params);
        }
    }
    CHECK(fake->calls > calls_before);

    CHECK(error_code(mcp->handle(call("take_screenshot_region", {
        {"x", 0}, {"y", 0}, {"width", 2}
    }))) == rpc_error::invalid_params);
    CHECK(error_code(mcp->handle(call("take_screenshot_region", {
        {"x", 0.5}, {"y", 0}, {"width", 2}, {"height", 2}
    }))) == rpc_error::invalid_params);
}

TEST_CASE_FIXTURE(ServerFixture, "MCP capture failures") {
    auto const mcp = server(BackendVariant::kms);

    fake->fail_with = CaptureErrc::pixel_format;
    auto const reply = mcp->handle(call("take_screenshot"));
    REQUIRE(reply);
    CHECK(!reply->contains("error"));
    auto const& result = (*reply)["result"];
    CHECK(result["isError"] == true);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"].get<std::string>().find("Fake failure") !=
          std::string::npos);

    fake->fail_with = CaptureErrc::permission;
    CHECK((*mcp->handle(call("take_screenshot")))["result"]["isError"] == true);

    fake->fail_with = CaptureErrc::device_lost;
    CHECK((*mcp->handle(call("take_screenshot")))["result"]["isError"] == true);

    fake->fail_with = std::make_error_code(std::errc::io_error);
    CHECK(error_code(mcp->handle(call("take_screenshot"))) ==
          rpc_error::internal_error);

    // list_monitors doesn't capture, so still works
    auto const list = mcp->handle(call("list_monitors"));
    REQUIRE(list);
    CHECK(!(*list)["result"].contains("isError"));
}

TEST_CASE_FIXTURE(ServerFixture, "MCP listings") {
    auto const mcp = server(BackendVariant::display);

    auto const monitors = mcp->handle(call("list_monitors"));
    REQUIRE(monitors);
    auto const& monitor_text = (*monitors)["result"]["content"][0];
    CHECK(monitor_text["type"] == "text");
    auto const list = json::parse(monitor_text["text"].get<std::string>());
    REQUIRE(list.size() == 2);
    CHECK(list[0] == json{
        {"id", 0}, {"name", "HDMI-1"}, {"x", 0}, {"y", 0},
        {"width", 4}, {"height", 3}, {"is_primary", true},
    });
    CHECK(list[1]["is_primary"] == false);

    auto const windows = mcp->handle(call("list_windows"));
    REQUIRE(windows);
    auto const wlist = json::parse(
        (*windows)["result"]["content"][0]["text"].get<std::string>()
    );
    REQUIRE(wlist.size() == 1);
    CHECK(wlist[0]["id"] == 77);
    CHECK(wlist[0]["title"] == "Terminal");
    CHECK(wlist[0]["app_name"] == "xterm");
    CHECK(wlist[0]["monitor_id"] == 0);
    CHECK(wlist[0]["is_minimized"] == false);
    CHECK(wlist[0]["is_maximized"] == true);

    auto const shot = mcp->handle(call("take_screenshot_window", {{"window_id", 77}}));
    REQUIRE(shot);
    CHECK((*shot)["result"]["content"][0]["type"] == "image");

    CHECK(error_code(mcp->handle(call("take_screenshot_window", {{"window_id", 5}}))) ==
          rpc_error::invalid_params);
    CHECK(error_code(mcp->handle(call("take_screenshot_window"))) ==
          rpc_error::invalid_params);
}

TEST_CASE("MCP listings with invalid UTF-8") {
    CaptureWindow window;
    window.title = "bad \xFF title";
    json const j = window;
    CHECK(j["title"].get<std::string>() == "bad \xFF title");

    auto const fake = std::make_shared<FakeBackend>();
    fake->windows = {window};
    ActiveBackend backend{BackendVariant::display, fake, fake};
    auto const mcp = make_mcp_server(backend);
    auto const reply = mcp->handle_text(
        R"({"jsonrpc": "2.0", "id": 1, "method": "tools/call",)"
        R"( "params": {"name": "list_windows"}})"
    );
    REQUIRE(reply);
    CHECK(json::parse(*reply)["result"]["content"][0]["type"] == "text");
}

}  // namespace snapmcp
