// MCP screenshot server, over stdio or HTTP.

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <fmt/core.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "backend_selector.h"
#include "logging_policy.h"
#include "mcp_server.h"
#include "unix_system.h"

namespace snapmcp {

namespace {

std::shared_ptr<log::logger> const& server_logger() {
    static const auto logger = make_logger("server");
    return logger;
}

struct ServerContext {
    std::unique_ptr<McpServer> mcp;
    bool trust_network = false;
    int port = 31415;
};

// Newline-delimited JSON-RPC on stdin/stdout, one message at a time.
void serve_stdio(McpServer& mcp, std::istream& in, std::ostream& out) {
    auto const& logger = server_logger();
    logger->info("Serving MCP on stdio");

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        TRACE(logger, "IN {}", line);
        auto const reply = mcp.handle_text(line);
        if (!reply) continue;
        TRACE(logger, "OUT {}", *reply);
        out << *reply << '\n';
        out.flush();
    }

    logger->info("End of input");
}

// JSON-RPC over HTTP POST (one message or batch per request).
class HttpServer {
  public:
    void run(ServerContext&& context) {
        cx = std::move(context);

        http.Post("/mcp", [&](auto const& q, auto& s) {on_mcp(q, s);});
        http.set_logger([&](auto const& q, auto const& s) {log_hook(q, s);});
        http.set_exception_handler(
            [&](auto const& q, auto& s, auto const& e) {error_hook(q, s, e);}
        );

        if (cx.trust_network) {
            logger->info("Listening to WHOLE NETWORK on port {}", cx.port);
            http.listen("0.0.0.0", cx.port);
        } else {
            logger->info("Listening to localhost on port {}", cx.port);
            http.listen("localhost", cx.port);
        }
        logger->info("Stopped listening");
    }

  private:
    std::shared_ptr<log::logger> const logger = server_logger();
    ServerContext cx;
    httplib::Server http;

    void on_mcp(httplib::Request const& req, httplib::Response& res) {
        DEBUG(logger, "MCP request ({}b)", req.body.size());
        auto const reply = cx.mcp->handle_text(req.body);
        if (!reply) {
            res.status = 202;  // Accepted (notification)
            return;
        }
        res.set_content(*reply, "application/json");
    }

    void log_hook(httplib::Request const& req, httplib::Response const& res) {
        logger->info(
            "[{}] {} {} {}",
            res.status, req.remote_addr, req.method, req.path
        );
    }

    void error_hook(
        httplib::Request const& req, httplib::Response& res,
        std::exception_ptr const& ep
    ) {
        std::string what = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (std::exception const& e) {
            what = e.what();
        }
        logger->error("{} {}: {}", req.method, req.path, what);
        res.status = 500;
        nlohmann::json const j = {{"req", req.path}, {"error", what}};
        res.set_content(j.dump(), "application/json");
    }
};

}  // anonymous namespace

extern "C" int main(int const argc, char const* const* const argv) {
    std::string log_arg;
    std::optional<std::string> backend_arg;
    std::string transport_arg = "stdio";
    ServerContext server_cx;

    CLI::App app("Serve screenshot tools over the Model Context Protocol");
    app.add_option("--log", log_arg, "Log levels (default from $SNAPMCP_LOG)");
    app.add_option(
        "--backend", backend_arg,
        "Force capture backend (kms or xcap; default automatic)"
    );
    app.add_option(
        "--transport", transport_arg, "MCP transport (stdio or http)"
    )->check(CLI::IsMember({"stdio", "http"}));
    app.add_option("--port", server_cx.port, "TCP port for --transport=http");
    app.add_flag(
        "--trust_network", server_cx.trust_network,
        "Allow non-localhost connections"
    );
    CLI11_PARSE(app, argc, argv);
    configure_logging(log_arg);
    auto const logger = server_logger();

    try {
        logger->info("Starting MCP screenshot server");
        auto backend = start_backend(global_system(), backend_arg);
        server_cx.mcp = make_mcp_server(std::move(backend));

        if (transport_arg == "http") {
            HttpServer server;
            server.run(std::move(server_cx));
        } else {
            serve_stdio(*server_cx.mcp, std::cin, std::cout);
        }
    } catch (std::exception const& e) {
        logger->critical("{}", e.what());
        return 1;
    }

    return 0;
}

}  // namespace snapmcp
