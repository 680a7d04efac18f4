// Simple command line tool to take one screenshot and save it as PNG.

#include <optional>
#include <vector>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <fmt/core.h>

#include "backend_selector.h"
#include "image_encoder.h"
#include "logging_policy.h"

namespace snapmcp {

// Main program, parses flags and captures a monitor, region or window.
extern "C" int main(int const argc, char const* const* const argv) {
    std::string log_arg;
    std::optional<std::string> backend_arg;
    std::optional<uint32_t> monitor_arg;
    std::optional<uint32_t> window_arg;
    std::vector<int64_t> region_arg;
    std::string out_arg = "screenshot.png";
    bool list_arg = false;

    CLI::App app("Capture the screen to a PNG file");
    app.add_option("--log", log_arg, "Log levels (default from $SNAPMCP_LOG)");
    app.add_option("--backend", backend_arg, "Force backend (kms or xcap)");
    app.add_option("--monitor", monitor_arg, "Monitor id (default primary)");
    app.add_option("--region", region_arg, "Region as X Y WIDTH HEIGHT")
        ->expected(4);
    app.add_option("--window", window_arg, "Window id (display backend)")
        ->excludes("--region");
    app.add_option("--out", out_arg, "PNG file to write");
    app.add_flag("--list", list_arg, "List monitors (and windows) only");
    CLI11_PARSE(app, argc, argv);

    try {
        configure_logging(log_arg);
        auto const logger = make_logger("snapmcp_grab");
        auto const backend = start_backend(global_system(), backend_arg);

        if (list_arg) {
            for (auto const& output : backend.capture->list_outputs())
                fmt::print("Monitor {}\n", debug(output));
            if (backend.windows) {
                for (auto const& window : backend.windows->list_windows())
                    fmt::print("Window {}\n", debug(window));
            }
            return 0;
        }

        DecodedImage image;
        if (window_arg) {
            CHECK_ARG(backend.windows, "No window capture with this backend");
            image = backend.windows->capture_window(*window_arg);
        } else if (!region_arg.empty()) {
            Region const region = {
                {region_arg[0], region_arg[1]}, {region_arg[2], region_arg[3]}
            };
            image = backend.capture->capture_region(monitor_arg, region);
        } else {
            image = backend.capture->capture_output(monitor_arg);
        }

        logger->info("Captured {}", debug(image));
        save_file(out_arg, encode_png(image));
        fmt::print("Saved: {}\n", out_arg);
    } catch (std::exception const& e) {
        fmt::print("*** {}\n", e.what());
        return 1;
    }

    return 0;
}

}  // namespace snapmcp
