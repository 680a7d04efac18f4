// Simple command line tool to print DRM devices, active outputs and the
// framebuffers they scan out (and whether this process could read them).

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <fmt/core.h>

#include "backend_selector.h"
#include "drm_resources.h"
#include "logging_policy.h"
#include "pixel_decoder.h"

namespace snapmcp {

// Main program, parses flags and scans outputs.
extern "C" int main(int const argc, char const* const* const argv) {
    std::string dev_arg;
    std::string log_arg;

    CLI::App app("Print DRM devices, active outputs and scanout framebuffers");
    app.add_option("--dev", dev_arg, "DRM device to scan (default all)");
    app.add_option("--log", log_arg, "Log levels (default from $SNAPMCP_LOG)");
    CLI11_PARSE(app, argc, argv);

    configure_logging(log_arg);
    auto const logger = make_logger("snapmcp_scan_outputs");

    try {
        std::shared_ptr sys = global_system();
        auto const signals = read_selector_signals(*sys);
        fmt::print(
            "Display server: {}, active DRM output: {} -> backend \"{}\"\n\n",
            signals.display_server ? "yes" : "no",
            signals.active_drm_output ? "yes" : "no",
            variant_name(select_backend(signals))
        );

        for (auto const& listing : list_drm_devices(*sys)) {
            auto const text = debug(listing);
            if (text.find(dev_arg) == std::string::npos) continue;
            fmt::print("=== {}\n", text);

            std::shared_ptr<FileDescriptor> const fd = sys->open(
                listing.dev_file, O_RDWR | O_CLOEXEC
            ).ex(listing.dev_file);
            for (auto const& output : scan_active_outputs(*fd)) {
                fmt::print("Output {}\n", debug(output));
                try {
                    auto const fb = resolve_framebuffer(fd, output.fb_id);
                    bool const ok = decodable_bytes_per_pixel(fb.fourcc) > 0;
                    fmt::print(
                        "  {} [{}]\n", debug(fb), ok ? "readable" : "UNDECODABLE"
                    );
                } catch (std::system_error const& e) {
                    fmt::print("  *** {}\n", e.what());
                }
            }
            fmt::print("\n");
        }
    } catch (std::exception const& e) {
        logger->critical("{}", e.what());
        return 1;
    }

    return 0;
}

}  // namespace snapmcp
