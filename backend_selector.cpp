#include "backend_selector.h"

#include <fmt/core.h>

#include "capability_probe.h"
#include "capture_error.h"
#include "drm_resources.h"
#include "kms_capture.h"
#include "logging_policy.h"
#include "x11_capture.h"

namespace snapmcp {

namespace {

auto const& select_logger() {
    static const auto logger = make_logger("select");
    return logger;
}

// True if sysfs shows an enabled, connected connector for this card.
bool sysfs_active_output(UnixSystem& sys, std::string const& card) {
    auto const& logger = select_logger();
    std::string const class_dir = "/sys/class/drm";
    auto const listing = sys.ls(class_dir);
    if (listing.err) {
        DEBUG(logger, "Can't list {} (errno {})", class_dir, listing.err);
        return false;
    }

    for (auto const& entry : listing.value) {
        if (entry.substr(0, card.size() + 1) != card + "-") continue;
        auto const dir = fmt::format("{}/{}", class_dir, entry);
        auto const status = read_text_file(sys, dir + "/status");
        auto const enabled = read_text_file(sys, dir + "/enabled");
        TRACE(
            logger, "  {}: {} / {}", entry,
            status.err ? "?" : status.value, enabled.err ? "?" : enabled.value
        );
        if (status.err || enabled.err) continue;
        if (status.value == "connected" && enabled.value == "enabled")
            return true;
    }
    return false;
}

}  // anonymous namespace

BackendVariant select_backend(SelectorSignals const& signals) {
    if (signals.override) {
        if (*signals.override == "kms") return BackendVariant::kms;
        if (*signals.override == "xcap" || *signals.override == "display")
            return BackendVariant::display;
        throw_capture(
            CaptureErrc::configuration,
            fmt::format(
                "Bad backend override \"{}\" (expected \"kms\" or \"xcap\")",
                *signals.override
            )
        );
    }

    if (signals.active_drm_output && !signals.display_server)
        return BackendVariant::kms;
    return BackendVariant::display;
}

SelectorSignals read_selector_signals(
    UnixSystem& sys, std::optional<std::string> flag_override
) {
    auto const& logger = select_logger();
    SelectorSignals signals;
    signals.override = flag_override
        ? flag_override : sys.getenv("MCP_SCREENSHOT_BACKEND");
    signals.display_server =
        sys.getenv("DISPLAY").has_value() ||
        sys.getenv("WAYLAND_DISPLAY").has_value();

    for (auto const& node : list_card_nodes(sys)) {
        auto const card = node.substr(node.rfind('/') + 1);
        if (sysfs_active_output(sys, card)) {
            signals.active_drm_output = true;
            break;
        }
    }

    DEBUG(
        logger, "Signals: override={} display_server={} active_drm_output={}",
        signals.override.value_or("(none)"), signals.display_server,
        signals.active_drm_output
    );
    return signals;
}

ActiveBackend start_backend(
    std::shared_ptr<UnixSystem> sys, std::optional<std::string> flag_override
) {
    auto const& logger = select_logger();
    auto const signals = read_selector_signals(*sys, flag_override);

    ActiveBackend active;
    active.variant = select_backend(signals);
    logger->info(
        "Backend: {}{}", variant_name(active.variant),
        signals.override ? " (override)" : ""
    );

    switch (active.variant) {
        case BackendVariant::kms: {
            auto const probe = probe_kms_access(*sys);
            active.capture = open_kms_capture(sys, probe.dev_file);
            break;
        }
        case BackendVariant::display: {
            // Connects lazily; a missing display shows up on first use.
            std::shared_ptr<WindowCaptureBackend> x11 = open_x11_capture(sys);
            active.capture = x11;
            active.windows = x11;
            break;
        }
    }
    return active;
}

}  // namespace snapmcp
