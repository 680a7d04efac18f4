// Choice of capture backend from the process environment.

#pragma once

#include <optional>
#include <string>

#include "capture_backend.h"
#include "unix_system.h"

namespace snapmcp {

// Everything the backend choice depends on.
struct SelectorSignals {
    std::optional<std::string> override;  // "kms" or "xcap" ("display"), if forced
    bool display_server = false;          // DISPLAY or WAYLAND_DISPLAY set
    bool active_drm_output = false;       // Some card has a lit connector
};

// Picks the backend variant (pure function of the signals):
// an explicit override wins; otherwise an active DRM output with no
// display server selects KMS, and anything else selects the display path.
// Unrecognized overrides throw CaptureErrc::configuration.
BackendVariant select_backend(SelectorSignals const&);

// Gathers the signals: the override from `flag_override` if given, else
// from $MCP_SCREENSHOT_BACKEND; DRM outputs from sysfs attributes only
// (device nodes are not opened).
SelectorSignals read_selector_signals(
    UnixSystem&, std::optional<std::string> flag_override = {}
);

// Selects, probes (for KMS) and opens the capture backend.
// Startup failures throw std::system_error with a CaptureErrc code.
ActiveBackend start_backend(
    std::shared_ptr<UnixSystem>, std::optional<std::string> flag_override = {}
);

}  // namespace snapmcp
