// Capture backend going through the X server (or XWayland) with Xlib.

#pragma once

#include <memory>
#include <string>

#include "capture_backend.h"
#include "unix_system.h"

namespace snapmcp {

// Creates an Xlib capture backend. RandR monitors are reported as outputs
// and EWMH client windows as windows. The display connection is opened on
// first use (`display_name` empty means $DISPLAY); failure to connect is
// reported per request as CaptureErrc::display_unavailable.
std::unique_ptr<WindowCaptureBackend> open_x11_capture(
    std::shared_ptr<UnixSystem>, std::string const& display_name = {}
);

}  // namespace snapmcp
