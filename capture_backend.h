// Interfaces to the screen capture backends.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "image_buffer.h"
#include "xy.h"

namespace snapmcp {

// The two capture backends; chosen once at startup by select_backend().
enum class BackendVariant {
    kms,      // Direct DRM/KMS framebuffer reads (no display server)
    display,  // Through the display server (Xlib), with window support
};

// One monitor/output. Returned by CaptureBackend::list_outputs().
struct CaptureOutput {
    uint32_t id = 0;    // Stable while topology is unchanged
    std::string name;   // Like "HDMI-A-1" or "DP-2"
    XY<int> position;   // Logical position
    XY<int> size;       // Pixel size
    bool is_primary = false;
};

// One top-level window. Returned by WindowCaptureBackend::list_windows().
struct CaptureWindow {
    uint32_t id = 0;
    std::string title;
    std::string app_name;
    XY<int> position;
    XY<int> size;
    uint32_t output_id = 0;  // Output the window lives on
    bool is_minimized = false;
    bool is_maximized = false;
};

// Interface to a capture backend.
// *Internally synchronized* for multithreaded access.
class CaptureBackend {
  public:
    virtual ~CaptureBackend() = default;

    // Returns currently active outputs (rescanned on every call).
    virtual std::vector<CaptureOutput> list_outputs() = 0;

    // Captures a whole output; no id means the primary output.
    virtual DecodedImage capture_output(std::optional<uint32_t> id) = 0;

    // Captures a rectangle given relative to the output's top left corner.
    // Fails with CaptureErrc::bounds unless it is nonempty and lies fully
    // inside the output. The default captures the output and crops.
    virtual DecodedImage capture_region(
        std::optional<uint32_t> id, Region const& region
    );
};

// A capture backend that also knows about windows.
class WindowCaptureBackend : public CaptureBackend {
  public:
    virtual std::vector<CaptureWindow> list_windows() = 0;
    virtual DecodedImage capture_window(uint32_t id) = 0;
};

// The backend chosen for this process.
// The window interface is only present for BackendVariant::display.
struct ActiveBackend {
    BackendVariant variant = BackendVariant::display;
    std::shared_ptr<CaptureBackend> capture;
    std::shared_ptr<WindowCaptureBackend> windows;
};

// Finds an output by id (or the primary), failing with
// CaptureErrc::not_found if there is no such output.
CaptureOutput const& find_output(
    std::vector<CaptureOutput> const&, std::optional<uint32_t> id
);

// Fails with CaptureErrc::bounds unless the region fits in the output.
void check_region(CaptureOutput const&, Region const&);

// Converts an output-relative region to desktop coordinates
// (offset by the output's position).
Region desktop_region(CaptureOutput const&, Region const&);

// Returns the id of the output containing a desktop point;
// if none does, the primary output (or 0 with no outputs at all).
uint32_t output_at(std::vector<CaptureOutput> const&, XY<int64_t> point);

// Debugging descriptions of values and structures.
std::string_view variant_name(BackendVariant);
std::string debug(CaptureOutput const&);
std::string debug(CaptureWindow const&);
std::string debug(Region const&);

}  // namespace snapmcp
