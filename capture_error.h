// Error codes for screen capture failures, carried in std::system_error.

#pragma once

#include <string>
#include <system_error>

#include <fmt/core.h>

namespace snapmcp {

// Kinds of capture failure; the MCP layer maps each to a protocol response.
enum class CaptureErrc {
    configuration = 1,   // Bad backend override or other startup setting
    permission,          // Missing CAP_SYS_ADMIN / DRM master for KMS access
    no_hardware,         // No DRM/KMS device with an active output
    device_busy,         // Device node exists but is held exclusively
    device_lost,         // Device or driver went away mid-operation
    pixel_format,        // Framebuffer format the decoder does not handle
    tiling_unsupported,  // Framebuffer uses a non-linear (tiled) modifier
    bounds,              // Requested region is not inside the output
    not_found,           // Unknown monitor or window id
    display_unavailable, // No display server reachable for Xlib capture
};

std::error_category const& capture_category();

inline std::error_code make_error_code(CaptureErrc e) {
    return {static_cast<int>(e), capture_category()};
}

// Throws std::system_error with a CaptureErrc code and message.
[[noreturn]] void throw_capture(CaptureErrc, std::string const& what);

// Rethrows a syscall failure, reclassifying errnos with capture meaning
// (EACCES/EPERM, ENODEV/ENXIO, EBUSY); others stay system_category errors.
[[noreturn]] void rethrow_classified(std::system_error const&);

// Returns the capture kind for an errno, or {} if it has none.
std::error_code classify_errno(int err);

#define CHECK_CAPTURE(f, errc, ...) \
    [&]{ if (!(f)) throw_capture(errc, fmt::format(__VA_ARGS__)); }()

}  // namespace snapmcp

namespace std {
template <> struct is_error_code_enum<snapmcp::CaptureErrc> : true_type {};
}  // namespace std
