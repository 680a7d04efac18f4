// Copies scanout framebuffers out of device memory.

#pragma once

#include <cstddef>

#include "image_buffer.h"
#include "unix_system.h"
#include "xy.h"

namespace snapmcp {

// Returns how many bytes of a plane's buffer object must be mapped to reach
// every plane stored in it (the furthest offset + stride * height).
size_t mapping_length(FramebufferHandle const&, size_t plane);

// Reads the `scanout` rectangle (clipped to the framebuffer) and decodes it.
// The device memory is mapped read-only only for the duration of the copy.
// Non-linear framebuffers fail with CaptureErrc::tiling_unsupported before
// any ioctl or mapping is attempted; undecodable formats fail with
// CaptureErrc::pixel_format, also before mapping.
DecodedImage read_framebuffer(
    UnixSystem& sys, FileDescriptor& drm_fd,
    FramebufferHandle const& fb, Region const& scanout
);

}  // namespace snapmcp
