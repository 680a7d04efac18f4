// Conversion of raw scanout pixel formats to packed RGBA.

#pragma once

#include <cstddef>
#include <cstdint>

#include "image_buffer.h"
#include "xy.h"

namespace snapmcp {

// Returns the bytes per pixel of a format decode_pixels() handles, or 0.
// Handled: XRGB8888, ARGB8888, XBGR8888, ABGR8888, RGB565 (DRM fourccs).
int decodable_bytes_per_pixel(uint32_t fourcc);

// Throws a CaptureErrc::pixel_format error if the format is not handled.
void check_decodable(uint32_t fourcc);

// Converts size.x * size.y pixels at `data` (`stride` bytes between rows)
// to RGBA. Row padding beyond size.x pixels is never read. Formats without
// alpha decode as opaque; RGB565 channels are widened by bit replication.
DecodedImage decode_pixels(
    uint8_t const* data, size_t length, ptrdiff_t stride,
    uint32_t fourcc, XY<int> size
);

}  // namespace snapmcp
