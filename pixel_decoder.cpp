#include "pixel_decoder.h"

#include <drm_fourcc.h>

#include "capture_error.h"
#include "logging_policy.h"

namespace snapmcp {

namespace {

// Converts one row of `width` pixels; `from` is in the DRM (little endian)
// byte order of the format, `to` receives width * 4 RGBA bytes.
void row_to_rgba(uint32_t format, int width, uint8_t const* from, uint8_t* to) {
    switch (format) {
        case DRM_FORMAT_XRGB8888:  // B G R x
            for (int x = 0; x < width; ++x) {
                to[0 + 4 * x] = from[2 + 4 * x];
                to[1 + 4 * x] = from[1 + 4 * x];
                to[2 + 4 * x] = from[0 + 4 * x];
                to[3 + 4 * x] = 0xFF;
            }
            break;

        case DRM_FORMAT_ARGB8888:  // B G R A
            for (int x = 0; x < width; ++x) {
                to[0 + 4 * x] = from[2 + 4 * x];
                to[1 + 4 * x] = from[1 + 4 * x];
                to[2 + 4 * x] = from[0 + 4 * x];
                to[3 + 4 * x] = from[3 + 4 * x];
            }
            break;

        case DRM_FORMAT_XBGR8888:  // R G B x
            for (int x = 0; x < width; ++x) {
                to[0 + 4 * x] = from[0 + 4 * x];
                to[1 + 4 * x] = from[1 + 4 * x];
                to[2 + 4 * x] = from[2 + 4 * x];
                to[3 + 4 * x] = 0xFF;
            }
            break;

        case DRM_FORMAT_ABGR8888:  // R G B A
            for (int x = 0; x < width; ++x) {
                to[0 + 4 * x] = from[0 + 4 * x];
                to[1 + 4 * x] = from[1 + 4 * x];
                to[2 + 4 * x] = from[2 + 4 * x];
                to[3 + 4 * x] = from[3 + 4 * x];
            }
            break;

        case DRM_FORMAT_RGB565:  // [g2:0 b4:0] [r4:0 g5:3]
            for (int x = 0; x < width; ++x) {
                uint16_t const px = from[2 * x] | (from[1 + 2 * x] << 8);
                uint8_t const r = (px >> 11) & 0x1F;
                uint8_t const g = (px >> 5) & 0x3F;
                uint8_t const b = px & 0x1F;
                to[0 + 4 * x] = (r << 3) | (r >> 2);
                to[1 + 4 * x] = (g << 2) | (g >> 4);
                to[2 + 4 * x] = (b << 3) | (b >> 2);
                to[3 + 4 * x] = 0xFF;
            }
            break;

        default:
            ASSERT(false && "Format not checked before decoding");
    }
}

}  // anonymous namespace

int decodable_bytes_per_pixel(uint32_t fourcc) {
    switch (fourcc) {
        case DRM_FORMAT_XRGB8888:
        case DRM_FORMAT_ARGB8888:
        case DRM_FORMAT_XBGR8888:
        case DRM_FORMAT_ABGR8888: return 4;
        case DRM_FORMAT_RGB565: return 2;
        default: return 0;
    }
}

void check_decodable(uint32_t fourcc) {
    CHECK_CAPTURE(
        decodable_bytes_per_pixel(fourcc) > 0, CaptureErrc::pixel_format,
        "Unsupported pixel format {} (supported: XR24 AR24 XB24 AB24 RG16)",
        debug_fourcc(fourcc)
    );
}

DecodedImage decode_pixels(
    uint8_t const* data, size_t length, ptrdiff_t stride,
    uint32_t fourcc, XY<int> size
) {
    check_decodable(fourcc);
    int const bpp = decodable_bytes_per_pixel(fourcc);
    CHECK_ARG(size.x > 0 && size.y > 0, "Bad image size {}x{}", size.x, size.y);
    CHECK_ARG(
        stride >= ptrdiff_t(size.x) * bpp,
        "Stride {} too small for {}px {}", stride, size.x, debug_fourcc(fourcc)
    );

    size_t const needed = stride * (size.y - 1) + size_t(size.x) * bpp;
    CHECK_ARG(
        length >= needed, "Buffer too small ({} < {}) for {}x{} {}/{}",
        debug_size(length), debug_size(needed),
        size.x, size.y, debug_fourcc(fourcc), stride
    );

    DecodedImage out;
    out.size = size;
    out.rgba.resize(size_t(size.x) * size.y * 4);
    for (int y = 0; y < size.y; ++y) {
        row_to_rgba(
            fourcc, size.x, data + y * stride,
            out.rgba.data() + size_t(y) * size.x * 4
        );
    }
    return out;
}

}  // namespace snapmcp
