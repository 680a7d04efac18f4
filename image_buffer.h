// Data structures for scanout framebuffers and decoded images.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "unix_system.h"
#include "xy.h"

namespace snapmcp {

// Holds references to DRM buffer objects ("GEM handles") returned by
// GET_FB / GET_FB2, closing them with DRM_IOCTL_GEM_CLOSE on delete.
class BufferObjectRefs {
  public:
    explicit BufferObjectRefs(std::shared_ptr<FileDescriptor> drm_fd);
    ~BufferObjectRefs() noexcept;
    void adopt(uint32_t handle);  // Zero and repeated handles are ignored.
    size_t count() const { return handles.size(); }

    BufferObjectRefs(BufferObjectRefs const&) = delete;
    BufferObjectRefs& operator=(BufferObjectRefs const&) = delete;

  private:
    std::shared_ptr<FileDescriptor> fd;
    std::vector<uint32_t> handles;
};

// Description of the framebuffer a CRTC is scanning out.
// Resolved fresh for every capture, since page flips change it.
//
// Format is described with DRM FourCC codes (little endian, drm_fourcc.h)
// and format "modifiers" as defined by the Linux kernel:
// kernel.org/doc/html/latest/gpu/drm-kms.html#format-modifiers
struct FramebufferHandle {
    // Multi-planar formats use several planes, which may share a buffer.
    struct Plane {
        uint32_t handle = 0;  // DRM buffer object (GEM) handle
        uint32_t offset = 0;  // Start offset within buffer
        uint32_t stride = 0;  // Offset between scanlines
    };

    uint32_t fb_id = 0;
    uint32_t fourcc = 0;    // Zero if the legacy query gave an unknown depth
    uint64_t modifier = 0;  // DRM_FORMAT_MOD_INVALID if not reported
    XY<int> size;
    std::vector<Plane> planes;
    std::unique_ptr<BufferObjectRefs> refs;  // Owns the plane handles

    bool is_linear() const;
};

// Tightly packed 8-bit RGBA pixels (row length is exactly size.x * 4).
// The only image representation handed out by capture backends.
struct DecodedImage {
    XY<int> size;
    std::vector<uint8_t> rgba;
};

// Assembles a fourcc uint32_t from text (like "XR24").
constexpr uint32_t fourcc(char const c[4]) {
    return c[0] | (c[1] << 8) | (c[2] << 16) | (uint32_t(c[3]) << 24);
}

// Returns a copy of part of an image; the region must fit inside it.
DecodedImage crop_image(DecodedImage const&, Region const&);

// Debugging descriptions of values and structures.
std::string debug_fourcc(uint32_t);
std::string debug_modifier(uint64_t);
std::string debug_size(size_t);
std::string debug(FramebufferHandle const&);
std::string debug(DecodedImage const&);

}  // namespace snapmcp
