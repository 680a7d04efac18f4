#include "image_buffer.h"

#include <drm.h>
#include <drm_fourcc.h>

#include <algorithm>
#include <cstring>

#include <fmt/core.h>

#include "capture_error.h"

namespace snapmcp {

BufferObjectRefs::BufferObjectRefs(std::shared_ptr<FileDescriptor> drm_fd)
    : fd(std::move(drm_fd)) {}

BufferObjectRefs::~BufferObjectRefs() noexcept {
    for (auto const handle : handles) {
        drm_gem_close cdat = {.handle = handle, .pad = 0};
        (void) fd->ioc<DRM_IOCTL_GEM_CLOSE>(cdat);
    }
}

void BufferObjectRefs::adopt(uint32_t handle) {
    if (!handle) return;
    if (std::find(handles.begin(), handles.end(), handle) != handles.end())
        return;
    handles.push_back(handle);
}

bool FramebufferHandle::is_linear() const {
    // "Invalid" means no explicit modifier, i.e. the legacy implicit layout,
    // which scanout engines treat as linear.
    return modifier == DRM_FORMAT_MOD_LINEAR ||
        modifier == DRM_FORMAT_MOD_INVALID;
}

DecodedImage crop_image(DecodedImage const& image, Region const& region) {
    CHECK_CAPTURE(
        region.fits_within(image.size.as<int64_t>()), CaptureErrc::bounds,
        "Region {}x{}+{}+{} is outside the {}x{} image",
        region.size.x, region.size.y, region.origin.x, region.origin.y,
        image.size.x, image.size.y
    );

    DecodedImage out;
    out.size = region.size.as<int>();
    out.rgba.resize(size_t(out.size.x) * out.size.y * 4);
    size_t const from_stride = size_t(image.size.x) * 4;
    size_t const to_stride = size_t(out.size.x) * 4;
    for (int y = 0; y < out.size.y; ++y) {
        auto const* from = image.rgba.data() +
            (region.origin.y + y) * from_stride + region.origin.x * 4;
        memcpy(out.rgba.data() + y * to_stride, from, to_stride);
    }
    return out;
}

std::string debug_size(size_t s) {
    if (s < 1000) return fmt::format("{}B", s);
    if (s < 10240) return fmt::format("{:.1f}K", s / 1024.0);
    if (s < 1024000) return fmt::format("{}K", s / 1024);
    if (s < 10485760) return fmt::format("{:.1f}M", s / 1048576.0);
    if (s < 1048576000) return fmt::format("{}M", s / 1048576);
    return fmt::format("{:.1f}G", s / 1073741824.0);
}

std::string debug_fourcc(uint32_t fourcc) {
    if (!fourcc) return "????";
    std::string out;
    for (int i = 0; i < 4; ++i) {
        int const ch = (fourcc >> (i * 8)) & 0xFF;
        if (ch > 32) out.append(1, ch);
        if (ch > 0 && ch < 32) out.append(fmt::format("{}", ch));
    }
    return out;
}

std::string debug_modifier(uint64_t modifier) {
    if (modifier == DRM_FORMAT_MOD_LINEAR) return "linear";
    if (modifier == DRM_FORMAT_MOD_INVALID) return "implicit";

    std::string out;
    auto const vendor = modifier >> 56;
    switch (vendor) {
#define V(x, y) case DRM_FORMAT_MOD_VENDOR_##x: out += y; break
        V(NONE, "NONE");
        V(INTEL, "INTL");
        V(AMD, "AMD");
        V(NVIDIA, "NVID");
        V(SAMSUNG, "SAMS");
        V(QCOM, "QCOM");
        V(VIVANTE, "VIVA");
        V(BROADCOM, "BCOM");
        V(ARM, "ARM");
        V(ALLWINNER, "ALLW");
        V(AMLOGIC, "AML");
#undef V
        default: out += fmt::format("{}", vendor);
    }
    out += fmt::format(":{:x}", modifier & ((1ull << 56) - 1));
    return out;
}

std::string debug(FramebufferHandle const& fb) {
    std::string out = fmt::format(
        "fb{} {}x{} {} {}",
        fb.fb_id, fb.size.x, fb.size.y,
        debug_fourcc(fb.fourcc), debug_modifier(fb.modifier)
    );

    for (size_t p = 0; p < fb.planes.size(); ++p) {
        auto const& plane = fb.planes[p];
        out += (p ? "|" : " ");
        out += fmt::format("h{}", plane.handle);
        if (plane.offset) out += fmt::format("@{}", debug_size(plane.offset));
        out += fmt::format("/{}", debug_size(plane.stride));
    }
    return out;
}

std::string debug(DecodedImage const& image) {
    return fmt::format(
        "{}x{} RGBA ({})", image.size.x, image.size.y,
        debug_size(image.rgba.size())
    );
}

}  // namespace snapmcp
