#include "framebuffer_reader.h"

#include <drm.h>
#include <linux/dma-buf.h>
#include <sys/mman.h>

#include <algorithm>
#include <cstring>

#include <fmt/core.h>

#include "capture_error.h"
#include "logging_policy.h"
#include "pixel_decoder.h"

namespace snapmcp {

namespace {

auto const& capture_logger() {
    static const auto logger = make_logger("capture");
    return logger;
}

// A read-only mapping of a buffer object, unmapped on delete.
// Mapped through an exported dma-buf where possible (bracketed with
// DMA_BUF_IOCTL_SYNC for cache coherency), else as a "dumb" buffer.
class ScopedMapping {
  public:
    ScopedMapping(
        UnixSystem& sys, FileDescriptor& drm_fd, uint32_t handle, size_t len
    ) : length(len) {
        auto const& logger = capture_logger();

        drm_prime_handle hdat = {};
        hdat.handle = handle;
        hdat.flags = DRM_CLOEXEC;
        auto const prime_ret = drm_fd.ioc<DRM_IOCTL_PRIME_HANDLE_TO_FD>(&hdat);
        if (!prime_ret.err) {
            dmabuf = sys.adopt(hdat.fd);
            auto map_ret = dmabuf->mmap(len, PROT_READ, MAP_SHARED, 0);
            if (!map_ret.err) {
                mem = std::move(map_ret.value);
                dma_buf_sync const sync = {DMA_BUF_SYNC_START | DMA_BUF_SYNC_READ};
                (void) dmabuf->ioc<DMA_BUF_IOCTL_SYNC>(sync);
                TRACE(logger, "Mapped h{} as dma-buf ({})", handle, debug_size(len));
                return;
            }
            if (!fallback_errno(map_ret.err)) check(map_ret, "Map dma-buf");
            DEBUG(logger, "dma-buf mmap failed (errno {}), trying dumb map", map_ret.err);
            dmabuf.reset();
        } else {
            if (!fallback_errno(prime_ret.err)) check(prime_ret, "PRIME export");
            DEBUG(logger, "PRIME export failed (errno {}), trying dumb map", prime_ret.err);
        }

        drm_mode_map_dumb mdat = {};
        mdat.handle = handle;
        check(drm_fd.ioc<DRM_IOCTL_MODE_MAP_DUMB>(&mdat), "Map dumb buffer");
        auto map_ret = drm_fd.mmap(len, PROT_READ, MAP_SHARED, mdat.offset);
        check(map_ret, "Memory map dumb buffer");
        mem = std::move(map_ret.value);
        TRACE(logger, "Mapped h{} as dumb buffer ({})", handle, debug_size(len));
    }

    ~ScopedMapping() noexcept {
        if (dmabuf && mem) {
            dma_buf_sync const sync = {DMA_BUF_SYNC_END | DMA_BUF_SYNC_READ};
            (void) dmabuf->ioc<DMA_BUF_IOCTL_SYNC>(sync);
        }
    }

    uint8_t const* data() const { return (uint8_t const*) mem.get(); }
    size_t size() const { return length; }

    ScopedMapping(ScopedMapping const&) = delete;
    ScopedMapping& operator=(ScopedMapping const&) = delete;

  private:
    std::unique_ptr<FileDescriptor> dmabuf;  // Destroyed after mem
    std::shared_ptr<void> mem;
    size_t length = 0;

    static bool fallback_errno(int err) {
        return err == ENOSYS || err == ENODEV || err == EOPNOTSUPP ||
            err == EINVAL;
    }

    template <typename T>
    static void check(ErrnoOr<T> const& ret, std::string_view what) {
        try {
            ret.check(what);
        } catch (std::system_error const& e) {
            rethrow_classified(e);
        }
    }
};

}  // anonymous namespace

size_t mapping_length(FramebufferHandle const& fb, size_t plane) {
    ASSERT(plane < fb.planes.size());
    size_t length = 0;
    for (auto const& p : fb.planes) {
        if (p.handle != fb.planes[plane].handle) continue;
        length = std::max(length, p.offset + size_t(p.stride) * fb.size.y);
    }
    return length;
}

DecodedImage read_framebuffer(
    UnixSystem& sys, FileDescriptor& drm_fd,
    FramebufferHandle const& fb, Region const& scanout
) {
    auto const& logger = capture_logger();
    CHECK_CAPTURE(
        fb.is_linear(), CaptureErrc::tiling_unsupported,
        "fb{} uses a tiled/compressed layout ({}); only linear framebuffers "
        "can be read", fb.fb_id, debug_modifier(fb.modifier)
    );
    check_decodable(fb.fourcc);
    CHECK_CAPTURE(
        !fb.planes.empty() && fb.planes[0].handle, CaptureErrc::permission,
        "No buffer handle for fb{} (needs CAP_SYS_ADMIN)", fb.fb_id
    );

    // The CRTC viewport may not cover the whole framebuffer (or may even
    // hang off its edge during a mode change); decode only the overlap.
    Region clip = scanout;
    clip.origin.x = std::clamp<int64_t>(clip.origin.x, 0, fb.size.x);
    clip.origin.y = std::clamp<int64_t>(clip.origin.y, 0, fb.size.y);
    clip.size.x = std::min<int64_t>(clip.size.x, fb.size.x - clip.origin.x);
    clip.size.y = std::min<int64_t>(clip.size.y, fb.size.y - clip.origin.y);
    CHECK_RUNTIME(
        clip.size.x > 0 && clip.size.y > 0,
        "Scanout {}x{}+{}+{} misses {}", scanout.size.x, scanout.size.y,
        scanout.origin.x, scanout.origin.y, debug(fb)
    );

    auto const& plane = fb.planes[0];
    int const bpp = decodable_bytes_per_pixel(fb.fourcc);
    size_t const map_len = mapping_length(fb, 0);
    DEBUG(logger, "Reading {} ({})", debug(fb), debug_size(map_len));

    std::vector<uint8_t> bytes;
    {
        ScopedMapping const mapping{sys, drm_fd, plane.handle, map_len};
        size_t const start = plane.offset +
            clip.origin.y * plane.stride + clip.origin.x * bpp;
        ASSERT(start <= mapping.size());
        bytes.assign(mapping.data() + start, mapping.data() + mapping.size());
    }

    return decode_pixels(
        bytes.data(), bytes.size(), plane.stride, fb.fourcc,
        clip.size.as<int>()
    );
}

}  // namespace snapmcp
