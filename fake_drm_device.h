// In-memory stand-in for DRM/KMS devices and the bits of the OS they need.
// Used by tests; answers the KMS ioctls from a scripted topology and
// records every ioctl and mapping made.

#pragma once

#include <drm.h>
#include <drm_fourcc.h>
#include <linux/dma-buf.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <algorithm>
#include <cstring>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "unix_system.h"
#include "xy.h"

namespace snapmcp {

struct FakeFramebuffer {
    uint32_t id = 0;
    uint32_t handle = 0;        // GEM handle
    uint32_t fourcc = DRM_FORMAT_XRGB8888;
    uint64_t modifier = DRM_FORMAT_MOD_LINEAR;
    bool report_modifier = true;
    uint32_t bpp = 32, depth = 24;  // Reported by legacy GET_FB
    XY<int> size;
    uint32_t stride = 0;
    std::vector<uint8_t> bytes;

    void put32(int x, int y, uint32_t v) {
        uint8_t* p = bytes.data() + y * stride + x * 4;
        for (int i = 0; i < 4; ++i) p[i] = (v >> (8 * i)) & 0xFF;
    }
};

struct FakeConnector {
    uint32_t id = 0;
    uint32_t type = DRM_MODE_CONNECTOR_HDMIA;
    uint32_t type_id = 1;
    bool connected = true;
    uint32_t encoder_id = 0;
};

struct FakeEncoder {
    uint32_t id = 0;
    uint32_t crtc_id = 0;
};

struct FakeCrtc {
    uint32_t id = 0;
    uint32_t fb_id = 0;
    XY<int> xy;         // Scanout offset within the framebuffer
    XY<int> mode_size;  // Zero for no mode
};

// One fake GPU: topology, behavior switches and a record of calls.
class FakeDrm {
  public:
    std::vector<FakeConnector> connectors;
    std::vector<FakeEncoder> encoders;
    std::vector<FakeCrtc> crtcs;
    std::vector<FakeFramebuffer> framebuffers;

    bool has_getfb2 = true;      // Else GET_FB2 fails with ENOTTY
    bool has_prime = true;       // Else PRIME export fails with ENOSYS
    bool privileged = true;      // Else GET_FB/GET_FB2 withhold handles
    int resources_errno = 0;     // Fails GETRESOURCES if set
    int prime_fd_base = 1000;    // Exported dma-buf "fds" are base + handle

    std::vector<uint32_t> ioctls;  // Every request, in order
    std::vector<uint32_t> closed_handles;
    int maps = 0, unmaps = 0;
    int sync_starts = 0, sync_ends = 0;

    int count(uint32_t nr) const {
        return std::count(ioctls.begin(), ioctls.end(), nr);
    }

    // Adds connector -> encoder -> CRTC -> framebuffer; returns the fb id.
    uint32_t add_output(
        XY<int> mode_size, uint32_t fourcc = DRM_FORMAT_XRGB8888,
        XY<int> fb_size = {}, XY<int> scanout_xy = {}, uint32_t padding = 0
    ) {
        uint32_t const n = connectors.size();
        FakeFramebuffer fb;
        fb.id = 100 + n;
        fb.handle = 1 + n;
        fb.fourcc = fourcc;
        fb.size = fb_size ? fb_size : mode_size;
        int const bpp = (fourcc == DRM_FORMAT_RGB565) ? 2 : 4;
        if (bpp == 2) fb.bpp = fb.depth = 16;
        fb.stride = fb.size.x * bpp + padding;
        fb.bytes.assign(size_t(fb.stride) * fb.size.y, 0);
        framebuffers.push_back(std::move(fb));

        crtcs.push_back({10 + n, 100 + n, scanout_xy, mode_size});
        encoders.push_back({20 + n, 10 + n});
        connectors.push_back({30 + n, DRM_MODE_CONNECTOR_HDMIA, 1 + n, true, 20 + n});
        return 100 + n;
    }

    FakeFramebuffer* fb_by_id(uint32_t id) {
        for (auto& fb : framebuffers) if (fb.id == id) return &fb;
        return nullptr;
    }

    FakeFramebuffer* fb_by_handle(uint32_t handle) {
        for (auto& fb : framebuffers) if (fb.handle == handle) return &fb;
        return nullptr;
    }

    ErrnoOr<std::shared_ptr<void>> map(uint32_t handle, size_t len) {
        auto* fb = fb_by_handle(handle);
        if (!fb || len > fb->bytes.size()) return {EINVAL, {}};
        ++maps;
        return {0, {fb->bytes.data(), [this](void*) { ++unmaps; }}};
    }

    ErrnoOr<int> drm_ioctl(uint32_t nr, void* data) {
        ioctls.push_back(nr);
        switch (nr) {
            case DRM_IOCTL_MODE_GETRESOURCES: {
                if (resources_errno) return {resources_errno, -1};
                auto* r = (drm_mode_card_res*) data;
                std::vector<uint32_t> crtc_ids, conn_ids;
                for (auto const& c : crtcs) crtc_ids.push_back(c.id);
                for (auto const& c : connectors) conn_ids.push_back(c.id);
                fill_ids(r->crtc_id_ptr, &r->count_crtcs, crtc_ids);
                fill_ids(r->connector_id_ptr, &r->count_connectors, conn_ids);
                r->count_fbs = r->count_encoders = 0;
                return {};
            }

            case DRM_IOCTL_MODE_GETCONNECTOR: {
                auto* c = (drm_mode_get_connector*) data;
                for (auto const& conn : connectors) {
                    if (conn.id != c->connector_id) continue;
                    c->connection = conn.connected ? 1 : 2;
                    c->encoder_id = conn.encoder_id;
                    c->connector_type = conn.type;
                    c->connector_type_id = conn.type_id;
                    c->count_modes = c->count_props = c->count_encoders = 0;
                    return {};
                }
                return {ENOENT, -1};
            }

            case DRM_IOCTL_MODE_GETENCODER: {
                auto* e = (drm_mode_get_encoder*) data;
                for (auto const& enc : encoders) {
                    if (enc.id != e->encoder_id) continue;
                    e->crtc_id = enc.crtc_id;
                    return {};
                }
                return {ENOENT, -1};
            }

            case DRM_IOCTL_MODE_GETCRTC: {
                auto* c = (drm_mode_crtc*) data;
                for (auto const& crtc : crtcs) {
                    if (crtc.id != c->crtc_id) continue;
                    c->fb_id = crtc.fb_id;
                    c->x = crtc.xy.x;
                    c->y = crtc.xy.y;
                    c->mode_valid = crtc.mode_size ? 1 : 0;
                    c->mode.hdisplay = crtc.mode_size.x;
                    c->mode.vdisplay = crtc.mode_size.y;
                    c->mode.vrefresh = 60;
                    return {};
                }
                return {ENOENT, -1};
            }

            case DRM_IOCTL_MODE_GETFB2: {
                if (!has_getfb2) return {ENOTTY, -1};
                auto* f = (drm_mode_fb_cmd2*) data;
                auto const* fb = fb_by_id(f->fb_id);
                if (!fb) return {ENOENT, -1};
                f->width = fb->size.x;
                f->height = fb->size.y;
                f->pixel_format = fb->fourcc;
                f->flags = fb->report_modifier ? DRM_MODE_FB_MODIFIERS : 0;
                f->handles[0] = privileged ? fb->handle : 0;
                f->pitches[0] = fb->stride;
                f->offsets[0] = 0;
                f->modifier[0] = fb->report_modifier ? fb->modifier : 0;
                return {};
            }

            case DRM_IOCTL_MODE_GETFB: {
                auto* f = (drm_mode_fb_cmd*) data;
                auto const* fb = fb_by_id(f->fb_id);
                if (!fb) return {ENOENT, -1};
                f->width = fb->size.x;
                f->height = fb->size.y;
                f->pitch = fb->stride;
                f->bpp = fb->bpp;
                f->depth = fb->depth;
                f->handle = privileged ? fb->handle : 0;
                return {};
            }

            case DRM_IOCTL_PRIME_HANDLE_TO_FD: {
                if (!has_prime) return {ENOSYS, -1};
                auto* p = (drm_prime_handle*) data;
                if (!fb_by_handle(p->handle)) return {ENOENT, -1};
                p->fd = prime_fd_base + p->handle;
                return {};
            }

            case DRM_IOCTL_MODE_MAP_DUMB: {
                auto* m = (drm_mode_map_dumb*) data;
                if (!fb_by_handle(m->handle)) return {ENOENT, -1};
                m->offset = uint64_t(m->handle) << 16;
                return {};
            }

            case DRM_IOCTL_GEM_CLOSE: {
                closed_handles.push_back(((drm_gem_close*) data)->handle);
                return {};
            }

            case DRM_IOCTL_VERSION: {
                auto* v = (drm_version*) data;
                fill_text(v->name, &v->name_len, "fake");
                fill_text(v->date, &v->date_len, "20260101");
                fill_text(v->desc, &v->desc_len, "Fake DRM device");
                return {};
            }

            case DRM_IOCTL_GET_UNIQUE: {
                auto* u = (drm_unique*) data;
                fill_text(u->unique, &u->unique_len, "fake.0");
                return {};
            }

            case DMA_BUF_IOCTL_SYNC: {
                auto const* s = (dma_buf_sync const*) data;
                ++((s->flags & DMA_BUF_SYNC_END) ? sync_ends : sync_starts);
                return {};
            }
        }
        return {ENOTTY, -1};
    }

  private:
    // Kernel convention: copy only if the caller's array is big enough,
    // always report the real count.
    template <typename Count>
    static void fill_ids(
        uint64_t ptr, Count* count, std::vector<uint32_t> const& ids
    ) {
        if (ptr && *count >= ids.size())
            std::copy(ids.begin(), ids.end(), (uint32_t*) (uintptr_t) ptr);
        *count = ids.size();
    }

    template <typename Len>
    static void fill_text(char* ptr, Len* len, std::string const& text) {
        if (ptr && *len >= text.size())
            std::memcpy(ptr, text.data(), text.size());
        *len = text.size();
    }
};

// The DRM device node itself.
class FakeDrmFd : public FileDescriptor {
  public:
    explicit FakeDrmFd(std::shared_ptr<FakeDrm> drm) : drm(std::move(drm)) {}
    virtual int raw_fd() const final { return 3; }
    virtual ErrnoOr<int> read(void*, size_t) final { return {EINVAL, -1}; }
    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) final {
        return drm->drm_ioctl(nr, data);
    }
    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int, int, off_t off
    ) final {
        return drm->map(off >> 16, len);  // Offsets from MAP_DUMB
    }

  private:
    std::shared_ptr<FakeDrm> const drm;
};

// A dma-buf exported with PRIME_HANDLE_TO_FD.
class FakeDmaBufFd : public FileDescriptor {
  public:
    FakeDmaBufFd(std::shared_ptr<FakeDrm> drm, uint32_t handle)
        : drm(std::move(drm)), handle(handle) {}
    virtual int raw_fd() const final { return drm->prime_fd_base + handle; }
    virtual ErrnoOr<int> read(void*, size_t) final { return {EINVAL, -1}; }
    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) final {
        if (nr != DMA_BUF_IOCTL_SYNC) return {ENOTTY, -1};
        return drm->drm_ioctl(nr, data);
    }
    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int, int, off_t off
    ) final {
        if (off != 0) return {EINVAL, {}};
        return drm->map(handle, len);
    }

  private:
    std::shared_ptr<FakeDrm> const drm;
    uint32_t const handle;
};

// A small regular file (like a sysfs attribute).
class FakeTextFd : public FileDescriptor {
  public:
    explicit FakeTextFd(std::string text) : text(std::move(text)) {}
    virtual int raw_fd() const final { return 4; }
    virtual ErrnoOr<int> read(void* buf, size_t len) final {
        size_t const n = std::min(len, text.size() - pos);
        std::memcpy(buf, text.data() + pos, n);
        pos += n;
        return {0, int(n)};
    }
    virtual ErrnoOr<int> ioctl(uint32_t, void*) final { return {ENOTTY, -1}; }
    virtual ErrnoOr<std::shared_ptr<void>> mmap(size_t, int, int, off_t) final {
        return {ENODEV, {}};
    }

  private:
    std::string const text;
    size_t pos = 0;
};

// Filesystem with /dev/dri card nodes, text files and environment variables.
class FakeSystem : public UnixSystem {
  public:
    std::map<std::string, std::shared_ptr<FakeDrm>> cards;  // By node path
    std::map<std::string, std::string> files;               // By path
    std::map<std::string, std::string> env;
    std::map<std::string, int> open_errnos;                 // By path

    // Adds "/dev/dri/cardN" for the next N.
    std::shared_ptr<FakeDrm> add_card() {
        auto drm = std::make_shared<FakeDrm>();
        drm->prime_fd_base = 1000 * (cards.size() + 1);
        cards[fmt_card(cards.size())] = drm;
        return drm;
    }

    virtual ErrnoOr<struct stat> stat(std::string const& path) const final {
        ErrnoOr<struct stat> ret;
        if (cards.count(path)) {
            ret.value.st_mode = S_IFCHR | 0660;
            ret.value.st_rdev = makedev(226, 0);
        } else if (files.count(path)) {
            ret.value.st_mode = S_IFREG | 0444;
        } else {
            ret.err = ENOENT;
        }
        return ret;
    }

    virtual ErrnoOr<std::string> realpath(std::string const&) const final {
        return {ENOENT, {}};
    }

    virtual ErrnoOr<std::vector<std::string>> ls(
        std::string const& dir
    ) const final {
        std::set<std::string> names;
        std::string const prefix = dir + "/";
        for (auto const& [path, drm] : cards) add_entry(&names, prefix, path);
        for (auto const& [path, text] : files) add_entry(&names, prefix, path);
        if (names.empty()) return {ENOENT, {}};
        if (dir == "/dev/dri") names.insert("renderD128");
        names.insert(".");
        names.insert("..");
        return {0, {names.begin(), names.end()}};
    }

    virtual ErrnoOr<std::unique_ptr<FileDescriptor>> open(
        std::string const& path, int, mode_t = 0
    ) final {
        auto const err = open_errnos.find(path);
        if (err != open_errnos.end()) return {err->second, {}};
        auto const card = cards.find(path);
        if (card != cards.end())
            return {0, std::make_unique<FakeDrmFd>(card->second)};
        auto const file = files.find(path);
        if (file != files.end())
            return {0, std::make_unique<FakeTextFd>(file->second)};
        return {ENOENT, {}};
    }

    virtual std::unique_ptr<FileDescriptor> adopt(int raw_fd) final {
        for (auto const& [path, drm] : cards) {
            int const handle = raw_fd - drm->prime_fd_base;
            if (handle > 0 && handle < 1000)
                return std::make_unique<FakeDmaBufFd>(drm, handle);
        }
        throw std::invalid_argument("Unexpected fd to adopt");
    }

    virtual std::optional<std::string> getenv(
        std::string const& name
    ) const final {
        auto const it = env.find(name);
        if (it == env.end() || it->second.empty()) return {};
        return it->second;
    }

  private:
    static std::string fmt_card(size_t n) {
        return "/dev/dri/card" + std::to_string(n);
    }

    static void add_entry(
        std::set<std::string>* names, std::string const& prefix,
        std::string const& path
    ) {
        if (path.compare(0, prefix.size(), prefix) != 0) return;
        auto const rest = path.substr(prefix.size());
        names->insert(rest.substr(0, rest.find('/')));
    }
};

}  // namespace snapmcp
