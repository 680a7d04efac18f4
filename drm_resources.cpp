#include "drm_resources.h"

#include <drm.h>
#include <drm_fourcc.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <cctype>
#include <string_view>

#include <fmt/core.h>

#include "capture_error.h"
#include "logging_policy.h"

namespace snapmcp {

namespace {

auto const& drm_logger() {
    static const auto logger = make_logger("drm");
    return logger;
}

// Support KMS/DRM ioctl conventions for variable size arrays;
// returns true if the ioctl needs to be re-submitted with a resized array.
template <typename Pointer, typename Count, typename Item>
bool size_vec(Pointer* ptr, Count* count, std::vector<Item>* v) {
    if (*count == v->size() && *ptr == (Pointer) v->data()) return false;
    v->resize(*count);
    *ptr = (Pointer) v->data();
    return true;
}

// Runs a KMS query ioctl, throwing with capture meaning on failure.
template <uint32_t nr, typename T>
void query(FileDescriptor& fd, T* data, std::string_view what) {
    try {
        fd.ioc<nr>(data).ex(what);
    } catch (std::system_error const& e) {
        rethrow_classified(e);
    }
}

// Maps a legacy GET_FB depth/bpp pair to the equivalent fourcc, or 0.
uint32_t legacy_fourcc(uint32_t bpp, uint32_t depth) {
    if (bpp == 32 && depth == 24) return DRM_FORMAT_XRGB8888;
    if (bpp == 32 && depth == 32) return DRM_FORMAT_ARGB8888;
    if (bpp == 16 && depth == 16) return DRM_FORMAT_RGB565;
    return 0;
}

}  // anonymous namespace

std::string connector_name(uint32_t type, uint32_t type_id) {
    // Same spelling as the kernel's /sys/class/drm/cardN-* entries
    std::string_view name;
    switch (type) {
        case DRM_MODE_CONNECTOR_Unknown: name = "Unknown"; break;
        case DRM_MODE_CONNECTOR_VGA: name = "VGA"; break;
        case DRM_MODE_CONNECTOR_DVII: name = "DVI-I"; break;
        case DRM_MODE_CONNECTOR_DVID: name = "DVI-D"; break;
        case DRM_MODE_CONNECTOR_DVIA: name = "DVI-A"; break;
        case DRM_MODE_CONNECTOR_Composite: name = "Composite"; break;
        case DRM_MODE_CONNECTOR_SVIDEO: name = "SVIDEO"; break;
        case DRM_MODE_CONNECTOR_LVDS: name = "LVDS"; break;
        case DRM_MODE_CONNECTOR_Component: name = "Component"; break;
        case DRM_MODE_CONNECTOR_9PinDIN: name = "DIN"; break;
        case DRM_MODE_CONNECTOR_DisplayPort: name = "DP"; break;
        case DRM_MODE_CONNECTOR_HDMIA: name = "HDMI-A"; break;
        case DRM_MODE_CONNECTOR_HDMIB: name = "HDMI-B"; break;
        case DRM_MODE_CONNECTOR_TV: name = "TV"; break;
        case DRM_MODE_CONNECTOR_eDP: name = "eDP"; break;
        case DRM_MODE_CONNECTOR_VIRTUAL: name = "Virtual"; break;
        case DRM_MODE_CONNECTOR_DSI: name = "DSI"; break;
        case DRM_MODE_CONNECTOR_DPI: name = "DPI"; break;
        case DRM_MODE_CONNECTOR_WRITEBACK: name = "Writeback"; break;
        case DRM_MODE_CONNECTOR_SPI: name = "SPI"; break;
        case DRM_MODE_CONNECTOR_USB: name = "USB"; break;
        default: return fmt::format("[#{}]-{}", type, type_id);
    }
    return fmt::format("{}-{}", name, type_id);
}

//
// Device discovery
//

std::vector<std::string> list_card_nodes(UnixSystem& sys) {
    std::vector<std::string> out;
    std::string const dri_dir = "/dev/dri";
    auto const listing = sys.ls(dri_dir);
    if (listing.err == ENOENT) return out;
    for (auto const& fname : listing.ex(dri_dir)) {
        if (fname.substr(0, 4) != "card" || !isdigit(fname[4])) continue;
        out.push_back(fmt::format("{}/{}", dri_dir, fname));
    }
    return out;
}

std::vector<DrmDeviceListing> list_drm_devices(UnixSystem& sys) {
    std::vector<DrmDeviceListing> out;
    for (auto const& dev_file : list_card_nodes(sys)) {
        DrmDeviceListing listing;
        listing.dev_file = dev_file;

        struct stat fstat = sys.stat(listing.dev_file).ex(listing.dev_file);
        CHECK_RUNTIME(
            (fstat.st_mode & S_IFMT) == S_IFCHR,
            "Not a character device node: {}", listing.dev_file
        );

        std::unique_ptr<FileDescriptor> fd;
        try {
            fd = sys.open(listing.dev_file, O_RDWR | O_CLOEXEC)
                .ex(listing.dev_file);
        } catch (std::runtime_error const& e) {  // Skip but log on open error
            drm_logger()->error("{}", e.what());
            continue;
        }

        drm_mode_card_res res = {};
        auto const res_ret = fd->ioc<DRM_IOCTL_MODE_GETRESOURCES>(&res);
        if (res_ret.err == ENOTSUP) continue;  // Not a KMS driver.
        res_ret.ex("DRM resource probe");

        auto const maj = major(fstat.st_rdev), min = minor(fstat.st_rdev);
        auto const dev_link = fmt::format("/sys/dev/char/{}:{}", maj, min);
        auto const sys_path = sys.realpath(dev_link);
        if (!sys_path.err) {
            listing.system_path = (sys_path.value.substr(0, 13) == "/sys/devices/")
                ? sys_path.value.substr(13) : sys_path.value;
        }

        std::vector<char> name, date, desc;
        drm_version ver = {};
        do {
            fd->ioc<DRM_IOCTL_VERSION>(&ver).ex("Get version");
        } while (
            size_vec(&ver.name, &ver.name_len, &name) +
            size_vec(&ver.date, &ver.date_len, &date) +
            size_vec(&ver.desc, &ver.desc_len, &desc)
        );
        listing.driver.assign(name.begin(), name.end());
        listing.driver_desc.assign(desc.begin(), desc.end());

        std::vector<char> bus_id;
        drm_unique uniq = {};
        do {
            fd->ioc<DRM_IOCTL_GET_UNIQUE>(&uniq).ex("Get unique");
        } while (size_vec(&uniq.unique, &uniq.unique_len, &bus_id));
        listing.driver_bus_id.assign(bus_id.begin(), bus_id.end());
        out.push_back(std::move(listing));
    }

    return out;
}

//
// Output scanning
//

std::vector<DrmOutput> scan_active_outputs(FileDescriptor& fd) {
    auto const& logger = drm_logger();
    TRACE(logger, "Scanning outputs...");

    drm_mode_card_res res = {};
    std::vector<uint32_t> crtc_ids, conn_ids;
    do {
        res.count_fbs = res.count_encoders = 0;  // Don't use these.
        query<DRM_IOCTL_MODE_GETRESOURCES>(fd, &res, "DRM resources");
    } while (
        size_vec(&res.crtc_id_ptr, &res.count_crtcs, &crtc_ids) +
        size_vec(&res.connector_id_ptr, &res.count_connectors, &conn_ids)
    );

    std::vector<DrmOutput> out;
    for (auto const conn_id : conn_ids) {
        // No mode/property/encoder arrays; the scalar fields are enough.
        drm_mode_get_connector cdat = {};
        cdat.connector_id = conn_id;
        query<DRM_IOCTL_MODE_GETCONNECTOR>(fd, &cdat, "DRM connector");

        auto const name = connector_name(
            cdat.connector_type, cdat.connector_type_id
        );
        if (cdat.connection != 1) {  // DRM_MODE_CONNECTED
            TRACE(logger, "  {} (#{}): not connected", name, conn_id);
            continue;
        }
        if (!cdat.encoder_id) {
            TRACE(logger, "  {} (#{}): no encoder", name, conn_id);
            continue;
        }

        drm_mode_get_encoder edat = {};
        edat.encoder_id = cdat.encoder_id;
        query<DRM_IOCTL_MODE_GETENCODER>(fd, &edat, "DRM encoder");
        if (!edat.crtc_id) {
            TRACE(logger, "  {} (#{}): no CRTC", name, conn_id);
            continue;
        }

        drm_mode_crtc ccdat = {};
        ccdat.crtc_id = edat.crtc_id;
        query<DRM_IOCTL_MODE_GETCRTC>(fd, &ccdat, "DRM CRTC");
        if (!ccdat.mode_valid || !ccdat.fb_id) {
            TRACE(logger, "  {} (#{}): CRTC {} idle", name, conn_id, ccdat.crtc_id);
            continue;
        }

        DrmOutput output = {};
        output.index = out.size();
        output.connector_id = conn_id;
        output.connector = name;
        output.crtc_id = ccdat.crtc_id;
        output.scanout_xy = {int(ccdat.x), int(ccdat.y)};
        output.size = {ccdat.mode.hdisplay, ccdat.mode.vdisplay};
        output.refresh_hz = ccdat.mode.vrefresh;
        output.fb_id = ccdat.fb_id;
        TRACE(logger, "  {}", debug(output));
        out.push_back(std::move(output));
    }

    DEBUG(logger, "Found {} active outputs", out.size());
    return out;
}

//
// Framebuffer resolution
//

FramebufferHandle resolve_framebuffer(
    std::shared_ptr<FileDescriptor> const& fd, uint32_t fb_id
) {
    auto const& logger = drm_logger();
    FramebufferHandle fb;
    fb.fb_id = fb_id;
    fb.refs = std::make_unique<BufferObjectRefs>(fd);

    drm_mode_fb_cmd2 f2 = {};
    f2.fb_id = fb_id;
    auto const f2_ret = fd->ioc<DRM_IOCTL_MODE_GETFB2>(&f2);
    if (!f2_ret.err) {
        static_assert(std::extent_v<decltype(f2.handles)> == 4);
        for (size_t p = 0; p < 4; ++p) fb.refs->adopt(f2.handles[p]);

        fb.fourcc = f2.pixel_format;
        fb.size = {int(f2.width), int(f2.height)};
        fb.modifier = (f2.flags & DRM_MODE_FB_MODIFIERS)
            ? f2.modifier[0] : DRM_FORMAT_MOD_INVALID;
        for (size_t p = 0; p < 4 && (f2.handles[p] || f2.pitches[p]); ++p)
            fb.planes.push_back({f2.handles[p], f2.offsets[p], f2.pitches[p]});
    } else if (
        f2_ret.err == ENOTTY || f2_ret.err == EINVAL ||
        f2_ret.err == ENOSYS || f2_ret.err == EOPNOTSUPP
    ) {
        DEBUG(logger, "GET_FB2 unsupported (errno {}), using GET_FB", f2_ret.err);
        drm_mode_fb_cmd f1 = {};
        f1.fb_id = fb_id;
        query<DRM_IOCTL_MODE_GETFB>(*fd, &f1, "DRM GET_FB");
        fb.refs->adopt(f1.handle);

        fb.fourcc = legacy_fourcc(f1.bpp, f1.depth);
        if (!fb.fourcc) {
            logger->warn(
                "fb{}: unknown legacy format ({}bpp depth {})",
                fb_id, f1.bpp, f1.depth
            );
        }
        fb.size = {int(f1.width), int(f1.height)};
        fb.modifier = DRM_FORMAT_MOD_INVALID;
        fb.planes.push_back({f1.handle, 0, f1.pitch});
    } else if (f2_ret.err == ENOENT) {
        throw_capture(
            CaptureErrc::device_lost,
            fmt::format("Framebuffer fb{} went away (mode change?)", fb_id)
        );
    } else {
        try {
            f2_ret.check("DRM GET_FB2");
        } catch (std::system_error const& e) {
            rethrow_classified(e);
        }
    }

    TRACE(logger, "Resolved {}", debug(fb));
    CHECK_CAPTURE(
        !fb.planes.empty() && fb.planes[0].handle, CaptureErrc::permission,
        "No buffer handle for fb{}: reading the screen needs CAP_SYS_ADMIN "
        "or DRM master (try: sudo setcap cap_sys_admin+ep <binary>)", fb_id
    );
    CHECK_CAPTURE(
        fb.is_linear(), CaptureErrc::tiling_unsupported,
        "fb{} uses a tiled/compressed layout ({}); only linear framebuffers "
        "can be read", fb_id, debug_modifier(fb.modifier)
    );
    return fb;
}

//
// Debugging utilities
//

std::string debug(DrmDeviceListing const& d) {
    return fmt::format(
        "{} ({}): {}{}",
        d.dev_file, d.driver, d.system_path,
        d.driver_bus_id.empty() ? "" : fmt::format(" ({})", d.driver_bus_id)
    );
}

std::string debug(DrmOutput const& o) {
    return fmt::format(
        "#{} {} crtc{} {}x{}@{}Hz +{}+{} fb{}",
        o.index, o.connector, o.crtc_id, o.size.x, o.size.y, o.refresh_hz,
        o.scanout_xy.x, o.scanout_xy.y, o.fb_id
    );
}

}  // namespace snapmcp
