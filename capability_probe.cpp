#include "capability_probe.h"

#include <drm.h>

#include <cstring>
#include <optional>

#include <fmt/core.h>

#include "capture_error.h"
#include "drm_resources.h"
#include "logging_policy.h"

namespace snapmcp {

namespace {

auto const& probe_logger() {
    static const auto logger = make_logger("probe");
    return logger;
}

// Which failure to report when no card works; higher wins.
int severity(std::error_code const& code) {
    if (code == CaptureErrc::permission) return 3;
    if (code == CaptureErrc::device_busy) return 2;
    if (code == CaptureErrc::no_hardware) return 1;
    return 0;
}

std::system_error describe_open_failure(
    std::string const& dev_file, int err
) {
    auto const code = classify_errno(err);
    if (code == CaptureErrc::permission) {
        return std::system_error(code, fmt::format(
            "Cannot open {}: KMS capture needs CAP_SYS_ADMIN or DRM master "
            "(try: sudo setcap cap_sys_admin+ep <binary>, or run as root)",
            dev_file
        ));
    }
    if (code == CaptureErrc::device_busy) {
        return std::system_error(code, fmt::format(
            "Cannot open {}: held exclusively by another process", dev_file
        ));
    }
    return std::system_error(
        make_error_code(CaptureErrc::no_hardware),
        fmt::format("Cannot open {}: {}", dev_file, std::strerror(err))
    );
}

}  // anonymous namespace

KmsProbeResult probe_kms_access(UnixSystem& sys) {
    auto const& logger = probe_logger();
    auto const cards = list_card_nodes(sys);
    CHECK_CAPTURE(
        !cards.empty(), CaptureErrc::no_hardware,
        "No DRM devices found (/dev/dri/card*)"
    );

    std::optional<std::system_error> worst;
    auto const note = [&](std::system_error const& e) {
        logger->info("{}", e.what());
        if (!worst || severity(e.code()) > severity(worst->code())) worst = e;
    };

    for (auto const& dev_file : cards) {
        DEBUG(logger, "Probing {}...", dev_file);
        auto opened = sys.open(dev_file, O_RDWR | O_CLOEXEC);
        if (opened.err) {
            note(describe_open_failure(dev_file, opened.err));
            continue;
        }

        std::shared_ptr<FileDescriptor> const fd = std::move(opened.value);
        drm_mode_card_res res = {};
        auto const res_ret = fd->ioc<DRM_IOCTL_MODE_GETRESOURCES>(&res);
        if (res_ret.err == EOPNOTSUPP || res_ret.err == EINVAL) {
            note(std::system_error(
                make_error_code(CaptureErrc::no_hardware),
                fmt::format("{}: not a KMS device", dev_file)
            ));
            continue;
        }

        size_t active = 0;
        try {
            res_ret.check(fmt::format("{}: DRM resources", dev_file));
            auto const outputs = scan_active_outputs(*fd);
            active = outputs.size();
            if (outputs.empty()) {
                note(std::system_error(
                    make_error_code(CaptureErrc::no_hardware),
                    fmt::format("{}: no active outputs", dev_file)
                ));
                continue;
            }

            // Throws a permission error if the kernel withholds the handle.
            auto const fb = resolve_framebuffer(fd, outputs[0].fb_id);
            logger->info(
                "Using {} ({} active output{}; {} on {})",
                dev_file, outputs.size(), outputs.size() == 1 ? "" : "s",
                debug(fb), outputs[0].connector
            );
            return {dev_file, outputs.size()};
        } catch (std::system_error const& e) {
            // A tiled screen is still a usable device (the handle came back);
            // those captures fail individually.
            if (e.code() == CaptureErrc::tiling_unsupported) {
                logger->warn("{}", e.what());
                return {dev_file, active};
            }
            try {
                rethrow_classified(e);
            } catch (std::system_error const& classified) {
                if (!severity(classified.code())) throw;
                note(classified);
            }
        }
    }

    ASSERT(worst);
    throw *worst;
}

}  // namespace snapmcp
