#include "kms_capture.h"

#include <mutex>

#include <fmt/core.h>

#include "capability_probe.h"
#include "capture_error.h"
#include "drm_resources.h"
#include "framebuffer_reader.h"
#include "logging_policy.h"

namespace snapmcp {

namespace {

auto const& kms_logger() {
    static const auto logger = make_logger("kms");
    return logger;
}

CaptureOutput to_capture_output(DrmOutput const& drm) {
    CaptureOutput out;
    out.id = drm.index;
    out.name = drm.connector;
    out.position = drm.scanout_xy;
    out.size = drm.size;
    out.is_primary = (drm.index == 0);
    return out;
}

class KmsCaptureDef : public CaptureBackend {
  public:
    KmsCaptureDef(std::shared_ptr<UnixSystem> sys, std::string dev_file)
        : sys(std::move(sys)), dev_file(std::move(dev_file)) {}

    void init() { (void) device(); }

  private:
    template <typename F>
    auto with_device(F&& f) {
        auto const used = device();
        try {
            return f(used);
        } catch (std::system_error const& e) {
            if (e.code() == CaptureErrc::device_lost) {
                std::scoped_lock const lock{mutex};
                if (fd == used) {
                    kms_logger()->warn("{} lost: {}", dev_file, e.what());
                    fd.reset();
                    dev_file.clear();
                }
            }
            throw;
        }
    }

  public:
    virtual std::vector<CaptureOutput> list_outputs() final {
        return with_device([&](auto const& fd) {
            std::vector<CaptureOutput> out;
            for (auto const& drm : scan_active_outputs(*fd))
                out.push_back(to_capture_output(drm));
            return out;
        });
    }

    virtual DecodedImage capture_output(std::optional<uint32_t> id) final {
        return with_device([&](auto const& fd) {
            auto const drm = find_drm_output(*fd, id);
            Region const scanout = {
                drm.scanout_xy.template as<int64_t>(),
                drm.size.template as<int64_t>()
            };
            return read_output(fd, drm, scanout);
        });
    }

    virtual DecodedImage capture_region(
        std::optional<uint32_t> id, Region const& region
    ) final {
        return with_device([&](auto const& fd) {
            auto const drm = find_drm_output(*fd, id);
            check_region(to_capture_output(drm), region);
            Region const scanout = {
                drm.scanout_xy.template as<int64_t>() + region.origin,
                region.size
            };
            return read_output(fd, drm, scanout);
        });
    }

  private:
    std::shared_ptr<UnixSystem> const sys;
    std::mutex mutex;
    std::string dev_file;                 // Empty after device loss
    std::shared_ptr<FileDescriptor> fd;   // Null until (re)opened

    std::shared_ptr<FileDescriptor> device() {
        std::scoped_lock const lock{mutex};
        if (!fd) {
            if (dev_file.empty()) dev_file = probe_kms_access(*sys).dev_file;
            auto opened = sys->open(dev_file, O_RDWR | O_CLOEXEC);
            try {
                opened.check(dev_file);
            } catch (std::system_error const& e) {
                rethrow_classified(e);
            }
            fd = std::move(opened.value);
            kms_logger()->info("Opened {}", dev_file);
        }
        return fd;
    }

    DrmOutput find_drm_output(FileDescriptor& drm_fd, std::optional<uint32_t> id) {
        auto const drm = scan_active_outputs(drm_fd);
        std::vector<CaptureOutput> outputs;
        for (auto const& o : drm) outputs.push_back(to_capture_output(o));
        return drm[find_output(outputs, id).id];
    }

    DecodedImage read_output(
        std::shared_ptr<FileDescriptor> const& drm_fd,
        DrmOutput const& drm, Region const& scanout
    ) {
        auto const fb = resolve_framebuffer(drm_fd, drm.fb_id);
        auto image = read_framebuffer(*sys, *drm_fd, fb, scanout);
        DEBUG(kms_logger(), "Captured {}: {}", drm.connector, debug(image));
        return image;
    }
};

}  // anonymous namespace

std::unique_ptr<CaptureBackend> open_kms_capture(
    std::shared_ptr<UnixSystem> sys, std::string const& dev_file
) {
    auto kms = std::make_unique<KmsCaptureDef>(std::move(sys), dev_file);
    kms->init();
    return kms;
}

}  // namespace snapmcp
