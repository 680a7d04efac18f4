#include "capture_error.h"

#include <errno.h>

namespace snapmcp {

namespace {

class CaptureErrorCategory : public std::error_category {
  public:
    virtual char const* name() const noexcept { return "capture"; }
    virtual std::string message(int code) const {
        switch (static_cast<CaptureErrc>(code)) {
            case CaptureErrc::configuration: return "Configuration error";
            case CaptureErrc::permission: return "Permission denied";
            case CaptureErrc::no_hardware: return "No compatible hardware";
            case CaptureErrc::device_busy: return "Device busy";
            case CaptureErrc::device_lost: return "Device lost";
            case CaptureErrc::pixel_format: return "Unsupported pixel format";
            case CaptureErrc::tiling_unsupported: return "Tiling unsupported";
            case CaptureErrc::bounds: return "Region out of bounds";
            case CaptureErrc::not_found: return "Not found";
            case CaptureErrc::display_unavailable: return "No display server";
        }
        return fmt::format("Capture error {}", code);
    }
};

}  // anonymous namespace

std::error_category const& capture_category() {
    static CaptureErrorCategory singleton;
    return singleton;
}

void throw_capture(CaptureErrc errc, std::string const& what) {
    throw std::system_error(make_error_code(errc), what);
}

std::error_code classify_errno(int err) {
    switch (err) {
        case EACCES:
        case EPERM: return CaptureErrc::permission;
        case ENODEV:
        case ENXIO: return CaptureErrc::device_lost;
        case EBUSY: return CaptureErrc::device_busy;
        default: return {};
    }
}

void rethrow_classified(std::system_error const& e) {
    if (e.code().category() == std::system_category()) {
        auto const code = classify_errno(e.code().value());
        if (code) throw std::system_error(code, e.what());
    }
    throw e;
}

}  // namespace snapmcp
