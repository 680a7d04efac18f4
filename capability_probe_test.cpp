#include "capability_probe.h"

#include <drm_fourcc.h>

#include <doctest/doctest.h>

#include "capture_error.h"
#include "fake_drm_device.h"

namespace snapmcp {

namespace {

std::system_error probe_failure(UnixSystem& sys) {
    try {
        auto const result = probe_kms_access(sys);
        FAIL("Probe unexpectedly chose " + result.dev_file);
    } catch (std::system_error const& e) {
        return e;
    }
    return std::system_error(std::error_code{});
}

}  // anonymous namespace

TEST_CASE("probe_kms_access picks a working card") {
    FakeSystem sys;
    sys.add_card();  // card0: no active outputs
    auto const card1 = sys.add_card();
    card1->add_output({1920, 1080});
    card1->add_output({1280, 1024});

    auto const result = probe_kms_access(sys);
    CHECK(result.dev_file == "/dev/dri/card1");
    CHECK(result.active_outputs == 2);
    CHECK(card1->count(DRM_IOCTL_MODE_GETFB2) == 1);
    CHECK(card1->closed_handles == std::vector<uint32_t>{1});
    CHECK(card1->maps == 0);
}

TEST_CASE("probe_kms_access skips non-KMS cards") {
    FakeSystem sys;
    sys.add_card()->resources_errno = EOPNOTSUPP;
    sys.add_card()->add_output({800, 600});
    CHECK(probe_kms_access(sys).dev_file == "/dev/dri/card1");
}

TEST_CASE("probe_kms_access accepts tiled scanout") {
    FakeSystem sys;
    auto const card = sys.add_card();
    card->fb_by_id(card->add_output({800, 600}))->modifier =
        I915_FORMAT_MOD_X_TILED;

    auto const result = probe_kms_access(sys);
    CHECK(result.dev_file == "/dev/dri/card0");
    CHECK(result.active_outputs == 1);
}

TEST_CASE("probe_kms_access failures") {
    SUBCASE("no cards") {
        FakeSystem sys;
        CHECK(probe_failure(sys).code() == CaptureErrc::no_hardware);
    }

    SUBCASE("no active outputs") {
        FakeSystem sys;
        sys.add_card();
        CHECK(probe_failure(sys).code() == CaptureErrc::no_hardware);
    }

    SUBCASE("open denied") {
        FakeSystem sys;
        sys.add_card()->add_output({800, 600});
        sys.open_errnos["/dev/dri/card0"] = EACCES;
        auto const e = probe_failure(sys);
        CHECK(e.code() == CaptureErrc::permission);
        CHECK(std::string(e.what()).find("CAP_SYS_ADMIN") != std::string::npos);
        CHECK(std::string(e.what()).find("/dev/dri/card0") != std::string::npos);
    }

    SUBCASE("busy") {
        FakeSystem sys;
        sys.add_card()->add_output({800, 600});
        sys.open_errnos["/dev/dri/card0"] = EBUSY;
        CHECK(probe_failure(sys).code() == CaptureErrc::device_busy);
    }

    SUBCASE("handles withheld") {
        FakeSystem sys;
        auto const card = sys.add_card();
        card->add_output({800, 600});
        card->privileged = false;
        auto const e = probe_failure(sys);
        CHECK(e.code() == CaptureErrc::permission);
        CHECK(std::string(e.what()).find("setcap") != std::string::npos);
    }

    SUBCASE("permission outranks the rest") {
        FakeSystem sys;
        sys.add_card();  // No outputs
        sys.add_card()->add_output({800, 600});
        sys.add_card()->add_output({800, 600});
        sys.open_errnos["/dev/dri/card1"] = EBUSY;
        sys.open_errnos["/dev/dri/card2"] = EPERM;
        CHECK(probe_failure(sys).code() == CaptureErrc::permission);
    }

    SUBCASE("busy outranks no hardware") {
        FakeSystem sys;
        sys.add_card();
        sys.add_card()->add_output({800, 600});
        sys.open_errnos["/dev/dri/card1"] = EBUSY;
        CHECK(probe_failure(sys).code() == CaptureErrc::device_busy);
    }
}

}  // namespace snapmcp
