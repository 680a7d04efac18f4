#include "x11_capture.h"

#include <doctest/doctest.h>

#include "capture_error.h"
#include "fake_drm_device.h"

namespace snapmcp {

TEST_CASE("X11 capture without a display") {
    auto const sys = std::make_shared<FakeSystem>();
    auto const x11 = open_x11_capture(sys);  // Does not connect yet

    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            x11->list_outputs();
            FAIL("no throw");
        } catch (std::system_error const& e) {
            CHECK(e.code() == CaptureErrc::display_unavailable);
            CHECK(std::string(e.what()).find("DISPLAY") != std::string::npos);
        }
    }

    std::error_code code;
    try {
        x11->capture_window(12345);
    } catch (std::system_error const& e) {
        code = e.code();
    }
    CHECK(code == CaptureErrc::display_unavailable);
}

}  // namespace snapmcp
