#include "drm_resources.h"

#include <drm_fourcc.h>

#include <doctest/doctest.h>

#include "capture_error.h"
#include "fake_drm_device.h"

namespace snapmcp {

namespace {

template <typename F>
std::error_code error_from(F&& f) {
    try {
        f();
    } catch (std::system_error const& e) {
        return e.code();
    }
    return {};
}

}  // anonymous namespace

TEST_CASE("list_card_nodes") {
    FakeSystem sys;
    CHECK(list_card_nodes(sys).empty());

    sys.add_card();
    sys.add_card();
    std::vector<std::string> const expected = {
        "/dev/dri/card0", "/dev/dri/card1"
    };
    CHECK(list_card_nodes(sys) == expected);  // No renderD128
}

TEST_CASE("list_drm_devices") {
    FakeSystem sys;
    auto const drm = sys.add_card();
    drm->add_output({640, 480});
    sys.open_errnos["/dev/dri/card1"] = EACCES;
    sys.add_card();

    auto const devices = list_drm_devices(sys);
    REQUIRE(devices.size() == 1);  // Unopenable card1 is skipped
    CHECK(devices[0].dev_file == "/dev/dri/card0");
    CHECK(devices[0].driver == "fake");
    CHECK(devices[0].driver_desc == "Fake DRM device");
    CHECK(devices[0].driver_bus_id == "fake.0");
    CHECK(debug(devices[0]).find("fake.0") != std::string::npos);
}

TEST_CASE("connector_name") {
    CHECK(connector_name(DRM_MODE_CONNECTOR_HDMIA, 1) == "HDMI-A-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_HDMIB, 2) == "HDMI-B-2");
    CHECK(connector_name(DRM_MODE_CONNECTOR_DisplayPort, 3) == "DP-3");
    CHECK(connector_name(DRM_MODE_CONNECTOR_eDP, 1) == "eDP-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_DVII, 1) == "DVI-I-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_VGA, 1) == "VGA-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_9PinDIN, 1) == "DIN-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_VIRTUAL, 1) == "Virtual-1");
    CHECK(connector_name(DRM_MODE_CONNECTOR_DSI, 1) == "DSI-1");
    CHECK(connector_name(999, 4) == "[#999]-4");
}

TEST_CASE("scan_active_outputs") {
    auto const drm = std::make_shared<FakeDrm>();
    drm->connectors.push_back({40, DRM_MODE_CONNECTOR_DisplayPort, 1, false, 0});
    drm->add_output({1920, 1080});
    drm->connectors.push_back({41, DRM_MODE_CONNECTOR_VGA, 1, true, 0});
    drm->connectors.push_back({42, DRM_MODE_CONNECTOR_eDP, 1, true, 52});
    drm->encoders.push_back({52, 62});
    drm->crtcs.push_back({62, 0, {}, {1366, 768}});  // Mode set but no fb
    drm->add_output({1280, 720}, DRM_FORMAT_XRGB8888, {2560, 720}, {1280, 0});

    FakeDrmFd fd(drm);
    auto const outputs = scan_active_outputs(fd);
    REQUIRE(outputs.size() == 2);

    CHECK(outputs[0].index == 0);
    CHECK(outputs[0].connector == "HDMI-A-2");
    CHECK(outputs[0].size == XY{1920, 1080});
    CHECK(outputs[0].scanout_xy == XY{0, 0});
    CHECK(outputs[0].refresh_hz == 60);
    CHECK(outputs[0].fb_id == 101);

    CHECK(outputs[1].index == 1);
    CHECK(outputs[1].connector == "HDMI-A-5");
    CHECK(outputs[1].size == XY{1280, 720});
    CHECK(outputs[1].scanout_xy == XY{1280, 0});
    CHECK(outputs[1].fb_id == 104);

    // Same topology, same answer
    auto const again = scan_active_outputs(fd);
    REQUIRE(again.size() == outputs.size());
    for (size_t i = 0; i < again.size(); ++i) {
        CHECK(again[i].index == outputs[i].index);
        CHECK(again[i].connector_id == outputs[i].connector_id);
        CHECK(again[i].connector == outputs[i].connector);
        CHECK(again[i].fb_id == outputs[i].fb_id);
    }

    drm->resources_errno = ENODEV;
    CHECK(error_from([&] { scan_active_outputs(fd); }) ==
          CaptureErrc::device_lost);
}

TEST_CASE("resolve_framebuffer with GET_FB2") {
    auto const drm = std::make_shared<FakeDrm>();
    auto const fb_id = drm->add_output({64, 32}, DRM_FORMAT_ABGR8888, {}, {}, 16);
    std::shared_ptr<FileDescriptor> const fd = std::make_shared<FakeDrmFd>(drm);

    {
        auto const fb = resolve_framebuffer(fd, fb_id);
        CHECK(fb.fb_id == fb_id);
        CHECK(fb.fourcc == DRM_FORMAT_ABGR8888);
        CHECK(fb.modifier == DRM_FORMAT_MOD_LINEAR);
        CHECK(fb.size == XY{64, 32});
        REQUIRE(fb.planes.size() == 1);
        CHECK(fb.planes[0].handle == 1);
        CHECK(fb.planes[0].stride == 64 * 4 + 16);
        CHECK(drm->count(DRM_IOCTL_MODE_GETFB2) == 1);
        CHECK(drm->count(DRM_IOCTL_MODE_GETFB) == 0);
        CHECK(drm->closed_handles.empty());
    }
    CHECK(drm->closed_handles == std::vector<uint32_t>{1});

    // Modifier not reported: implicit layout, readable
    drm->fb_by_id(fb_id)->report_modifier = false;
    CHECK(resolve_framebuffer(fd, fb_id).modifier == DRM_FORMAT_MOD_INVALID);

    CHECK(error_from([&] { resolve_framebuffer(fd, 999); }) ==
          CaptureErrc::device_lost);
}

TEST_CASE("resolve_framebuffer falls back to GET_FB") {
    auto const drm = std::make_shared<FakeDrm>();
    drm->has_getfb2 = false;
    auto const xrgb_id = drm->add_output({64, 32});
    auto const rgb565_id = drm->add_output({64, 32}, DRM_FORMAT_RGB565);
    std::shared_ptr<FileDescriptor> const fd = std::make_shared<FakeDrmFd>(drm);

    auto const xrgb = resolve_framebuffer(fd, xrgb_id);
    CHECK(xrgb.fourcc == DRM_FORMAT_XRGB8888);
    CHECK(xrgb.modifier == DRM_FORMAT_MOD_INVALID);
    CHECK(xrgb.size == XY{64, 32});
    REQUIRE(xrgb.planes.size() == 1);
    CHECK(xrgb.planes[0].stride == 256);
    CHECK(drm->count(DRM_IOCTL_MODE_GETFB2) == 1);
    CHECK(drm->count(DRM_IOCTL_MODE_GETFB) == 1);

    CHECK(resolve_framebuffer(fd, rgb565_id).fourcc == DRM_FORMAT_RGB565);

    drm->fb_by_id(xrgb_id)->depth = 32;
    CHECK(resolve_framebuffer(fd, xrgb_id).fourcc == DRM_FORMAT_ARGB8888);

    // Unknown depth resolves (to be refused by the decoder)
    drm->fb_by_id(xrgb_id)->bpp = 24;
    drm->fb_by_id(xrgb_id)->depth = 24;
    CHECK(resolve_framebuffer(fd, xrgb_id).fourcc == 0);
}

TEST_CASE("resolve_framebuffer without privilege") {
    auto const drm = std::make_shared<FakeDrm>();
    drm->privileged = false;
    auto const fb_id = drm->add_output({64, 32});
    std::shared_ptr<FileDescriptor> const fd = std::make_shared<FakeDrmFd>(drm);

    try {
        resolve_framebuffer(fd, fb_id);
        FAIL("no throw");
    } catch (std::system_error const& e) {
        CHECK(e.code() == CaptureErrc::permission);
        CHECK(std::string(e.what()).find("CAP_SYS_ADMIN") != std::string::npos);
    }

    drm->has_getfb2 = false;
    CHECK(error_from([&] { resolve_framebuffer(fd, fb_id); }) ==
          CaptureErrc::permission);
    CHECK(drm->closed_handles.empty());
}

TEST_CASE("resolve_framebuffer refuses tiled framebuffers") {
    auto const drm = std::make_shared<FakeDrm>();
    auto const fb_id = drm->add_output({64, 32});
    drm->fb_by_id(fb_id)->modifier = I915_FORMAT_MOD_X_TILED;
    std::shared_ptr<FileDescriptor> const fd = std::make_shared<FakeDrmFd>(drm);

    try {
        resolve_framebuffer(fd, fb_id);
        FAIL("no throw");
    } catch (std::system_error const& e) {
        CHECK(e.code() == CaptureErrc::tiling_unsupported);
        CHECK(std::string(e.what()).find("INTL:1") != std::string::npos);
    }

    CHECK(drm->closed_handles == std::vector<uint32_t>{1});
    CHECK(drm->count(DRM_IOCTL_PRIME_HANDLE_TO_FD) == 0);
    CHECK(drm->count(DRM_IOCTL_MODE_MAP_DUMB) == 0);
    CHECK(drm->maps == 0);
}

}  // namespace snapmcp
