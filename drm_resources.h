// Enumeration of DRM/KMS devices, active outputs, and scanout framebuffers.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "image_buffer.h"
#include "unix_system.h"
#include "xy.h"

namespace snapmcp {

// Description of a GPU device. Returned by list_drm_devices().
struct DrmDeviceListing {
    std::string dev_file;       // Like "/dev/dri/card0"
    std::string system_path;    // Like "platform/gpu/drm/card0" (more stable)
    std::string driver;         // Like "vc4" or "i915"
    std::string driver_desc;    // Like "Broadcom VC4 graphics"
    std::string driver_bus_id;  // Like "fec00000.v3d" (PCI address, etc)
    bool operator==(DrmDeviceListing const&) const = default;
};

// A connected connector driven by a CRTC with a mode and a framebuffer.
// Returned by scan_active_outputs().
struct DrmOutput {
    uint32_t index = 0;         // Ordinal among active outputs
    uint32_t connector_id = 0;
    std::string connector;      // Like "HDMI-1"
    uint32_t crtc_id = 0;
    XY<int> scanout_xy;         // CRTC viewport origin within the framebuffer
    XY<int> size;               // Active mode size
    int refresh_hz = 0;
    uint32_t fb_id = 0;         // Framebuffer bound when scanned
};

// Returns the "/dev/dri/cardN" nodes present, in name order, without
// opening them.
std::vector<std::string> list_card_nodes(UnixSystem&);

// Lists KMS-capable GPU devices (opening each node briefly to query it).
// Nodes that cannot be opened are logged and skipped.
std::vector<DrmDeviceListing> list_drm_devices(UnixSystem&);

// Walks connectors -> encoders -> CRTCs and returns the active outputs,
// numbered in connector enumeration order. Disabled outputs are left out.
std::vector<DrmOutput> scan_active_outputs(FileDescriptor& drm_fd);

// Describes a framebuffer by id, using GET_FB2 (falling back to GET_FB on
// older kernels). Fails with CaptureErrc::tiling_unsupported for non-linear
// modifiers and CaptureErrc::permission if the kernel withholds handles.
FramebufferHandle resolve_framebuffer(
    std::shared_ptr<FileDescriptor> const& drm_fd, uint32_t fb_id
);

// Connector name like "HDMI-A-1", spelled as in /sys/class/drm.
std::string connector_name(uint32_t type, uint32_t type_id);

// Debugging descriptions of structures.
std::string debug(DrmDeviceListing const&);
std::string debug(DrmOutput const&);

}  // namespace snapmcp
