// Startup check that this process can actually read KMS framebuffers.

#pragma once

#include <string>

#include "unix_system.h"

namespace snapmcp {

// The device chosen by probe_kms_access().
struct KmsProbeResult {
    std::string dev_file;     // Like "/dev/dri/card0"
    size_t active_outputs = 0;
};

// Walks the DRM card nodes in name order and returns the first one with
// an active output whose framebuffer handle this process is allowed to
// obtain. Resolving a handle is the only reliable privilege test, since
// unprivileged GET_FB calls succeed but withhold the handle.
//
// Throws std::system_error with a CaptureErrc code if no card qualifies:
// permission (naming the missing privilege) takes precedence over
// device_busy, which takes precedence over no_hardware.
KmsProbeResult probe_kms_access(UnixSystem&);

}  // namespace snapmcp
