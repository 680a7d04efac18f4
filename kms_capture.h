// Capture backend reading scanout framebuffers directly from DRM/KMS.

#pragma once

#include <memory>
#include <string>

#include "capture_backend.h"
#include "unix_system.h"

namespace snapmcp {

// Opens a KMS capture backend on a device node (like "/dev/dri/card0"),
// normally the one chosen by probe_kms_access(). Outputs are rescanned and
// framebuffers resolved fresh for every request. If the device goes away,
// that request fails with CaptureErrc::device_lost and the next request
// probes the cards again.
std::unique_ptr<CaptureBackend> open_kms_capture(
    std::shared_ptr<UnixSystem>, std::string const& dev_file
);

}  // namespace snapmcp
