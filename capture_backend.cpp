#include "capture_backend.h"

#include <fmt/core.h>

#include "capture_error.h"

namespace snapmcp {

DecodedImage CaptureBackend::capture_region(
    std::optional<uint32_t> id, Region const& region
) {
    auto const outputs = list_outputs();
    check_region(find_output(outputs, id), region);
    return crop_image(capture_output(id), region);
}

CaptureOutput const& find_output(
    std::vector<CaptureOutput> const& outputs, std::optional<uint32_t> id
) {
    for (auto const& output : outputs) {
        if (id ? output.id == *id : output.is_primary) return output;
    }
    if (!id && !outputs.empty()) return outputs.front();

    CHECK_CAPTURE(!outputs.empty(), CaptureErrc::not_found, "No active outputs");
    throw_capture(
        CaptureErrc::not_found,
        fmt::format("Monitor {} not found ({} available)", *id, outputs.size())
    );
}

void check_region(CaptureOutput const& output, Region const& region) {
    CHECK_CAPTURE(
        region.fits_within(output.size.as<int64_t>()), CaptureErrc::bounds,
        "Region {} is not inside monitor {} ({}x{})",
        debug(region), output.id, output.size.x, output.size.y
    );
}

Region desktop_region(CaptureOutput const& output, Region const& region) {
    return {region.origin + output.position.as<int64_t>(), region.size};
}

uint32_t output_at(
    std::vector<CaptureOutput> const& outputs, XY<int64_t> point
) {
    for (auto const& output : outputs) {
        Region const pixel = {point - output.position.as<int64_t>(), {1, 1}};
        if (pixel.fits_within(output.size.as<int64_t>())) return output.id;
    }
    return outputs.empty() ? 0 : find_output(outputs, {}).id;
}

std::string_view variant_name(BackendVariant variant) {
    switch (variant) {
        case BackendVariant::kms: return "kms";
        case BackendVariant::display: return "display";
    }
    return "?";
}

std::string debug(CaptureOutput const& o) {
    return fmt::format(
        "#{} \"{}\" {}x{}+{}+{}{}",
        o.id, o.name, o.size.x, o.size.y, o.position.x, o.position.y,
        o.is_primary ? " [primary]" : ""
    );
}

std::string debug(CaptureWindow const& w) {
    return fmt::format(
        "#{} \"{}\" ({}) {}x{}+{}+{} on #{}{}{}",
        w.id, w.title, w.app_name, w.size.x, w.size.y,
        w.position.x, w.position.y, w.output_id,
        w.is_minimized ? " [min]" : "", w.is_maximized ? " [max]" : ""
    );
}

std::string debug(Region const& r) {
    return fmt::format(
        "{}x{}+{}+{}", r.size.x, r.size.y, r.origin.x, r.origin.y
    );
}

}  // namespace snapmcp
