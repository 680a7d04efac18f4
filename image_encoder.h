// Encoding of captured images for delivery (PNG, base64, files).

#pragma once

#include <string>
#include <vector>

#include "image_buffer.h"

namespace snapmcp {

// Compresses an image to PNG (via the libavcodec PNG encoder).
std::vector<uint8_t> encode_png(DecodedImage const&);

// Returns standard (RFC 4648, padded) base64 text for binary data.
std::string encode_base64(std::vector<uint8_t> const&);

// Writes data to a file, replacing it; throws std::ios_base::failure
// (a std::system_error) on error.
void save_file(std::string const& path, std::vector<uint8_t> const&);

}  // namespace snapmcp
