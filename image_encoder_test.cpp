#include "image_encoder.h"

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <iterator>

#include <doctest/doctest.h>

namespace snapmcp {

namespace {

std::vector<uint8_t> bytes(std::string const& s) { return {s.begin(), s.end()}; }

uint32_t big_endian_at(std::vector<uint8_t> const& data, size_t pos) {
    return (data[pos] << 24) | (data[pos + 1] << 16) |
        (data[pos + 2] << 8) | data[pos + 3];
}

}  // anonymous namespace

TEST_CASE("encode_base64") {
    CHECK(encode_base64({}) == "");
    CHECK(encode_base64(bytes("f")) == "Zg==");
    CHECK(encode_base64(bytes("fo")) == "Zm8=");
    CHECK(encode_base64(bytes("foo")) == "Zm9v");
    CHECK(encode_base64(bytes("foobar")) == "Zm9vYmFy");
    CHECK(encode_base64({0xFB, 0xFF, 0xBF}) == "+/+/");
}

TEST_CASE("encode_png") {
    DecodedImage image;
    image.size = {3, 2};
    for (int i = 0; i < 6; ++i)
        image.rgba.insert(image.rgba.end(), {uint8_t(40 * i), 0x20, 0x40, 0xFF});

    auto const png = encode_png(image);
    REQUIRE(png.size() > 33);
    std::vector<uint8_t> const signature = {
        0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
    };
    CHECK(std::vector<uint8_t>(png.begin(), png.begin() + 8) == signature);
    CHECK(std::string(png.begin() + 12, png.begin() + 16) == "IHDR");
    CHECK(big_endian_at(png, 16) == 3);  // Width
    CHECK(big_endian_at(png, 20) == 2);  // Height
    CHECK(encode_base64(png).substr(0, 11) == "iVBORw0KGgo");

    DecodedImage bad;
    bad.size = {3, 2};
    bad.rgba.resize(5);
    CHECK_THROWS_AS(encode_png(bad), std::invalid_argument);
    CHECK_THROWS_AS(encode_png(DecodedImage{}), std::invalid_argument);
}

TEST_CASE("save_file") {
    char dir_template[] = "/tmp/snapmcp_test.XXXXXX";
    std::string const dir = mkdtemp(dir_template);
    std::string const path = dir + "/shot.png";

    save_file(path, bytes("first version"));
    save_file(path, bytes("second"));
    std::ifstream ifs(path, std::ios::binary);
    std::string const content{std::istreambuf_iterator<char>(ifs), {}};
    CHECK(content == "second");

    CHECK_THROWS_AS(
        save_file(dir + "/missing/shot.png", bytes("x")), std::system_error
    );

    unlink(path.c_str());
    rmdir(dir.c_str());
}

}  // namespace snapmcp
