#include "xy.h"

#include <doctest/doctest.h>

namespace snapmcp {

TEST_CASE("XY arithmetic") {
    CHECK(XY{3, 5}.x == 3);
    CHECK(XY{3, 5}.y == 5);

    CHECK(XY{1.1, 2.2}.as<int>() == XY{1, 2});
    CHECK(XY{3, 5}.as<int64_t>() == XY<int64_t>{3, 5});

    CHECK(!XY{0, 0});
    CHECK(XY{1, 0});
    CHECK(XY{0, 1});
    CHECK(XY{3, 5} == XY{3, 5});
    CHECK(XY{3, 5} != XY{5, 3});
    CHECK(!(XY{3, 5} == XY{5, 3}));
    CHECK(!(XY{3, 5} != XY{3, 5}));

    CHECK(XY{3, 5} + XY{2, 1} == XY{5, 6});
    CHECK(XY{3, 5} - XY{2, 1} == XY{1, 4});
}

TEST_CASE("Region fits_within") {
    XY<int64_t> const area = {1920, 1080};
    CHECK(Region{{0, 0}, {1920, 1080}}.fits_within(area));
    CHECK(Region{{100, 200}, {300, 400}}.fits_within(area));
    CHECK(Region{{1919, 1079}, {1, 1}}.fits_within(area));

    CHECK(!Region{{0, 0}, {1921, 1080}}.fits_within(area));   // Too wide
    CHECK(!Region{{1900, 0}, {100, 100}}.fits_within(area));  // Overhangs
    CHECK(!Region{{-1, 0}, {10, 10}}.fits_within(area));      // Negative
    CHECK(!Region{{2000, 2000}, {10, 10}}.fits_within(area)); // Outside
    CHECK(!Region{{10, 10}, {0, 10}}.fits_within(area));      // Empty
    CHECK(!Region{{10, 10}, {10, 0}}.fits_within(area));
    CHECK(!Region{{0, 0}, {1, 1}}.fits_within({0, 0}));
}

TEST_CASE("Region clipped_to") {
    XY<int64_t> const area = {1920, 1080};
    Region const inside = {{100, 200}, {300, 400}};
    CHECK(inside.clipped_to(area) == inside);

    // Window dragged past the top left corner
    CHECK(Region{{-50, -20}, {300, 200}}.clipped_to(area) ==
          Region{{0, 0}, {250, 180}});

    // Window hanging off the bottom right
    CHECK(Region{{1800, 1000}, {300, 200}}.clipped_to(area) ==
          Region{{1800, 1000}, {120, 80}});

    // Larger than the screen on every side
    CHECK(Region{{-10, -10}, {4000, 3000}}.clipped_to(area) ==
          Region{{0, 0}, area});

    auto const gone = Region{{2000, 50}, {100, 100}}.clipped_to(area);
    CHECK(gone.size == XY<int64_t>{0, 0});
    CHECK(!gone.fits_within(area));
    CHECK(Region{{-200, 0}, {100, 100}}.clipped_to(area).size.x == 0);
}

}  // namespace snapmcp
