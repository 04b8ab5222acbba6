#include <slidetrack/coords/SlideVisibility.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace ST;
using namespace ST::Coords;

namespace {

auto halfViewport() -> Widths {
    return Widths{.viewport = 800.0, .track = 1600.0, .slide = 400.0, .gap = 0.0, .slideAndGap = 400.0};
}

auto slides(int count) -> std::vector<SlideDescriptor> {
    std::vector<SlideDescriptor> result;
    for (int i = 0; i < count; ++i) {
        result.push_back(SlideDescriptor{.logicalIndex = i, .renderIndex = i});
    }
    return result;
}

} // namespace

TEST_SUITE("coords.visibility") {

TEST_CASE("Slides at rest") {
    auto info = computeSlideVisibility(halfViewport(), slides(4), 0.0);
    REQUIRE(info.size() == 4);

    CHECK(info[0].visibilityPercent == 1.0);
    CHECK(info[0].isFullyVisible);
    CHECK(info[0].leftVisibility == 1.0);
    CHECK(info[0].rightVisibility == 1.0);
    CHECK(info[0].parallaxVisibility == 0.0);
    CHECK(info[0].parallax == doctest::Approx(-0.5));
    CHECK(info[1].parallax == doctest::Approx(0.5));

    CHECK_FALSE(info[2].isVisible);
    CHECK(info[2].visibilityPercent == 0.0);
    CHECK(info[2].parallaxVisibility == 1.0);
    CHECK(info[2].slideStart == 800.0);
    CHECK(info[2].slideEnd == 1200.0);
}

TEST_CASE("Partially visible slides on both edges") {
    auto info = computeSlideVisibility(halfViewport(), slides(4), -200.0);

    CHECK(info[0].visibilityPercent == 0.5);
    CHECK(info[0].isVisible);
    CHECK_FALSE(info[0].isFullyVisible);
    CHECK(info[0].leftVisibility == 0.5);
    CHECK(info[0].rightVisibility == 1.0);
    CHECK(info[0].parallaxVisibility == -0.5);

    CHECK(info[2].visibilityPercent == 0.5);
    CHECK(info[2].rightVisibility == 0.5);
    CHECK(info[2].leftVisibility == 1.0);
    CHECK(info[2].parallaxVisibility == 0.5);

    CHECK_FALSE(info[3].isVisible);
}

TEST_CASE("Fully visible from two thirds") {
    auto info = computeSlideVisibility(halfViewport(), slides(3), -120.0);
    CHECK(info[0].visibilityPercent == doctest::Approx(0.7));
    CHECK(info[0].isFullyVisible);
    CHECK(info[2].visibilityPercent == doctest::Approx(0.3));
    CHECK_FALSE(info[2].isFullyVisible);
}

TEST_CASE("Buffer widens the viewport") {
    auto info = computeSlideVisibility(halfViewport(), slides(3), 0.0, 100.0);
    CHECK(info[2].isVisible);
    CHECK(info[2].visibilityPercent == 0.25);
}

TEST_CASE("Render index decides the slot") {
    auto wrapped           = slides(3);
    wrapped[2].renderIndex = -1;
    auto info              = computeSlideVisibility(halfViewport(), wrapped, 200.0);
    CHECK(info[2].logicalIndex == 2);
    CHECK(info[2].renderIndex == -1);
    CHECK(info[2].visibilityPercent == 0.5);
    CHECK(info[2].parallaxVisibility == -0.5);
}

} // TEST_SUITE
