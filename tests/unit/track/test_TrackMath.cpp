#include <slidetrack/track/TrackMath.hpp>

#include <doctest/doctest.h>

using namespace ST;
using namespace ST::Track;

namespace {

auto fullWidthLayout(int slides) -> Widths {
    return computeWidths(LayoutMetrics{.viewport = 800.0, .gap = 20.0}, slides, 1);
}

} // namespace

TEST_SUITE("track.math") {

TEST_CASE("Widths derive the slide from the viewport") {
    SUBCASE("One per view") {
        auto widths = fullWidthLayout(5);
        CHECK(widths.slide == 800.0);
        CHECK(widths.slideAndGap == 820.0);
        CHECK(widths.track == 4100.0);
    }
    SUBCASE("Two per view with padding") {
        auto widths = computeWidths(LayoutMetrics{.viewport = 800.0, .gap = 20.0, .paddingLeft = 10.0, .paddingRight = 10.0}, 4, 2);
        CHECK(widths.slide == 380.0);
        CHECK(widths.slideAndGap == 400.0);
        CHECK(widths.track == 1600.0);
        CHECK(widths.paddingLeft == 10.0);
    }
    SUBCASE("Explicit slide width and minimum") {
        auto widths = computeWidths(LayoutMetrics{.viewport = 800.0, .gap = 10.0, .slideMin = 300.0, .slide = 250.0}, 3, 1);
        CHECK(widths.slide == 300.0);
        CHECK(widths.track == 930.0);
    }
    SUBCASE("Empty carousel") {
        CHECK(computeWidths(LayoutMetrics{.viewport = 800.0}, 0, 1).track == 0.0);
    }
}

TEST_CASE("Rounding helpers") {
    CHECK(roundToHalf(10.26) == 10.5);
    CHECK(roundToHalf(10.24) == 10.0);
    CHECK(roundToThousandth(1.23456) == doctest::Approx(1.235));
}

TEST_CASE("Rounding ties go toward positive infinity") {
    CHECK(roundToHalf(10.25) == 10.5);
    CHECK(roundToHalf(-0.25) == 0.0);
    CHECK(roundToHalf(-10.75) == -10.5);
    CHECK(roundToHalf(-10.8) == -11.0);
    CHECK(roundToThousandth(-2.0625) == doctest::Approx(-2.062));
}

TEST_CASE("Loop needs more slides than fit in view") {
    Options options;
    options.loop          = true;
    options.slidesPerView = 2;
    CHECK(canLoop(3, options));
    CHECK_FALSE(canLoop(2, options));
    options.loop = false;
    CHECK_FALSE(canLoop(10, options));
}

TEST_CASE("Offsets for slide indices") {
    auto const widths = fullWidthLayout(5);
    Options    options;

    CHECK(trackOffsetForIndex(0, widths, options, false) == 0.0);
    CHECK(trackOffsetForIndex(2, widths, options, false) == -1640.0);
    // The last slide is clamped to the right edge of the track.
    CHECK(trackOffsetForIndex(4, widths, options, false) == doctest::Approx(-3279.9));
    CHECK(trackOffsetForIndex(4, widths, options, true) == -3280.0);

    SUBCASE("Centred selection") {
        auto const padded = computeWidths(LayoutMetrics{.viewport = 800.0, .gap = 20.0, .paddingLeft = 10.0, .paddingRight = 10.0}, 4, 2);
        options.centerSelectedSlide = true;
        CHECK(trackOffsetForIndex(1, padded, options, false) == -190.0);
        // Negative positions clamp to the left padding.
        CHECK(trackOffsetForIndex(0, padded, options, false) == 10.0);
    }
}

TEST_CASE("Indices round trip through offsets") {
    auto const widths = fullWidthLayout(5);
    Options    options;
    for (int i = 0; i < 4; ++i) {
        CHECK(indexForTrackOffset(trackOffsetForIndex(i, widths, options, false), widths, 5) == i);
    }
    CHECK(indexForTrackOffset(-3279.9, widths, 5) == 4);
    CHECK(indexForTrackOffset(-400.0, widths, 5) == 0);
    CHECK(indexForTrackOffset(-420.0, widths, 5) == 1);
    CHECK(indexForTrackOffset(5000.0, widths, 5) == 0);
    CHECK(indexForTrackOffset(-99999.0, widths, 5) == 4);
    CHECK(indexForTrackOffset(-100.0, widths, 0) == 0);
}

TEST_CASE("Loop targets take the shortest way round") {
    constexpr double track = 4100.0;

    CHECK(resolveLoopTarget(0.0, -820.0, track, std::nullopt) == -820.0);
    CHECK(resolveLoopTarget(0.0, -3280.0, track, std::nullopt) == 820.0);
    CHECK(resolveLoopTarget(-3280.0, 0.0, track, std::nullopt) == -4100.0);

    SUBCASE("Half-track ties follow the velocity") {
        CHECK(resolveLoopTarget(0.0, 2050.0, track, std::nullopt) == -2050.0);
        CHECK(resolveLoopTarget(0.0, -2050.0, track, std::nullopt) == -2050.0);
        CHECK(resolveLoopTarget(0.0, -2050.0, track, -3.0) == -2050.0);
        CHECK(resolveLoopTarget(0.0, 2050.0, track, -3.0) == -2050.0);
        CHECK(resolveLoopTarget(0.0, -2050.0, track, 3.0) == 2050.0);
        CHECK(resolveLoopTarget(0.0, 2050.0, track, 3.0) == 2050.0);
    }
}

TEST_CASE("Launch velocity") {
    CHECK(resolveLaunchVelocity(0.0, -100.0, std::nullopt) == -kDefaultLaunchVelocity);
    CHECK(resolveLaunchVelocity(-100.0, 0.0, std::nullopt) == kDefaultLaunchVelocity);
    CHECK(resolveLaunchVelocity(0.0, 100.0, 5.0) == doctest::Approx(5.0 * 1.2 * 1.3));
    CHECK(resolveLaunchVelocity(0.0, 100.0, 20.0) == doctest::Approx(24.0));
    CHECK(resolveLaunchVelocity(0.0, 100.0, 0.0) == 0.0);
    CHECK(directionOf(0.0, -5.0) == -1);
    CHECK(directionOf(0.0, 5.0) == 1);
    CHECK(directionOf(3.0, 3.0) == 0);
}

TEST_CASE("Page counts") {
    Options options;
    CHECK(pageCount(5, options) == 5);
    CHECK(pageCount(0, options) == 1);

    options.slidesPerView = 2;
    CHECK(pageCount(5, options) == 4);
    CHECK(pageCount(2, options) == 1);

    options.slidesPerMove = 2;
    CHECK(pageCount(5, options) == 3);
    CHECK(pageForSlide(3, options) == 1);

    options.loop = true;
    CHECK(pageCount(5, options) == 3);
    CHECK(pageCount(6, options) == 3);
}

} // TEST_SUITE
