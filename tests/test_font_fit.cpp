#include "topclock/clock/font_fit.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace topclock;
using namespace topclock::clock;

namespace {

// Monospace-ish text: 11 glyphs, each 0.6 of the pixel size wide
TextExtent measure_clock(int32_t size)
{
    return { size * 11 * 6 / 10, size };
}

} // namespace

TEST_CASE("Tall narrow boxes are limited by width", "[clock]")
{
    int calls = 0;
    auto fit = fit_font(
        { 300, 100 },
        10,
        [&](int32_t size)
        {
            ++calls;
            return measure_clock(size);
        }
    );

    // 280 wide: 42 * 6.6 = 277, 43 * 6.6 = 283
    REQUIRE(fit.size == 42);
    REQUIRE(fit.extent == TextExtent{ 277, 42 });
    REQUIRE(calls == 80 - 42 + 1);
}

TEST_CASE("Wide boxes are limited by height", "[clock]")
{
    auto fit = fit_font({ 1000, 60 }, 10, measure_clock);

    REQUIRE(fit.size == 40);
}

TEST_CASE("Boxes smaller than the padding fall back to size one", "[clock][edge]")
{
    auto fit = fit_font({ 15, 15 }, 10, measure_clock);

    REQUIRE(fit.size == 1);
    REQUIRE(fit.extent == measure_clock(1));
}

TEST_CASE("Text wider than any size falls back to size one", "[clock][edge]")
{
    auto fit = fit_font({ 40, 200 }, 0, [](int32_t) { return TextExtent{ 1000, 10 }; });

    REQUIRE(fit.size == 1);
}

TEST_CASE("Text is centred with truncating division", "[clock]")
{
    REQUIRE(centered_text_origin({ 300, 100 }, { 277, 42 }) == Point{ 11, 29 });
    REQUIRE(centered_text_origin({ 100, 50 }, { 100, 50 }) == Point{ 0, 0 });
}

TEST_CASE("Oversized text is centred at a negative origin", "[clock][edge]")
{
    REQUIRE(centered_text_origin({ 10, 10 }, { 15, 13 }) == Point{ -2, -1 });
}
