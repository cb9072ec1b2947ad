#include <doctest/doctest.h>
#include "derive/MapGenerators.h"
#include "TestImages.h"

using namespace MapForge;
using namespace MapForge::MapGenerators;

namespace {

void checkGrayscale(const PixelBuffer& map, const PixelBuffer& source) {
    REQUIRE(map.width == source.width);
    REQUIRE(map.height == source.height);
    REQUIRE(map.channels == source.channels);
    for (uint32_t y = 0; y < map.height; ++y) {
        for (uint32_t x = 0; x < map.width; ++x) {
            size_t idx = map.pixelIndex(x, y);
            CHECK(map.pixels[idx + 0] == map.pixels[idx + 1]);
            CHECK(map.pixels[idx + 1] == map.pixels[idx + 2]);
            CHECK(map.alpha(x, y) == source.alpha(x, y));
        }
    }
}

} // namespace

TEST_SUITE("Luminance maps") {
    TEST_CASE("roughness value inverts and boosts contrast") {
        CHECK(roughnessValue(255.0, 1.0) == doctest::Approx(0.0));
        CHECK(roughnessValue(0.0, 1.0) == doctest::Approx(255.0));
        CHECK(roughnessValue(0.0, 0.5) == doctest::Approx(127.5));
        CHECK(roughnessValue(127.5, 1.0) == doctest::Approx(127.5));
        // (255 - 51) * 0.6 = 122.4 -> ((0.48 - 0.5) * 1.5 + 0.5) * 255 = 119.85
        CHECK(roughnessValue(51.0, 0.6) == doctest::Approx(119.85));
    }

    TEST_CASE("ambient occlusion threshold") {
        CHECK(ambientOcclusionValue(0.0) == doctest::Approx(0.0));
        CHECK(ambientOcclusionValue(50.0) == doctest::Approx(127.5));
        CHECK(ambientOcclusionValue(99.0) == doctest::Approx(252.45));
        CHECK(ambientOcclusionValue(100.0) == doctest::Approx(255.0));
        CHECK(ambientOcclusionValue(200.0) == doctest::Approx(255.0));
    }

    TEST_CASE("height value applies mild contrast") {
        CHECK(heightValue(127.5) == doctest::Approx(127.5));
        CHECK(heightValue(0.0) == doctest::Approx(0.0));
        CHECK(heightValue(255.0) == doctest::Approx(255.0));
        CHECK(heightValue(204.0) == doctest::Approx(((0.8 - 0.5) * 1.2 + 0.5) * 255.0));
    }

    TEST_CASE("flat white image") {
        PixelBuffer white = TestImages::solid(4, 4, 4, 255, 255, 255);

        auto roughness = generateRoughnessMap(white, 1.0);
        auto ao = generateAmbientOcclusionMap(white);
        auto height = generateHeightMap(white);
        REQUIRE(roughness.has_value());
        REQUIRE(ao.has_value());
        REQUIRE(height.has_value());

        for (size_t i = 0; i < white.pixelCount(); ++i) {
            CHECK(roughness->pixels[i * 4] == 0);
            CHECK(ao->pixels[i * 4] == 255);
            CHECK(height->pixels[i * 4] == 255);
        }
    }

    TEST_CASE("flat black image") {
        PixelBuffer black = TestImages::solid(3, 3, 3, 0, 0, 0);

        auto roughness = generateRoughnessMap(black, 1.0);
        auto ao = generateAmbientOcclusionMap(black);
        auto height = generateHeightMap(black);
        REQUIRE(roughness.has_value());
        REQUIRE(ao.has_value());
        REQUIRE(height.has_value());

        CHECK(roughness->pixels[0] == 255);
        CHECK(ao->pixels[0] == 0);
        CHECK(height->pixels[0] == 0);
    }

    TEST_CASE("ambient occlusion rounds below the threshold") {
        // avg 50 -> 127.5, rounds to even
        auto ao = generateAmbientOcclusionMap(TestImages::solid(2, 2, 3, 50, 50, 50));
        REQUIRE(ao.has_value());
        CHECK(ao->pixels[0] == 128);

        // avg 60 -> 153
        auto ao60 = generateAmbientOcclusionMap(TestImages::solid(2, 2, 3, 30, 60, 90));
        REQUIRE(ao60.has_value());
        CHECK(ao60->pixels[0] == 153);

        // RGB sum 10 -> avg/100*255 = 8.5 exactly, ties to even gives 8 (half-up would give 9)
        auto tie = generateAmbientOcclusionMap(TestImages::solid(2, 2, 3, 3, 3, 4));
        REQUIRE(tie.has_value());
        CHECK(tie->pixels[0] == 8);

        auto bright = generateAmbientOcclusionMap(TestImages::solid(2, 2, 3, 100, 100, 100));
        REQUIRE(bright.has_value());
        CHECK(bright->pixels[0] == 255);
    }

    TEST_CASE("grayscale maps keep layout and alpha") {
        for (uint32_t channels : {3u, 4u}) {
            CAPTURE(channels);
            PixelBuffer source = TestImages::pattern(9, 6, channels);

            auto roughness = generateRoughnessMap(source, 0.8);
            auto ao = generateAmbientOcclusionMap(source);
            auto height = generateHeightMap(source);
            REQUIRE(roughness.has_value());
            REQUIRE(ao.has_value());
            REQUIRE(height.has_value());

            checkGrayscale(*roughness, source);
            checkGrayscale(*ao, source);
            checkGrayscale(*height, source);
        }
    }

    TEST_CASE("source is left untouched") {
        PixelBuffer source = TestImages::pattern(5, 5, 4);
        PixelBuffer copy = source;
        auto height = generateHeightMap(source);
        REQUIRE(height.has_value());
        CHECK(source.pixels == copy.pixels);
    }

    TEST_CASE("metalness is a uniform classification") {
        PixelBuffer source = TestImages::pattern(3, 2, 3);

        auto metal = generateMetalnessMap(source, true);
        REQUIRE(metal.has_value());
        CHECK(metal->channels == 4);
        CHECK(metal->width == 3);
        CHECK(metal->height == 2);
        for (uint8_t v : metal->pixels) {
            CHECK(v == 255);
        }

        for (uint32_t size : {1u, 7u, 32u}) {
            auto dielectric = generateMetalnessMap(TestImages::pattern(size, size, 4), false);
            REQUIRE(dielectric.has_value());
            for (size_t i = 0; i < dielectric->pixelCount(); ++i) {
                CHECK(dielectric->pixels[i * 4 + 0] == 0);
                CHECK(dielectric->pixels[i * 4 + 1] == 0);
                CHECK(dielectric->pixels[i * 4 + 2] == 0);
                CHECK(dielectric->pixels[i * 4 + 3] == 255);
            }
        }
    }

    TEST_CASE("invalid sources report UnsupportedFormat") {
        DeriveError error;
        CHECK_FALSE(generateRoughnessMap(TestImages::malformed(), 1.0, &error).has_value());
        CHECK(error.kind == DeriveErrorKind::UnsupportedFormat);
        REQUIRE(error.map.has_value());
        CHECK(*error.map == MapKind::Roughness);

        CHECK_FALSE(generateMetalnessMap(PixelBuffer(), true, &error).has_value());
        CHECK(*error.map == MapKind::Metalness);

        CHECK_FALSE(generateHeightMap(PixelBuffer(2, 2, 2), &error).has_value());
        CHECK(*error.map == MapKind::Height);
    }
}
