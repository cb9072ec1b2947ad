#include <doctest/doctest.h>
#include "derive/MapDerivation.h"
#include "core/threading/TaskScheduler.h"
#include "image/ImageEncoder.h"
#include "TestImages.h"

using namespace MapForge;

namespace {

const DerivationParams DEFAULT_PARAMS{2.5, 0.6, false};

} // namespace

TEST_SUITE("MapDerivation") {
    TEST_CASE("derives all five maps at the albedo size") {
        TaskScheduler inlineScheduler;
        PixelBuffer albedo = TestImages::pattern(12, 7, 4);

        DerivationResult result = MapDerivation::deriveMaps(albedo, DEFAULT_PARAMS,
                                                            FailurePolicy::FailFast, &inlineScheduler);
        REQUIRE(result.ok());
        CHECK(result.errors.empty());
        CHECK(result.partialMaps.empty());

        for (MapKind kind : MapDerivation::GENERATED_KINDS) {
            const MaterialMap* map = result.maps->get(kind);
            REQUIRE(map != nullptr);
            CHECK(map->kind == kind);
            CHECK(map->image.width == 12);
            CHECK(map->image.height == 7);
        }
        CHECK(result.maps->get(MapKind::Albedo) == nullptr);
        CHECK_FALSE(MapDerivation::validateMapSet(*result.maps, 12, 7).has_value());
    }

    TEST_CASE("flat white scenario") {
        TaskScheduler inlineScheduler;
        DerivationParams params{2.5, 1.0, false};
        DerivationResult result = MapDerivation::deriveMaps(TestImages::solid(4, 4, 4, 255, 255, 255),
                                                            params, FailurePolicy::FailFast, &inlineScheduler);
        REQUIRE(result.ok());
        const MaterialMapSet& maps = *result.maps;
        CHECK(maps.normal.image.pixels[0] == 128);
        CHECK(maps.normal.image.pixels[1] == 128);
        CHECK(maps.normal.image.pixels[2] == 255);
        CHECK(maps.roughness.image.pixels[0] == 0);
        CHECK(maps.ao.image.pixels[0] == 255);
        CHECK(maps.height.image.pixels[0] == 255);
        CHECK(maps.metalness.image.pixels[0] == 0);
    }

    TEST_CASE("worker pool produces the same maps as inline execution") {
        PixelBuffer albedo = TestImages::pattern(33, 17, 3);
        DerivationParams params{3.0, 0.9, true};

        TaskScheduler inlineScheduler;
        DerivationResult expected = MapDerivation::deriveMaps(albedo, params,
                                                              FailurePolicy::FailFast, &inlineScheduler);

        TaskScheduler pool;
        pool.initialize(3);
        DerivationResult actual = MapDerivation::deriveMaps(albedo, params, FailurePolicy::FailFast, &pool);
        pool.shutdown();

        REQUIRE(expected.ok());
        REQUIRE(actual.ok());
        for (MapKind kind : MapDerivation::GENERATED_KINDS) {
            CAPTURE(mapKindName(kind));
            CHECK(actual.maps->get(kind)->image.pixels == expected.maps->get(kind)->image.pixels);
        }
    }

    TEST_CASE("fail fast reports only the first failure") {
        TaskScheduler inlineScheduler;
        DerivationResult result = MapDerivation::deriveMaps(TestImages::malformed(), DEFAULT_PARAMS,
                                                            FailurePolicy::FailFast, &inlineScheduler);
        CHECK_FALSE(result.ok());
        CHECK(result.partialMaps.empty());
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors[0].kind == DeriveErrorKind::UnsupportedFormat);
        REQUIRE(result.errors[0].map.has_value());
        CHECK(*result.errors[0].map == MapKind::Normal);
    }

    TEST_CASE("partial results report every failure in generator order") {
        TaskScheduler inlineScheduler;
        DerivationResult result = MapDerivation::deriveMaps(TestImages::malformed(), DEFAULT_PARAMS,
                                                            FailurePolicy::PartialResults, &inlineScheduler);
        CHECK_FALSE(result.ok());
        CHECK(result.partialMaps.empty());
        REQUIRE(result.errors.size() == 5);
        for (size_t i = 0; i < result.errors.size(); ++i) {
            REQUIRE(result.errors[i].map.has_value());
            CHECK(*result.errors[i].map == MapDerivation::GENERATED_KINDS[i]);
        }
    }

    TEST_CASE("partial policy on valid input returns the full set") {
        TaskScheduler inlineScheduler;
        DerivationResult result = MapDerivation::deriveMaps(TestImages::pattern(4, 4, 4), DEFAULT_PARAMS,
                                                            FailurePolicy::PartialResults, &inlineScheduler);
        CHECK(result.ok());
        CHECK(result.partialMaps.empty());
    }

    TEST_CASE("decode failure stops before any generator") {
        TaskScheduler inlineScheduler;
        PixelBuffer albedo;
        DerivationResult result = MapDerivation::deriveMapsFromSource(
            "data:image/png;base64,AAAA", DEFAULT_PARAMS, FailurePolicy::PartialResults,
            &inlineScheduler, &albedo);

        CHECK_FALSE(result.ok());
        CHECK(result.partialMaps.empty());
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors[0].kind == DeriveErrorKind::DecodeError);
        CHECK_FALSE(result.errors[0].map.has_value());
        CHECK(albedo.pixels.empty());
    }

    TEST_CASE("deriveMapsFromSource hands back the decoded albedo") {
        PixelBuffer source = TestImages::pattern(5, 4, 4);
        auto uri = ImageEncoder::encodeDataUri(source);
        REQUIRE(uri.has_value());

        TaskScheduler inlineScheduler;
        PixelBuffer albedo;
        DerivationResult result = MapDerivation::deriveMapsFromSource(
            *uri, DEFAULT_PARAMS, FailurePolicy::FailFast, &inlineScheduler, &albedo);

        REQUIRE(result.ok());
        CHECK(albedo.pixels == source.pixels);
        CHECK(result.maps->height.image.width == 5);
    }

    TEST_CASE("validateMapSet reports the first mismatched map") {
        TaskScheduler inlineScheduler;
        DerivationResult result = MapDerivation::deriveMaps(TestImages::pattern(4, 4, 4), DEFAULT_PARAMS,
                                                            FailurePolicy::FailFast, &inlineScheduler);
        REQUIRE(result.ok());

        MaterialMapSet maps = *result.maps;
        maps.height.image = TestImages::solid(2, 2, 4, 0, 0, 0);

        auto error = MapDerivation::validateMapSet(maps, 4, 4);
        REQUIRE(error.has_value());
        CHECK(error->kind == DeriveErrorKind::DimensionMismatch);
        REQUIRE(error->map.has_value());
        CHECK(*error->map == MapKind::Height);

        auto wrongSize = MapDerivation::validateMapSet(*result.maps, 8, 4);
        REQUIRE(wrongSize.has_value());
        CHECK(*wrongSize->map == MapKind::Normal);
    }
}
