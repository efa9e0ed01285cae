#include <catch2/catch.hpp>

#include "simqc/Image.hpp"
#include "simqc/ResultSet.hpp"
#include "simqc/Utilities.hpp"
#include "Helpers.hpp"

using namespace ::sqc;

TEST_CASE("Calibration units", "[image]") {
    REQUIRE(parse_length_unit("µm") == LengthUnit::MICROMETER);
    REQUIRE(parse_length_unit("Micron") == LengthUnit::MICROMETER);
    REQUIRE(parse_length_unit("nm") == LengthUnit::NANOMETER);
    REQUIRE(parse_length_unit("") == LengthUnit::PIXEL);
    REQUIRE(parse_length_unit("pixel") == LengthUnit::PIXEL);
    REQUIRE(test::thrown_error([] { static_cast<void>(parse_length_unit("inch")); }) == Error::UNCALIBRATED_DATA);

    const Calibration nanometers{.pixel_width = 80, .pixel_height = 80, .pixel_depth = 125, .unit = LengthUnit::NANOMETER};
    REQUIRE(nanometers.is_calibrated());
    const Calibration converted = nanometers.to_micrometers();
    REQUIRE(converted.pixel_width == Approx(0.08));
    REQUIRE(converted.pixel_depth == Approx(0.125));
    REQUIRE(converted.unit == LengthUnit::MICROMETER);

    REQUIRE_FALSE(Calibration{}.is_calibrated());
    REQUIRE(test::thrown_error([] { static_cast<void>(Calibration{}.to_micrometers()); }) == Error::UNCALIBRATED_DATA);
}

TEST_CASE("Image volume", "[image]") {
    ImageVolume volume({.width = 4, .height = 3, .channels = 2, .slices = 5, .frames = 2});
    REQUIRE(volume.stack_size() == 20);
    REQUIRE(volume.samples().size() == 240);
    REQUIRE(volume.plane_index(1, 2, 1) == 15);
    REQUIRE(volume.plane(1, 2, 1).size() == 12);

    volume.at(volume.plane_index(1, 2, 1), 2, 3) = 7;
    REQUIRE(volume.samples()[15 * 12 + 2 * 4 + 3] == 7);
    volume.reset_display_range();
    REQUIRE(volume.display_range() == Vec<f64, 2>{0, 7});

    const ImageVolume other = volume.like({.width = 2, .height = 2});
    REQUIRE(other.display_range() == volume.display_range());
    REQUIRE(other.precision() == volume.precision());

    REQUIRE(test::thrown_error([&] { static_cast<void>(volume.plane(20)); }) == Error::INVALID_INPUT);
    REQUIRE(test::thrown_error([] { ImageVolume invalid({.width = 0, .height = 2}); }) == Error::INVALID_INPUT);
    REQUIRE(test::thrown_error([] {
        ImageVolume invalid({.width = 2, .height = 2}, std::vector<f32>(3));
    }) == Error::DIMENSION_MISMATCH);
}

TEST_CASE("Plane utilities", "[image]") {
    ImageVolume volume({.width = 4, .height = 4, .channels = 2, .slices = 3});
    for (i64 z = 0; z < 3; ++z)
        for (i64 c = 0; c < 2; ++c)
            std::ranges::fill(volume.plane(c, z, 0), static_cast<f32>(10 * c + z));

    SECTION("projection and extraction") {
        const ImageVolume projection = max_project_z(volume);
        REQUIRE(projection.slices() == 1);
        REQUIRE(projection.plane(1, 0, 0)[5] == 12);

        const ImageVolume center = central_slice(volume);
        REQUIRE(center.plane(0, 0, 0)[0] == 1);

        const ImageVolume channel = extract_channel(volume, 1);
        REQUIRE(channel.channels() == 1);
        REQUIRE(channel.plane(0, 2, 0)[0] == 12);
        REQUIRE(test::thrown_error([&] { static_cast<void>(extract_channel(volume, 2)); }) == Error::INVALID_INPUT);
    }

    SECTION("autoscale") {
        autoscale_planes(volume);
        REQUIRE(volume.plane(1, 2, 0)[0] == 1);
        REQUIRE(volume.plane(0, 0, 0)[0] == 0); // zero plane is left unchanged
    }

    SECTION("rotation") {
        // A vertical line becomes a horizontal line after a quarter turn.
        ImageVolume line({.width = 5, .height = 5});
        for (i64 y = 0; y < 5; ++y)
            line.at(0, y, 2) = 1;
        const ImageVolume rotated = rotate_planes(line, 90);
        for (i64 x = 0; x < 5; ++x)
            REQUIRE(rotated.at(0, 2, x) == Approx(1).margin(1e-6));
        REQUIRE(rotated.at(0, 0, 2) == Approx(0).margin(1e-6));
    }

    SECTION("resize and pad to square") {
        ImageVolume plane({.width = 8, .height = 8});
        std::ranges::fill(plane.samples(), 1.f);
        const ImageVolume square = resize_and_pad_to_square(plane, 0.5);
        REQUIRE(square.width() == 8);
        REQUIRE(square.height() == 8);
        REQUIRE(square.at(0, 0, 0) == 0);
        REQUIRE(square.at(0, 2, 0) == 1);
        REQUIRE(square.at(0, 5, 7) == 1);
        REQUIRE(square.at(0, 6, 7) == 0);
    }
}

TEST_CASE("Feature statistics", "[image]") {
    // Long tail on the right, as with a dark background.
    const std::vector<i64> histogram{100, 50, 25, 12, 6, 3, 1, 0};
    REQUIRE(triangle_threshold(histogram) == 3);

    // Bright squares on a dark background.
    ImageVolume volume({.width = 16, .height = 16, .slices = 2});
    for (i64 z = 0; z < 2; ++z) {
        std::ranges::fill(volume.plane(z), 1.f);
        for (i64 y = 4; y < 8; ++y)
            for (i64 x = 4; x < 8; ++x)
                volume.at(z, y, x) = static_cast<f32>(10 * (z + 1));
    }
    REQUIRE(feature_mean(volume) == Approx(15));

    // Without foreground, every pixel is used.
    ImageVolume flat({.width = 8, .height = 8});
    std::ranges::fill(flat.samples(), 3.f);
    REQUIRE(feature_mean(flat) == Approx(3));
}

TEST_CASE("Variance stabilization and normalization", "[image]") {
    VectorBatch batch(2, 2);
    batch.data = {4, -1, 16, 0};
    anscombe(batch);
    REQUIRE(batch(0, 0) == Approx(4.375));
    REQUIRE(batch(0, 1) == Approx(0.375));
    REQUIRE(batch(1, 0) == Approx(8.375));

    VectorBatch vectors(2, 2);
    vectors.data = {1, 3, 5, 7};
    normalize_inner(vectors);
    REQUIRE(vectors(0, 0) == Approx(2));
    REQUIRE(vectors(0, 1) == Approx(6));
    REQUIRE(vectors(1, 0) + vectors(1, 1) == Approx(8));
}

TEST_CASE("Result set", "[image]") {
    ResultSet results("Test");
    results.add_image("Spectrum", "A spectrum", ImageVolume({.width = 4, .height = 4}),
                      ResolutionRingSet{.spectrum_width = 4, .spectrum_height = 4});
    results.add_stat("Ratio", 1.5, StatStatus::PASS);
    results.add_stat("Mean", 2);
    results.add_info("Note", "Check this");

    REQUIRE(results.name() == "Test");
    REQUIRE(results.has_image("Spectrum"));
    REQUIRE_FALSE(results.has_image("Other"));
    REQUIRE(results.image("Spectrum").rings.has_value());
    REQUIRE(results.stat("Ratio").value == 1.5);
    REQUIRE(results.info("Note") == "Check this");

    const std::string summary = results.summary();
    REQUIRE(summary.find("Spectrum (4x4, 1 planes") != std::string::npos);
    REQUIRE(summary.find("Ratio = 1.5 (Yes)") != std::string::npos);
    REQUIRE(summary.find("Note: Check this") != std::string::npos);

    REQUIRE(test::thrown_error([&] { results.add_info("Note", "again"); }) == Error::INVALID_INPUT);
    REQUIRE(test::thrown_error([&] { static_cast<void>(results.profile("Radial")); }) == Error::INVALID_INPUT);
}
