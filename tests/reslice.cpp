#include <catch2/catch.hpp>

#include "simqc/Reslice.hpp"
#include "Helpers.hpp"

using namespace ::sqc;

TEST_CASE("Orthogonal view without interpolation", "[reslice]") {
    ImageVolume volume({.width = 8, .height = 6, .slices = 4});
    volume.at(volume.plane_index(0, 1, 0), 2, 3) = 10; // x=3, y=2, z=1
    volume.set_display_range({0, 500});

    const OrthogonalResampler resampler({.interpolate = false});
    const ImageVolume xz = resampler.reslice(volume);
    REQUIRE(xz.width() == 8);
    REQUIRE(xz.height() == 4);
    REQUIRE(xz.slices() == 6);
    REQUIRE(xz.display_range() == Vec<f64, 2>{0, 500});

    // Plane y, row z.
    REQUIRE(xz.at(xz.plane_index(0, 2, 0), 1, 3) == 10);
    f64 sum{};
    for (f32 value: xz.samples())
        sum += value;
    REQUIRE(sum == 10);

    // Reslicing twice gives the input back.
    const ImageVolume round_trip = resampler.reslice(xz);
    REQUIRE(round_trip.dimensions() == volume.dimensions());
    REQUIRE(std::ranges::equal(round_trip.samples(), volume.samples()));
}

TEST_CASE("Orthogonal view of an isotropic volume", "[reslice]") {
    const Calibration calibration = test::micrometers(0.1, 0.1, 0.1);
    const ImageVolume volume = test::random_volume({.width = 10, .height = 12, .channels = 2, .slices = 5}, 11, calibration);

    const ImageVolume interpolated = OrthogonalResampler({.interpolate = true}).reslice(volume);
    const ImageVolume strided = OrthogonalResampler({.interpolate = false}).reslice(volume);
    REQUIRE(interpolated.dimensions() == strided.dimensions());
    REQUIRE(std::ranges::equal(interpolated.samples(), strided.samples()));

    const ImageVolume round_trip = OrthogonalResampler().reslice(interpolated);
    REQUIRE(std::ranges::equal(round_trip.samples(), volume.samples()));
    REQUIRE(interpolated.calibration().pixel_height == Approx(0.1));
    REQUIRE(interpolated.calibration().pixel_depth == Approx(0.1));
}

TEST_CASE("Orthogonal view of an anisotropic volume", "[reslice]") {
    const Calibration calibration = test::micrometers(0.1, 0.1, 0.2);
    const ImageVolume volume = test::random_volume({.width = 10, .height = 30, .slices = 5, .frames = 2}, 5, calibration);

    const OrthogonalResampler resampler;
    const Dimensions expected{.width = 10, .height = 10, .channels = 1, .slices = 15, .frames = 2};
    REQUIRE(resampler.output_dimensions(volume.dimensions(), calibration) == expected);

    const ImageVolume xz = resampler.reslice(volume);
    REQUIRE(xz.dimensions() == expected);
    REQUIRE(xz.calibration().pixel_width == Approx(0.1));
    REQUIRE(xz.calibration().pixel_height == Approx(0.1));
    REQUIRE(xz.calibration().pixel_depth == Approx(0.2));
    REQUIRE(xz.calibration().unit == LengthUnit::MICROMETER);

    // The first and last rows are the first and last z-planes of the input row.
    const i64 output_plane = xz.plane_index(0, 3, 1);
    const i64 input_row = 6; // 3 * spacing
    for (i64 x = 0; x < 10; ++x) {
        REQUIRE(xz.at(output_plane, 0, x) == Approx(volume.at(volume.plane_index(0, 0, 1), input_row, x)));
        REQUIRE(xz.at(output_plane, 9, x) == Approx(volume.at(volume.plane_index(0, 4, 1), input_row, x)));
    }

    const Calibration strided = OrthogonalResampler({.interpolate = false}).output_calibration(calibration);
    REQUIRE(strided.pixel_height == Approx(0.2));
    REQUIRE(strided.pixel_depth == Approx(0.1));
}

TEST_CASE("Interpolated orthogonal view of a bright voxel", "[reslice]") {
    ImageVolume volume({.width = 8, .height = 8, .slices = 4}, test::micrometers(0.1, 0.1, 0.2));
    volume.at(volume.plane_index(0, 2, 0), 4, 3) = 100; // x=3, y=4, z=2

    const OrthogonalResampler resampler({.interpolate = true});
    const ImageVolume xz = resampler.reslice(volume);
    REQUIRE(xz.width() == 8);
    REQUIRE(xz.height() == 8);
    REQUIRE(xz.slices() == 4);

    // Reslicing twice gives the input shape back, with the voxel blurred along y and z.
    const ImageVolume round_trip = resampler.reslice(xz);
    REQUIRE(round_trip.dimensions() == volume.dimensions());
    REQUIRE(round_trip.calibration().pixel_height == Approx(0.1));
    REQUIRE(round_trip.calibration().pixel_depth == Approx(0.2));

    const f32 peak = round_trip.at(round_trip.plane_index(0, 2, 0), 4, 3);
    REQUIRE(peak == Approx(56.25));
    REQUIRE(std::ranges::max(round_trip.samples()) == Approx(peak));
    for (i64 z: {0, 1, 3})
        REQUIRE(std::ranges::max(round_trip.plane(z)) < peak / 2);
}

TEST_CASE("Orthogonal view errors", "[reslice]") {
    const OrthogonalResampler resampler;
    REQUIRE(test::thrown_error([&] {
        static_cast<void>(resampler.reslice(ImageVolume({.width = 8, .height = 8, .slices = 1})));
    }) == Error::INVALID_INPUT);
    REQUIRE(test::thrown_error([&] {
        const ImageVolume volume({.width = 8, .height = 8, .slices = 4}, Calibration{}, Precision::U16);
        static_cast<void>(resampler.reslice(volume));
    }) == Error::INVALID_INPUT);
}
