#include <catch2/catch.hpp>

#include "simqc/RadialProfile.hpp"
#include "Helpers.hpp"

using namespace ::sqc;

namespace {
    // Plane where each pixel is set by a function of its distance to (width/2, height/2).
    template<typename Func>
    auto radial_plane(i64 width, i64 height, Func&& func) -> std::vector<f32> {
        std::vector<f32> plane(static_cast<size_t>(width * height));
        const auto x0 = static_cast<f64>(width / 2);
        const auto y0 = static_cast<f64>(height / 2);
        for (i64 y = 0; y < height; ++y) {
            for (i64 x = 0; x < width; ++x) {
                const f64 dx = static_cast<f64>(x) - x0;
                const f64 dy = static_cast<f64>(y) - y0;
                plane[static_cast<size_t>(y * width + x)] = static_cast<f32>(func(std::sqrt(dx * dx + dy * dy)));
            }
        }
        return plane;
    }
}

TEST_CASE("Radial profile bins", "[radial]") {
    REQUIRE(radial_bin_count(100, 100) == 37);
    REQUIRE(radial_bin_count(512, 512) == 192);

    const auto plane = radial_plane(100, 100, [](f64) { return 1.; });
    const RadialProfile profile = radial_profile(plane, 100, 100, test::micrometers(0.1, 0.1, 0.1));
    REQUIRE(profile.max_radius == 50);
    REQUIRE(profile.n_bins == 37);
    REQUIRE(profile.bins.size() == 37);
    REQUIRE(profile.is_spectral);
    REQUIRE(profile.unit == "1/um");
    REQUIRE(profile.bins.back().frequency == Approx(5)); // Nyquist: 0.5 / 0.1
    REQUIRE(profile.bins.front().frequency == Approx(5. / 37));
    for (const auto& bin: profile.bins) {
        REQUIRE(bin.count > 0);
        REQUIRE(bin.amplitude == Approx(1));
    }
    REQUIRE(profile.frequencies().size() == 37);
    REQUIRE(profile.amplitudes().front() == Approx(1));
}

TEST_CASE("Radial profile of a Gaussian", "[radial]") {
    const auto plane = radial_plane(100, 100, [](f64 radius) { return 1000 * std::exp(-radius * radius / 200); });
    for (bool corrected: {false, true}) {
        const RadialProfile profile = radial_profile(
            plane, 100, 100, test::micrometers(0.1, 0.1, 0.1), {.corrected_binning = corrected});
        const auto amplitudes = profile.amplitudes();
        for (size_t i = 1; i < amplitudes.size(); ++i)
            REQUIRE(amplitudes[i] <= amplitudes[i - 1]);
        REQUIRE(amplitudes.front() > amplitudes.back());
    }
}

TEST_CASE("Radial profile binning policies", "[radial]") {
    // Each pixel is set to its raw bin.
    constexpr f64 max_radius = 50;
    constexpr f64 n_bins = 37;
    const auto plane = radial_plane(100, 100, [](f64 radius) { return std::floor(radius / max_radius * n_bins); });
    const Calibration calibration = test::micrometers(0.1, 0.1, 0.1);

    const RadialProfile corrected = radial_profile(plane, 100, 100, calibration, {.corrected_binning = true});
    REQUIRE(corrected.bins[0].amplitude == Approx(0));
    REQUIRE(corrected.bins[0].count == 5);
    REQUIRE(corrected.bins[5].amplitude == Approx(5));
    REQUIRE(corrected.bins[20].amplitude == Approx(20));

    // The reference binning merges the raw bins 0 and 1, and shifts the others down by one.
    const RadialProfile reference = radial_profile(plane, 100, 100, calibration, {.corrected_binning = false});
    REQUIRE(reference.bins[0].amplitude > 0);
    REQUIRE(reference.bins[0].amplitude < 1);
    REQUIRE(reference.bins[0].count > corrected.bins[0].count);
    REQUIRE(reference.bins[5].amplitude == Approx(6));
    REQUIRE(reference.bins[20].amplitude == Approx(21));
}

TEST_CASE("Radial profile errors", "[radial]") {
    const std::vector<f32> plane(100 * 100, 1.f);
    REQUIRE(test::thrown_error([&] {
        static_cast<void>(radial_profile(plane, 100, 100, Calibration{}));
    }) == Error::UNCALIBRATED_DATA);
    REQUIRE(test::thrown_error([&] {
        static_cast<void>(radial_profile(plane, 100, 99, test::micrometers(0.1, 0.1, 0.1)));
    }) == Error::DIMENSION_MISMATCH);

    const std::vector<f32> tiny(1, 1.f);
    REQUIRE(test::thrown_error([&] {
        static_cast<void>(radial_profile(tiny, 1, 1, test::micrometers(0.1, 0.1, 0.1)));
    }) == Error::INVALID_INPUT);
}

TEST_CASE("Radial profile of a spectrum", "[radial]") {
    const Calibration calibration{.pixel_width = 80, .pixel_height = 80, .pixel_depth = 125, .unit = LengthUnit::NANOMETER};
    const ImageVolume volume = test::random_volume({.width = 64, .height = 64, .slices = 2}, 3, calibration);
    const SpectralImage spectrum = SpectralTransform2D().transform(volume);

    const RadialProfile profile = radial_profile(spectrum, 1);
    REQUIRE(profile.n_bins == radial_bin_count(64, 64));
    REQUIRE(profile.unit == "1/nm");
    REQUIRE(profile.bins.back().frequency == Approx(0.5 / 80));
}

TEST_CASE("Radial profile with a fractional radius", "[radial]") {
    // mR = 5.25: the first sampled row and column are at -0.25 and are truncated onto the image edge.
    const auto plane = radial_plane(10, 11, [](f64) { return 2.; });
    const RadialProfile profile = radial_profile(plane, 10, 11, test::micrometers(0.1, 0.1, 0.1));
    REQUIRE(profile.max_radius == 5.25);
    REQUIRE(profile.n_bins == 3);

    i64 total{};
    for (const auto& bin: profile.bins) {
        total += bin.count;
        REQUIRE(bin.amplitude == Approx(2));
    }
    REQUIRE(total == 11 * 11);
}
