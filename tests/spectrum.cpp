#include <catch2/catch.hpp>
#include <limits>
#include <string>

#include "simqc/Spectrum.hpp"
#include "Helpers.hpp"

using namespace ::sqc;

TEST_CASE("Spectrum of a flat plane", "[spectrum]") {
    ImageVolume flat({.width = 64, .height = 64});
    std::ranges::fill(flat.samples(), 3.f);

    const SpectralImage spectrum = SpectralTransform2D().transform(flat);
    REQUIRE(spectrum.dimensions() == flat.dimensions());
    for (f32 value: spectrum.volume().samples())
        REQUIRE(value == 0);

    // The 8-bit display scaling stays within [1,254].
    const SpectralImage display = SpectralTransform2D({.output = Precision::U8}).transform(flat);
    REQUIRE(display.volume().precision() == Precision::U8);
    for (f32 value: display.volume().samples())
        REQUIRE(value == 1);
}

TEST_CASE("Failed spectra are reported together", "[spectrum]") {
    ImageVolume volume = test::random_volume({.width = 16, .height = 16, .slices = 5});
    volume.at(1, 3, 4) = std::numeric_limits<f32>::quiet_NaN();
    volume.at(3, 0, 0) = std::numeric_limits<f32>::infinity();

    const SpectralTransform2D transform({.n_threads = 4});
    REQUIRE(test::thrown_error([&] {
        static_cast<void>(transform.amplitude(volume.plane(1), 16, 16));
    }) == Error::INVALID_INPUT);

    std::string message;
    try {
        static_cast<void>(transform.transform(volume));
    } catch (const Exception& e) {
        REQUIRE(e.code() == Error::WORKER_FAILURE);
        message = e.what();
    }
    REQUIRE(message.find("plane 1:") != std::string::npos);
    REQUIRE(message.find("plane 3:") != std::string::npos);
    REQUIRE(message.find("plane 0:") == std::string::npos);
    REQUIRE(message.find("plane 2:") == std::string::npos);
    REQUIRE(message.find("plane 4:") == std::string::npos);
}

TEST_CASE("Spectrum shape", "[spectrum]") {
    const ImageVolume volume = test::random_volume({.width = 100, .height = 60, .channels = 2, .slices = 3});

    SECTION("padded to a power-of-two square") {
        const SpectralImage spectrum = SpectralTransform2D().transform(volume);
        REQUIRE(spectrum.width() == 128);
        REQUIRE(spectrum.height() == 128);
        REQUIRE(spectrum.dimensions().channels == 2);
        REQUIRE(spectrum.dimensions().slices == 3);
        REQUIRE(spectrum.is_padded());
        REQUIRE(spectrum.source_dimensions() == volume.dimensions());
        REQUIRE(spectrum.center() == Vec<i64, 2>{64, 64});
    }

    SECTION("not padded") {
        const SpectralImage spectrum = SpectralTransform2D({.pad = false}).transform(volume);
        REQUIRE(spectrum.width() == 100);
        REQUIRE(spectrum.height() == 60);
        REQUIRE_FALSE(spectrum.is_padded());
        REQUIRE(spectrum.center() == Vec<i64, 2>{50, 30});
    }
}

TEST_CASE("Spectrum values", "[spectrum]") {
    const SpectralTransform2D transform({.window_fraction = 0, .pad = false, .scaling = SpectrumScaling::LINEAR});

    SECTION("an impulse gives a flat spectrum") {
        std::vector<f32> plane(64, 0.f);
        plane[0] = 1;
        for (f64 value: transform.amplitude(plane, 8, 8))
            REQUIRE(value == Approx(1));
    }

    SECTION("the zero frequency is at the center") {
        // Columns alternate between 1 and 2.
        std::vector<f32> plane(64);
        for (i64 y = 0; y < 8; ++y)
            for (i64 x = 0; x < 8; ++x)
                plane[static_cast<size_t>(y * 8 + x)] = static_cast<f32>(1 + x % 2);
        const auto amplitude = transform.amplitude(plane, 8, 8);
        REQUIRE(amplitude[4 * 8 + 4] == Approx(96)); // sum
        REQUIRE(amplitude[4 * 8 + 0] == Approx(32)); // Nyquist along x
        REQUIRE(amplitude[0] == Approx(0).margin(1e-9));
    }

    SECTION("log scaling") {
        ImageVolume volume({.width = 8, .height = 8});
        volume.samples()[0] = 1;
        const SpectralImage spectrum =
            SpectralTransform2D({.window_fraction = 0, .scaling = SpectrumScaling::LOG}).transform(volume);
        for (f32 value: spectrum.volume().samples())
            REQUIRE(value == Approx(std::log(2.)));
    }
}

TEST_CASE("8-bit spectrum", "[spectrum]") {
    const ImageVolume volume = test::random_volume({.width = 32, .height = 32});
    const SpectralImage spectrum = SpectralTransform2D({.output = Precision::U8}).transform(volume);
    const auto samples = spectrum.volume().samples();
    const auto [min, max] = std::ranges::minmax(samples);
    REQUIRE(min >= 1);
    REQUIRE(max == 254);
    for (f32 value: samples)
        REQUIRE(value == std::round(value));
}

TEST_CASE("Spectrum calibration and input", "[spectrum]") {
    const Calibration calibration = test::micrometers(0.08, 0.08, 0.125);
    const ImageVolume volume = test::random_volume({.width = 50, .height = 50}, 7, calibration);
    const std::vector<f32> copy(volume.samples().begin(), volume.samples().end());

    const SpectralImage spectrum = SpectralTransform2D().transform(volume);
    REQUIRE(spectrum.calibration().pixel_width == 0.08);
    REQUIRE(spectrum.calibration().unit == LengthUnit::MICROMETER);
    REQUIRE(std::ranges::equal(copy, volume.samples()));
}

TEST_CASE("Edge window", "[spectrum]") {
    const auto window = edge_window(100, 10);
    REQUIRE(window[0] < 0.01);
    REQUIRE(window[99] < 0.01);
    REQUIRE(window[50] == Approx(1));
    REQUIRE(window[10] == Approx(0.5).margin(0.2));

    for (f64 value: edge_window(16, 0))
        REQUIRE(value == 1);

    REQUIRE(test::thrown_error([] { SpectralTransform2D invalid({.window_fraction = 1}); }) == Error::INVALID_INPUT);
    REQUIRE(test::thrown_error([] { SpectralTransform2D invalid({.output = Precision::U16}); }) == Error::INVALID_INPUT);
}
