#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include "simqc/Options.hpp"
#include "Helpers.hpp"

using namespace ::sqc;

TEST_CASE("Default options", "[options]") {
    const Options options;
    REQUIRE(options.sim.phases == 5);
    REQUIRE(options.sim.angles == 3);
    REQUIRE(options.sim.format == SimFormat::OMX);
    REQUIRE(options.fourier.window_fraction == 0.01);
    REQUIRE(options.fourier.pad);
    REQUIRE(options.fourier.resolutions == DEFAULT_RING_RESOLUTIONS);
    REQUIRE(options.fourier.blur_radius == 6);
    REQUIRE_FALSE(options.reslice.interpolate.has_value());
    REQUIRE(options.reslice_parameters(true).interpolate);
    REQUIRE_FALSE(options.reslice_parameters(false).interpolate);
    REQUIRE_FALSE(options.radial.corrected_binning);

    // An empty file gives the defaults.
    const Options empty(YAML::Node{});
    REQUIRE(empty.sim.phases == 5);
    REQUIRE(empty.compute.log_level == "info");
}

TEST_CASE("Options from YAML", "[options]") {
    const Options options(YAML::Load(R"(
sim:
  phases: 3
  angles: 2
  format: ELYRA
  angle1: -45.5
fourier:
  window_fraction: 0.05
  scaling: linear
  output: u8
  resolutions: [0.1, 0.25]
  show_axial: true
radial:
  corrected_binning: true
reslice:
  interpolate: false
compute:
  n_threads: 4
  log_level: trace
)"));
    REQUIRE(options.sim.phases == 3);
    REQUIRE(options.sim.angles == 2);
    REQUIRE(options.sim.format == SimFormat::ELYRA);
    REQUIRE(options.sim.angle1 == -45.5);
    REQUIRE(options.sim.z_window == 1);
    REQUIRE(options.fourier.window_fraction == 0.05);
    REQUIRE(options.fourier.scaling == SpectrumScaling::LINEAR);
    REQUIRE(options.fourier.output == Precision::U8);
    REQUIRE(options.fourier.resolutions == std::vector<f64>{0.1, 0.25});
    REQUIRE(options.fourier.show_axial);
    REQUIRE(options.fourier.font_size == 12);
    REQUIRE(options.radial.corrected_binning);
    REQUIRE(options.reslice.interpolate == false);
    REQUIRE(options.compute.n_threads == 4);
    REQUIRE(options.compute.log_level == "trace");

    const SpectrumParameters spectrum = options.spectrum_parameters();
    REQUIRE(spectrum.window_fraction == 0.05);
    REQUIRE(spectrum.output == Precision::U8);
    REQUIRE(spectrum.n_threads == 4);
    REQUIRE(options.ring_parameters().resolutions.size() == 2);
    REQUIRE(options.radial_parameters().corrected_binning);
    REQUIRE_FALSE(options.reslice_parameters(true).interpolate);

    const Options scalar(YAML::Load("fourier: {resolutions: 0.3}\nsim: {format: n-sim}"));
    REQUIRE(scalar.fourier.resolutions == std::vector<f64>{0.3});
    REQUIRE(scalar.sim.format == SimFormat::NSIM);
}

TEST_CASE("Invalid options", "[options]") {
    const auto parse = [](const char* yaml) {
        return test::thrown_error([yaml] { Options options(YAML::Load(yaml)); });
    };
    REQUIRE(parse("foo: 1") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {foo: 1}") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: 5") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {phases: 0}") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {phases: abc}") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {phases: [1, 2]}") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {format: zeiss}") == Error::INVALID_CONFIG);
    REQUIRE(parse("sim: {z_window: -1}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {window_fraction: 1.5}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {resolutions: [0.1, -0.2]}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {resolutions: [0.1, abc]}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {scaling: sqrt}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {output: u16}") == Error::INVALID_CONFIG);
    REQUIRE(parse("fourier: {font_size: 0}") == Error::INVALID_CONFIG);
    REQUIRE(parse("compute: {log_level: loud}") == Error::INVALID_CONFIG);

    REQUIRE(test::thrown_error([] { Options options(Path("/nonexistent/simqc.yaml")); }) == Error::INVALID_CONFIG);
}
