#pragma once

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "simqc/Image.hpp"
#include "simqc/RadialProfile.hpp"
#include "simqc/Reindex.hpp"
#include "simqc/Reslice.hpp"
#include "simqc/ResolutionRings.hpp"
#include "simqc/Spectrum.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    // Parameters of the analyses. Every entry is optional and defaults to the values below.
    class Options {
    public:
        Options() = default;

        /// Parses the options from a YAML map. Unknown entries, invalid types or invalid values
        /// throw an INVALID_CONFIG error.
        explicit Options(const YAML::Node& node);

        /// Parses the options from a YAML file.
        explicit Options(const Path& filename);

        struct Sim {
            i64 phases{5};
            i64 angles{3};
            SimFormat format{SimFormat::OMX};
            f64 angle1{0}; // degrees
            i64 z_window{1}; // half-width of the central z-window of the phase spectra
        } sim;

        struct Fourier {
            f64 window_fraction{0.01};
            bool pad{true};
            SpectrumScaling scaling{SpectrumScaling::LOG};
            Precision output{Precision::F32};
            std::vector<f64> resolutions{DEFAULT_RING_RESOLUTIONS};
            f64 blur_radius{6}; // display only
            bool show_axial{false};
            i64 font_size{12};
        } fourier;

        struct Radial {
            bool corrected_binning{false};
        } radial;

        struct Reslice {
            std::optional<bool> interpolate{}; // unset: each analysis uses its own default
        } reslice;

        struct Compute {
            i64 n_threads{0};
            std::string log_level{"info"};
            Path log_file{};
        } compute;

    public:
        [[nodiscard]] auto spectrum_parameters() const -> SpectrumParameters {
            return {
                .window_fraction = fourier.window_fraction,
                .pad = fourier.pad,
                .scaling = fourier.scaling,
                .output = fourier.output,
                .n_threads = compute.n_threads,
            };
        }

        [[nodiscard]] auto ring_parameters() const -> ResolutionRingParameters {
            return {.resolutions = fourier.resolutions, .font_size = fourier.font_size};
        }

        [[nodiscard]] auto radial_parameters() const -> RadialProfileParameters {
            return {.corrected_binning = radial.corrected_binning, .is_spectral = true};
        }

        [[nodiscard]] auto reslice_parameters(bool default_interpolate) const -> ResliceParameters {
            return {.interpolate = reslice.interpolate.value_or(default_interpolate)};
        }
    };
}
