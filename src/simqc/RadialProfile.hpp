#pragma once

#include <span>
#include <string>

#include "simqc/Image.hpp"
#include "simqc/Spectrum.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    struct RadialBin {
        f64 frequency; // or distance, if the source is not a spectrum
        f64 amplitude;
        i64 count;
    };

    struct RadialProfile {
        std::vector<RadialBin> bins{};
        f64 max_radius{};
        i64 n_bins{};
        bool is_spectral{};
        std::string unit{};

        [[nodiscard]] auto frequencies() const -> std::vector<f64>;
        [[nodiscard]] auto amplitudes() const -> std::vector<f64>;
    };

    struct RadialProfileParameters {
        /// The reference binning merges the first two radial bins (raw bin 0 is counted as bin 1,
        /// then every bin is shifted down by one). The corrected binning keeps every bin as is.
        bool corrected_binning{false};

        /// Whether the plane is a spectrum. If so, the unit of the bins is an inverse length.
        bool is_spectral{true};
    };

    /// Azimuthal average of a plane about (width/2, height/2).
    /// The bins cover the maximum radius mR = (width+height)/4 and there are floor(3*mR/4) of them.
    /// The frequency of bin i is ((i+1)/n_bins) * 0.5 / pixel_width.
    /// Throws an UNCALIBRATED_DATA error if the calibration is in pixels.
    [[nodiscard]] auto radial_profile(
        std::span<const f32> plane, i64 width, i64 height,
        const Calibration& calibration,
        const RadialProfileParameters& parameters = {}
    ) -> RadialProfile;

    /// Radial profile of one plane of a stack of spectra.
    [[nodiscard]] auto radial_profile(
        const SpectralImage& spectrum, i64 plane_index,
        const RadialProfileParameters& parameters = {}
    ) -> RadialProfile;

    /// Radial bin count used for a plane of the given shape.
    [[nodiscard]] constexpr auto radial_bin_count(i64 width, i64 height) noexcept -> i64 {
        const f64 max_radius = static_cast<f64>(width + height) / 4.0;
        return static_cast<i64>(3 * max_radius / 4);
    }
}
