#include <algorithm>
#include <cmath>

#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/RadialProfile.hpp"

namespace sqc {
    auto RadialProfile::frequencies() const -> std::vector<f64> {
        std::vector<f64> output;
        output.reserve(bins.size());
        for (const auto& bin: bins)
            output.push_back(bin.frequency);
        return output;
    }

    auto RadialProfile::amplitudes() const -> std::vector<f64> {
        std::vector<f64> output;
        output.reserve(bins.size());
        for (const auto& bin: bins)
            output.push_back(bin.amplitude);
        return output;
    }

    auto radial_profile(
        std::span<const f32> plane, i64 width, i64 height,
        const Calibration& calibration,
        const RadialProfileParameters& parameters
    ) -> RadialProfile {
        check(width > 0 and height > 0 and static_cast<i64>(plane.size()) == width * height,
              Error::DIMENSION_MISMATCH, "The plane size ({}) does not match its shape (width={}, height={})",
              plane.size(), width, height);
        check(calibration.is_calibrated(), Error::UNCALIBRATED_DATA,
              "The radial profile requires a spatial calibration, but the image is calibrated in pixels");
        check(calibration.pixel_width > 0, Error::UNCALIBRATED_DATA,
              "The pixel width should be positive, but got {}", calibration.pixel_width);

        const i64 center_x = width / 2;
        const i64 center_y = height / 2;
        const f64 max_radius = static_cast<f64>(width + height) / 4.0;
        const i64 n_bins = radial_bin_count(width, height);
        check(n_bins > 0, Error::INVALID_INPUT,
              "The plane (width={}, height={}) is too small for a radial profile", width, height);

        std::vector<f64> sums(static_cast<size_t>(n_bins), 0.);
        std::vector<i64> counts(static_cast<size_t>(n_bins), 0);

        const auto x0 = static_cast<f64>(center_x);
        const auto y0 = static_cast<f64>(center_y);
        for (f64 y = y0 - max_radius; y < y0 + max_radius; y += 1) {
            // Truncated toward zero, so that y in (-1,0) falls in the first row.
            const auto iy = static_cast<i64>(y);
            if (iy < 0 or iy >= height)
                continue;
            for (f64 x = x0 - max_radius; x < x0 + max_radius; x += 1) {
                const auto ix = static_cast<i64>(x);
                if (ix < 0 or ix >= width)
                    continue;

                const f64 radius = std::sqrt((x - x0) * (x - x0) + (y - y0) * (y - y0));
                auto bin = static_cast<i64>(std::floor(radius / max_radius * static_cast<f64>(n_bins)));
                if (not parameters.corrected_binning) {
                    if (bin == 0)
                        bin = 1;
                    bin -= 1;
                }
                bin = std::min(bin, n_bins - 1);

                sums[static_cast<size_t>(bin)] += static_cast<f64>(plane[static_cast<size_t>(iy * width + ix)]);
                counts[static_cast<size_t>(bin)] += 1;
            }
        }

        RadialProfile profile{
            .max_radius = max_radius,
            .n_bins = n_bins,
            .is_spectral = parameters.is_spectral,
            .unit = parameters.is_spectral ?
                    fmt::format("1/{}", calibration.unit) :
                    fmt::format("{}", calibration.unit),
        };
        profile.bins.reserve(static_cast<size_t>(n_bins));
        i64 n_empty{};
        for (i64 i = 0; i < n_bins; ++i) {
            const i64 count = counts[static_cast<size_t>(i)];
            n_empty += count == 0;
            profile.bins.push_back({
                .frequency = (static_cast<f64>(i + 1) / static_cast<f64>(n_bins)) * 0.5 / calibration.pixel_width,
                .amplitude = count > 0 ? sums[static_cast<size_t>(i)] / static_cast<f64>(count) : 0.,
                .count = count,
            });
        }
        if (n_empty > 0)
            Logger::trace("Radial profile: {} of {} bins are empty", n_empty, n_bins);
        return profile;
    }

    auto radial_profile(
        const SpectralImage& spectrum, i64 plane_index,
        const RadialProfileParameters& parameters
    ) -> RadialProfile {
        return radial_profile(
            spectrum.volume().plane(plane_index), spectrum.width(), spectrum.height(),
            spectrum.calibration(), parameters);
    }
}
