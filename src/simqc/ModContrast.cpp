#include <algorithm>
#include <cmath>

#include "simqc/Analysis.hpp"
#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Utilities.hpp"

namespace {
    using namespace ::sqc;

    auto standard_deviation_(std::span<const f32> values) -> f64 {
        const auto size = static_cast<f64>(values.size());
        f64 mean{};
        for (f32 value: values)
            mean += static_cast<f64>(value);
        mean /= size;
        f64 variance{};
        for (f32 value: values)
            variance += (static_cast<f64>(value) - mean) * (static_cast<f64>(value) - mean);
        return std::sqrt(variance / size);
    }

    // The orders are at multiples of n/phases. The highest frequency, at n/2, is taken as the noise.
    void modulation_contrast_(const VectorBatch& spectra, i64 phases, std::span<f32> output) {
        const i64 order1 = spectra.n / phases;
        const i64 order2 = 2 * spectra.n / phases;
        const f64 noise = standard_deviation_(spectra.vector(spectra.n / 2));
        check(noise > 0, Error::INVALID_INPUT,
              "The highest frequency along the phases is constant, so the noise cannot be estimated");

        const auto first = spectra.vector(order1);
        const auto second = spectra.vector(order2);
        for (size_t i = 0; i < output.size(); ++i) {
            const auto k1 = static_cast<f64>(first[i]);
            const auto k2 = static_cast<f64>(second[i]);
            output[i] = static_cast<f32>(std::sqrt(k1 * k1 + k2 * k2) / noise);
        }
    }
}

namespace sqc {
    auto ModContrast::wiener_estimate(f64 mcnr) -> f64 {
        check(mcnr > 0, Error::INVALID_INPUT, "The MCNR should be positive, but got {}", mcnr);
        return 0.170 / (mcnr * mcnr);
    }

    auto ModContrast::check_mcnr(f64 mcnr) -> StatStatus {
        if (mcnr >= 6)
            return StatStatus::PASS;
        if (mcnr > 3)
            return StatStatus::UNSURE;
        return StatStatus::FAIL;
    }

    auto ModContrast::execute(const ImageVolume& raw) const -> ResultSet {
        const auto [canonical, layout] = canonical_raw(raw, m_options.sim);
        check(layout.phases >= 3, Error::INVALID_INPUT,
              "The modulation contrast requires at least 3 phases, but got {}", layout.phases);

        const i64 window = m_options.sim.z_window;
        const i64 nz = layout.slices;
        ImageVolume mcnr(
            {
                .width = canonical.width(),
                .height = canonical.height(),
                .channels = layout.channels,
                .slices = nz,
                .frames = layout.frames,
            },
            canonical.calibration());

        std::vector<f32> contrast(static_cast<size_t>(canonical.width() * canonical.height()));
        const auto n_angles = static_cast<f32>(layout.angles);
        for (i64 t = 0; t < layout.frames; ++t) {
            for (i64 c = 0; c < layout.channels; ++c) {
                auto timer = Logger::info_scope_time("Modulation contrast, channel {}, frame {}", c + 1, t + 1);
                for (i64 z = 0; z < nz; ++z) {
                    // The z-window is truncated at the ends of the stack.
                    const i64 z_first = std::max(i64{0}, z - window);
                    const i64 z_last = std::min(nz - 1, z + window);
                    const auto average = mcnr.plane(c, z, t);
                    for (i64 a = 0; a < layout.angles; ++a) {
                        const VectorBatch spectra = phase_spectra(
                            canonical, layout, c, a, t, z_first, z_last, m_options.compute.n_threads);
                        modulation_contrast_(spectra, layout.phases, contrast);
                        for (size_t i = 0; i < contrast.size(); ++i)
                            average[i] += contrast[i] / n_angles;
                    }
                }
            }
        }
        mcnr.set_display_range({0, 24});

        ResultSet output{std::string(name())};
        for (i64 c = 0; c < layout.channels; ++c) {
            const f64 feature = feature_mean(extract_channel(mcnr, c));
            Logger::info("Channel {}: feature MCNR={:.2f}", c + 1, feature);
            output.add_stat(fmt::format("C{} feature MCNR", c + 1), feature, check_mcnr(feature));
            output.add_stat(fmt::format("C{} Wiener estimate", c + 1), wiener_estimate(feature));
        }
        output.add_image("MCNR", "Modulation contrast-to-noise ratio, averaged over the angles", std::move(mcnr));
        output.add_info("Modulation contrast-to-noise ratio (MCNR)",
                        "3 or less is inadequate, 6 and above is acceptable, higher values are better");
        return output;
    }
}
