#include <algorithm>

#include "simqc/Analysis.hpp"
#include "simqc/DFT.hpp"
#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Utilities.hpp"

namespace {
    using namespace ::sqc;

    auto mean_(std::span<const f32> values) -> f64 {
        f64 sum{};
        for (f32 value: values)
            sum += static_cast<f64>(value);
        return sum / static_cast<f64>(values.size());
    }
}

namespace sqc {
    auto phase_spectra(
        const ImageVolume& canonical, const SimLayout& layout,
        i64 channel, i64 angle, i64 frame, i64 z_first, i64 z_last,
        i64 n_threads
    ) -> VectorBatch {
        check(z_first >= 0 and z_first <= z_last and z_last < layout.slices, Error::INVALID_INPUT,
              "Invalid z-window [{}, {}] for {} z-slices", z_first, z_last, layout.slices);
        const std::vector<i64> indices = slice_list({
            {.size = layout.channels, .first = channel, .last = channel},
            {.size = layout.phases, .first = 0, .last = layout.phases - 1},
            {.size = layout.slices, .first = z_first, .last = z_last},
            {.size = layout.angles, .first = angle, .last = angle},
            {.size = layout.frames, .first = frame, .last = frame},
        });

        const auto vector_size = static_cast<i64>(indices.size());
        VectorBatch batch(vector_size, canonical.width() * canonical.height());
        for (i64 k = 0; k < vector_size; ++k)
            std::ranges::copy(canonical.plane(indices[static_cast<size_t>(k)]), batch.vector(k).begin());
        anscombe(batch);
        normalize_inner(batch);
        return dft_outer(batch, 2 * effective_n_threads(n_threads));
    }

    auto PhaseFourier::execute(const ImageVolume& raw) const -> ResultSet {
        const auto [canonical, layout] = canonical_raw(raw, m_options.sim);

        const i64 window = m_options.sim.z_window;
        const i64 nz = layout.slices;
        check(nz >= 2 * window + 1, Error::INVALID_INPUT,
              "The central z-window (half-width={}) requires at least {} z-slices, but got {}",
              window, 2 * window + 1, nz);
        const i64 z_first = nz / 2 - window;
        const i64 z_last = nz / 2 + window;

        // The phases repeat every "phases" samples, so the orders are at multiples of the window size.
        const i64 vector_size = layout.phases * (2 * window + 1);
        const i64 order_step = 2 * window + 1;

        ResultSet output{std::string(name())};
        for (i64 t = 0; t < layout.frames; ++t) {
            for (i64 a = 0; a < layout.angles; ++a) {
                for (i64 c = 0; c < layout.channels; ++c) {
                    auto timer = Logger::info_scope_time("Phase spectra, channel {}, angle {}, frame {}", c + 1, a + 1, t + 1);
                    VectorBatch spectra = phase_spectra(canonical, layout, c, a, t, z_first, z_last,
                                                        m_options.compute.n_threads);

                    const std::string suffix = fmt::format("C{} A{} T{}", c + 1, a + 1, t + 1);
                    const f64 order0 = mean_(spectra.vector(0));
                    for (i64 order = 0; order * order_step < vector_size and order <= layout.phases / 2; ++order) {
                        output.add_stat(fmt::format("{} order {} mean", suffix, order),
                                        mean_(spectra.vector(order * order_step)));
                    }
                    if (order_step < vector_size and order0 > 0) {
                        output.add_stat(fmt::format("{} order 1 ratio", suffix),
                                        mean_(spectra.vector(order_step)) / order0);
                    }

                    ImageVolume image(
                        {.width = canonical.width(), .height = canonical.height(), .slices = vector_size},
                        std::move(spectra.data), canonical.calibration());
                    output.add_image(fmt::format("FT phases {}", suffix),
                                     fmt::format("Spectra along the {} phases of z-slices [{}, {}]",
                                                 layout.phases, z_first + 1, z_last + 1),
                                     std::move(image));
                }
            }
        }
        output.add_info("Phase Fourier plots",
                        fmt::format("The order 1 (k={}) should stand out, i.e. the stripes move "
                                    "by one period over the phases", order_step));
        return output;
    }
}
