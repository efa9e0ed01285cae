#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>
#include <string>

#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Spectrum.hpp"
#include "simqc/Utilities.hpp"

namespace {
    using namespace ::sqc;

    auto is_uniform_(std::span<const f32> plane) -> bool {
        if (plane.empty())
            return true;
        const f32 first = plane.front();
        return std::ranges::all_of(plane, [first](f32 value) { return value == first; });
    }

    // In-place forward transform along the columns of a row-major plane.
    void transform_columns_(
        std::span<std::complex<f64>> plane, i64 width, i64 height,
        const ComplexTransform& transform
    ) {
        std::vector<std::complex<f64>> column(static_cast<size_t>(height));
        for (i64 x = 0; x < width; ++x) {
            for (i64 y = 0; y < height; ++y)
                column[static_cast<size_t>(y)] = plane[static_cast<size_t>(y * width + x)];
            transform.forward(column);
            for (i64 y = 0; y < height; ++y)
                plane[static_cast<size_t>(y * width + x)] = column[static_cast<size_t>(y)];
        }
    }
}

namespace sqc {
    auto operator<<(std::ostream& os, SpectrumScaling scaling) -> std::ostream& {
        switch (scaling) {
            case SpectrumScaling::LINEAR:
                return os << "linear";
            case SpectrumScaling::LOG:
                return os << "log";
        }
        return os;
    }

    auto edge_window(i64 size, i64 border) -> std::vector<f64> {
        std::vector<f64> window(static_cast<size_t>(size), 1.);
        if (border <= 0)
            return window;

        // The box covers the pixels [border, size - border). Pixel i covers [i, i + 1),
        // so the blurred box is evaluated at the pixel center.
        const f64 sigma = 0.25 * static_cast<f64>(border);
        const f64 denominator = sigma * std::numbers::sqrt2;
        const auto box_start = static_cast<f64>(border);
        const auto box_end = static_cast<f64>(size - border);
        for (i64 i = 0; i < size; ++i) {
            if (box_end <= box_start) {
                window[static_cast<size_t>(i)] = 0;
                continue;
            }
            const f64 center = static_cast<f64>(i) + 0.5;
            window[static_cast<size_t>(i)] =
                0.5 * (std::erf((center - box_start) / denominator) - std::erf((center - box_end) / denominator));
        }
        return window;
    }

    void apply_edge_window(std::span<f64> plane, i64 width, i64 height, f64 fraction) {
        check(fraction >= 0 and fraction < 1, Error::INVALID_INPUT,
              "The window fraction should be within [0,1), but got {}", fraction);
        if (fraction == 0)
            return;
        const auto border_x = static_cast<i64>(fraction * static_cast<f64>(width));
        const auto border_y = static_cast<i64>(fraction * static_cast<f64>(height));
        const auto window_x = edge_window(width, border_x);
        const auto window_y = edge_window(height, border_y);
        for (i64 y = 0; y < height; ++y)
            for (i64 x = 0; x < width; ++x)
                plane[static_cast<size_t>(y * width + x)] *= window_y[static_cast<size_t>(y)] * window_x[static_cast<size_t>(x)];
    }

    SpectralTransform2D::SpectralTransform2D(const SpectrumParameters& parameters) : m_parameters(parameters) {
        check(parameters.window_fraction >= 0 and parameters.window_fraction < 1, Error::INVALID_INPUT,
              "The window fraction should be within [0,1), but got {}", parameters.window_fraction);
        check(parameters.output == Precision::F32 or parameters.output == Precision::U8, Error::INVALID_INPUT,
              "The spectrum output should be 8-bit or 32-bit, but got {}", parameters.output);
    }

    auto SpectralTransform2D::output_shape(i64 width, i64 height) const -> Vec<i64, 2> {
        if (not m_parameters.pad)
            return {width, height};
        const i64 size = next_power_of_two(std::max(width, height));
        return {size, size};
    }

    auto SpectralTransform2D::amplitude(std::span<const f32> plane, i64 width, i64 height) const -> std::vector<f64> {
        check(width > 0 and height > 0 and static_cast<i64>(plane.size()) == width * height,
              Error::DIMENSION_MISMATCH, "The plane size ({}) does not match its shape (width={}, height={})",
              plane.size(), width, height);
        const auto non_finite = std::ranges::find_if(plane, [](f32 value) { return not std::isfinite(value); });
        check(non_finite == plane.end(), Error::INVALID_INPUT, "Non-finite sample ({}) at index {}",
              non_finite == plane.end() ? 0.f : *non_finite, non_finite - plane.begin());

        const auto [output_width, output_height] = output_shape(width, height);
        std::vector<f64> output(static_cast<size_t>(output_width * output_height), 0.);
        if (is_uniform_(plane))
            return output;

        // Window.
        std::vector<f64> windowed(plane.begin(), plane.end());
        apply_edge_window(windowed, width, height, m_parameters.window_fraction);

        // Zero-pad, with the plane at the top-left corner.
        std::vector<std::complex<f64>> buffer(output.size());
        for (i64 y = 0; y < height; ++y)
            for (i64 x = 0; x < width; ++x)
                buffer[static_cast<size_t>(y * output_width + x)] = windowed[static_cast<size_t>(y * width + x)];

        // Rows, then columns.
        const ComplexTransform row_transform(output_width);
        for (i64 y = 0; y < output_height; ++y) {
            row_transform.forward(std::span(buffer).subspan(
                static_cast<size_t>(y * output_width), static_cast<size_t>(output_width)));
        }
        const ComplexTransform column_transform(output_height);
        transform_columns_(buffer, output_width, output_height, column_transform);

        // Amplitude, with the zero frequency moved to the center.
        for (i64 y = 0; y < output_height; ++y) {
            const i64 oy = (y + output_height / 2) % output_height;
            for (i64 x = 0; x < output_width; ++x) {
                const i64 ox = (x + output_width / 2) % output_width;
                output[static_cast<size_t>(oy * output_width + ox)] =
                    std::abs(buffer[static_cast<size_t>(y * output_width + x)]);
            }
        }
        return output;
    }

    void SpectralTransform2D::scale_(std::span<const f64> amplitude, std::span<f32> output) const {
        if (m_parameters.output == Precision::U8) {
            // 8-bit display scaling: logarithm of the amplitude, mapped to [1,254].
            auto [min, max] = std::ranges::minmax(amplitude);
            if (max <= 0) {
                std::ranges::fill(output, 1.f);
                return;
            }
            min = min < 1 ? 0 : std::log(min);
            max = max < 1 ? 0 : std::log(max);
            const f64 scale = max > min ? 253. / (max - min) : 0.;
            for (size_t i = 0; i < amplitude.size(); ++i) {
                const f64 value = amplitude[i] < 1 ? 0 : std::log(amplitude[i]);
                const f64 scaled = std::floor(std::max(value - min, 0.) * scale + 0.5) + 1;
                output[i] = static_cast<f32>(std::clamp(scaled, 1., 254.));
            }
            return;
        }

        for (size_t i = 0; i < amplitude.size(); ++i) {
            const f64 value = m_parameters.scaling == SpectrumScaling::LOG ? std::log1p(amplitude[i]) : amplitude[i];
            output[i] = static_cast<f32>(value);
        }
    }

    auto SpectralTransform2D::transform(const ImageVolume& input) const -> SpectralImage {
        check(not input.is_empty(), Error::INVALID_INPUT, "The input volume is empty");
        const auto [output_width, output_height] = output_shape(input.width(), input.height());
        auto timer = Logger::trace_scope_time(
            "Computing {} spectra of shape {}x{} (window={}, scaling={}, output={})",
            input.stack_size(), output_width, output_height,
            m_parameters.window_fraction, m_parameters.scaling, m_parameters.output);

        ImageVolume spectra(
            {
                .width = output_width,
                .height = output_height,
                .channels = input.channels(),
                .slices = input.slices(),
                .frames = input.frames(),
            },
            input.calibration(),
            m_parameters.output
        );

        const i32 n_threads = effective_n_threads(m_parameters.n_threads);
        std::vector<std::string> errors(static_cast<size_t>(input.stack_size()));
        parallel_for(n_threads, input.stack_size(), [&](i32, i64 index) {
            // Exceptions cannot leave the parallel region.
            try {
                const auto amplitudes = amplitude(input.plane(index), input.width(), input.height());
                scale_(amplitudes, spectra.plane(index));
            } catch (const std::exception& e) {
                errors[static_cast<size_t>(index)] = e.what();
                Logger::warn("The spectrum of plane {} failed: {}", index, e.what());
            }
        });

        std::string failed;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (not errors[i].empty())
                failed += fmt::format("\n  plane {}: {}", i, errors[i]);
        }
        check(failed.empty(), Error::WORKER_FAILURE, "Some spectra failed:{}", failed);

        spectra.reset_display_range();
        return SpectralImage(std::move(spectra), input.dimensions());
    }
}
