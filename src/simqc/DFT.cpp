#include <algorithm>
#include <bit>
#include <cmath>
#include <numbers>
#include <string>

#include "simqc/DFT.hpp"
#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Utilities.hpp"

namespace sqc {
    SpectralTransform1D::SpectralTransform1D(i64 n) : m_size(n) {
        check(n > 0, Error::INVALID_INPUT, "The transform size should be positive, but got {}", n);
        const auto size = static_cast<size_t>(n * n);
        m_cos.resize(size);
        m_sin.resize(size);

        // The product t*k is reduced modulo n to keep the arguments small and exact.
        const f64 step = 2 * std::numbers::pi / static_cast<f64>(n);
        for (i64 t = 0; t < n; ++t) {
            for (i64 k = 0; k < n; ++k) {
                const f64 angle = step * static_cast<f64>((t * k) % n);
                m_cos[static_cast<size_t>(t * n + k)] = std::cos(angle);
                m_sin[static_cast<size_t>(t * n + k)] = std::sin(angle);
            }
        }
    }

    void SpectralTransform1D::power_spectrum(const VectorBatch& input, VectorBatch& output, i64 start, i64 end) const {
        check(input.n == m_size and output.n == m_size and output.n_pixels == input.n_pixels,
              Error::DIMENSION_MISMATCH,
              "The batch shapes (input: n={}, npix={}; output: n={}, npix={}) do not match the transform size {}",
              input.n, input.n_pixels, output.n, output.n_pixels, m_size);
        check(start >= 0 and start <= end and end <= input.n_pixels, Error::INVALID_INPUT,
              "Invalid pixel range [{}, {}) for {} pixels", start, end, input.n_pixels);

        const auto count = static_cast<size_t>(end - start);
        for (i64 t = 0; t < m_size; ++t) {
            const f32* row = input.data.data() + t * input.n_pixels + start;
            for (size_t p = 0; p < count; ++p) {
                check(std::isfinite(row[p]), Error::INVALID_INPUT,
                      "Non-finite sample ({}) at k={}, pixel={}", row[p], t, start + static_cast<i64>(p));
            }
        }

        std::vector<f64> real(count);
        std::vector<f64> imag(count);
        for (i64 k = 0; k < m_size; ++k) {
            std::ranges::fill(real, 0.);
            std::ranges::fill(imag, 0.);
            for (i64 t = 0; t < m_size; ++t) {
                const f64 c = cos(t, k);
                const f64 s = sin(t, k);
                const f32* row = input.data.data() + t * input.n_pixels + start;
                for (size_t p = 0; p < count; ++p) {
                    const auto value = static_cast<f64>(row[p]);
                    real[p] += value * c;
                    imag[p] -= value * s;
                }
            }
            f32* row = output.data.data() + k * output.n_pixels + start;
            for (size_t p = 0; p < count; ++p)
                row[p] = static_cast<f32>(std::sqrt(real[p] * real[p] + imag[p] * imag[p]));
        }
    }

    auto SpectralTransform1D::power_spectrum(std::span<const f32> input) const -> std::vector<f64> {
        check(static_cast<i64>(input.size()) == m_size, Error::DIMENSION_MISMATCH,
              "The input size ({}) does not match the transform size ({})", input.size(), m_size);
        std::vector<f64> output(static_cast<size_t>(m_size));
        for (i64 k = 0; k < m_size; ++k) {
            f64 real{};
            f64 imag{};
            for (i64 t = 0; t < m_size; ++t) {
                const auto value = static_cast<f64>(input[static_cast<size_t>(t)]);
                real += value * cos(t, k);
                imag -= value * sin(t, k);
            }
            output[static_cast<size_t>(k)] = std::sqrt(real * real + imag * imag);
        }
        return output;
    }

    auto partition_range(i64 size, i64 n_partitions) -> std::vector<Vec<i64, 2>> {
        check(size >= 0 and n_partitions > 0, Error::INVALID_INPUT,
              "Cannot partition {} elements into {} partitions", size, n_partitions);
        n_partitions = std::max(i64{1}, std::min(n_partitions, size));
        const i64 chunk = size / n_partitions;

        std::vector<Vec<i64, 2>> ranges;
        ranges.reserve(static_cast<size_t>(n_partitions));
        for (i64 i = 0; i < n_partitions; ++i) {
            const i64 start = i * chunk;
            const i64 end = i == n_partitions - 1 ? size : start + chunk;
            ranges.push_back({start, end});
        }
        return ranges;
    }

    auto dft_outer(const VectorBatch& input, i64 n_partitions) -> VectorBatch {
        check(input.n > 0 and input.n_pixels > 0 and
              static_cast<i64>(input.data.size()) == input.n * input.n_pixels,
              Error::INVALID_INPUT, "Invalid batch: n={}, npix={}, size={}",
              input.n, input.n_pixels, input.data.size());
        if (n_partitions <= 0)
            n_partitions = 2 * static_cast<i64>(omp_get_max_threads());

        const auto ranges = partition_range(input.n_pixels, n_partitions);
        const auto n_ranges = static_cast<i64>(ranges.size());
        auto timer = Logger::trace_scope_time("Computing {} transforms of size {} using {} partitions",
                                              input.n_pixels, input.n, n_ranges);

        VectorBatch output(input.n, input.n_pixels);
        std::vector<std::string> errors(ranges.size());
        const auto n_threads = static_cast<i32>(std::min(n_ranges, static_cast<i64>(omp_get_max_threads())));
        parallel_for(n_threads, n_ranges, [&](i32, i64 i) {
            const auto& [start, end] = ranges[static_cast<size_t>(i)];
            try {
                // Each partition has its own coefficients.
                const SpectralTransform1D transform(input.n);
                transform.power_spectrum(input, output, start, end);
            } catch (const std::exception& e) {
                errors[static_cast<size_t>(i)] = e.what();
                Logger::warn("Partition {} (pixels [{}, {})) failed: {}", i, start, end, e.what());
            }
        });

        std::string failed;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (not errors[i].empty())
                failed += fmt::format("\n  pixels [{}, {}): {}", ranges[i][0], ranges[i][1], errors[i]);
        }
        check(failed.empty(), Error::WORKER_FAILURE, "Some partitions of the transform failed:{}", failed);
        return output;
    }

    ComplexTransform::ComplexTransform(i64 n) : m_size(n) {
        check(n > 0, Error::INVALID_INPUT, "The transform size should be positive, but got {}", n);
        const f64 minus_2pi = -2 * std::numbers::pi;

        if (not is_power_of_two(n) or n == 1) {
            m_roots.resize(static_cast<size_t>(n));
            for (i64 k = 0; k < n; ++k)
                m_roots[static_cast<size_t>(k)] = std::polar(1., minus_2pi * static_cast<f64>(k) / static_cast<f64>(n));
            return;
        }

        // Bit reversal permutation.
        const auto n_bits = static_cast<size_t>(std::countr_zero(static_cast<u64>(n)));
        m_bit_reverse.resize(static_cast<size_t>(n));
        for (size_t i = 0; i < static_cast<size_t>(n); ++i) {
            size_t value = i;
            size_t result = 0;
            for (size_t j = 0; j < n_bits; ++j, value >>= 1)
                result = (result << 1) | (value & 1U);
            m_bit_reverse[i] = result;
        }

        // Twiddle factors of every stage.
        for (i64 size = 2; size <= n; size *= 2) {
            const i64 half = size / 2;
            std::vector<std::complex<f64>> twiddles(static_cast<size_t>(half));
            for (i64 j = 0; j < half; ++j)
                twiddles[static_cast<size_t>(j)] = std::polar(1., minus_2pi * static_cast<f64>(j) / static_cast<f64>(size));
            m_stage_twiddles.push_back(std::move(twiddles));
        }
    }

    void ComplexTransform::forward(std::span<std::complex<f64>> data) const {
        check(static_cast<i64>(data.size()) == m_size, Error::DIMENSION_MISMATCH,
              "The input size ({}) does not match the transform size ({})", data.size(), m_size);

        if (not m_roots.empty()) {
            // Direct transform.
            std::vector<std::complex<f64>> output(data.size());
            for (i64 k = 0; k < m_size; ++k) {
                std::complex<f64> sum{};
                for (i64 t = 0; t < m_size; ++t)
                    sum += data[static_cast<size_t>(t)] * m_roots[static_cast<size_t>((t * k) % m_size)];
                output[static_cast<size_t>(k)] = sum;
            }
            std::ranges::copy(output, data.begin());
            return;
        }

        for (size_t i = 0; i < data.size(); ++i) {
            const size_t j = m_bit_reverse[i];
            if (i < j)
                std::swap(data[i], data[j]);
        }

        size_t stage{};
        for (size_t size = 2; size <= data.size(); size *= 2, ++stage) {
            const size_t half = size / 2;
            const auto& twiddles = m_stage_twiddles[stage];
            for (size_t i = 0; i < data.size(); i += size) {
                for (size_t j = 0; j < half; ++j) {
                    const std::complex<f64> temp = data[i + j + half] * twiddles[j];
                    data[i + j + half] = data[i + j] - temp;
                    data[i + j] += temp;
                }
            }
        }
    }
}
