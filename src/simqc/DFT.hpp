#pragma once

#include <complex>
#include <span>

#include "simqc/Types.hpp"

namespace sqc {
    /// Batch of n vectors of npix samples each, stored contiguously as [n][npix].
    /// The transforms are computed along the first dimension, independently for each pixel.
    struct VectorBatch {
        i64 n{};
        i64 n_pixels{};
        std::vector<f32> data{};

        VectorBatch() = default;
        VectorBatch(i64 n_, i64 n_pixels_)
            : n(n_), n_pixels(n_pixels_), data(static_cast<size_t>(n_ * n_pixels_), 0.f) {}

        [[nodiscard]] auto operator()(i64 k, i64 pixel) const -> f32 {
            return data[static_cast<size_t>(k * n_pixels + pixel)];
        }
        [[nodiscard]] auto operator()(i64 k, i64 pixel) -> f32& {
            return data[static_cast<size_t>(k * n_pixels + pixel)];
        }
        [[nodiscard]] auto vector(i64 k) const -> std::span<const f32> {
            return std::span(data).subspan(static_cast<size_t>(k * n_pixels), static_cast<size_t>(n_pixels));
        }
        [[nodiscard]] auto vector(i64 k) -> std::span<f32> {
            return std::span(data).subspan(static_cast<size_t>(k * n_pixels), static_cast<size_t>(n_pixels));
        }
    };

    /// Discrete Fourier transform of fixed length, with cached coefficients.
    class SpectralTransform1D {
    public:
        /// Precomputes the n-by-n cosine and sine tables, i.e. O(n^2) in time and memory.
        explicit SpectralTransform1D(i64 n);

        [[nodiscard]] auto size() const noexcept -> i64 { return m_size; }
        [[nodiscard]] auto cos(i64 t, i64 k) const noexcept -> f64 { return m_cos[static_cast<size_t>(t * m_size + k)]; }
        [[nodiscard]] auto sin(i64 t, i64 k) const noexcept -> f64 { return m_sin[static_cast<size_t>(t * m_size + k)]; }

        /// Computes the power spectrum sqrt(re^2 + im^2) of the vectors at the pixels [start, end).
        /// The output should have the same shape as the input and is only written at these pixels.
        /// Non-finite samples within the range throw an INVALID_INPUT error.
        void power_spectrum(const VectorBatch& input, VectorBatch& output, i64 start, i64 end) const;

        /// Power spectrum of a single vector.
        [[nodiscard]] auto power_spectrum(std::span<const f32> input) const -> std::vector<f64>;

    private:
        i64 m_size{};
        std::vector<f64> m_cos{}; // [t][k]
        std::vector<f64> m_sin{}; // [t][k]
    };

    /// Computes the power spectrum of every pixel of the batch.
    /// The pixels are split into contiguous and disjoint partitions, each one processed by its own
    /// transform on its own thread. If n_partitions <= 0, twice the number of threads is used.
    /// The call blocks until every partition is done. If any partition failed, an Exception with
    /// the WORKER_FAILURE code is thrown once every partition is done and the output should be discarded.
    [[nodiscard]] auto dft_outer(const VectorBatch& input, i64 n_partitions = 0) -> VectorBatch;

    /// Contiguous, disjoint, ranges covering [0, size). The last range takes the remainder.
    [[nodiscard]] auto partition_range(i64 size, i64 n_partitions) -> std::vector<Vec<i64, 2>>;

    /// Forward complex transform of fixed length.
    /// Powers of two use an in-place radix-2 FFT, other sizes fall back to a direct transform.
    class ComplexTransform {
    public:
        explicit ComplexTransform(i64 n);

        [[nodiscard]] auto size() const noexcept -> i64 { return m_size; }
        [[nodiscard]] auto is_radix2() const noexcept -> bool { return not m_bit_reverse.empty() or m_size == 1; }

        /// In-place forward transform.
        void forward(std::span<std::complex<f64>> data) const;

    private:
        i64 m_size{};
        std::vector<size_t> m_bit_reverse{};
        std::vector<std::vector<std::complex<f64>>> m_stage_twiddles{};
        std::vector<std::complex<f64>> m_roots{}; // direct transform, exp(-2i*pi*k/n)
    };

    [[nodiscard]] constexpr auto is_power_of_two(i64 n) noexcept -> bool {
        return n > 0 and (n & (n - 1)) == 0;
    }

    /// Smallest power of two, starting at 2, greater or equal to n.
    [[nodiscard]] constexpr auto next_power_of_two(i64 n) noexcept -> i64 {
        i64 size{2};
        while (size < n)
            size *= 2;
        return size;
    }
}
