#pragma once

#include <omp.h>
#include <span>

#include "simqc/DFT.hpp"
#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    void parallel_for(i32 n_threads, i64 size, auto&& func) {
        #pragma omp parallel for num_threads(n_threads)
        for (i64 c = 0; c < size; ++c) {
            func(omp_get_thread_num(), c);
        }
    }

    /// Number of threads to use. Zero or negative means every available thread.
    [[nodiscard]] inline auto effective_n_threads(i64 n_threads) -> i32 {
        return n_threads > 0 ? static_cast<i32>(n_threads) : omp_get_max_threads();
    }

    /// Bilinear interpolation of a plane at (y, x). Coordinates are clamped to the plane.
    [[nodiscard]] auto interpolate_bilinear(std::span<const f32> plane, i64 width, i64 height, f64 y, f64 x) -> f64;

    /// Resizes a plane with bilinear interpolation.
    /// Pixel centers are aligned, i.e. output pixel i samples the input at (i + 0.5) / scale - 0.5.
    [[nodiscard]] auto resize_bilinear(
        std::span<const f32> input, i64 input_width, i64 input_height,
        i64 output_width, i64 output_height
    ) -> std::vector<f32>;

    /// Rotates each plane about its center, by the given angle in degrees (clockwise, as displayed
    /// with y pointing downward). Pixels mapping outside of the input are set to zero.
    [[nodiscard]] auto rotate_planes(const ImageVolume& input, f64 angle_degrees) -> ImageVolume;

    /// Maximum intensity projection along z, for every channel and frame.
    [[nodiscard]] auto max_project_z(const ImageVolume& input) -> ImageVolume;

    /// Extracts the z-slice at nz/2, for every channel and frame.
    [[nodiscard]] auto central_slice(const ImageVolume& input) -> ImageVolume;

    /// Extracts one channel.
    [[nodiscard]] auto extract_channel(const ImageVolume& input, i64 channel) -> ImageVolume;

    /// Resizes each plane along y by the given factor, then zero-pads it to a square,
    /// with the resized plane in the middle.
    [[nodiscard]] auto resize_and_pad_to_square(const ImageVolume& input, f64 y_factor) -> ImageVolume;

    /// Divides every plane by its maximum, so that its maximum is 1.
    /// Planes with a non-positive maximum are left unchanged.
    void autoscale_planes(ImageVolume& volume);

    /// Triangle threshold of a histogram: the bin furthest from the line joining the peak to the end
    /// of the longest tail. Bins above the returned bin are the foreground of a dark background.
    [[nodiscard]] auto triangle_threshold(std::span<const i64> histogram) -> i64;

    /// Mean of the foreground of every plane, averaged over the planes. The foreground is selected by
    /// a triangle threshold on the 256-bin histogram of the plane. Planes without foreground use every pixel.
    [[nodiscard]] auto feature_mean(const ImageVolume& volume) -> f64;

    /// Anscombe variance stabilizing transform, 2 * sqrt(x) + 3/8, with negative values clamped to zero.
    void anscombe(VectorBatch& batch);

    /// Rescales each vector of the batch so that its mean is equal to the mean of the whole batch.
    /// Vectors with a zero mean are left unchanged.
    void normalize_inner(VectorBatch& batch);
}
