#include <algorithm>

#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Reslice.hpp"
#include "simqc/Utilities.hpp"

namespace sqc {
    auto OrthogonalResampler::spacing_(const Calibration& calibration) const -> Spacing {
        if (not m_parameters.interpolate)
            return {.output_z = 1, .z_scale = 1};
        check(calibration.pixel_width > 0 and calibration.pixel_height > 0 and calibration.pixel_depth > 0,
              Error::INVALID_INPUT, "The pixel sizes should be positive, but got {}x{}x{}",
              calibration.pixel_width, calibration.pixel_height, calibration.pixel_depth);
        return {
            .output_z = calibration.pixel_depth / calibration.pixel_height,
            .z_scale = calibration.pixel_depth / calibration.pixel_width,
        };
    }

    auto OrthogonalResampler::output_dimensions(const Dimensions& input, const Calibration& calibration) const -> Dimensions {
        const auto [output_z, z_scale] = spacing_(calibration);
        return {
            .width = input.width,
            .height = z_scale != 1 ? static_cast<i64>(static_cast<f64>(input.slices) * z_scale) : input.slices,
            .channels = input.channels,
            .slices = static_cast<i64>(static_cast<f64>(input.height) / output_z),
            .frames = input.frames,
        };
    }

    auto OrthogonalResampler::output_calibration(const Calibration& calibration) const -> Calibration {
        const auto spacing = spacing_(calibration);
        Calibration output = calibration;
        output.pixel_height = m_parameters.interpolate ?
                              calibration.pixel_depth / (calibration.pixel_depth / calibration.pixel_height) :
                              calibration.pixel_depth;
        output.pixel_depth = calibration.pixel_height * spacing.output_z;
        return output;
    }

    auto OrthogonalResampler::reslice(const ImageVolume& input) const -> ImageVolume {
        check(input.precision() == Precision::F32, Error::INVALID_INPUT,
              "The orthogonal view requires a 32-bit volume, but got a {} volume", input.precision());
        check(input.slices() >= 2, Error::INVALID_INPUT,
              "The orthogonal view requires at least 2 z-slices, but got {}", input.slices());

        const Calibration& calibration = input.calibration();
        const auto spacing = spacing_(calibration);
        const Dimensions shape = output_dimensions(input.dimensions(), calibration);
        check(shape.slices > 0 and shape.height > 0, Error::INVALID_INPUT,
              "The pixel sizes ({}x{}x{}) give an empty orthogonal view",
              calibration.pixel_width, calibration.pixel_height, calibration.pixel_depth);

        auto timer = Logger::trace_scope_time("Reslicing {}x{}x{} volume to {}x{}x{} (interpolate={})",
                                              input.width(), input.height(), input.slices(),
                                              shape.width, shape.height, shape.slices, m_parameters.interpolate);

        ImageVolume output(shape, output_calibration(calibration), input.precision());
        output.set_display_range(input.display_range());

        const i64 width = input.width();
        const i64 nz = input.slices();
        std::vector<f32> xz(static_cast<size_t>(width * nz));
        for (i64 t = 0; t < input.frames(); ++t) {
            for (i64 c = 0; c < input.channels(); ++c) {
                for (i64 i = 0; i < shape.slices; ++i) {
                    const auto y = std::min(static_cast<i64>(static_cast<f64>(i) * spacing.output_z), input.height() - 1);

                    // One row per z-plane.
                    for (i64 z = 0; z < nz; ++z) {
                        const auto row = input.plane(c, z, t).subspan(static_cast<size_t>(y * width), static_cast<size_t>(width));
                        std::ranges::copy(row, xz.begin() + z * width);
                    }

                    const auto destination = output.plane(c, i, t);
                    if (spacing.z_scale != 1) {
                        const auto resized = resize_bilinear(xz, width, nz, width, shape.height);
                        std::ranges::copy(resized, destination.begin());
                    } else {
                        std::ranges::copy(xz, destination.begin());
                    }
                }
            }
        }
        return output;
    }
}
