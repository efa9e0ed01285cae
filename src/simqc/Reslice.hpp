#pragma once

#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    struct ResliceParameters {
        /// Resample the resliced axis so that the output voxels keep the physical aspect ratio.
        /// Otherwise, every spacing is treated as 1 and the reslice is a simple stride.
        bool interpolate{true};
    };

    /// Orthogonal (XZ) view of a volume.
    /// Each output plane i is made of row y=int(i*spacing) of every z-plane of the input, i.e. the output
    /// planes are width-by-z images and the output z walks along the input y. Channels and frames are
    /// kept, as is the display range.
    class OrthogonalResampler {
    public:
        explicit OrthogonalResampler(const ResliceParameters& parameters = {}) : m_parameters(parameters) {}

        /// Throws an INVALID_INPUT error if the input is not 32-bit or has less than 2 z-slices.
        [[nodiscard]] auto reslice(const ImageVolume& input) const -> ImageVolume;

        /// Output (width, height, slices) for a given input.
        [[nodiscard]] auto output_dimensions(const Dimensions& input, const Calibration& calibration) const -> Dimensions;

        /// Output calibration for a given input calibration.
        [[nodiscard]] auto output_calibration(const Calibration& calibration) const -> Calibration;

    private:
        struct Spacing {
            f64 output_z; // step along the input y, in pixels
            f64 z_scale; // resize factor of the resliced axis
        };
        [[nodiscard]] auto spacing_(const Calibration& calibration) const -> Spacing;

    private:
        ResliceParameters m_parameters;
    };
}
