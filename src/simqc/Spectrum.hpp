#pragma once

#include <span>

#include "simqc/DFT.hpp"
#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    enum class SpectrumScaling {
        LINEAR,
        LOG, // log(1 + x)
    };
    auto operator<<(std::ostream& os, SpectrumScaling scaling) -> std::ostream&;

    struct SpectrumParameters {
        /// Fraction, in [0,1), of each edge tapered by the window. Zero turns off the window.
        f64 window_fraction{0.01};

        /// Zero-pad each plane to the smallest square with a power-of-two size.
        bool pad{true};

        SpectrumScaling scaling{SpectrumScaling::LOG};

        /// F32 returns the scaled amplitudes. U8 returns the 8-bit display values in [1,254],
        /// in which case the scaling is ignored since these are always logarithmic.
        /// Uniform planes are 1 in U8.
        Precision output{Precision::F32};

        i64 n_threads{0};
    };

    /// Stack of power spectra, with the zero frequency at (width/2, height/2) of each plane.
    /// The pixel size stays the real-space pixel size of the source, so that resolutions can be
    /// converted to frequencies using the spectrum size.
    class SpectralImage {
    public:
        SpectralImage() = default;
        SpectralImage(ImageVolume&& spectra, const Dimensions& source_dimensions)
            : m_volume(std::move(spectra)), m_source_dimensions(source_dimensions) {}

        [[nodiscard]] auto volume() const noexcept -> const ImageVolume& { return m_volume; }
        [[nodiscard]] auto volume() noexcept -> ImageVolume& { return m_volume; }
        [[nodiscard]] auto dimensions() const noexcept -> const Dimensions& { return m_volume.dimensions(); }
        [[nodiscard]] auto source_dimensions() const noexcept -> const Dimensions& { return m_source_dimensions; }
        [[nodiscard]] auto calibration() const noexcept -> const Calibration& { return m_volume.calibration(); }
        [[nodiscard]] auto is_padded() const noexcept -> bool {
            return m_source_dimensions.width != width() or m_source_dimensions.height != height();
        }
        [[nodiscard]] auto width() const noexcept -> i64 { return m_volume.width(); }
        [[nodiscard]] auto height() const noexcept -> i64 { return m_volume.height(); }

        /// (x, y) index of the zero frequency.
        [[nodiscard]] auto center() const noexcept -> Vec<i64, 2> { return {width() / 2, height() / 2}; }

        [[nodiscard]] static constexpr auto is_spectral() noexcept -> bool { return true; }

    private:
        ImageVolume m_volume{};
        Dimensions m_source_dimensions{};
    };

    /// One-dimensional edge taper: a box of ones with `border` zeros at each end,
    /// blurred by a Gaussian of standard deviation 0.25 * border.
    [[nodiscard]] auto edge_window(i64 size, i64 border) -> std::vector<f64>;

    /// Multiplies the plane by the separable edge window. The border is int(fraction * size) along each axis.
    void apply_edge_window(std::span<f64> plane, i64 width, i64 height, f64 fraction);

    /// 2d power spectra of every plane of a stack.
    class SpectralTransform2D {
    public:
        explicit SpectralTransform2D(const SpectrumParameters& parameters = {});

        /// Computes the spectrum of every plane. The input is left unchanged.
        /// If any plane failed, a WORKER_FAILURE error listing every failed plane is thrown once all planes are done.
        [[nodiscard]] auto transform(const ImageVolume& input) const -> SpectralImage;

        /// Amplitude spectrum sqrt(re^2 + im^2) of one plane, before scaling.
        /// The output has the (padded) output shape and is centered.
        /// Planes of uniform value give a spectrum of zeros. Non-finite samples throw an INVALID_INPUT error.
        [[nodiscard]] auto amplitude(std::span<const f32> plane, i64 width, i64 height) const -> std::vector<f64>;

        /// Shape (width, height) of the spectra for an input plane of the given shape.
        [[nodiscard]] auto output_shape(i64 width, i64 height) const -> Vec<i64, 2>;

        [[nodiscard]] auto parameters() const noexcept -> const SpectrumParameters& { return m_parameters; }

    private:
        void scale_(std::span<const f64> amplitude, std::span<f32> output) const;

    private:
        SpectrumParameters m_parameters;
    };
}

namespace fmt {
    template<> struct formatter<sqc::SpectrumScaling> : ostream_formatter {};
}
