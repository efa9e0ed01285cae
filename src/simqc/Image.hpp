#pragma once

#include <ostream>
#include <span>
#include <string_view>

#include "simqc/Exception.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    /// Physical unit of the calibration. PIXEL marks the absence of calibration.
    enum class LengthUnit {
        PIXEL,
        NANOMETER,
        MICROMETER,
        MILLIMETER,
    };

    /// Parses a unit label, e.g. "µm", "um", "micron", "nm", "pixel".
    /// Unrecognized labels throw an UNCALIBRATED_DATA error.
    [[nodiscard]] auto parse_length_unit(std::string_view label) -> LengthUnit;
    [[nodiscard]] auto length_unit_label(LengthUnit unit) -> std::string_view;
    auto operator<<(std::ostream& os, LengthUnit unit) -> std::ostream&;

    struct Calibration {
        f64 pixel_width{1};
        f64 pixel_height{1};
        f64 pixel_depth{1};
        LengthUnit unit{LengthUnit::PIXEL};

        [[nodiscard]] constexpr auto is_calibrated() const noexcept -> bool {
            return unit != LengthUnit::PIXEL;
        }

        /// Returns the calibration expressed in micrometers.
        /// Throws an UNCALIBRATED_DATA error if the unit is not a length.
        [[nodiscard]] auto to_micrometers() const -> Calibration;
    };

    /// Bit depth of the data the samples are coming from. Samples are always stored as f32.
    enum class Precision {
        U8,
        U16,
        F32,
    };
    auto operator<<(std::ostream& os, Precision precision) -> std::ostream&;

    struct Dimensions {
        i64 width{};
        i64 height{};
        i64 channels{1};
        i64 slices{1}; // z
        i64 frames{1}; // t

        [[nodiscard]] constexpr auto plane_size() const noexcept -> i64 { return width * height; }
        [[nodiscard]] constexpr auto stack_size() const noexcept -> i64 { return channels * slices * frames; }
        [[nodiscard]] constexpr auto n_elements() const noexcept -> i64 { return plane_size() * stack_size(); }
        [[nodiscard]] constexpr auto is_square() const noexcept -> bool { return width == height; }
        [[nodiscard]] constexpr auto operator==(const Dimensions&) const noexcept -> bool = default;
    };

    /// Dense stack of 2d planes, stored with the channels varying fastest, then z, then time (CZT).
    /// Each plane is stored row-major.
    class ImageVolume {
    public:
        ImageVolume() = default;

        /// Allocates a zero-initialized volume.
        ImageVolume(const Dimensions& dimensions, const Calibration& calibration = {}, Precision precision = Precision::F32);

        /// Takes ownership of the samples. The size must match the dimensions.
        ImageVolume(
            const Dimensions& dimensions,
            std::vector<f32>&& samples,
            const Calibration& calibration = {},
            Precision precision = Precision::F32
        );

    public: // Slice indexing
        /// Index of the (c,z,t) plane in the stack.
        [[nodiscard]] constexpr auto plane_index(i64 c, i64 z, i64 t) const noexcept -> i64 {
            return (t * m_dimensions.slices + z) * m_dimensions.channels + c;
        }

        [[nodiscard]] auto plane(i64 index) const -> std::span<const f32>;
        [[nodiscard]] auto plane(i64 index) -> std::span<f32>;
        [[nodiscard]] auto plane(i64 c, i64 z, i64 t) const -> std::span<const f32> { return plane(plane_index(c, z, t)); }
        [[nodiscard]] auto plane(i64 c, i64 z, i64 t) -> std::span<f32> { return plane(plane_index(c, z, t)); }

        [[nodiscard]] auto at(i64 index, i64 y, i64 x) const -> f32 {
            return m_samples[static_cast<size_t>(index * m_dimensions.plane_size() + y * m_dimensions.width + x)];
        }
        [[nodiscard]] auto at(i64 index, i64 y, i64 x) -> f32& {
            return m_samples[static_cast<size_t>(index * m_dimensions.plane_size() + y * m_dimensions.width + x)];
        }

    public: // Getters
        [[nodiscard]] auto dimensions() const noexcept -> const Dimensions& { return m_dimensions; }
        [[nodiscard]] auto width() const noexcept -> i64 { return m_dimensions.width; }
        [[nodiscard]] auto height() const noexcept -> i64 { return m_dimensions.height; }
        [[nodiscard]] auto channels() const noexcept -> i64 { return m_dimensions.channels; }
        [[nodiscard]] auto slices() const noexcept -> i64 { return m_dimensions.slices; }
        [[nodiscard]] auto frames() const noexcept -> i64 { return m_dimensions.frames; }
        [[nodiscard]] auto stack_size() const noexcept -> i64 { return m_dimensions.stack_size(); }
        [[nodiscard]] auto calibration() const noexcept -> const Calibration& { return m_calibration; }
        [[nodiscard]] auto precision() const noexcept -> Precision { return m_precision; }
        [[nodiscard]] auto samples() const noexcept -> std::span<const f32> { return m_samples; }
        [[nodiscard]] auto samples() noexcept -> std::span<f32> { return m_samples; }
        [[nodiscard]] auto is_empty() const noexcept -> bool { return m_samples.empty(); }

        [[nodiscard]] auto display_range() const noexcept -> Vec<f64, 2> { return m_display_range; }

    public: // Setters
        auto set_calibration(const Calibration& calibration) -> ImageVolume& {
            m_calibration = calibration;
            return *this;
        }
        auto set_precision(Precision precision) -> ImageVolume& {
            m_precision = precision;
            return *this;
        }
        auto set_display_range(const Vec<f64, 2>& range) -> ImageVolume& {
            m_display_range = range;
            return *this;
        }

        /// Sets the display range to the min and max of the samples.
        auto reset_display_range() -> ImageVolume&;

        /// Creates a volume of the same precision, calibration and display range, with new dimensions.
        [[nodiscard]] auto like(const Dimensions& dimensions) const -> ImageVolume;

    private:
        Dimensions m_dimensions{};
        Calibration m_calibration{};
        Precision m_precision{Precision::F32};
        Vec<f64, 2> m_display_range{};
        std::vector<f32> m_samples{};
    };
}

namespace fmt {
    template<> struct formatter<sqc::LengthUnit> : ostream_formatter {};
    template<> struct formatter<sqc::Precision> : ostream_formatter {};
}
