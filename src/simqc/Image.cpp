#include <algorithm>
#include <cctype>

#include "simqc/Image.hpp"

namespace {
    using namespace ::sqc;

    auto to_lower_(std::string_view str) -> std::string {
        std::string out(str);
        for (char& c: out)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    auto micrometers_per_unit_(LengthUnit unit) -> f64 {
        switch (unit) {
            case LengthUnit::NANOMETER:
                return 1e-3;
            case LengthUnit::MICROMETER:
                return 1;
            case LengthUnit::MILLIMETER:
                return 1e3;
            case LengthUnit::PIXEL:
                break;
        }
        panic(Error::UNCALIBRATED_DATA, "The calibration unit ({}) is not a length", unit);
    }
}

namespace sqc {
    auto parse_length_unit(std::string_view label) -> LengthUnit {
        const std::string unit = to_lower_(label);
        if (unit.empty() or unit == "pixel" or unit == "pixels" or unit == "px")
            return LengthUnit::PIXEL;
        if (unit == "nm" or unit == "nanometer" or unit == "nanometers")
            return LengthUnit::NANOMETER;
        if (unit == "µm" or unit == "um" or unit == "micron" or unit == "microns" or
            unit == "micrometer" or unit == "micrometers")
            return LengthUnit::MICROMETER;
        if (unit == "mm" or unit == "millimeter" or unit == "millimeters")
            return LengthUnit::MILLIMETER;
        panic(Error::UNCALIBRATED_DATA, "Unrecognized calibration unit: \"{}\"", label);
    }

    auto length_unit_label(LengthUnit unit) -> std::string_view {
        switch (unit) {
            case LengthUnit::PIXEL:
                return "pixel";
            case LengthUnit::NANOMETER:
                return "nm";
            case LengthUnit::MICROMETER:
                return "um";
            case LengthUnit::MILLIMETER:
                return "mm";
        }
        return "";
    }

    auto operator<<(std::ostream& os, LengthUnit unit) -> std::ostream& {
        return os << length_unit_label(unit);
    }

    auto operator<<(std::ostream& os, Precision precision) -> std::ostream& {
        switch (precision) {
            case Precision::U8:
                return os << "8-bit";
            case Precision::U16:
                return os << "16-bit";
            case Precision::F32:
                return os << "32-bit";
        }
        return os;
    }

    auto Calibration::to_micrometers() const -> Calibration {
        const f64 factor = micrometers_per_unit_(unit);
        return {
            .pixel_width = pixel_width * factor,
            .pixel_height = pixel_height * factor,
            .pixel_depth = pixel_depth * factor,
            .unit = LengthUnit::MICROMETER,
        };
    }

    ImageVolume::ImageVolume(const Dimensions& dimensions, const Calibration& calibration, Precision precision)
        : m_dimensions(dimensions), m_calibration(calibration), m_precision(precision)
    {
        check(dimensions.width > 0 and dimensions.height > 0 and
              dimensions.channels > 0 and dimensions.slices > 0 and dimensions.frames > 0,
              Error::INVALID_INPUT, "Invalid dimensions: width={}, height={}, channels={}, slices={}, frames={}",
              dimensions.width, dimensions.height, dimensions.channels, dimensions.slices, dimensions.frames);
        m_samples.resize(static_cast<size_t>(dimensions.n_elements()), 0.f);
    }

    ImageVolume::ImageVolume(
        const Dimensions& dimensions,
        std::vector<f32>&& samples,
        const Calibration& calibration,
        Precision precision
    ) : ImageVolume(dimensions, calibration, precision)
    {
        check(static_cast<i64>(samples.size()) == dimensions.n_elements(), Error::DIMENSION_MISMATCH,
              "The number of samples ({}) does not match the dimensions (width={}, height={}, stack size={})",
              samples.size(), dimensions.width, dimensions.height, dimensions.stack_size());
        m_samples = std::move(samples);
        reset_display_range();
    }

    auto ImageVolume::plane(i64 index) const -> std::span<const f32> {
        check(index >= 0 and index < stack_size(), Error::INVALID_INPUT,
              "Plane index {} is out of range (stack size={})", index, stack_size());
        const i64 size = m_dimensions.plane_size();
        return std::span<const f32>(m_samples).subspan(static_cast<size_t>(index * size), static_cast<size_t>(size));
    }

    auto ImageVolume::plane(i64 index) -> std::span<f32> {
        check(index >= 0 and index < stack_size(), Error::INVALID_INPUT,
              "Plane index {} is out of range (stack size={})", index, stack_size());
        const i64 size = m_dimensions.plane_size();
        return std::span<f32>(m_samples).subspan(static_cast<size_t>(index * size), static_cast<size_t>(size));
    }

    auto ImageVolume::reset_display_range() -> ImageVolume& {
        if (m_samples.empty())
            return *this;
        const auto [min, max] = std::ranges::minmax_element(m_samples);
        m_display_range = {static_cast<f64>(*min), static_cast<f64>(*max)};
        return *this;
    }

    auto ImageVolume::like(const Dimensions& dimensions) const -> ImageVolume {
        ImageVolume output(dimensions, m_calibration, m_precision);
        output.m_display_range = m_display_range;
        return output;
    }
}
