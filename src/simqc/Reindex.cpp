#include <algorithm>

#include "simqc/Logger.hpp"
#include "simqc/Reindex.hpp"

namespace {
    using namespace ::sqc;

    void copy_plane_(const ImageVolume& input, i64 input_index, ImageVolume& output, i64 output_index) {
        const auto source = input.plane(input_index);
        std::ranges::copy(source, output.plane(output_index).begin());
    }

    void check_phases_and_angles_(i64 phases, i64 angles) {
        check(phases > 0 and angles > 0, Error::INVALID_INPUT,
              "The number of phases ({}) and angles ({}) should be positive", phases, angles);
    }

    auto convert_elyra_(const ImageVolume& raw, i64 phases, i64 angles) -> ImageVolume {
        // Angles are folded in Z, phases in time.
        const Dimensions& shape = raw.dimensions();
        check(shape.frames % phases == 0 and shape.slices % angles == 0, Error::DIMENSION_MISMATCH,
              "ELYRA data should have the angles in Z and the phases in time, "
              "but got slices={}, frames={} for angles={}, phases={}",
              shape.slices, shape.frames, angles, phases);
        const i64 nc = shape.channels;
        const i64 nz = shape.slices / angles;
        const i64 nt = shape.frames / phases;

        ImageVolume output = raw.like({
            .width = shape.width,
            .height = shape.height,
            .channels = nc,
            .slices = phases * nz * angles,
            .frames = nt,
        });

        i64 output_index{};
        for (i64 t = 0; t < nt; ++t)
            for (i64 a = 0; a < angles; ++a)
                for (i64 z = 0; z < nz; ++z)
                    for (i64 p = 0; p < phases; ++p)
                        for (i64 c = 0; c < nc; ++c, ++output_index)
                            copy_plane_(raw, stack_slice_index({{c, nc}, {z, nz}, {a, angles}, {p, phases}, {t, nt}}),
                                        output, output_index);
        return output;
    }

    auto convert_nsim_(const ImageVolume& raw, i64 phases, i64 angles) -> ImageVolume {
        // Phases are tiled along x, angles along y.
        const Dimensions& shape = raw.dimensions();
        check(shape.width % phases == 0 and shape.height % angles == 0, Error::DIMENSION_MISMATCH,
              "N-SIM data should have the phases tiled in x and the angles tiled in y, "
              "but got width={}, height={} for phases={}, angles={}",
              shape.width, shape.height, phases, angles);
        const i64 tile_width = shape.width / phases;
        const i64 tile_height = shape.height / angles;
        const i64 nc = shape.channels;
        const i64 nz = shape.slices;
        const i64 nt = shape.frames;

        ImageVolume output = raw.like({
            .width = tile_width,
            .height = tile_height,
            .channels = nc,
            .slices = phases * nz * angles,
            .frames = nt,
        });

        i64 output_index{};
        for (i64 t = 0; t < nt; ++t) {
            for (i64 a = 0; a < angles; ++a) {
                for (i64 z = 0; z < nz; ++z) {
                    for (i64 p = 0; p < phases; ++p) {
                        for (i64 c = 0; c < nc; ++c, ++output_index) {
                            const i64 input_index = raw.plane_index(c, z, t);
                            const i64 offset_x = tile_width * p;
                            const i64 offset_y = tile_height * a;
                            for (i64 y = 0; y < tile_height; ++y)
                                for (i64 x = 0; x < tile_width; ++x)
                                    output.at(output_index, y, x) = raw.at(input_index, y + offset_y, x + offset_x);
                        }
                    }
                }
            }
        }
        return output;
    }
}

namespace sqc {
    auto operator<<(std::ostream& os, SimFormat format) -> std::ostream& {
        switch (format) {
            case SimFormat::OMX:
                return os << "OMX";
            case SimFormat::ELYRA:
                return os << "ELYRA";
            case SimFormat::NSIM:
                return os << "N-SIM";
        }
        return os;
    }

    auto stack_slice_index(std::span<const DimensionPosition> dimensions) -> i64 {
        i64 index{};
        i64 stride{1};
        for (const auto& [position, size]: dimensions) {
            check(size > 0 and position >= 0 and position < size, Error::INVALID_INPUT,
                  "Position {} is out of range for a dimension of size {}", position, size);
            index += position * stride;
            stride *= size;
        }
        return index;
    }

    auto slice_list(std::span<const DimensionRange> ranges) -> std::vector<i64> {
        check(not ranges.empty(), Error::INVALID_INPUT, "At least one dimension range is required");

        i64 count{1};
        for (const auto& [size, first, last]: ranges) {
            check(size > 0 and first >= 0 and first <= last and last < size, Error::INVALID_INPUT,
                  "Invalid range [{}, {}] for a dimension of size {}", first, last, size);
            count *= last - first + 1;
        }

        // Odometer over the ranges, the first dimension being the fastest.
        std::vector<i64> output;
        output.reserve(static_cast<size_t>(count));
        std::vector<DimensionPosition> current;
        current.reserve(ranges.size());
        for (const auto& range: ranges)
            current.push_back({range.first, range.size});

        for (i64 i = 0; i < count; ++i) {
            output.push_back(stack_slice_index(current));
            for (size_t d = 0; d < ranges.size(); ++d) {
                if (current[d].position < ranges[d].last) {
                    ++current[d].position;
                    break;
                }
                current[d].position = ranges[d].first;
            }
        }
        return output;
    }

    auto SimLayout::from_raw(i64 total_planes, i64 phases, i64 angles, i64 channels, i64 frames) -> SimLayout {
        check_phases_and_angles_(phases, angles);
        check(channels > 0 and frames > 0, Error::INVALID_INPUT,
              "The number of channels ({}) and frames ({}) should be positive", channels, frames);
        const i64 divisor = channels * phases * angles * frames;
        check(total_planes > 0 and total_planes % divisor == 0, Error::DIMENSION_MISMATCH,
              "The number of planes ({}) is not divisible by channels*phases*angles*frames={}*{}*{}*{}",
              total_planes, channels, phases, angles, frames);
        return {
            .phases = phases,
            .angles = angles,
            .channels = channels,
            .slices = total_planes / divisor,
            .frames = frames,
        };
    }

    auto SimLayout::from_raw(const Dimensions& dimensions, i64 phases, i64 angles) -> SimLayout {
        check_phases_and_angles_(phases, angles);
        check(dimensions.slices % (phases * angles) == 0, Error::DIMENSION_MISMATCH,
              "The number of slices ({}) is not divisible by phases*angles={}*{}",
              dimensions.slices, phases, angles);
        return from_raw(dimensions.stack_size(), phases, angles, dimensions.channels, dimensions.frames);
    }

    auto ReindexMap::index(const SimIndex& position) const -> i64 {
        return stack_slice_index({
            {position.channel, m_layout.channels},
            {position.phase, m_layout.phases},
            {position.z, m_layout.slices},
            {position.angle, m_layout.angles},
            {position.time, m_layout.frames},
        });
    }

    auto ReindexMap::position(i64 index) const -> SimIndex {
        check(index >= 0 and index < size(), Error::INVALID_INPUT,
              "Plane index {} is out of range (size={})", index, size());
        SimIndex output;
        output.channel = index % m_layout.channels;
        index /= m_layout.channels;
        output.phase = index % m_layout.phases;
        index /= m_layout.phases;
        output.z = index % m_layout.slices;
        index /= m_layout.slices;
        output.angle = index % m_layout.angles;
        output.time = index / m_layout.angles;
        return output;
    }

    auto split_angle(const ImageVolume& raw, const SimLayout& layout, i64 angle) -> ImageVolume {
        check(layout.total_planes() == raw.stack_size(), Error::DIMENSION_MISMATCH,
              "The layout ({} planes) does not match the volume ({} planes)",
              layout.total_planes(), raw.stack_size());
        check(angle >= 0 and angle < layout.angles, Error::INVALID_INPUT,
              "Angle {} is out of range (angles={})", angle, layout.angles);

        const ReindexMap map(layout);
        ImageVolume output = raw.like({
            .width = raw.width(),
            .height = raw.height(),
            .channels = layout.channels,
            .slices = layout.slices * layout.phases,
            .frames = layout.frames,
        });
        for (i64 t = 0; t < layout.frames; ++t)
            for (i64 z = 0; z < layout.slices; ++z)
                for (i64 p = 0; p < layout.phases; ++p)
                    for (i64 c = 0; c < layout.channels; ++c)
                        copy_plane_(raw, map.index({c, p, z, angle, t}),
                                    output, output.plane_index(c, z * layout.phases + p, t));
        return output;
    }

    auto first_phase_each_angle(const ImageVolume& raw, const SimLayout& layout) -> ImageVolume {
        check(layout.total_planes() == raw.stack_size(), Error::DIMENSION_MISMATCH,
              "The layout ({} planes) does not match the volume ({} planes)",
              layout.total_planes(), raw.stack_size());

        const ReindexMap map(layout);
        ImageVolume output = raw.like({
            .width = raw.width(),
            .height = raw.height(),
            .channels = layout.channels,
            .slices = layout.slices * layout.angles,
            .frames = layout.frames,
        });
        for (i64 t = 0; t < layout.frames; ++t)
            for (i64 a = 0; a < layout.angles; ++a)
                for (i64 z = 0; z < layout.slices; ++z)
                    for (i64 c = 0; c < layout.channels; ++c)
                        copy_plane_(raw, map.index({c, 0, z, a, t}),
                                    output, output.plane_index(c, a * layout.slices + z, t));
        return output;
    }

    auto convert_to_canonical(const ImageVolume& raw, SimFormat format, i64 phases, i64 angles) -> ImageVolume {
        check_phases_and_angles_(phases, angles);
        Logger::trace("Converting {} data to OMX (CPZAT) order", format);
        switch (format) {
            case SimFormat::OMX: {
                // Already canonical, only check the layout.
                [[maybe_unused]] const auto layout = SimLayout::from_raw(raw.dimensions(), phases, angles);
                return raw;
            }
            case SimFormat::ELYRA:
                return convert_elyra_(raw, phases, angles);
            case SimFormat::NSIM:
                return convert_nsim_(raw, phases, angles);
        }
        panic(Error::INVALID_INPUT, "Unknown format");
    }
}
