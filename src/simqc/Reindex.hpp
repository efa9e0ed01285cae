#pragma once

#include <initializer_list>
#include <span>

#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    /// Acquisition order of raw SIM data.
    enum class SimFormat {
        OMX,   // CPZAT, the canonical order.
        ELYRA, // CZAPT: angles folded in Z, phases folded in time.
        NSIM,  // phases tiled along x, angles tiled along y.
    };
    auto operator<<(std::ostream& os, SimFormat format) -> std::ostream&;

    /// Position and size along one dimension.
    struct DimensionPosition {
        i64 position;
        i64 size;
    };

    /// Linear index of a multidimensional position. The first dimension varies fastest.
    [[nodiscard]] auto stack_slice_index(std::span<const DimensionPosition> dimensions) -> i64;
    [[nodiscard]] inline auto stack_slice_index(std::initializer_list<DimensionPosition> dimensions) -> i64 {
        return stack_slice_index(std::span(dimensions.begin(), dimensions.size()));
    }

    /// Inclusive range [first, last] along a dimension of the given size.
    struct DimensionRange {
        i64 size;
        i64 first;
        i64 last;
    };

    /// Linear indices of every position within the ranges. The first dimension varies fastest,
    /// both in the linear index and in the order of the returned list.
    [[nodiscard]] auto slice_list(std::span<const DimensionRange> ranges) -> std::vector<i64>;
    [[nodiscard]] inline auto slice_list(std::initializer_list<DimensionRange> ranges) -> std::vector<i64> {
        return slice_list(std::span(ranges.begin(), ranges.size()));
    }

    /// Position of a raw SIM plane.
    struct SimIndex {
        i64 channel{};
        i64 phase{};
        i64 z{};
        i64 angle{};
        i64 time{};

        [[nodiscard]] constexpr auto operator==(const SimIndex&) const noexcept -> bool = default;
    };

    /// Extents of raw SIM data.
    struct SimLayout {
        i64 phases{5};
        i64 angles{3};
        i64 channels{1};
        i64 slices{1}; // z, once the phases and angles are removed
        i64 frames{1};

        /// Derives the number of z-slices from the total number of planes.
        /// Throws a DIMENSION_MISMATCH error if the extents do not divide the total.
        [[nodiscard]] static auto from_raw(i64 total_planes, i64 phases, i64 angles, i64 channels, i64 frames) -> SimLayout;

        /// Layout of a raw OMX (CPZAT) volume, with phases and angles folded in its z dimension.
        [[nodiscard]] static auto from_raw(const Dimensions& dimensions, i64 phases, i64 angles) -> SimLayout;

        [[nodiscard]] constexpr auto total_planes() const noexcept -> i64 {
            return channels * phases * slices * angles * frames;
        }
    };

    /// Maps the linear CPZAT plane index to (channel, phase, z, angle, time), and back.
    class ReindexMap {
    public:
        ReindexMap() = default;
        explicit ReindexMap(const SimLayout& layout) : m_layout(layout) {}

        [[nodiscard]] auto index(const SimIndex& position) const -> i64;
        [[nodiscard]] auto position(i64 index) const -> SimIndex;
        [[nodiscard]] auto layout() const noexcept -> const SimLayout& { return m_layout; }
        [[nodiscard]] auto size() const noexcept -> i64 { return m_layout.total_planes(); }

    private:
        SimLayout m_layout{};
    };

    /// Extracts every phase of one angle. The output has (channels, z*phases, frames) planes,
    /// with the phases varying fastest along the output z.
    [[nodiscard]] auto split_angle(const ImageVolume& raw, const SimLayout& layout, i64 angle) -> ImageVolume;

    /// Extracts the first phase of every angle. The output has (channels, z*angles, frames) planes,
    /// with the z varying fastest along the output z.
    [[nodiscard]] auto first_phase_each_angle(const ImageVolume& raw, const SimLayout& layout) -> ImageVolume;

    /// Converts raw data to the canonical OMX (CPZAT) order.
    /// The input dimensions are interpreted according to the format; the output has
    /// (channels, phases*z*angles, frames) planes.
    [[nodiscard]] auto convert_to_canonical(const ImageVolume& raw, SimFormat format, i64 phases, i64 angles) -> ImageVolume;
}

namespace fmt {
    template<> struct formatter<sqc::SimFormat> : ostream_formatter {};
}
