#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sqc {
    namespace stdr = std::ranges;
    namespace stdv = std::views;
    namespace fs = std::filesystem;
    using Path = std::filesystem::path;

    using i32 = std::int32_t;
    using i64 = std::int64_t;
    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u64 = std::uint64_t;
    using f32 = float;
    using f64 = double;

    template<typename T, size_t N>
    using Vec = std::array<T, N>;

    template<typename T, typename U>
    using Pair = std::pair<T, U>;
}
