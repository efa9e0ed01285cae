#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>
#include <random>

#include "simqc/Exception.hpp"
#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace test {
    using namespace ::sqc;

    /// Code of the Exception thrown by func, if any.
    template<typename Func>
    auto thrown_error(Func&& func) -> std::optional<Error> {
        try {
            func();
        } catch (const Exception& e) {
            return e.code();
        }
        return std::nullopt;
    }

    inline auto micrometers(f64 width, f64 height, f64 depth) -> Calibration {
        return {.pixel_width = width, .pixel_height = height, .pixel_depth = depth, .unit = LengthUnit::MICROMETER};
    }

    inline auto random_volume(const Dimensions& dimensions, u64 seed = 42, const Calibration& calibration = {}) -> ImageVolume {
        std::mt19937_64 generator(seed);
        std::uniform_real_distribution<f32> distribution(0.f, 100.f);
        std::vector<f32> samples(static_cast<size_t>(dimensions.n_elements()));
        for (f32& sample: samples)
            sample = distribution(generator);
        return ImageVolume(dimensions, std::move(samples), calibration);
    }

    /// Raw OMX (CPZAT) volume where every plane shows stripes, shifted by 1/phases of a period at each phase.
    inline auto striped_raw(
        i64 size, i64 phases, i64 angles, i64 slices,
        const Calibration& calibration = {}
    ) -> ImageVolume {
        ImageVolume raw({.width = size, .height = size, .slices = phases * slices * angles}, calibration);
        for (i64 a = 0; a < angles; ++a) {
            for (i64 z = 0; z < slices; ++z) {
                for (i64 p = 0; p < phases; ++p) {
                    const i64 index = (a * slices + z) * phases + p;
                    for (i64 y = 0; y < size; ++y) {
                        for (i64 x = 0; x < size; ++x) {
                            const f64 period = static_cast<f64>(a % 2 == 0 ? x : y) / 4 +
                                               static_cast<f64>(p) / static_cast<f64>(phases);
                            raw.at(index, y, x) = static_cast<f32>(100 + 50 * std::cos(2 * std::numbers::pi * period));
                        }
                    }
                }
            }
        }
        raw.reset_display_range();
        return raw;
    }

    /// Raw OMX volume of stripes with the given modulation depth, around a mean of 1000,
    /// with Gaussian noise of the same variance as the shot noise.
    inline auto modulated_raw(
        i64 size, i64 phases, i64 angles, i64 slices,
        f64 modulation, u64 seed = 42
    ) -> ImageVolume {
        std::mt19937_64 generator(seed);
        std::normal_distribution<f64> noise(0., std::sqrt(1000.));
        ImageVolume raw({.width = size, .height = size, .slices = phases * slices * angles});
        for (i64 a = 0; a < angles; ++a) {
            for (i64 z = 0; z < slices; ++z) {
                for (i64 p = 0; p < phases; ++p) {
                    const i64 index = (a * slices + z) * phases + p;
                    for (i64 y = 0; y < size; ++y) {
                        for (i64 x = 0; x < size; ++x) {
                            const f64 period = static_cast<f64>(a % 2 == 0 ? x : y) / 4 +
                                               static_cast<f64>(p) / static_cast<f64>(phases);
                            const f64 signal = 1000 * (1 + modulation * std::cos(2 * std::numbers::pi * period));
                            raw.at(index, y, x) = static_cast<f32>(signal + noise(generator));
                        }
                    }
                }
            }
        }
        raw.reset_display_range();
        return raw;
    }
}
