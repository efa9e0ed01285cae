#include <algorithm>
#include <cmath>
#include <numbers>

#include "simqc/Exception.hpp"
#include "simqc/Utilities.hpp"

namespace sqc {
    auto interpolate_bilinear(std::span<const f32> plane, i64 width, i64 height, f64 y, f64 x) -> f64 {
        x = std::clamp(x, 0., static_cast<f64>(width - 1));
        y = std::clamp(y, 0., static_cast<f64>(height - 1));
        const auto x0 = static_cast<i64>(x);
        const auto y0 = static_cast<i64>(y);
        const i64 x1 = std::min(x0 + 1, width - 1);
        const i64 y1 = std::min(y0 + 1, height - 1);
        const f64 dx = x - static_cast<f64>(x0);
        const f64 dy = y - static_cast<f64>(y0);

        const auto value = [&](i64 iy, i64 ix) {
            return static_cast<f64>(plane[static_cast<size_t>(iy * width + ix)]);
        };
        const f64 top = value(y0, x0) * (1 - dx) + value(y0, x1) * dx;
        const f64 bottom = value(y1, x0) * (1 - dx) + value(y1, x1) * dx;
        return top * (1 - dy) + bottom * dy;
    }

    auto resize_bilinear(
        std::span<const f32> input, i64 input_width, i64 input_height,
        i64 output_width, i64 output_height
    ) -> std::vector<f32> {
        check(static_cast<i64>(input.size()) == input_width * input_height and
              output_width > 0 and output_height > 0,
              Error::INVALID_INPUT, "Invalid resize from {}x{} ({} samples) to {}x{}",
              input_width, input_height, input.size(), output_width, output_height);

        const f64 scale_x = static_cast<f64>(output_width) / static_cast<f64>(input_width);
        const f64 scale_y = static_cast<f64>(output_height) / static_cast<f64>(input_height);
        std::vector<f32> output(static_cast<size_t>(output_width * output_height));
        for (i64 y = 0; y < output_height; ++y) {
            const f64 iy = (static_cast<f64>(y) + 0.5) / scale_y - 0.5;
            for (i64 x = 0; x < output_width; ++x) {
                const f64 ix = (static_cast<f64>(x) + 0.5) / scale_x - 0.5;
                output[static_cast<size_t>(y * output_width + x)] =
                    static_cast<f32>(interpolate_bilinear(input, input_width, input_height, iy, ix));
            }
        }
        return output;
    }

    auto rotate_planes(const ImageVolume& input, f64 angle_degrees) -> ImageVolume {
        ImageVolume output = input.like(input.dimensions());
        const i64 width = input.width();
        const i64 height = input.height();
        const f64 center_x = static_cast<f64>(width - 1) / 2;
        const f64 center_y = static_cast<f64>(height - 1) / 2;

        // Inverse mapping: rotate the output coordinates by -angle to find the input coordinates.
        const f64 angle = angle_degrees * std::numbers::pi / 180;
        const f64 cos = std::cos(angle);
        const f64 sin = std::sin(angle);
        for (i64 index = 0; index < input.stack_size(); ++index) {
            const auto source = input.plane(index);
            const auto destination = output.plane(index);
            for (i64 y = 0; y < height; ++y) {
                for (i64 x = 0; x < width; ++x) {
                    const f64 dx = static_cast<f64>(x) - center_x;
                    const f64 dy = static_cast<f64>(y) - center_y;
                    const f64 ix = center_x + dx * cos + dy * sin;
                    const f64 iy = center_y - dx * sin + dy * cos;
                    f64 value{};
                    if (ix >= -0.5 and ix <= static_cast<f64>(width) - 0.5 and
                        iy >= -0.5 and iy <= static_cast<f64>(height) - 0.5)
                        value = interpolate_bilinear(source, width, height, iy, ix);
                    destination[static_cast<size_t>(y * width + x)] = static_cast<f32>(value);
                }
            }
        }
        return output;
    }

    auto max_project_z(const ImageVolume& input) -> ImageVolume {
        Dimensions shape = input.dimensions();
        shape.slices = 1;
        ImageVolume output = input.like(shape);
        for (i64 t = 0; t < input.frames(); ++t) {
            for (i64 c = 0; c < input.channels(); ++c) {
                const auto destination = output.plane(c, 0, t);
                std::ranges::copy(input.plane(c, 0, t), destination.begin());
                for (i64 z = 1; z < input.slices(); ++z) {
                    const auto source = input.plane(c, z, t);
                    for (size_t i = 0; i < source.size(); ++i)
                        destination[i] = std::max(destination[i], source[i]);
                }
            }
        }
        output.reset_display_range();
        return output;
    }

    auto central_slice(const ImageVolume& input) -> ImageVolume {
        Dimensions shape = input.dimensions();
        shape.slices = 1;
        ImageVolume output = input.like(shape);
        const i64 z = input.slices() / 2;
        for (i64 t = 0; t < input.frames(); ++t)
            for (i64 c = 0; c < input.channels(); ++c)
                std::ranges::copy(input.plane(c, z, t), output.plane(c, 0, t).begin());
        return output;
    }

    auto extract_channel(const ImageVolume& input, i64 channel) -> ImageVolume {
        check(channel >= 0 and channel < input.channels(), Error::INVALID_INPUT,
              "Channel {} is out of range (channels={})", channel, input.channels());
        Dimensions shape = input.dimensions();
        shape.channels = 1;
        ImageVolume output = input.like(shape);
        for (i64 t = 0; t < input.frames(); ++t)
            for (i64 z = 0; z < input.slices(); ++z)
                std::ranges::copy(input.plane(channel, z, t), output.plane(0, z, t).begin());
        output.reset_display_range();
        return output;
    }

    auto resize_and_pad_to_square(const ImageVolume& input, f64 y_factor) -> ImageVolume {
        check(y_factor > 0, Error::INVALID_INPUT, "The resize factor should be positive, but got {}", y_factor);
        const i64 width = input.width();
        const i64 resized_height = std::max(i64{1}, static_cast<i64>(static_cast<f64>(input.height()) * y_factor));
        const i64 size = std::max(width, resized_height);

        Dimensions shape = input.dimensions();
        shape.width = size;
        shape.height = size;
        ImageVolume output = input.like(shape);

        const i64 offset_x = (size - width) / 2;
        const i64 offset_y = (size - resized_height) / 2;
        for (i64 index = 0; index < input.stack_size(); ++index) {
            const auto resized = resize_bilinear(input.plane(index), width, input.height(), width, resized_height);
            const auto destination = output.plane(index);
            for (i64 y = 0; y < resized_height; ++y)
                for (i64 x = 0; x < width; ++x)
                    destination[static_cast<size_t>((y + offset_y) * size + x + offset_x)] =
                        resized[static_cast<size_t>(y * width + x)];
        }
        return output;
    }

    void autoscale_planes(ImageVolume& volume) {
        for (i64 index = 0; index < volume.stack_size(); ++index) {
            const auto plane = volume.plane(index);
            const f32 max = std::ranges::max(plane);
            if (max <= 0)
                continue;
            for (f32& value: plane)
                value /= max;
        }
        volume.reset_display_range();
    }

    auto triangle_threshold(std::span<const i64> histogram) -> i64 {
        check(not histogram.empty(), Error::INVALID_INPUT, "The histogram is empty");
        std::vector<i64> data(histogram.begin(), histogram.end());
        const auto size = static_cast<i64>(data.size());
        const auto at = [&data](i64 i) -> i64& { return data[static_cast<size_t>(i)]; };

        // Ends of the histogram, extended by one empty bin so that the line starts at zero.
        i64 first{};
        for (i64 i = 0; i < size; ++i) {
            if (at(i) > 0) {
                first = i;
                break;
            }
        }
        if (first > 0)
            --first;
        i64 last{};
        for (i64 i = size - 1; i > 0; --i) {
            if (at(i) > 0) {
                last = i;
                break;
            }
        }
        if (last < size - 1)
            ++last;
        const i64 peak = std::ranges::max_element(data) - data.begin();

        // The longest tail is moved to the left.
        const bool flipped = peak - first < last - peak;
        i64 start = first;
        i64 top = peak;
        if (flipped) {
            std::ranges::reverse(data);
            start = size - 1 - last;
            top = size - 1 - peak;
        }
        if (start == top)
            return flipped ? size - 1 - start : start;

        // Distance to the line from (start, data[start]) to (top, data[top]).
        f64 nx = static_cast<f64>(at(top));
        f64 ny = static_cast<f64>(start - top);
        const f64 norm = std::sqrt(nx * nx + ny * ny);
        nx /= norm;
        ny /= norm;
        const f64 offset = nx * static_cast<f64>(start) + ny * static_cast<f64>(at(start));

        i64 split = start;
        f64 split_distance{};
        for (i64 i = start + 1; i <= top; ++i) {
            const f64 distance = nx * static_cast<f64>(i) + ny * static_cast<f64>(at(i)) - offset;
            if (distance > split_distance) {
                split = i;
                split_distance = distance;
            }
        }
        --split;
        return flipped ? size - 1 - split : split;
    }

    auto feature_mean(const ImageVolume& volume) -> f64 {
        check(not volume.is_empty(), Error::INVALID_INPUT, "The volume is empty");
        constexpr i64 N_BINS = 256;
        std::vector<i64> histogram(N_BINS);
        std::vector<i64> bins;

        f64 total{};
        for (i64 index = 0; index < volume.stack_size(); ++index) {
            const auto plane = volume.plane(index);
            const auto [min, max] = std::ranges::minmax(plane);
            const f64 range = static_cast<f64>(max) - static_cast<f64>(min);

            std::ranges::fill(histogram, 0);
            bins.resize(plane.size());
            for (size_t i = 0; i < plane.size(); ++i) {
                const f64 scaled = range > 0 ? (static_cast<f64>(plane[i]) - min) / range * static_cast<f64>(N_BINS) : 0.;
                bins[i] = std::clamp(static_cast<i64>(scaled), i64{0}, N_BINS - 1);
                ++histogram[static_cast<size_t>(bins[i])];
            }
            const i64 threshold = triangle_threshold(histogram);

            f64 sum{};
            i64 count{};
            for (size_t i = 0; i < plane.size(); ++i) {
                if (bins[i] > threshold) {
                    sum += static_cast<f64>(plane[i]);
                    ++count;
                }
            }
            if (count == 0) {
                for (f32 value: plane)
                    sum += static_cast<f64>(value);
                count = static_cast<i64>(plane.size());
            }
            total += sum / static_cast<f64>(count);
        }
        return total / static_cast<f64>(volume.stack_size());
    }

    void anscombe(VectorBatch& batch) {
        for (f32& value: batch.data)
            value = static_cast<f32>(2 * std::sqrt(std::max(static_cast<f64>(value), 0.)) + 3. / 8.);
    }

    void normalize_inner(VectorBatch& batch) {
        if (batch.data.empty())
            return;
        f64 total{};
        for (f32 value: batch.data)
            total += static_cast<f64>(value);
        const f64 average = total / static_cast<f64>(batch.data.size());

        for (i64 k = 0; k < batch.n; ++k) {
            const auto vector = batch.vector(k);
            f64 sum{};
            for (f32 value: vector)
                sum += static_cast<f64>(value);
            const f64 mean = sum / static_cast<f64>(vector.size());
            if (mean == 0)
                continue;
            const f64 factor = average / mean;
            for (f32& value: vector)
                value = static_cast<f32>(static_cast<f64>(value) * factor);
        }
    }
}
