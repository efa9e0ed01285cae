#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/ResolutionRings.hpp"

namespace sqc {
    auto resolution_rings(
        i64 width, i64 height,
        const Calibration& calibration,
        const ResolutionRingParameters& parameters
    ) -> ResolutionRingSet {
        check(width > 0 and height > 0, Error::INVALID_INPUT,
              "Invalid spectrum shape: width={}, height={}", width, height);
        check(not parameters.require_square or width == height, Error::INVALID_INPUT,
              "The resolution rings require a square spectrum, but got width={}, height={}", width, height);

        ResolutionRingSet output{.spectrum_width = width, .spectrum_height = height};
        if (not calibration.is_calibrated()) {
            Logger::warn("Non-spatial calibration ({}). Cannot plot resolution rings", calibration.unit);
            return output;
        }
        const Calibration micrometers = calibration.to_micrometers();

        const f64 center_x = static_cast<f64>(width / 2);
        const f64 center_y = static_cast<f64>(height / 2);
        const auto font_size = static_cast<f64>(parameters.font_size);
        output.rings.reserve(parameters.resolutions.size());
        for (size_t i = 0; i < parameters.resolutions.size(); ++i) {
            const f64 resolution = parameters.resolutions[i];
            check(resolution > 0, Error::INVALID_INPUT, "The resolutions should be positive, but got {}", resolution);

            // Spatial frequency, in pixels from the origin, of the resolution: N * spacing / resolution.
            const f64 radius_x = static_cast<f64>(width) * micrometers.pixel_width / resolution;
            const f64 radius_y = static_cast<f64>(height) * micrometers.pixel_height / resolution;

            // Even rings have their label above the ellipse, odd rings below.
            const f64 side = -0.5 + static_cast<f64>((i + 1) % 2);
            output.rings.push_back({
                .resolution = resolution,
                .center_x = center_x,
                .center_y = center_y,
                .width = 2 * radius_x,
                .height = 2 * radius_y,
                .label = fmt::format("{} um", resolution),
                .label_x = center_x - font_size,
                .label_y = center_y - 2 * side * radius_y - font_size,
            });
        }
        return output;
    }
}
