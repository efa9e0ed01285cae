#pragma once

#include <string>

#include "simqc/Image.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    /// Resolutions, in micrometers, of the default rings.
    inline const std::vector<f64> DEFAULT_RING_RESOLUTIONS{0.10, 0.12, 0.15, 0.2, 0.3, 0.6};

    struct ResolutionRing {
        f64 resolution; // um

        // Ellipse, centered on the zero frequency.
        f64 center_x;
        f64 center_y;
        f64 width;
        f64 height;

        // Label, placed alternatively above and below the ellipses.
        std::string label;
        f64 label_x;
        f64 label_y;

        [[nodiscard]] auto top_left() const noexcept -> Vec<f64, 2> {
            return {center_x - width / 2, center_y - height / 2};
        }
    };

    struct ResolutionRingSet {
        i64 spectrum_width{};
        i64 spectrum_height{};
        std::vector<ResolutionRing> rings{};

        [[nodiscard]] auto empty() const noexcept -> bool { return rings.empty(); }
        [[nodiscard]] auto size() const noexcept -> size_t { return rings.size(); }
    };

    struct ResolutionRingParameters {
        std::vector<f64> resolutions{DEFAULT_RING_RESOLUTIONS};
        i64 font_size{12};

        /// Refuse non-square spectra.
        bool require_square{false};
    };

    /// Ellipses marking the frequencies of the target resolutions on a spectrum of the given shape.
    /// The calibration is the real-space pixel size of the spectrum (i.e. its field of view is width*pixel_width).
    /// If the calibration is not a length, a warning is logged and no rings are returned.
    [[nodiscard]] auto resolution_rings(
        i64 width, i64 height,
        const Calibration& calibration,
        const ResolutionRingParameters& parameters = {}
    ) -> ResolutionRingSet;
}
