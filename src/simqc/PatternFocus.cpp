#include <algorithm>

#include "simqc/Analysis.hpp"
#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Reslice.hpp"
#include "simqc/Utilities.hpp"

namespace sqc {
    auto PatternFocus::execute(const ImageVolume& raw) const -> ResultSet {
        // The orthogonal view is resampled to the physical aspect ratio.
        check(raw.calibration().is_calibrated(), Error::UNCALIBRATED_DATA,
              "The pattern focus requires a spatially calibrated volume, but got a calibration in {}",
              raw.calibration().unit);
        const auto [canonical, layout] = canonical_raw(raw, m_options.sim);
        const ImageVolume first_phases = first_phase_each_angle(canonical, layout);
        const OrthogonalResampler resampler(m_options.reslice_parameters(true));

        ResultSet output{std::string(name())};
        const f64 angle_step = 180. / static_cast<f64>(layout.angles);
        for (i64 a = 0; a < layout.angles; ++a) {
            const f64 angle = m_options.sim.angle1 + static_cast<f64>(a) * angle_step;
            auto timer = Logger::info_scope_time("Pattern focus, angle {:.1f}", angle);

            // The z-block of this angle.
            Dimensions shape = first_phases.dimensions();
            shape.slices = layout.slices;
            ImageVolume block = first_phases.like(shape);
            for (i64 t = 0; t < layout.frames; ++t)
                for (i64 z = 0; z < layout.slices; ++z)
                    for (i64 c = 0; c < layout.channels; ++c)
                        std::ranges::copy(first_phases.plane(c, a * layout.slices + z, t),
                                          block.plane(c, z, t).begin());

            // Rotate so that the stripes are vertical, then look at them from the side.
            ImageVolume rotated = rotate_planes(block, -(90 - angle));
            rotated.set_precision(Precision::F32);
            output.add_image(
                fmt::format("Angle {:.1f} pattern focus", angle),
                "Orthogonal view of the first phase, max-projected along the stripes",
                max_project_z(resampler.reslice(rotated)));
        }
        output.add_info("Pattern focus",
                        "The stripes should be sharpest at the center of the stack, "
                        "with the same focus for every angle");
        return output;
    }
}
