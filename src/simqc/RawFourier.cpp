#include "simqc/Analysis.hpp"
#include "simqc/Logger.hpp"
#include "simqc/Spectrum.hpp"
#include "simqc/Utilities.hpp"

namespace sqc {
    auto RawFourier::execute(const ImageVolume& raw) const -> ResultSet {
        const auto [canonical, layout] = canonical_raw(raw, m_options.sim);

        // The raw spectra are always displayed on a log scale.
        SpectrumParameters parameters = m_options.spectrum_parameters();
        parameters.scaling = SpectrumScaling::LOG;
        const SpectralTransform2D transform(parameters);

        ResultSet output{std::string(name())};
        for (i64 a = 0; a < layout.angles; ++a) {
            auto timer = Logger::info_scope_time("Raw data spectra, angle {}", a + 1);
            const SpectralImage spectra = transform.transform(split_angle(canonical, layout, a));
            output.add_image(
                fmt::format("FT angle {}", a + 1),
                fmt::format("Spectra of the {} phases and {} z-slices of angle {}, max-projected",
                            layout.phases, layout.slices, a + 1),
                max_project_z(spectra.volume()));
        }
        output.add_info("Fourier-transformed raw data", "Check for clean 1st and 2nd order spots");
        return output;
    }
}
