#include "simqc/Analysis.hpp"
#include "simqc/Logger.hpp"
#include "simqc/RadialProfile.hpp"
#include "simqc/Reslice.hpp"
#include "simqc/ResolutionRings.hpp"
#include "simqc/Spectrum.hpp"
#include "simqc/Utilities.hpp"

namespace {
    using namespace ::sqc;

    // Display values (U8) are left as is. Amplitudes are scaled to the maximum of their plane.
    void autoscale_if_amplitude_(SpectralImage& spectra) {
        if (spectra.volume().precision() == Precision::F32)
            autoscale_planes(spectra.volume());
    }

    void add_radial_profiles_(const SpectralImage& lateral, const Options& options, ResultSet& output) {
        if (not lateral.calibration().is_calibrated()) {
            Logger::warn("The data is not spatially calibrated. Skipping the radial profiles");
            output.add_info("Radial profile", "Skipped: the data is not spatially calibrated");
            return;
        }
        const i64 z = lateral.dimensions().slices / 2;
        for (i64 c = 0; c < lateral.dimensions().channels; ++c) {
            output.add_profile(
                fmt::format("Radial profile C{}", c + 1),
                radial_profile(lateral, lateral.volume().plane_index(c, z, 0), options.radial_parameters()));
        }
    }

    void add_axial_spectrum_(
        const ImageVolume& reconstruction,
        const SpectralTransform2D& transform,
        const Options& options,
        ResultSet& output
    ) {
        if (reconstruction.slices() < 2) {
            Logger::warn("The orthogonal view requires at least 2 z-slices, got {}. Skipping the axial spectrum",
                         reconstruction.slices());
            output.add_info("FFT XZ", "Skipped: the volume has a single z-slice");
            return;
        }

        ImageVolume volume = reconstruction;
        volume.set_precision(Precision::F32);
        const OrthogonalResampler resampler(options.reslice_parameters(false));
        const ImageVolume xz = central_slice(resampler.reslice(volume));
        SpectralImage axial = transform.transform(xz);
        autoscale_if_amplitude_(axial);

        // The z-axis of the spectrum is squeezed to the lateral frequency scale,
        // so that the rings are circles of the lateral pixel size.
        // An interpolated view already has square pixels.
        const Calibration& calibration = xz.calibration();
        ImageVolume square = resize_and_pad_to_square(axial.volume(), calibration.pixel_width / calibration.pixel_height);
        Calibration ring_calibration = calibration;
        ring_calibration.pixel_height = ring_calibration.pixel_width;
        square.set_calibration(ring_calibration);

        auto rings = resolution_rings(square.width(), square.height(), ring_calibration, options.ring_parameters());
        output.add_image("FFT XZ", "Spectrum of the central orthogonal view", std::move(square), std::move(rings));
    }
}

namespace sqc {
    auto ReconstructedFourier::execute(const ImageVolume& reconstruction) const -> ResultSet {
        ResultSet output{std::string(name())};
        const SpectralTransform2D transform(m_options.spectrum_parameters());

        SpectralImage lateral;
        {
            auto timer = Logger::info_scope_time("Lateral spectra");
            lateral = transform.transform(reconstruction);
            autoscale_if_amplitude_(lateral);
        }
        add_radial_profiles_(lateral, m_options, output);

        auto rings = resolution_rings(lateral.width(), lateral.height(), lateral.calibration(),
                                      m_options.ring_parameters());
        output.add_image("FFT XY", "Lateral spectra, with the resolution rings",
                         std::move(lateral.volume()), std::move(rings));

        if (m_options.fourier.show_axial) {
            auto timer = Logger::info_scope_time("Axial spectrum");
            add_axial_spectrum_(reconstruction, transform, m_options, output);
        }

        output.add_info("Fourier-transformed reconstructed data",
                        "Check for a flat, isotropic spectrum out to the expected resolution, "
                        "without spots from the illumination pattern");
        return output;
    }
}
