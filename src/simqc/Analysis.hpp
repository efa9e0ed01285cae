#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "simqc/DFT.hpp"
#include "simqc/Image.hpp"
#include "simqc/Options.hpp"
#include "simqc/Reindex.hpp"
#include "simqc/ResultSet.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    /// Quality-control check of a SIM volume.
    class Analysis {
    public:
        virtual ~Analysis() = default;

        [[nodiscard]] virtual auto name() const -> std::string_view = 0;

        /// Runs the check. The input is left unchanged.
        [[nodiscard]] virtual auto execute(const ImageVolume& input) const -> ResultSet = 0;
    };

    /// Raw data split by angle: spectrum of every plane, max-projected over phases and z.
    class RawFourier final : public Analysis {
    public:
        explicit RawFourier(const Options& options) : m_options(options) {}
        [[nodiscard]] auto name() const -> std::string_view override { return "Raw data Fourier plots"; }
        [[nodiscard]] auto execute(const ImageVolume& raw) const -> ResultSet override;

    private:
        Options m_options;
    };

    /// Reconstructed data: lateral spectra with resolution rings, radial profiles at the central z,
    /// and optionally the spectrum of the central orthogonal (XZ) view.
    class ReconstructedFourier final : public Analysis {
    public:
        explicit ReconstructedFourier(const Options& options) : m_options(options) {}
        [[nodiscard]] auto name() const -> std::string_view override { return "Reconstructed data Fourier plots"; }
        [[nodiscard]] auto execute(const ImageVolume& reconstruction) const -> ResultSet override;

    private:
        Options m_options;
    };

    /// Raw data: first phase of each angle, rotated so that the illumination stripes are vertical,
    /// resliced and max-projected to show the focus of the pattern along z.
    class PatternFocus final : public Analysis {
    public:
        explicit PatternFocus(const Options& options) : m_options(options) {}
        [[nodiscard]] auto name() const -> std::string_view override { return "Pattern focus"; }
        [[nodiscard]] auto execute(const ImageVolume& raw) const -> ResultSet override;

    private:
        Options m_options;
    };

    /// Raw data: 1d spectra, along the phases and the central z-window, of every pixel.
    class PhaseFourier final : public Analysis {
    public:
        explicit PhaseFourier(const Options& options) : m_options(options) {}
        [[nodiscard]] auto name() const -> std::string_view override { return "Raw data phase Fourier plots"; }
        [[nodiscard]] auto execute(const ImageVolume& raw) const -> ResultSet override;

    private:
        Options m_options;
    };

    /// Raw data: modulation contrast-to-noise ratio (MCNR) map of every z-slice, averaged over the angles.
    /// The MCNR of a pixel is the amplitude of its first two orders along the phases of a sliding z-window,
    /// divided by the standard deviation, over the plane, of the highest frequency.
    class ModContrast final : public Analysis {
    public:
        explicit ModContrast(const Options& options) : m_options(options) {}
        [[nodiscard]] auto name() const -> std::string_view override { return "Raw data modulation contrast"; }
        [[nodiscard]] auto execute(const ImageVolume& raw) const -> ResultSet override;

        /// Optimal Wiener filter parameter for a given feature MCNR.
        [[nodiscard]] static auto wiener_estimate(f64 mcnr) -> f64;

        /// PASS for 6 and above, FAIL for 3 and below.
        [[nodiscard]] static auto check_mcnr(f64 mcnr) -> StatStatus;

    private:
        Options m_options;
    };

    /// Raw data converted to the canonical order, with its layout.
    [[nodiscard]] auto canonical_raw(const ImageVolume& raw, const Options::Sim& options) -> Pair<ImageVolume, SimLayout>;

    /// Spectra along the phases of the z-slices [z_first, z_last] of one channel, angle and frame.
    /// The vectors are Anscombe-transformed and normalized before the transform.
    /// The output has phases*(z_last-z_first+1) vectors of width*height pixels.
    [[nodiscard]] auto phase_spectra(
        const ImageVolume& canonical, const SimLayout& layout,
        i64 channel, i64 angle, i64 frame, i64 z_first, i64 z_last,
        i64 n_threads
    ) -> VectorBatch;

    /// Sets up the logger: console level, and the optional log file.
    void initialize_logging(const Options::Compute& options);

    /// Creates an analysis from its identifier: "raw_fourier", "reconstructed_fourier",
    /// "pattern_focus", "phase_fourier" or "modulation_contrast".
    [[nodiscard]] auto make_analysis(std::string_view identifier, const Options& options) -> std::unique_ptr<Analysis>;

    /// Runs each analysis on the volume. Analyses failing because the data is not spatially calibrated
    /// are skipped, i.e. their result only contains an info entry explaining why. Other errors are propagated.
    [[nodiscard]] auto run_analyses(
        const std::vector<std::unique_ptr<Analysis>>& analyses,
        const ImageVolume& input
    ) -> std::vector<ResultSet>;

    /// Sets up the logger from the options, creates the analyses, runs them and reports their results.
    [[nodiscard]] auto run_analyses(
        std::span<const std::string> identifiers,
        const ImageVolume& input,
        const Options& options
    ) -> std::vector<ResultSet>;
}
