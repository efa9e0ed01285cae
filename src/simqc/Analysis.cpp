#include "simqc/Analysis.hpp"
#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"

namespace sqc {
    auto canonical_raw(const ImageVolume& raw, const Options::Sim& options) -> Pair<ImageVolume, SimLayout> {
        ImageVolume canonical = convert_to_canonical(raw, options.format, options.phases, options.angles);
        const SimLayout layout = SimLayout::from_raw(canonical.dimensions(), options.phases, options.angles);
        Logger::trace("Raw data: channels={}, phases={}, z={}, angles={}, frames={}",
                      layout.channels, layout.phases, layout.slices, layout.angles, layout.frames);
        return {std::move(canonical), layout};
    }

    void initialize_logging(const Options::Compute& options) {
        Logger::initialize();
        Logger::set_level(options.log_level);
        if (not options.log_file.empty())
            Logger::add_logfile(options.log_file);
    }

    auto make_analysis(std::string_view identifier, const Options& options) -> std::unique_ptr<Analysis> {
        if (identifier == "raw_fourier")
            return std::make_unique<RawFourier>(options);
        if (identifier == "reconstructed_fourier")
            return std::make_unique<ReconstructedFourier>(options);
        if (identifier == "pattern_focus")
            return std::make_unique<PatternFocus>(options);
        if (identifier == "phase_fourier")
            return std::make_unique<PhaseFourier>(options);
        if (identifier == "modulation_contrast")
            return std::make_unique<ModContrast>(options);
        panic(Error::INVALID_CONFIG, "Unknown analysis: {}", identifier);
    }

    auto run_analyses(
        const std::vector<std::unique_ptr<Analysis>>& analyses,
        const ImageVolume& input
    ) -> std::vector<ResultSet> {
        std::vector<ResultSet> output;
        output.reserve(analyses.size());
        for (const auto& analysis: analyses) {
            auto timer = Logger::status_scope_time("{}", analysis->name());
            try {
                output.push_back(analysis->execute(input));
            } catch (const Exception& e) {
                if (e.code() != Error::UNCALIBRATED_DATA)
                    throw;
                const std::vector<std::string> messages = Exception::backtrace();
                for (size_t i = 0; i < messages.size(); ++i)
                    Logger::warn("[{}]: {}", i, messages[i]);
                ResultSet skipped(std::string(analysis->name()));
                skipped.add_info("Skipped", fmt::format("The data is not spatially calibrated: {}", e.what()));
                output.push_back(std::move(skipped));
            }
        }
        return output;
    }

    auto run_analyses(
        std::span<const std::string> identifiers,
        const ImageVolume& input,
        const Options& options
    ) -> std::vector<ResultSet> {
        initialize_logging(options.compute);

        std::vector<ResultSet> output;
        {
            auto timer = Logger::status_scope_time("Quality control");
            std::vector<std::unique_ptr<Analysis>> analyses;
            analyses.reserve(identifiers.size());
            for (const auto& identifier: identifiers)
                analyses.push_back(make_analysis(identifier, options));

            output = run_analyses(analyses, input);
            for (const auto& results: output)
                results.report();
        }
        Logger::flush();
        return output;
    }
}
