#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "simqc/Image.hpp"
#include "simqc/RadialProfile.hpp"
#include "simqc/ResolutionRings.hpp"
#include "simqc/Types.hpp"

namespace sqc {
    /// Interpretation of a statistic.
    enum class StatStatus {
        PASS,
        FAIL,
        UNSURE,
        NONE, // for information only
    };
    auto operator<<(std::ostream& os, StatStatus status) -> std::ostream&;

    struct ResultImage {
        std::string title;
        std::string description;
        ImageVolume image;
        std::optional<ResolutionRingSet> rings{}; // overlay
    };

    struct ResultProfile {
        std::string title;
        RadialProfile profile;
    };

    struct ResultStat {
        std::string name;
        f64 value;
        StatStatus status;
    };

    struct ResultInfo {
        std::string title;
        std::string text;
    };

    /// Results of one analysis, in insertion order. Titles and names must be unique within their category.
    class ResultSet {
    public:
        explicit ResultSet(std::string name) : m_name(std::move(name)) {}

        void add_image(
            std::string title, std::string description, ImageVolume image,
            std::optional<ResolutionRingSet> rings = std::nullopt
        );
        void add_profile(std::string title, RadialProfile profile);
        void add_stat(std::string name, f64 value, StatStatus status = StatStatus::NONE);
        void add_info(std::string title, std::string text);

        [[nodiscard]] auto name() const noexcept -> const std::string& { return m_name; }
        [[nodiscard]] auto images() const noexcept -> const std::vector<ResultImage>& { return m_images; }
        [[nodiscard]] auto profiles() const noexcept -> const std::vector<ResultProfile>& { return m_profiles; }
        [[nodiscard]] auto stats() const noexcept -> const std::vector<ResultStat>& { return m_stats; }
        [[nodiscard]] auto infos() const noexcept -> const std::vector<ResultInfo>& { return m_infos; }

        /// Lookups. Throw an INVALID_INPUT error if there is no entry with that title.
        [[nodiscard]] auto image(std::string_view title) const -> const ResultImage&;
        [[nodiscard]] auto profile(std::string_view title) const -> const RadialProfile&;
        [[nodiscard]] auto stat(std::string_view name) const -> const ResultStat&;
        [[nodiscard]] auto info(std::string_view title) const -> const std::string&;

        [[nodiscard]] auto has_image(std::string_view title) const -> bool;
        [[nodiscard]] auto has_info(std::string_view title) const -> bool;

        /// Plain text report: images, checked statistics, unchecked statistics, then infos.
        [[nodiscard]] auto summary() const -> std::string;

        /// Logs the summary.
        void report() const;

    private:
        std::string m_name;
        std::vector<ResultImage> m_images{};
        std::vector<ResultProfile> m_profiles{};
        std::vector<ResultStat> m_stats{};
        std::vector<ResultInfo> m_infos{};
    };
}

namespace fmt {
    template<> struct formatter<sqc::StatStatus> : ostream_formatter {};
}
