#include <algorithm>

#include "simqc/Exception.hpp"
#include "simqc/Logger.hpp"
#include "simqc/ResultSet.hpp"

namespace {
    using namespace ::sqc;

    template<typename T, typename Key>
    auto find_(const std::vector<T>& entries, std::string_view key, Key T::* member) -> const T* {
        const auto iter = std::ranges::find_if(entries, [&](const T& entry) { return entry.*member == key; });
        return iter == entries.end() ? nullptr : &*iter;
    }

    template<typename T, typename Key>
    void check_unique_(const std::vector<T>& entries, std::string_view key, Key T::* member, std::string_view category) {
        check(find_(entries, key, member) == nullptr, Error::INVALID_INPUT,
              "The {} \"{}\" already exists", category, key);
    }
}

namespace sqc {
    auto operator<<(std::ostream& os, StatStatus status) -> std::ostream& {
        switch (status) {
            case StatStatus::PASS:
                return os << "Yes";
            case StatStatus::FAIL:
                return os << "No";
            case StatStatus::UNSURE:
                return os << "?";
            case StatStatus::NONE:
                return os << "N/A";
        }
        return os;
    }

    void ResultSet::add_image(
        std::string title, std::string description, ImageVolume image,
        std::optional<ResolutionRingSet> rings
    ) {
        check_unique_(m_images, title, &ResultImage::title, "image");
        m_images.push_back({
            .title = std::move(title),
            .description = std::move(description),
            .image = std::move(image),
            .rings = std::move(rings),
        });
    }

    void ResultSet::add_profile(std::string title, RadialProfile profile) {
        check_unique_(m_profiles, title, &ResultProfile::title, "profile");
        m_profiles.push_back({.title = std::move(title), .profile = std::move(profile)});
    }

    void ResultSet::add_stat(std::string name, f64 value, StatStatus status) {
        check_unique_(m_stats, name, &ResultStat::name, "statistic");
        m_stats.push_back({.name = std::move(name), .value = value, .status = status});
    }

    void ResultSet::add_info(std::string title, std::string text) {
        check_unique_(m_infos, title, &ResultInfo::title, "info");
        m_infos.push_back({.title = std::move(title), .text = std::move(text)});
    }

    auto ResultSet::image(std::string_view title) const -> const ResultImage& {
        const auto* entry = find_(m_images, title, &ResultImage::title);
        check(entry != nullptr, Error::INVALID_INPUT, "{}: no image titled \"{}\"", m_name, title);
        return *entry;
    }

    auto ResultSet::profile(std::string_view title) const -> const RadialProfile& {
        const auto* entry = find_(m_profiles, title, &ResultProfile::title);
        check(entry != nullptr, Error::INVALID_INPUT, "{}: no profile titled \"{}\"", m_name, title);
        return entry->profile;
    }

    auto ResultSet::stat(std::string_view name) const -> const ResultStat& {
        const auto* entry = find_(m_stats, name, &ResultStat::name);
        check(entry != nullptr, Error::INVALID_INPUT, "{}: no statistic named \"{}\"", m_name, name);
        return *entry;
    }

    auto ResultSet::info(std::string_view title) const -> const std::string& {
        const auto* entry = find_(m_infos, title, &ResultInfo::title);
        check(entry != nullptr, Error::INVALID_INPUT, "{}: no info titled \"{}\"", m_name, title);
        return entry->text;
    }

    auto ResultSet::has_image(std::string_view title) const -> bool {
        return find_(m_images, title, &ResultImage::title) != nullptr;
    }

    auto ResultSet::has_info(std::string_view title) const -> bool {
        return find_(m_infos, title, &ResultInfo::title) != nullptr;
    }

    auto ResultSet::summary() const -> std::string {
        const std::string separator(36, '-');
        std::string output = fmt::format("{}\n{}\n{}\n", separator, m_name, separator);

        for (const auto& [title, description, image, rings]: m_images) {
            output += fmt::format("{} ({}x{}, {} planes", title, image.width(), image.height(), image.stack_size());
            if (rings.has_value() and not rings->empty())
                output += fmt::format(", {} resolution rings", rings->size());
            output += fmt::format("):\n  {}\n", description);
        }
        for (const auto& [title, profile]: m_profiles)
            output += fmt::format("{} ({} bins, {})\n", title, profile.n_bins, profile.unit);

        // Checked statistics first.
        for (const auto& [name, value, status]: m_stats)
            if (status != StatStatus::NONE)
                output += fmt::format("{} = {:.3} ({})\n", name, value, status);
        output += "--\n";
        for (const auto& [name, value, status]: m_stats)
            if (status == StatStatus::NONE)
                output += fmt::format("{} = {:.3}\n", name, value);

        for (const auto& [title, text]: m_infos)
            output += fmt::format("{}: {}\n", title, text);
        return output;
    }

    void ResultSet::report() const {
        Logger::info("{}", summary());
    }
}
