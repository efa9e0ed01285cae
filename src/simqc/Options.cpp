#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include <fmt/ranges.h>

#include "simqc/Exception.hpp"
#include "simqc/Options.hpp"
#include "simqc/YAML.hpp"

namespace {
    using namespace ::sqc;

    template<size_t N>
    void sanitize_node_(YAML::Node node, std::string_view prefix, const std::array<const char*, N>& expected) {
        check(node.IsMap() or node.IsNull(), Error::INVALID_CONFIG,
              "{} has an invalid type ({}). Should be a map or be left empty", prefix, node.Type());

        // First, make sure the entries are all recognized.
        std::string name;
        const auto predicate = [&name](const char* expected_name) {
            return std::string_view(expected_name) == name;
        };
        for (const auto& e: node) {
            name = e.first.as<std::string>();
            if (std::ranges::find_if(expected, predicate) == expected.end())
                panic(Error::INVALID_CONFIG, "Invalid parameter: {}{}", prefix, name);
        }

        // Then, add the missing entries.
        for (const auto& e: expected)
            if (not node[e].IsDefined())
                node[e] = YAML::Null;
    }

    template<typename T>
    auto parse_scalar_(
        std::string_view prefix,
        const YAML::Node& node,
        const std::string& parameter_name,
        T fallback
    ) -> T {
        const auto parameter_node = node[parameter_name];
        if (parameter_node.IsNull())
            return fallback;
        check(parameter_node.IsScalar(), Error::INVALID_CONFIG,
              "{}{} has an invalid type ({})", prefix, parameter_name, parameter_node.Type());
        try {
            return parameter_node.as<T>();
        } catch (const YAML::Exception&) {
            panic(Error::INVALID_CONFIG, "{}{}={} could not be converted",
                  prefix, parameter_name, parameter_node.Scalar());
        }
    }

    auto to_lower_(std::string str) -> std::string {
        for (char& c: str)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return str;
    }

    auto parse_sim_(YAML::Node sim_node) -> Options::Sim {
        constexpr std::array COMPONENTS{
            "phases",
            "angles",
            "format",
            "angle1",
            "z_window",
        };
        sanitize_node_(sim_node, "sim:", COMPONENTS);

        Options::Sim sim;
        sim.phases = parse_scalar_<i64>("sim:", sim_node, "phases", sim.phases);
        sim.angles = parse_scalar_<i64>("sim:", sim_node, "angles", sim.angles);
        sim.angle1 = parse_scalar_<f64>("sim:", sim_node, "angle1", sim.angle1);
        sim.z_window = parse_scalar_<i64>("sim:", sim_node, "z_window", sim.z_window);

        const auto format = to_lower_(parse_scalar_<std::string>("sim:", sim_node, "format", "omx"));
        if (format == "omx")
            sim.format = SimFormat::OMX;
        else if (format == "elyra")
            sim.format = SimFormat::ELYRA;
        else if (format == "nsim" or format == "n-sim")
            sim.format = SimFormat::NSIM;
        else
            panic(Error::INVALID_CONFIG, R"(sim:format should be "omx", "elyra" or "nsim", but got {})", format);

        // Sanitize.
        check(sim.phases > 0 and sim.angles > 0, Error::INVALID_CONFIG,
              "sim:phases={} and sim:angles={} should be positive", sim.phases, sim.angles);
        check(sim.z_window >= 0, Error::INVALID_CONFIG,
              "sim:z_window={} should be positive or zero", sim.z_window);
        return sim;
    }

    auto parse_fourier_(YAML::Node fourier_node) -> Options::Fourier {
        constexpr std::array COMPONENTS{
            "window_fraction",
            "pad",
            "scaling",
            "output",
            "resolutions",
            "blur_radius",
            "show_axial",
            "font_size",
        };
        sanitize_node_(fourier_node, "fourier:", COMPONENTS);

        Options::Fourier fourier;
        fourier.window_fraction = parse_scalar_<f64>("fourier:", fourier_node, "window_fraction", fourier.window_fraction);
        fourier.pad = parse_scalar_<bool>("fourier:", fourier_node, "pad", fourier.pad);
        fourier.blur_radius = parse_scalar_<f64>("fourier:", fourier_node, "blur_radius", fourier.blur_radius);
        fourier.show_axial = parse_scalar_<bool>("fourier:", fourier_node, "show_axial", fourier.show_axial);
        fourier.font_size = parse_scalar_<i64>("fourier:", fourier_node, "font_size", fourier.font_size);

        const auto scaling = to_lower_(parse_scalar_<std::string>("fourier:", fourier_node, "scaling", "log"));
        if (scaling == "log")
            fourier.scaling = SpectrumScaling::LOG;
        else if (scaling == "linear")
            fourier.scaling = SpectrumScaling::LINEAR;
        else
            panic(Error::INVALID_CONFIG, R"(fourier:scaling should be "log" or "linear", but got {})", scaling);

        const auto output = to_lower_(parse_scalar_<std::string>("fourier:", fourier_node, "output", "f32"));
        if (output == "f32")
            fourier.output = Precision::F32;
        else if (output == "u8")
            fourier.output = Precision::U8;
        else
            panic(Error::INVALID_CONFIG, R"(fourier:output should be "f32" or "u8", but got {})", output);

        // resolutions
        const YAML::Node resolutions_node = fourier_node["resolutions"];
        if (resolutions_node.IsSequence()) {
            try {
                fourier.resolutions = resolutions_node.as<std::vector<f64>>();
            } catch (const YAML::Exception&) {
                panic(Error::INVALID_CONFIG, "fourier:resolutions should be a sequence of numbers");
            }
        } else if (resolutions_node.IsScalar()) {
            fourier.resolutions = {parse_scalar_<f64>("fourier:", fourier_node, "resolutions", 0.)};
        } else if (not resolutions_node.IsNull()) {
            panic(Error::INVALID_CONFIG,
                  "fourier:resolutions has an invalid type ({}). Should be a scalar or a sequence",
                  resolutions_node.Type());
        }

        // Sanitize.
        check(fourier.window_fraction >= 0 and fourier.window_fraction < 1, Error::INVALID_CONFIG,
              "fourier:window_fraction={} should be within [0,1)", fourier.window_fraction);
        check(std::ranges::all_of(fourier.resolutions, [](f64 r) { return r > 0; }), Error::INVALID_CONFIG,
              "fourier:resolutions={} should be positive", fourier.resolutions);
        check(fourier.blur_radius >= 0, Error::INVALID_CONFIG,
              "fourier:blur_radius={} should be positive or zero", fourier.blur_radius);
        check(fourier.font_size > 0, Error::INVALID_CONFIG,
              "fourier:font_size={} should be positive", fourier.font_size);
        return fourier;
    }

    auto parse_radial_(YAML::Node radial_node) -> Options::Radial {
        constexpr std::array COMPONENTS{"corrected_binning"};
        sanitize_node_(radial_node, "radial:", COMPONENTS);

        Options::Radial radial;
        radial.corrected_binning = parse_scalar_<bool>("radial:", radial_node, "corrected_binning", false);
        return radial;
    }

    auto parse_reslice_(YAML::Node reslice_node) -> Options::Reslice {
        constexpr std::array COMPONENTS{"interpolate"};
        sanitize_node_(reslice_node, "reslice:", COMPONENTS);

        Options::Reslice reslice;
        if (not reslice_node["interpolate"].IsNull())
            reslice.interpolate = parse_scalar_<bool>("reslice:", reslice_node, "interpolate", true);
        return reslice;
    }

    auto parse_compute_(YAML::Node compute_node) -> Options::Compute {
        constexpr std::array COMPONENTS{
            "n_threads",
            "log_level",
            "log_file",
        };
        sanitize_node_(compute_node, "compute:", COMPONENTS);

        Options::Compute compute;
        compute.n_threads = parse_scalar_<i64>("compute:", compute_node, "n_threads", 0);
        compute.log_file = parse_scalar_<Path>("compute:", compute_node, "log_file", Path{});

        const auto level = to_lower_(parse_scalar_<std::string>("compute:", compute_node, "log_level", "info"));
        constexpr std::array valid_levels{"off", "error", "warn", "status", "info", "trace", "debug"};
        check(std::ranges::find(valid_levels, level) != valid_levels.end(), Error::INVALID_CONFIG,
              "compute:log_level={} is not valid. Should be {}", level, valid_levels);
        compute.log_level = level;
        return compute;
    }
}

namespace sqc {
    Options::Options(const YAML::Node& node) {
        // The node is modified (missing entries are added), so work on a copy.
        YAML::Node root = YAML::Clone(node);
        constexpr std::array COMPONENTS{
            "sim",
            "fourier",
            "radial",
            "reslice",
            "compute",
        };
        sanitize_node_(root, "", COMPONENTS);

        sim = parse_sim_(root["sim"]);
        fourier = parse_fourier_(root["fourier"]);
        radial = parse_radial_(root["radial"]);
        reslice = parse_reslice_(root["reslice"]);
        compute = parse_compute_(root["compute"]);
    }

    Options::Options(const Path& filename) {
        YAML::Node node;
        try {
            node = YAML::LoadFile(filename.string());
        } catch (const YAML::Exception&) {
            panic(Error::INVALID_CONFIG, "Failed to load the parameter file {}", filename.string());
        }
        *this = Options(node);
    }
}
