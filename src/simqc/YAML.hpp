#pragma once

#include <filesystem>
#include <iterator>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

namespace YAML {
    // Paths are stored as plain strings.
    template<>
    struct convert<std::filesystem::path> {
        static auto encode(const std::filesystem::path& path) -> Node {
            return Node(path.string());
        }

        static auto decode(const Node& node, std::filesystem::path& path) -> bool {
            if (not node.IsScalar())
                return false;
            path = node.Scalar();
            return true;
        }
    };

    inline auto operator<<(std::ostream& os, NodeType::value type) -> std::ostream& {
        constexpr const char* NAMES[]{"undefined", "null", "scalar", "sequence", "map"};
        const auto index = static_cast<size_t>(type);
        return os << (index < std::size(NAMES) ? NAMES[index] : "unknown");
    }
}

namespace fmt {
    template<> struct formatter<YAML::NodeType::value> : ostream_formatter {};
}
