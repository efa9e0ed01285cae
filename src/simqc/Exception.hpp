#pragma once

#include <exception>
#include <ostream>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "simqc/Types.hpp"

namespace sqc {
    /// Error taxonomy of the library. Every Exception carries one of these.
    enum class Error {
        INVALID_INPUT,
        DIMENSION_MISMATCH,
        UNCALIBRATED_DATA,
        WORKER_FAILURE,
        INVALID_CONFIG,
    };

    auto operator<<(std::ostream& os, Error error) -> std::ostream&;

    // Global (within ::sqc) exception.
    class Exception : public std::exception {
    public:
        Exception(Error code, const std::source_location& location, const std::string& message)
            : m_buffer(format_(code, location, message)), m_code(code) {}

        [[nodiscard]] auto what() const noexcept -> const char* override { return m_buffer.data(); }
        [[nodiscard]] auto code() const noexcept -> Error { return m_code; }

        /// Flattens the exception currently handled, and the exceptions nested in it, into a list of messages.
        /// The outermost exception comes first.
        [[nodiscard]] static auto backtrace() -> std::vector<std::string>;

    private:
        static auto format_(Error code, const std::source_location& location, const std::string& message) -> std::string;

    private:
        std::string m_buffer{};
        Error m_code{};
    };

    /// Format string capturing the location of the call site.
    template<typename... Args>
    struct FormatWithLocation {
        fmt::format_string<Args...> fmt;
        std::source_location location;

        template<typename T>
        consteval FormatWithLocation(
            const T& format,
            const std::source_location& location_ = std::source_location::current()
        ) : fmt(format), location(location_) {}
    };

    /// Throws an Exception, nesting the exception currently handled (if any).
    template<typename... Args>
    [[noreturn]] void panic(Error code, FormatWithLocation<std::type_identity_t<Args>...> format, Args&&... args) {
        std::throw_with_nested(Exception(code, format.location, fmt::format(format.fmt, std::forward<Args>(args)...)));
    }

    template<typename... Args>
    void check(bool condition, Error code, FormatWithLocation<std::type_identity_t<Args>...> format, Args&&... args) {
        if (not condition) [[unlikely]]
            std::throw_with_nested(Exception(code, format.location, fmt::format(format.fmt, std::forward<Args>(args)...)));
    }
}

namespace fmt {
    template<> struct formatter<sqc::Error> : ostream_formatter {};
}
