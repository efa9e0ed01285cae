#include "simqc/Exception.hpp"

namespace {
    using namespace ::sqc;

    void collect_nested_(std::vector<std::string>& messages, const std::exception& exception) {
        messages.emplace_back(exception.what());
        try {
            std::rethrow_if_nested(exception);
        } catch (const std::exception& nested) {
            collect_nested_(messages, nested);
        }
    }
}

namespace sqc {
    auto operator<<(std::ostream& os, Error error) -> std::ostream& {
        switch (error) {
            case Error::INVALID_INPUT:
                return os << "InvalidInput";
            case Error::DIMENSION_MISMATCH:
                return os << "DimensionMismatch";
            case Error::UNCALIBRATED_DATA:
                return os << "UncalibratedData";
            case Error::WORKER_FAILURE:
                return os << "WorkerFailure";
            case Error::INVALID_CONFIG:
                return os << "InvalidConfig";
        }
        return os;
    }

    auto Exception::format_(
        Error code,
        const std::source_location& location,
        const std::string& message
    ) -> std::string {
        // Keep the path relative to the source tree, if possible.
        const std::string file = location.file_name();
        const size_t idx = file.rfind(std::string("simqc") + fs::path::preferred_separator);
        return fmt::format("ERROR:{}:{}:{}: {}: {}",
                           idx == std::string::npos ? fs::path(file).filename().string() : file.substr(idx),
                           location.function_name(), location.line(), code, message);
    }

    auto Exception::backtrace() -> std::vector<std::string> {
        std::vector<std::string> messages;
        const std::exception_ptr current = std::current_exception();
        if (not current)
            return messages;
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& exception) {
            collect_nested_(messages, exception);
        }
        return messages;
    }
}
