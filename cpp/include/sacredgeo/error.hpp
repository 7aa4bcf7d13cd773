#pragma once

#include <stdexcept>
#include <string>

namespace sacredgeo {

/**
 * Structured error reporting for the geometry engine.
 *
 * The common path is exception-free: every generator is total over finite
 * inputs. Exceptions are reserved for caller mistakes (bad arguments,
 * malformed Geometry records) and configuration failures.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Geometry record consistency
    INVARIANT_VIOLATION = 100,

    // Configuration errors
    CONFIG_ERROR = 300,

    INTERNAL_ERROR = 500
};

class SacredGeoException : public std::runtime_error {
public:
    explicit SacredGeoException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "SacredGeo error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public SacredGeoException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : SacredGeoException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// A Geometry record whose indices or radius break the documented invariants.
class InvariantViolationError : public SacredGeoException {
public:
    explicit InvariantViolationError(const std::string& message,
                                     const std::string& context = "",
                                     const std::string& suggestion = "")
        : SacredGeoException(ErrorCode::INVARIANT_VIOLATION, message, context, suggestion) {}
};

class ConfigError : public SacredGeoException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : SacredGeoException(ErrorCode::CONFIG_ERROR, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define SACREDGEO_CHECK_ARGUMENT(condition, message) \
    sacredgeo::ErrorHandler::check_argument(condition, message, __func__)

#define SACREDGEO_THROW(code, message) \
    throw sacredgeo::SacredGeoException(code, message, __func__)

} // namespace sacredgeo
