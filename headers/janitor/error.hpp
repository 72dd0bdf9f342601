//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_ERROR_HPP
#define JANITOR_ERROR_HPP

/**
 * @file error.hpp
 * @brief Structured error type for the analysis engine.
 *
 * Error categories follow the failure taxonomy of the engine:
 * - ParseError: the symbol provider could not parse one file
 * - DetectorError: a detector threw while analysing one file
 * - SchedulerError: the worker pool is shut down or refused a task
 * - ScopeResolutionError: incremental analysis without module structure
 * - ConfigError, IoError, NotFound, InvalidArgument, InternalError
 *
 * Only SchedulerError (pool shutdown) and ScopeResolutionError abort a whole
 * run; every other category is recorded against the smallest failing unit.
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace janitor {

    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,
        ParseError,
        IoError,
        ConfigError,
        DetectorError,
        SchedulerError,
        ScopeResolutionError,
        InternalError
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:                 return "None";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::NotFound:             return "NotFound";
            case ErrorCode::ParseError:           return "ParseError";
            case ErrorCode::IoError:              return "IoError";
            case ErrorCode::ConfigError:          return "ConfigError";
            case ErrorCode::DetectorError:        return "DetectorError";
            case ErrorCode::SchedulerError:       return "SchedulerError";
            case ErrorCode::ScopeResolutionError: return "ScopeResolutionError";
            case ErrorCode::InternalError:        return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error value: a code, a message and optional context such as
     * the file path or detector name that failed.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::string context = {}) {
            return make(ErrorCode::InvalidArgument, std::move(message), std::move(context));
        }

        static Error not_found(std::string message, std::string context = {}) {
            return make(ErrorCode::NotFound, std::move(message), std::move(context));
        }

        static Error parse_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ParseError, std::move(message), std::move(context));
        }

        static Error io_error(std::string message, std::string context = {}) {
            return make(ErrorCode::IoError, std::move(message), std::move(context));
        }

        static Error config_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ConfigError, std::move(message), std::move(context));
        }

        static Error detector_error(std::string message, std::string context = {}) {
            return make(ErrorCode::DetectorError, std::move(message), std::move(context));
        }

        static Error scheduler_error(std::string message, std::string context = {}) {
            return make(ErrorCode::SchedulerError, std::move(message), std::move(context));
        }

        static Error scope_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ScopeResolutionError, std::move(message), std::move(context));
        }

        static Error internal_error(std::string message, std::string context = {}) {
            return make(ErrorCode::InternalError, std::move(message), std::move(context));
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Returns a copy with more context appended, separated by "; ".
         */
        [[nodiscard]] Error with_context(std::string additional) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional)};
            }
            return {code_, message_, std::move(additional)};
        }

        /**
         * "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string text = "[";
            text += error_code_to_string(code_);
            text += "] ";
            text += message_;
            if (context_.has_value()) {
                text += " (context: ";
                text += *context_;
                text += ")";
            }
            return text;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ && message_ == other.message_ && context_ == other.context_;
        }

        bool operator!=(const Error& other) const { return !(*this == other); }

    private:
        static Error make(ErrorCode code, std::string message, std::string context) {
            if (context.empty()) {
                return {code, std::move(message)};
            }
            return {code, std::move(message), std::move(context)};
        }

        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace janitor

#endif //JANITOR_ERROR_HPP
