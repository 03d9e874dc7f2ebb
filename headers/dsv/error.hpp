//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_ERROR_HPP
#define DEPSIEVE_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error categories and the structured Error value.
 *
 * Every fallible operation in depsieve returns Result<T, Error>. An Error
 * carries a category, a human readable message and an optional context
 * (usually the path or package name the failure is about).
 *
 * Error categories:
 * - InvalidArgument: bad option or argument
 * - NotFound: manifest, file or package missing
 * - ParseError: malformed JSON/TOML or unparseable source text
 * - IoError: file system operation failed
 * - ConfigError: invalid .depsieve.toml
 * - AnalysisError: a dependency could not be analyzed
 * - InternalError: unexpected condition
 *
 * @code
 *     auto manifest = manifest::load_manifest(dir / "package.json");
 *     if (manifest.is_err()) {
 *         std::cerr << manifest.error() << "\n";
 *         // [NotFound] Manifest not found (context: /repo/package.json)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace dsv {

    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or option
        NotFound,         ///< Resource not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration error
        AnalysisError,    ///< Dependency analysis failed
        InternalError     ///< Internal/unexpected error
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error value with code, message and optional context.
     */
    class Error {
    public:
        Error(const ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(const ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message) {
            return {ErrorCode::AnalysisError, std::move(message)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Returns a copy with @p additional_context appended to the context.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string out = "[";
            out += error_code_to_string(code_);
            out += "] ";
            out += message_;
            if (context_.has_value()) {
                out += " (context: ";
                out += *context_;
                out += ")";
            }
            return out;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace dsv

#endif //DEPSIEVE_ERROR_HPP
