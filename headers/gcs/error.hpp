//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_ERROR_HPP
#define GCS_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type carried by Result<T, Error>.
 *
 * Fatal build errors:
 * - RepositoryNotFound: bad path or start reference, reported before any walk
 * - CorruptHistory: cycle or unreadable object found while walking
 * - Cancelled: the caller's cancellation token fired
 *
 * Recoverable:
 * - DiffUnavailable: one commit's diff could not be computed; the commit is
 *   still counted, and the condition is kept as a warning on the table
 *
 * Usage:
 * @code
 *     auto table = engine.build(scope, token);
 *     if (table.is_err()) {
 *         std::cerr << table.error() << std::endl;
 *         // [CorruptHistory] Commit graph contains a cycle (context: 3f2a...)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace gcs {

    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,            ///< Reference or object id unknown to the accessor
        RepositoryNotFound,  ///< Path is not a repository, or start ref missing
        CorruptHistory,      ///< Cycle, or object that cannot be decoded
        DiffUnavailable,     ///< A single commit's diff failed
        Cancelled,
        ParseError,
        IoError,
        ConfigError,
        GitError,            ///< The git executable failed in an unexpected way
        InternalError
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:               return "None";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::NotFound:           return "NotFound";
            case ErrorCode::RepositoryNotFound: return "RepositoryNotFound";
            case ErrorCode::CorruptHistory:     return "CorruptHistory";
            case ErrorCode::DiffUnavailable:    return "DiffUnavailable";
            case ErrorCode::Cancelled:          return "Cancelled";
            case ErrorCode::ParseError:         return "ParseError";
            case ErrorCode::IoError:            return "IoError";
            case ErrorCode::ConfigError:        return "ConfigError";
            case ErrorCode::GitError:           return "GitError";
            case ErrorCode::InternalError:      return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Error with a code, a message and optional context (commit id, path, ...).
     * Immutable after construction.
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

        static Error invalid_argument(std::string message, std::string context = {}) {
            return make(ErrorCode::InvalidArgument, std::move(message), std::move(context));
        }

        static Error not_found(std::string message, std::string context = {}) {
            return make(ErrorCode::NotFound, std::move(message), std::move(context));
        }

        static Error repository_not_found(std::string message, std::string context = {}) {
            return make(ErrorCode::RepositoryNotFound, std::move(message), std::move(context));
        }

        static Error corrupt_history(std::string message, std::string context = {}) {
            return make(ErrorCode::CorruptHistory, std::move(message), std::move(context));
        }

        static Error diff_unavailable(std::string message, std::string context = {}) {
            return make(ErrorCode::DiffUnavailable, std::move(message), std::move(context));
        }

        static Error cancelled(std::string message = "Build cancelled") {
            return {ErrorCode::Cancelled, std::move(message)};
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

        static Error git_error(std::string message, std::string context = {}) {
            return make(ErrorCode::GitError, std::move(message), std::move(context));
        }

        static Error internal_error(std::string message, std::string context = {}) {
            return make(ErrorCode::InternalError, std::move(message), std::move(context));
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
         * Returns a copy with the same message and context but a different code.
         */
        [[nodiscard]] Error with_code(const ErrorCode code) const {
            Error copy = *this;
            copy.code_ = code;
            return copy;
        }

        /**
         * Format: "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

    private:
        static Error make(const ErrorCode code, std::string message, std::string context) {
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

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace gcs

#endif //GCS_ERROR_HPP
