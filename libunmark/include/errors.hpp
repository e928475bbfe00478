//
// Created on 19/10/26.
//

/**
 * @file errors.hpp
 * @brief Exception taxonomy raised by sanitizers, capabilities and the path resolver.
 *
 * Everything derives from SanitizeError (itself a std::runtime_error), so the
 * dispatch boundary can turn any of them into a per-item error result with
 * what() as the user-visible message.
 */

#ifndef UNMARK_ERRORS_HPP
#define UNMARK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace unmark {

    /// @brief Root of every error raised while sanitizing a single item.
    class SanitizeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief No category matched the item.
    class UnsupportedTypeError : public SanitizeError {
    public:
        UnsupportedTypeError() : SanitizeError("unsupported file type") {}
        using SanitizeError::SanitizeError;
    };

    /// @brief A pre-XML binary office document was detected.
    class UnsupportedLegacyFormatError : public SanitizeError {
    public:
        using SanitizeError::SanitizeError;
    };

    /// @brief An archive, document or image failed to parse.
    class DecodeError : public SanitizeError {
    public:
        using SanitizeError::SanitizeError;
    };

    /// @brief The batch options are incomplete (e.g. no output directory).
    class ConfigError : public SanitizeError {
    public:
        using SanitizeError::SanitizeError;
    };

    /// @brief An external codec or remuxer reported a failure; what() is its message verbatim.
    class ToolError : public SanitizeError {
    public:
        using SanitizeError::SanitizeError;
    };

    /// @brief Read, write, copy or rename failure.
    class IoError : public SanitizeError {
    public:
        using SanitizeError::SanitizeError;
    };

} // namespace unmark

#endif // UNMARK_ERRORS_HPP
