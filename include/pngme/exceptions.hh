/**
 * @file exceptions.hh
 * @brief Error kinds, exception classes and throwing macros for pngme
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the closed set of failure kinds, the exception hierarchy
 * and convenience macros for error handling throughout the library.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <iosfwd>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Every way a pngme operation can fail
     */
    enum class error_kind {
        invalid_format,    ///< Chunk type text is not four ASCII letters
        truncated,         ///< Fewer bytes available than a declared length implies
        checksum_mismatch, ///< Stored CRC differs from the computed one
        bad_signature,     ///< Stream does not start with the PNG signature
        not_found,         ///< No chunk of the requested type
        not_text,          ///< Payload is not valid UTF-8
        size_limit,        ///< Declared chunk length exceeds the configured maximum
        io                 ///< Stream or file access failed
    };

    /**
     * @brief Stable lower-case name of an error kind
     * @param kind Error kind
     * @return Name such as "checksum_mismatch"
     */
    PNGME_EXPORT const char* to_string(error_kind kind) noexcept;

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, error_kind kind);

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme failure with a single catch block and branch
     * on kind().
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when file access, reading or writing operations fail.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_kind::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for decoding errors
     *
     * Thrown when the input is malformed, truncated or corrupted. The offset
     * is the position of the failing record in the input (for chunk type
     * text, the position of the offending character).
     */
    class parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, std::uint64_t offset, const std::string& msg)
            : pngme_error(kind, msg), m_offset(offset) {}

        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        std::uint64_t m_offset;
    };

    /**
     * @class checksum_error
     * @brief A chunk whose stored CRC does not match its contents
     */
    class checksum_error : public parse_error {
    public:
        checksum_error(std::uint64_t offset, std::uint32_t stored, std::uint32_t computed,
                       const std::string& msg)
            : parse_error(error_kind::checksum_mismatch, offset, msg)
            , m_stored(stored)
            , m_computed(computed) {}

        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def PNGME_THROW
     * @brief Throw a pngme_error of the given kind with formatted message
     */
    #define PNGME_THROW(kind, ...) \
        throw ::pngme::pngme_error(kind, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGME_THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define PNGME_THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGME_THROW_PARSE
     * @brief Throw a parse_error of the given kind at the given offset
     */
    #define PNGME_THROW_PARSE(kind, offset, ...) \
        throw ::pngme::parse_error(kind, offset, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGME_THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define PNGME_THROW_IO_IF(condition, ...) \
        do { if (condition) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def PNGME_THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define PNGME_THROW_PARSE_IF(condition, kind, offset, ...) \
        do { if (condition) PNGME_THROW_PARSE(kind, offset, __VA_ARGS__); } while(0)

    /**
     * @def PNGME_THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define PNGME_THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
