/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <sstream>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum format_errc
     * @brief Kind of malformed input reported by a format_error
     */
    enum class format_errc {
        too_short,          ///< Fewer bytes than a signature or chunk needs
        bad_signature,      ///< First 8 bytes are not the PNG signature
        invalid_chunk_type, ///< Chunk type fails the letter/reserved-bit check
        invalid_checksum,   ///< Declared CRC differs from the computed one
        wrong_length,       ///< Chunk type text is not exactly 4 bytes
        invalid_character,  ///< Chunk type text contains a non-letter
        not_utf8            ///< Chunk data requested as text is not UTF-8
    };

    /**
     * @brief Stable lower-case name of an error kind
     */
    PNGCHUNK_EXPORT std::string_view to_string(format_errc kind);

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Exception for malformed bytes or chunk type text
     *
     * The kind() tells which check failed.
     */
    class format_error : public pngchunk_error {
    public:
        format_error(format_errc kind, const std::string& msg)
            : pngchunk_error(msg), m_kind(kind) {}

        [[nodiscard]] format_errc kind() const noexcept { return m_kind; }

    private:
        format_errc m_kind;
    };

    /**
     * @class checksum_error
     * @brief CRC mismatch while decoding a chunk
     */
    class checksum_error : public format_error {
    public:
        checksum_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : format_error(format_errc::invalid_checksum, msg)
            , m_expected(expected)
            , m_actual(actual) {}

        /// CRC computed over the chunk type and data
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC stored in the chunk
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class length_error
     * @brief Chunk type text of the wrong size
     */
    class length_error : public format_error {
    public:
        length_error(std::size_t length, const std::string& msg)
            : format_error(format_errc::wrong_length, msg)
            , m_length(length) {}

        [[nodiscard]] std::size_t length() const noexcept { return m_length; }

    private:
        std::size_t m_length;
    };

    /**
     * @class lookup_error
     * @brief No chunk of the requested type exists
     */
    class lookup_error : public pngchunk_error {
    public:
        lookup_error(std::string type, const std::string& msg)
            : pngchunk_error(msg)
            , m_type(std::move(type)) {}

        [[nodiscard]] const std::string& type() const noexcept { return m_type; }

    private:
        std::string m_type;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_FORMAT
     * @brief Throw a format_error of the given kind with formatted message
     * @param kind Enumerator of ::pngchunk::format_errc
     */
    #define THROW_FORMAT(kind, ...) \
        throw ::pngchunk::format_error(::pngchunk::format_errc::kind, \
                                       ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT_IF
     * @brief Conditionally throw a format_error
     */
    #define THROW_FORMAT_IF(condition, kind, ...) \
        do { if (condition) THROW_FORMAT(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_LOOKUP
     * @brief Throw a lookup_error for a missing chunk type
     */
    #define THROW_LOOKUP(type) \
        throw ::pngchunk::lookup_error(std::string(type), \
                                       ::pngchunk::build_error_msg("Chunk not found: ", type))

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
