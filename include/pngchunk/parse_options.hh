/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding a PNG chunk stream
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, everything after IEND is decoded as chunks and bytes
         * that do not form a complete chunk are an error.
         * When false, everything after IEND is reported as a "trailing_data"
         * warning and ignored.
         */
        bool strict = true;

        /**
         * @brief Largest chunk length accepted without a warning
         *
         * PNG limits chunk lengths to 2^31-1. Longer chunks still decode
         * but raise a "size_limit" warning.
         */
        std::uint32_t max_chunk_length = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset where the warning occurred
         * @param category Warning category ("size_limit", "structure", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
