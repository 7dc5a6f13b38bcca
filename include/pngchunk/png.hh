/**
 * @file png.hh
 * @brief PNG file as a signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class png
     * @brief Ordered chunks of a PNG file
     *
     * Chunk order is the on-disk order and is preserved by every operation.
     * Chunk data is never interpreted.
     */
    class PNGCHUNK_EXPORT png {
    public:
        static constexpr std::array<std::uint8_t, 8> standard_header = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG byte stream
         * @param data Signature followed by chunks
         * @param size Number of bytes
         * @param options Strictness and warning callback
         * @throws format_error if the signature or any chunk is malformed
         *
         * Chunks are decoded until the buffer is exhausted. Nothing is
         * returned on failure.
         */
        static png from_bytes(const std::byte* data, std::size_t size, const parse_options& options);
        static png from_bytes(const std::byte* data, std::size_t size);
        static png from_bytes(const std::vector<std::byte>& bytes);

        /// Add a chunk after the last one
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @return The removed chunk
         * @throws lookup_error if no chunk has that type
         */
        chunk remove_chunk(std::string_view type);

        /// First chunk of the given type, or nullptr
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /// Signature followed by every chunk
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        std::vector<chunk>::const_iterator find(std::string_view type) const;

        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
