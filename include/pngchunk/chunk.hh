/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, data and CRC
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk
     * @brief PNG chunk holding a type and opaque data
     *
     * On disk a chunk is laid out as (all integers big-endian):
     *
     *     length:4 | type:4 | data:length | crc:4
     *
     * The CRC is never stored; crc() recomputes it from the type and data.
     *
     * Constructing from a type and data trusts the caller. from_bytes()
     * trusts nothing and checks the size, the type and the CRC.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_bytes = 4;
        static constexpr std::size_t type_bytes = chunk_type::size;
        static constexpr std::size_t crc_bytes = 4;

        /// Total size of the metadata surrounding the data
        static constexpr std::size_t metadata_bytes = length_bytes + type_bytes + crc_bytes;

        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Decode one chunk from the start of a buffer
         * @param data Buffer starting with the length field
         * @param size Number of bytes available; trailing bytes are ignored
         * @throws format_error (too_short) if the buffer ends inside the chunk
         * @throws format_error (invalid_chunk_type) if the type fails chunk_type::is_valid()
         * @throws checksum_error if the stored CRC does not match
         */
        static chunk from_bytes(const std::byte* data, std::size_t size);

        /// Number of data bytes
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /// CRC-32 of the type followed by the data
        [[nodiscard]] std::uint32_t crc() const;

        /// Number of bytes to_bytes() produces
        [[nodiscard]] std::size_t encoded_size() const { return metadata_bytes + m_data.size(); }

        /**
         * @brief Chunk data as text
         * @throws format_error (not_utf8) if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Serialized chunk, ready to be written after the previous one
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        // Multi-line summary of length, type, data size and CRC
        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

} // namespace pngchunk
