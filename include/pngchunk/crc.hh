/**
 * @file crc.hh
 * @brief CRC-32 as used by PNG chunks
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief CRC-32 (ISO-HDLC) over a chunk type followed by its data
     * @param type Chunk type, the first 4 bytes covered
     * @param data Chunk data, may be null when size is 0
     * @param size Number of data bytes
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @brief Continue a CRC-32 over more bytes
     * @param crc Running value, 0 to start
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const std::byte* data, std::size_t size);

} // namespace pngchunk
