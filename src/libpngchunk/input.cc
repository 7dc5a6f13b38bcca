//
// Bounds-checked cursors over in-memory byte buffers
//

#include "input.hh"

namespace pngchunk {
    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_FORMAT_IF(!data && size > 0, too_short, "Null buffer of size ", size);
    }

    void memory_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_FORMAT_IF(size > remaining(), too_short,
                        "Unexpected end of data at offset ", m_position,
                        ": requested ", size, " bytes, ", remaining(), " available");
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
    }

    void memory_reader::seek(std::size_t offset) {
        THROW_FORMAT_IF(offset > m_size, too_short,
                        "Cannot seek to offset ", offset, " - buffer size is only ", m_size, " bytes");
        m_position = offset;
    }

    chunk_type memory_reader::read_chunk_type() {
        std::array<char, chunk_type::size> data;
        read(data.data(), data.size());
        return chunk_type(data[0], data[1], data[2], data[3]);
    }

    // memory_writer implementation
    void memory_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        auto first = static_cast<const std::byte*>(src);
        m_buffer.insert(m_buffer.end(), first, first + size);
    }

    void memory_writer::write_chunk_type(const chunk_type& type) {
        write(type.b.data(), type.b.size());
    }
}
