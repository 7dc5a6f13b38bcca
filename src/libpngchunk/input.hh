//
// Bounds-checked cursors over in-memory byte buffers
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    // Reads from a caller-owned buffer; every read past the end throws format_error(too_short)
    class PNGCHUNK_EXPORT memory_reader {
        public:
            memory_reader(const std::byte* data, std::size_t size);

            void read(void* dst, std::size_t size);
            void seek(std::size_t offset);
            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Pointer to the current position, valid while the buffer lives
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            std::vector<std::byte> read_exact(std::size_t size) {
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                read(buff.data(), sizeof(T));

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Append-only output buffer
    class PNGCHUNK_EXPORT memory_writer {
        public:
            memory_writer() = default;
            explicit memory_writer(std::size_t reserve) { m_buffer.reserve(reserve); }

            void write(const void* src, std::size_t size);

            void write_bytes(const std::vector<std::byte>& bytes) {
                write(bytes.data(), bytes.size());
            }

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_chunk_type(const chunk_type& type);

            [[nodiscard]] std::size_t size() const { return m_buffer.size(); }
            std::vector<std::byte> take() { return std::move(m_buffer); }

        private:
            std::vector<std::byte> m_buffer;
    };
}
