//
// PNG chunk encoding and decoding
//

#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"
#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)) {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("Chunk data does not fit a 32-bit length field");
        }
    }

    chunk chunk::from_bytes(const std::byte* data, std::size_t size) {
        THROW_FORMAT_IF(size < metadata_bytes, too_short,
                        "At least ", metadata_bytes, " bytes are needed for a chunk, got ", size);

        memory_reader rd(data, size);
        auto length = rd.read<std::uint32_t>(byte_order::big);
        auto type = rd.read_chunk_type();

        THROW_FORMAT_IF(!type.is_valid(), invalid_chunk_type,
                        "Invalid chunk type '", type, "'");

        THROW_FORMAT_IF(length > rd.remaining() - crc_bytes, too_short,
                        "Chunk '", type, "' declares ", length, " data bytes but only ",
                        rd.remaining() - crc_bytes, " are available");

        auto payload = rd.read_exact(length);
        auto stored_crc = rd.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(payload));
        auto computed_crc = result.crc();
        if (computed_crc != stored_crc) {
            throw checksum_error(computed_crc, stored_crc,
                                 build_error_msg("Invalid CRC in chunk '", type, "': expected ",
                                                 computed_crc, " but found ", stored_crc));
        }
        return result;
    }

    std::uint32_t chunk::crc() const {
        return crc32(m_type, m_data.data(), m_data.size());
    }

    std::string chunk::data_as_string() const {
        THROW_FORMAT_IF(!is_valid_utf8(m_data.data(), m_data.size()), not_utf8,
                        "Data of chunk '", m_type, "' is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::to_bytes() const {
        memory_writer wr(encoded_size());
        wr.write(length(), byte_order::big);
        wr.write_chunk_type(m_type);
        wr.write_bytes(m_data);
        wr.write(crc(), byte_order::big);
        return wr.take();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.length() << "\n"
           << "  Type: " << c.type() << "\n"
           << "  Data: " << c.data().size() << " bytes\n"
           << "  Crc: " << c.crc() << "\n"
           << "}\n";
        return os;
    }

} // namespace pngchunk
