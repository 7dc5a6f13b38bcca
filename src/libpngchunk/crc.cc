//
// CRC-32 through zlib
//

#include <algorithm>
#include <limits>
#include <zlib.h>

#include <pngchunk/crc.hh>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const std::byte* data, std::size_t size) {
        uLong value = crc;
        auto p = reinterpret_cast<const Bytef*>(data);
        // zlib takes uInt lengths
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, p, n);
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size) {
        std::uint32_t crc = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
        crc = crc32_update(crc, reinterpret_cast<const std::byte*>(type.b.data()), type.b.size());
        return crc32_update(crc, data, size);
    }

} // namespace pngchunk
