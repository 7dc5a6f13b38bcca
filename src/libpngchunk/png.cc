//
// PNG chunk stream encoding and decoding
//

#include <algorithm>
#include <cstring>
#include <utility>

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

namespace pngchunk {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_bytes(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_FORMAT_IF(size < standard_header.size(), too_short,
                        "At least ", standard_header.size(), " bytes are needed for the PNG signature, got ", size);
        THROW_FORMAT_IF(std::memcmp(data, standard_header.data(), standard_header.size()) != 0, bad_signature,
                        "Missing PNG signature");

        memory_reader rd(data, size);
        rd.seek(standard_header.size());

        std::vector<chunk> chunks;
        bool seen_end = false;
        while (!rd.at_end()) {
            std::size_t offset = rd.tell();

            if (seen_end) {
                if (!options.strict) {
                    warn(options, offset, "trailing_data",
                         build_error_msg("Ignoring ", rd.remaining(), " bytes after IEND"));
                    break;
                }
                warn(options, offset, "structure",
                     build_error_msg("Chunk data follows IEND at offset ", offset));
            }

            try {
                chunks.push_back(chunk::from_bytes(rd.current(), rd.remaining()));
            } catch (const checksum_error& e) {
                throw checksum_error(e.expected(), e.actual(),
                                     build_error_msg(e.what(), " (chunk at offset ", offset, ")"));
            } catch (const format_error& e) {
                throw format_error(e.kind(), build_error_msg(e.what(), " (chunk at offset ", offset, ")"));
            }

            const auto& c = chunks.back();
            if (c.length() > options.max_chunk_length) {
                warn(options, offset, "size_limit",
                     build_error_msg("Chunk '", c.type(), "' at offset ", offset, " has length ",
                                     c.length(), ", exceeds maximum of ", options.max_chunk_length));
            }
            if (chunks.size() == 1 && c.type() != chunk_types::IHDR) {
                warn(options, offset, "structure",
                     build_error_msg("First chunk is '", c.type(), "', expected IHDR"));
            }
            if (c.type() == chunk_types::IEND) {
                seen_end = true;
            }

            rd.seek(offset + c.encoded_size());
        }

        if (!seen_end) {
            warn(options, rd.tell(), "structure", "No IEND chunk found");
        }

        return png(std::move(chunks));
    }

    png png::from_bytes(const std::byte* data, std::size_t size) {
        return from_bytes(data, size, parse_options{});
    }

    png png::from_bytes(const std::vector<std::byte>& bytes) {
        return from_bytes(bytes.data(), bytes.size(), parse_options{});
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = find(type);
        if (it == m_chunks.end()) {
            THROW_LOOKUP(type);
        }
        chunk removed = *it;
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = find(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<chunk>::const_iterator png::find(std::string_view type) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
    }

    std::vector<std::byte> png::to_bytes() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        memory_writer wr(total);
        wr.write(standard_header.data(), standard_header.size());
        for (const auto& c : m_chunks) {
            wr.write_bytes(c.to_bytes());
        }
        return wr.take();
    }

} // namespace pngchunk
