//
// Chunk type parsing
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_type chunk_type::from_string(std::string_view text) {
        if (text.size() != size) {
            throw length_error(text.size(),
                               build_error_msg("Expected 4 bytes but received ", text.size(),
                                               " when creating chunk type"));
        }
        for (std::size_t i = 0; i < size; i++) {
            THROW_FORMAT_IF(!is_valid_byte(text[i]), invalid_character,
                            "Chunk type '", text, "' contains an invalid character at index ", i);
        }
        return {text[0], text[1], text[2], text[3]};
    }

} // namespace pngchunk
