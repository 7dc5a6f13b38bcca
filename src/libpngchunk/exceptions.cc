//
// Error kind names
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    std::string_view to_string(format_errc kind) {
        switch (kind) {
            case format_errc::too_short:
                return "too_short";
            case format_errc::bad_signature:
                return "bad_signature";
            case format_errc::invalid_chunk_type:
                return "invalid_chunk_type";
            case format_errc::invalid_checksum:
                return "invalid_checksum";
            case format_errc::wrong_length:
                return "wrong_length";
            case format_errc::invalid_character:
                return "invalid_character";
            case format_errc::not_utf8:
                return "not_utf8";
        }
        return "unknown";
    }

} // namespace pngchunk
