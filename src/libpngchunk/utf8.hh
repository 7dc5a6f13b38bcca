//
// UTF-8 validation
//

#pragma once

#include <cstddef>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    // Well-formed UTF-8 per RFC 3629: no overlong forms, no surrogates, nothing above U+10FFFF
    PNGCHUNK_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);
}
