//
// UTF-8 validation
//

#include <cstdint>

#include "utf8.hh"

namespace pngchunk {
    namespace {
        bool is_continuation(std::uint8_t c) {
            return (c & 0xC0) == 0x80;
        }
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<std::uint8_t>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                extra = 1;
            } else if (c >= 0xE0 && c <= 0xEF) {
                extra = 2;
                if (c == 0xE0) {
                    lo = 0xA0;      // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;      // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                extra = 3;
                if (c == 0xF0) {
                    lo = 0x90;      // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;      // above U+10FFFF
                }
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }
            auto second = static_cast<std::uint8_t>(data[i + 1]);
            if (second < lo || second > hi) {
                return false;
            }
            for (std::size_t k = 2; k <= extra; k++) {
                if (!is_continuation(static_cast<std::uint8_t>(data[i + k]))) {
                    return false;
                }
            }
            i += extra + 1;
        }
        return true;
    }
}
