/**
 * @file chunk_type.hh
 * @brief Four-letter PNG chunk type code
 *
 * Bit 5 (0x20, the ASCII lower-case bit) of each byte carries a property:
 * ancillary, private, reserved and safe-to-copy, in that order.
 */
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    struct PNGCHUNK_EXPORT chunk_type {
        static constexpr std::size_t size = 4;
        static constexpr std::uint8_t property_bit = 0x20;

        std::array<char, size> b{};

        constexpr chunk_type() = default;

        // Constructor from 4 individual chars, not validated
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from raw bytes, not validated
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, size);
            return result;
        }

        /**
         * @brief Parse a chunk type from text
         * @param text Exactly four ASCII letters
         * @throws length_error if text is not 4 bytes long
         * @throws format_error (invalid_character) if any byte is not a letter
         *
         * The reserved bit is not checked here; use is_valid() for that.
         */
        static chunk_type from_string(std::string_view text);

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {b.data(), size};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), size};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), size);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }

        // Property bits
        [[nodiscard]] constexpr bool is_critical() const { return !has_property_bit(0); }
        [[nodiscard]] constexpr bool is_public() const { return !has_property_bit(1); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return !has_property_bit(2); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return has_property_bit(3); }

        /**
         * @brief True if all bytes are ASCII letters and the reserved bit is clear
         *
         * This is the check applied to every chunk type read from a file.
         */
        [[nodiscard]] bool is_valid() const {
            return is_reserved_bit_valid() &&
                   std::all_of(b.begin(), b.end(), [](char c) { return is_valid_byte(c); });
        }

        // A-Z or a-z
        static constexpr bool is_valid_byte(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Check if contains only printable ASCII
        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        // Stream output: text for printable codes, escaped bytes otherwise
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            for (char c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            return os;
        }

    private:
        [[nodiscard]] constexpr bool has_property_bit(std::size_t i) const {
            return (static_cast<std::uint8_t>(b[i]) & property_bit) != 0;
        }
    };

    // User-defined literal for compile-time chunk type creation
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }

    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }
}
