#include <doctest/doctest.h>
#include <pngchunk/exceptions.hh>

#include "input.hh"
#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("BYTE_IO") {
    TEST_CASE("memory_reader") {
        std::vector<std::byte> data = {
            std::byte(0x12), std::byte(0x34), std::byte(0x56), std::byte(0x78),
            std::byte('I'), std::byte('E'), std::byte('N'), std::byte('D'),
            std::byte(0xAA)
        };
        memory_reader rd(data.data(), data.size());

        SUBCASE("big-endian integers") {
            CHECK(rd.read<std::uint32_t>(byte_order::big) == 0x12345678u);
            CHECK(rd.tell() == 4);
        }

        SUBCASE("little-endian integers") {
            CHECK(rd.read<std::uint16_t>(byte_order::little) == 0x3412u);
            CHECK(rd.read<std::uint16_t>(byte_order::big) == 0x5678u);
        }

        SUBCASE("chunk type and remaining bytes") {
            rd.seek(4);
            CHECK(rd.read_chunk_type() == chunk_types::IEND);
            CHECK(rd.remaining() == 1);
            CHECK(rd.read_exact(1) == std::vector<std::byte>{std::byte(0xAA)});
            CHECK(rd.at_end());
        }

        SUBCASE("reading past the end") {
            rd.seek(8);
            try {
                (void)rd.read<std::uint32_t>(byte_order::big);
                FAIL("Should have thrown exception");
            } catch (const format_error& e) {
                CHECK(e.kind() == format_errc::too_short);
            }
            CHECK(rd.tell() == 8);
        }

        SUBCASE("seeking past the end") {
            CHECK_NOTHROW(rd.seek(data.size()));
            CHECK_THROWS_AS(rd.seek(data.size() + 1), format_error);
        }
    }

    TEST_CASE("memory_writer") {
        memory_writer wr;
        wr.write(std::uint32_t(0x0000002Au), byte_order::big);
        wr.write_chunk_type(chunk_type::from_string("RuSt"));
        wr.write(std::uint16_t(0x0102u), byte_order::little);
        CHECK(wr.size() == 10);

        auto bytes = wr.take();
        std::vector<std::byte> expected = {
            std::byte(0), std::byte(0), std::byte(0), std::byte(42),
            std::byte('R'), std::byte('u'), std::byte('S'), std::byte('t'),
            std::byte(0x02), std::byte(0x01)
        };
        CHECK(bytes == expected);
    }

    TEST_CASE("byte swapping") {
        CHECK(swap16(0x1234u) == 0x3412u);
        CHECK(swap32(0x12345678u) == 0x78563412u);
        CHECK(swap64(0x0102030405060708ULL) == 0x0807060504030201ULL);
        CHECK(swap_byte_order(std::int32_t(0x01000000)) == 1);
    }
}
