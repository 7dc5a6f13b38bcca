#include <doctest/doctest.h>
#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

#include "test_utils.hh"

using namespace pngchunk;
using namespace test_utils;

namespace {
    png testing_png() {
        png image;
        image.append_chunk(make_chunk("FrSt", "I am the first chunk"));
        image.append_chunk(make_chunk("miDl", "I am another chunk"));
        image.append_chunk(make_chunk("LASt", "I am the last chunk"));
        return image;
    }

    format_errc decode_error_kind(const std::vector<std::byte>& bytes) {
        try {
            (void)png::from_bytes(bytes);
        } catch (const format_error& e) {
            return e.kind();
        }
        FAIL("Should have thrown exception");
        return format_errc::too_short;
    }
}

TEST_SUITE("PNG") {
    TEST_CASE("png construction") {
        SUBCASE("from chunk list") {
            std::vector<chunk> chunks{make_chunk("FrSt", "a"), make_chunk("LASt", "b")};
            png image(chunks);
            CHECK(image.chunks() == chunks);
        }

        SUBCASE("empty") {
            png image;
            CHECK(image.chunks().empty());
            CHECK(image.to_bytes() == signature());
        }
    }

    TEST_CASE("png decoding") {
        SUBCASE("minimal file") {
            auto image = png::from_bytes(minimal_png());
            CHECK(type_names(image) == std::vector<std::string>{"IHDR", "IEND"});
            CHECK(image.chunks()[0].length() == 13);
            CHECK(image.chunks()[1].length() == 0);
        }

        SUBCASE("signature only") {
            auto image = png::from_bytes(signature());
            CHECK(image.chunks().empty());
        }

        SUBCASE("short signature") {
            auto bytes = signature();
            bytes.resize(7);
            CHECK(decode_error_kind(bytes) == format_errc::too_short);
            CHECK(decode_error_kind({}) == format_errc::too_short);
        }

        SUBCASE("wrong signature") {
            auto bytes = minimal_png();
            bytes[1] = std::byte('p');
            CHECK(decode_error_kind(bytes) == format_errc::bad_signature);
        }

        SUBCASE("corrupted chunk fails the whole file") {
            auto bytes = minimal_png();
            bytes[8 + 8] ^= std::byte(0x01);  // first IHDR data byte
            try {
                (void)png::from_bytes(bytes);
                FAIL("Should have thrown exception");
            } catch (const checksum_error& e) {
                CHECK(e.kind() == format_errc::invalid_checksum);
                CHECK(e.expected() != e.actual());
            }
        }

        SUBCASE("invalid chunk type") {
            auto bytes = signature();
            auto bad = raw_chunk(0, "Rust", "", 0);
            bytes.insert(bytes.end(), bad.begin(), bad.end());
            CHECK(decode_error_kind(bytes) == format_errc::invalid_chunk_type);
        }

        SUBCASE("trailing bytes after the last chunk") {
            for (std::size_t extra : {1u, 4u, 11u}) {
                CAPTURE(extra);
                auto bytes = minimal_png();
                bytes.insert(bytes.end(), extra, std::byte(0));
                CHECK(decode_error_kind(bytes) == format_errc::too_short);
            }
        }

        SUBCASE("truncated last chunk") {
            auto bytes = minimal_png();
            bytes.pop_back();
            CHECK(decode_error_kind(bytes) == format_errc::too_short);
        }
    }

    TEST_CASE("png encoding") {
        SUBCASE("signature then chunks in order") {
            auto image = testing_png();
            auto expected = signature();
            for (const auto& c : image.chunks()) {
                auto b = c.to_bytes();
                expected.insert(expected.end(), b.begin(), b.end());
            }
            CHECK(image.to_bytes() == expected);
        }

        SUBCASE("round trip") {
            auto image = testing_png();
            auto decoded = png::from_bytes(image.to_bytes());
            CHECK(decoded == image);
            CHECK(type_names(decoded) == std::vector<std::string>{"FrSt", "miDl", "LASt"});
        }

        SUBCASE("decoded file encodes to the same bytes") {
            auto bytes = minimal_png();
            CHECK(png::from_bytes(bytes).to_bytes() == bytes);
        }
    }

    TEST_CASE("png chunk lookup") {
        auto image = testing_png();

        SUBCASE("found") {
            const chunk* c = image.chunk_by_type("miDl");
            REQUIRE(c != nullptr);
            CHECK(c->data_as_string() == "I am another chunk");
        }

        SUBCASE("not found") {
            CHECK(image.chunk_by_type("nONe") == nullptr);
            CHECK(image.chunk_by_type("") == nullptr);
            CHECK(image.chunks().size() == 3);
        }

        SUBCASE("first match wins") {
            image.append_chunk(make_chunk("miDl", "second"));
            CHECK(image.chunk_by_type("miDl")->data_as_string() == "I am another chunk");
        }
    }

    TEST_CASE("png chunk removal") {
        auto image = testing_png();

        SUBCASE("returns the removed chunk") {
            auto removed = image.remove_chunk("miDl");
            CHECK(removed.data_as_string() == "I am another chunk");
            CHECK(type_names(image) == std::vector<std::string>{"FrSt", "LASt"});
        }

        SUBCASE("removes only the first match") {
            image.append_chunk(make_chunk("miDl", "second"));
            auto removed = image.remove_chunk("miDl");
            CHECK(removed.data_as_string() == "I am another chunk");
            CHECK(type_names(image) == std::vector<std::string>{"FrSt", "LASt", "miDl"});
            CHECK(image.chunk_by_type("miDl")->data_as_string() == "second");
        }

        SUBCASE("missing type leaves the file unchanged") {
            auto before = image;
            try {
                (void)image.remove_chunk("nONe");
                FAIL("Should have thrown exception");
            } catch (const lookup_error& e) {
                CHECK(e.type() == "nONe");
            }
            CHECK(image == before);
        }
    }

    TEST_CASE("png append") {
        auto image = testing_png();
        image.append_chunk(make_chunk("TeSt", "Message"));
        CHECK(image.chunks().size() == 4);
        CHECK(image.chunks().back().type().to_string() == "TeSt");
        CHECK(image.chunks().back().data_as_string() == "Message");
    }

    TEST_CASE("hide a message before IEND") {
        auto image = png::from_bytes(minimal_png());

        image.remove_chunk("IHDR");
        auto end = image.remove_chunk("IEND");
        image.append_chunk(make_chunk("ruSt", "hidden"));
        image.append_chunk(end);

        auto decoded = png::from_bytes(image.to_bytes());
        CHECK(type_names(decoded) == std::vector<std::string>{"ruSt", "IEND"});
        const chunk* c = decoded.chunk_by_type("ruSt");
        REQUIRE(c != nullptr);
        CHECK(c->data_as_string() == "hidden");
    }
}
