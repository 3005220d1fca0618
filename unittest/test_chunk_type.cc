#include <doctest/doctest.h>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <unordered_set>

using namespace pngme;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            std::array<std::uint8_t, 4> expected{82, 117, 83, 116};
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from string") {
            auto expected = chunk_type::from_bytes({82, 117, 83, 116});
            auto actual = chunk_type::from_string("RuSt");
            CHECK(actual == expected);
            CHECK(actual.to_string() == "RuSt");
        }

        SUBCASE("from raw stream bytes") {
            const std::byte raw[] = {std::byte('I'), std::byte('D'), std::byte('A'), std::byte('T')};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t.to_string() == "IDAT");
        }

        SUBCASE("digit is rejected") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru5T"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_chunk_type);
        }

        SUBCASE("non letter bytes are rejected") {
            CHECK_THROWS_AS(chunk_type::from_bytes({82, 117, 83, 0}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_bytes({'@', 'A', 'A', 'A'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_bytes({'[', 'A', 'A', 'A'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_bytes({'`', 'a', 'a', 'a'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_bytes({'{', 'a', 'a', 'a'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_bytes({'A', 'A', 'A', 0xC1}), invalid_chunk_type);
        }

        SUBCASE("wrong length is rejected") {
            CHECK_THROWS_AS(chunk_type::from_string(""), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("Rus"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("RuStt"), invalid_chunk_type);
        }

        SUBCASE("error reports the offending byte index") {
            try {
                (void) chunk_type::from_bytes({'A', 'B', '3', 'D'});
                FAIL("Should have thrown");
            } catch (const invalid_chunk_type& e) {
                CHECK(e.offset() == 2);
                CHECK(e.kind() == error_kind::invalid_chunk_type);
            }
        }

        SUBCASE("raw bytes report the absolute offset") {
            const std::byte raw[] = {std::byte('I'), std::byte('D'), std::byte(' '), std::byte('T')};
            try {
                (void) chunk_type::from_bytes(raw, 100);
                FAIL("Should have thrown");
            } catch (const invalid_chunk_type& e) {
                CHECK(e.offset() == 102);
            }
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("RuST") {
            auto t = chunk_type::from_string("RuST");
            CHECK(t.is_critical());
            CHECK(t.is_public() == false);
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy() == false);
        }

        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("validity follows the reserved bit only") {
            CHECK(chunk_type::from_string("RuSt").is_valid());
            auto t = chunk_type::from_string("Rust");
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("standard chunks") {
            auto ihdr = chunk_type::from_string("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK(ihdr.is_valid());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::from_string("tEXt");
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type comparison") {
        SUBCASE("case sensitive equality") {
            CHECK(chunk_type::from_string("RuST") != chunk_type::from_string("rust"));
            CHECK(chunk_type::from_string("RuST") != chunk_type::from_string("RUST"));
            CHECK(chunk_type::from_string("RuST") == chunk_type::from_string("RuST"));
        }

        SUBCASE("ordering is bytewise") {
            CHECK(chunk_type::from_string("IDAT") < chunk_type::from_string("IEND"));
            CHECK(chunk_type::from_string("ZZZZ") < chunk_type::from_string("aaaa"));
        }

        SUBCASE("usable as hash key") {
            std::unordered_set<chunk_type> seen;
            seen.insert(chunk_type::from_string("IHDR"));
            seen.insert(chunk_type::from_string("IEND"));
            seen.insert(chunk_type::from_string("IHDR"));
            CHECK(seen.size() == 2);
            CHECK(seen.count(chunk_type::from_string("IEND")) == 1);
            CHECK(seen.count(chunk_type::from_string("iend")) == 0);
        }
    }

    TEST_CASE("chunk_type output") {
        std::ostringstream os;
        os << chunk_type::from_string("RuSt");
        CHECK(os.str() == "RuSt");

        std::array<std::uint8_t, 4> out{};
        chunk_type::from_string("teSt").to_bytes(out.data());
        CHECK(out == std::array<std::uint8_t, 4>{'t', 'e', 'S', 't'});
    }
}
