#include <doctest/doctest.h>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <unordered_set>
#include <set>

using namespace pngme;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            std::array<std::uint8_t, 4> expected{82, 117, 83, 116};
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from text matches from bytes") {
            auto expected = chunk_type::from_bytes(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            auto actual = chunk_type::from_text("RuSt");
            CHECK(expected == actual);
        }

        SUBCASE("from raw pointer") {
            unsigned char raw[4] = {'I', 'D', 'A', 'T'};
            auto t = chunk_type::from_bytes(static_cast<const void*>(raw));
            CHECK(t.to_string() == "IDAT");
        }

        SUBCASE("from bytes accepts anything") {
            auto t = chunk_type::from_bytes(std::array<std::uint8_t, 4>{0x00, 0xFF, '1', ' '});
            CHECK(t[0] == 0x00);
            CHECK(t[1] == 0xFF);
            CHECK_FALSE(t.is_alphabetic());
        }
    }

    TEST_CASE("chunk_type from_text rejects bad input") {
        SUBCASE("digit") {
            try {
                (void)chunk_type::from_text("Ru1t");
                FAIL("expected invalid_format");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_format);
                CHECK(e.offset() == 2);
                std::string msg = e.what();
                CHECK(msg.find("position 2") != std::string::npos);
                CHECK(msg.find("49") != std::string::npos);  // '1'
            }
        }

        SUBCASE("wrong length") {
            CHECK_THROWS_AS((void)chunk_type::from_text("RuS"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("RuStt"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::from_text(""), parse_error);
        }

        SUBCASE("space and punctuation") {
            CHECK_THROWS_AS((void)chunk_type::from_text("Ru t"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("Ru_t"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("@uSt"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("RuS["), parse_error);
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_text("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_text("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_text("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_text("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_text("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_text("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_text("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_text("RuST").is_safe_to_copy());
        }

        SUBCASE("validity follows the reserved bit only") {
            CHECK(chunk_type::from_text("RuSt").is_valid());
            CHECK_FALSE(chunk_type::from_text("Rust").is_valid());
            CHECK(chunk_type::from_text("rust").is_critical() == false);
            CHECK(chunk_type::from_text("ruSt").is_valid());
        }

        SUBCASE("standard chunks") {
            auto ihdr = chunk_type::from_text("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK(ihdr.is_valid());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::from_text("tEXt");
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type rendering") {
        SUBCASE("to_string") {
            CHECK(chunk_type::from_text("RuSt").to_string() == "RuSt");
            CHECK(chunk_types::IEND.to_string() == "IEND");
        }

        SUBCASE("to_string rejects non letters") {
            auto t = chunk_type::from_bytes(std::array<std::uint8_t, 4>{'R', 'u', 0x01, 't'});
            try {
                (void)t.to_string();
                FAIL("expected invalid_format");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_format);
                CHECK(e.offset() == 2);
            }
        }

        SUBCASE("stream output escapes") {
            std::ostringstream oss;
            oss << chunk_type::from_text("RuSt");
            CHECK(oss.str() == "'RuSt'");

            std::ostringstream bin;
            bin << chunk_type::from_bytes(std::array<std::uint8_t, 4>{'A', 0x00, 0xFF, 'B'});
            CHECK(bin.str() == "'A\\x00\\xffB'");
        }

        SUBCASE("stream output keeps format flags") {
            std::ostringstream oss;
            oss << chunk_type::from_bytes(std::array<std::uint8_t, 4>{0x01, 'a', 'b', 'c'}) << 10;
            CHECK(oss.str() == "'\\x01abc'10");
        }
    }

    TEST_CASE("chunk_type matching and comparison") {
        auto t = chunk_type::from_text("tEXt");
        CHECK(t.matches("tEXt"));
        CHECK_FALSE(t.matches("TEXT"));
        CHECK_FALSE(t.matches("tEX"));
        CHECK_FALSE(t.matches("tEXtt"));

        auto odd = chunk_type::from_bytes(std::array<std::uint8_t, 4>{0x00, 0x00, 0x00, 0x00});
        CHECK(odd.matches(std::string_view("\0\0\0\0", 4)));
        CHECK_FALSE(odd.matches("AAAA"));

        CHECK(chunk_type::from_text("RuSt") != chunk_type::from_text("RUSt"));
        CHECK(chunk_type::from_text("AAAA") < chunk_type::from_text("AAAB"));

        std::set<chunk_type> ordered{chunk_types::IEND, chunk_types::IHDR, chunk_types::IEND};
        CHECK(ordered.size() == 2);

        std::unordered_set<chunk_type> hashed{chunk_types::IHDR, chunk_type::from_text("IHDR")};
        CHECK(hashed.size() == 1);
    }
}
