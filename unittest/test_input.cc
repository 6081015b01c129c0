//
// Created by igor on 12/08/2025.
//

#include <doctest/doctest.h>
#include <array>
#include <sstream>
#include <string>
#include <vector>

#include <pngme/exceptions.hh>
#include "input.hh"
#include "test_utils.hh"

using namespace pngme;

TEST_SUITE("Input readers") {
    TEST_CASE("memory_reader basics") {
        std::vector<std::byte> header;
        append_be32(header, 2);
        auto t = bytes_of("tEXt");
        header.insert(header.end(), t.begin(), t.end());

        memory_reader in(header.data(), header.size());
        CHECK(in.tell() == 0);
        CHECK_FALSE(in.at_end());
        CHECK(in.remaining() == 8);

        CHECK(in.read_u32be() == 2u);
        CHECK(in.tell() == 4);

        auto type = in.read_chunk_type();
        CHECK(type.matches("tEXt"));
        CHECK(in.at_end());
        CHECK(in.remaining() == 0);

        std::array<std::byte, 4> buf{};
        CHECK(in.read(buf.data(), buf.size()) == 0);
    }

    TEST_CASE("memory_reader partial read") {
        auto data = bytes_of("abc");
        memory_reader in(data.data(), data.size());

        std::array<std::byte, 8> buf{};
        CHECK(in.read(buf.data(), buf.size()) == 3);
        CHECK(buf[0] == std::byte{'a'});
        CHECK(buf[2] == std::byte{'c'});
        CHECK(in.at_end());
    }

    TEST_CASE("memory_reader rejects a null buffer") {
        CHECK_THROWS_AS(memory_reader(nullptr, 4), io_error);
        CHECK_NOTHROW(memory_reader(nullptr, 0));
    }

    TEST_CASE("read_exact reports the start of a short read") {
        auto data = bytes_of("0123456789");
        memory_reader in(data.data(), data.size());

        auto first = in.read_exact(4);
        CHECK(as_string(first) == "0123");

        try {
            (void)in.read_exact(10);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::truncated);
            CHECK(e.offset() == 4);
            std::string msg = e.what();
            CHECK(msg.find("requested 10") != std::string::npos);
            CHECK(msg.find("got 6") != std::string::npos);
        }
    }

    TEST_CASE("read_exact into a caller buffer") {
        auto data = bytes_of("xy");
        memory_reader in(data.data(), data.size());

        std::array<std::byte, 4> buf{};
        CHECK_THROWS_AS(in.read_exact(buf.data(), buf.size()), parse_error);
    }

    TEST_CASE("read_exact of zero bytes") {
        memory_reader in(nullptr, 0);
        CHECK(in.read_exact(0).empty());
    }

    TEST_CASE("stream_reader basics") {
        std::string text = "IEND" + std::string("tail");
        std::istringstream is(text);
        stream_reader in(is);

        CHECK_FALSE(in.at_end());
        auto type = in.read_chunk_type();
        CHECK(type.matches("IEND"));
        CHECK(in.tell() == 4);

        auto rest = in.read_exact(4);
        CHECK(as_string(rest) == "tail");
        CHECK(in.at_end());
    }

    TEST_CASE("stream_reader truncation") {
        std::istringstream is(std::string("abcde"));
        stream_reader in(is);

        (void)in.read_exact(2);
        try {
            (void)in.read_u32be();
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::truncated);
            CHECK(e.offset() == 2);
        }
    }

    TEST_CASE("stream_reader on an empty stream") {
        std::istringstream is;
        stream_reader in(is);
        CHECK(in.at_end());
        CHECK(in.tell() == 0);
    }
}
