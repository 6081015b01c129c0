//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Reads up to size bytes, returns how many were read
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual std::uint64_t tell() const = 0;

            // True when no further byte can be read
            virtual bool at_end() = 0;

            // Convenience methods, throw parse_error (truncated) on short reads.
            // The buffer grows as bytes arrive so a bogus length cannot force
            // a large allocation.
            std::vector<std::byte> read_exact(std::size_t size);

            void read_exact(void* dst, std::size_t size);

            std::uint32_t read_u32be() {
                std::array<std::byte, 4> buff;
                read_exact(buff.data(), buff.size());
                return load32be(buff.data());
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller owned memory block
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);
            ~memory_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }
            bool at_end() override { return m_position >= m_size; }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a stream until it is exhausted
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);
            ~stream_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }
            bool at_end() override;

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
