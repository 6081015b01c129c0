//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngme {
    static constexpr std::size_t read_block_size = 64 * 1024;

    // reader_base implementation
    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        std::uint64_t start = tell();
        std::vector<std::byte> buffer;
        while (buffer.size() < size) {
            std::size_t step = std::min(size - buffer.size(), read_block_size);
            std::size_t old_size = buffer.size();
            buffer.resize(old_size + step);
            std::size_t actual = read(buffer.data() + old_size, step);
            PNGME_THROW_PARSE_IF(actual != step, error_kind::truncated, start,
                                 "Unexpected end of data at offset ", start, ": requested ", size,
                                 " bytes, got ", old_size + actual);
        }
        return buffer;
    }

    void reader_base::read_exact(void* dst, std::size_t size) {
        std::uint64_t start = tell();
        std::size_t actual = read(dst, size);
        PNGME_THROW_PARSE_IF(actual != size, error_kind::truncated, start,
                             "Unexpected end of data at offset ", start, ": requested ", size, " bytes, got ", actual);
    }

    chunk_type reader_base::read_chunk_type() {
        std::array<std::uint8_t, 4> data;
        read_exact(data.data(), data.size());
        return chunk_type::from_bytes(data);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        PNGME_THROW_IO_IF(!data && size > 0, "Null buffer in memory_reader");
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        PNGME_THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::copy_n(m_data + m_position, size, static_cast<std::byte*>(dst));
        m_position += size;
        return size;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is) : m_stream(is), m_position(0) {}

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        PNGME_THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        PNGME_THROW_IO_IF(m_stream.bad(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        PNGME_THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position + bytes_read);
        m_position += bytes_read;
        return bytes_read;
    }

    bool stream_reader::at_end() {
        PNGME_THROW_IO_IF(m_stream.bad(), "Stream in bad state");
        if (m_stream.eof()) {
            return true;
        }
        return m_stream.peek() == std::istream::traits_type::eof();
    }
}
