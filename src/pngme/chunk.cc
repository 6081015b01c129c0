//
// Created by igor on 14/08/2025.
//

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <ostream>
#include <sstream>
#include <iomanip>
#include <algorithm>

#include "chunk_io.hh"
#include "crc.hh"
#include "input.hh"

namespace pngme {

    static std::uint32_t compute_crc(const chunk_type& type, const std::vector<std::byte>& payload) {
        crc32_accumulator acc;
        acc.update(type.bytes().data(), 4);
        acc.update(payload.data(), payload.size());
        return acc.value();
    }

    // RFC 3629: rejects overlong forms, surrogates and code points above U+10FFFF
    static bool is_valid_utf8(const std::vector<std::byte>& data) {
        std::size_t i = 0;
        const std::size_t n = data.size();
        while (i < n) {
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
                    lo = 0xA0;
                } else if (c == 0xED) {
                    hi = 0x9F;
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                extra = 3;
                if (c == 0xF0) {
                    lo = 0x90;
                } else if (c == 0xF4) {
                    hi = 0x8F;
                }
            } else {
                return false;
            }

            if (n - i <= extra) {
                return false;
            }
            // Only the first continuation byte has a narrowed range
            auto first = static_cast<std::uint8_t>(data[i + 1]);
            if (first < lo || first > hi) {
                return false;
            }
            for (std::size_t k = 2; k <= extra; k++) {
                auto cc = static_cast<std::uint8_t>(data[i + k]);
                if (cc < 0x80 || cc > 0xBF) {
                    return false;
                }
            }
            i += extra + 1;
        }
        return true;
    }

    static void append_hex(std::ostream& os, const void* data, std::size_t size) {
        auto p = static_cast<const std::uint8_t*>(data);
        for (std::size_t i = 0; i < size; i++) {
            os << std::setw(2) << static_cast<unsigned>(p[i]);
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload)
        : m_length(static_cast<std::uint32_t>(payload.size()))
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(compute_crc(m_type, m_payload)) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> payload, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(crc) {
    }

    chunk read_chunk(reader_base& in, const parse_options& options) {
        std::uint64_t start_pos = in.tell();

        auto length = in.read_u32be();
        PNGME_THROW_PARSE_IF(length > options.max_chunk_size, error_kind::size_limit, start_pos,
                             "Chunk at offset ", start_pos, " has length ", length,
                             " bytes, which exceeds maximum allowed size of ",
                             options.max_chunk_size, " bytes");

        chunk_type type = in.read_chunk_type();
        if (!type.is_alphabetic()) {
            if (options.strict) {
                PNGME_THROW_PARSE(error_kind::invalid_format, start_pos,
                                  "Chunk at offset ", start_pos, " has type ", type,
                                  " which is not four ASCII letters");
            } else if (options.on_warning) {
                options.on_warning(start_pos, "chunk_type",
                    build_error_msg("Chunk type ", type, " is not four ASCII letters"));
            }
        }
        if (!type.is_reserved_bit_valid() && options.on_warning) {
            options.on_warning(start_pos, "reserved_bit",
                build_error_msg("Chunk type ", type, " has the reserved bit set"));
        }

        std::vector<std::byte> payload;
        std::uint32_t stored = 0;
        try {
            payload = in.read_exact(length);
            stored = in.read_u32be();
        } catch (const parse_error& e) {
            PNGME_THROW_PARSE(error_kind::truncated, start_pos,
                              "Chunk ", type, " at offset ", start_pos, " declares ", length,
                              " payload bytes but the data ends early (", e.what(), ")");
        }

        std::uint32_t computed = compute_crc(type, payload);
        if (stored != computed) {
            throw checksum_error(start_pos, stored, computed,
                build_error_msg("Invalid CRC for chunk ", type, " at offset ", start_pos,
                                ": stored ", stored, ", computed ", computed));
        }

        return chunk(length, type, std::move(payload), stored);
    }

    chunk chunk::decode(const void* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);
        return read_chunk(in, options);
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> bytes(encoded_size());
        store32be(m_length, bytes.data());
        m_type.to_bytes(bytes.data() + 4);
        std::copy(m_payload.begin(), m_payload.end(), bytes.begin() + 8);
        store32be(m_crc, bytes.data() + 8 + m_payload.size());
        return bytes;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = encode();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        PNGME_THROW_IO_UNLESS(os.good(), "Failed to write chunk ", m_type);
    }

    std::string chunk::payload_as_text() const {
        if (!is_valid_utf8(m_payload)) {
            PNGME_THROW(error_kind::not_text, "Payload of chunk ", m_type, " is not valid UTF-8 text");
        }
        return {reinterpret_cast<const char*>(m_payload.data()), m_payload.size()};
    }

    std::string chunk::to_string() const {
        std::array<std::uint8_t, 4> length_bytes;
        std::array<std::uint8_t, 4> crc_bytes;
        store32be(m_length, length_bytes.data());
        store32be(m_crc, crc_bytes.data());

        std::ostringstream oss;
        oss << std::uppercase << std::hex << std::setfill('0');
        append_hex(oss, length_bytes.data(), length_bytes.size());
        oss << m_type.to_string();
        append_hex(oss, m_payload.data(), m_payload.size());
        append_hex(oss, crc_bytes.data(), crc_bytes.size());
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_payload == o.m_payload;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.to_string();
    }

} // namespace pngme
