/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC protected PNG chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    class reader_base;

    /**
     * @class chunk
     * @brief One PNG chunk: length, type, payload and CRC-32
     *
     * Wire form is length (u32, big-endian), the four type bytes, the
     * payload and the CRC (u32, big-endian) computed over type and payload.
     * The chunk owns its payload.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t framing_size = 12;

        /**
         * @brief Build a chunk, deriving length and CRC
         * @param type Chunk type
         * @param payload Chunk data
         */
        chunk(chunk_type type, std::vector<std::byte> payload);

        /**
         * @brief Decode the chunk at the start of a buffer
         * @param data Encoded bytes; anything after the chunk is ignored
         * @param size Number of bytes available
         * @param options Size limit, strictness and warning callback
         * @return Decoded chunk carrying the stored CRC
         * @throws parse_error truncated, size_limit or invalid_format
         * @throws checksum_error if the stored CRC does not match
         */
        static chunk decode(const void* data, std::size_t size, const parse_options& options = {});

        static chunk decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Encode to the wire form
         * @return length ++ type ++ payload ++ crc
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Write the wire form to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /**
         * @brief Payload as UTF-8 text
         * @throws pngme_error (not_text) if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string payload_as_text() const;

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& payload() const { return m_payload; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        // Number of bytes encode() produces
        [[nodiscard]] std::size_t encoded_size() const { return framing_size + m_payload.size(); }

        /**
         * @brief Diagnostic rendering
         *
         * Hex of the length bytes, the type text, hex of the payload and hex
         * of the CRC bytes, without separators.
         * @throws parse_error (invalid_format) if the type is not ASCII letters
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> payload, std::uint32_t crc);

        friend chunk read_chunk(reader_base& in, const parse_options& options);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_payload;
        std::uint32_t m_crc;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
