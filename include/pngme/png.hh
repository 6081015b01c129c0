/**
 * @file png.hh
 * @brief PNG container: signature followed by an ordered chunk sequence
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <array>
#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief In-memory PNG stream at the chunk level
     *
     * Chunk order is the on-disk order. The container does not enforce which
     * chunk types are present. Encoding always walks the current sequence,
     * so mutations show up in the next encode().
     */
    class PNGME_EXPORT png {
    public:
        /// The eight bytes every PNG stream starts with
        static constexpr std::array<std::uint8_t, 8> signature{
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG stream from memory
         * @param data Signature followed by zero or more chunks
         * @param size Number of bytes
         * @param options Decoding options
         * @throws parse_error bad_signature, or any chunk decoding failure
         */
        static png decode(const void* data, std::size_t size, const parse_options& options = {});

        static png decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Decode a complete PNG stream read from an input stream
         *
         * Reads until the stream is exhausted.
         * @throws parse_error on malformed data, io_error if the stream fails
         */
        static png read(std::istream& is, const parse_options& options = {});

        /**
         * @brief Encode signature and every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Write the encoded stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        // Append at the end of the sequence
        void append_chunk(chunk c);

        /**
         * @brief All chunks of a type, in sequence order
         * @param type Four letter chunk type
         * @return Possibly empty list of pointers into this container
         */
        [[nodiscard]] std::vector<const chunk*> chunks_by_type(std::string_view type) const;

        /**
         * @brief First chunk of a type
         * @return Pointer into this container or nullptr
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove the first chunk of a type
         * @return The removed chunk
         * @throws pngme_error (not_found) leaving the sequence unchanged
         */
        chunk remove_first_chunk(std::string_view type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /**
         * @brief One chunk rendering per line, signature omitted
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        static png read_all(reader_base& in, const parse_options& options);

        std::vector<chunk> m_chunks;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
