//
// Created by igor on 13/08/2025.
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <istream>
#include <ostream>
#include <sstream>

#include "chunk_io.hh"
#include "input.hh"

namespace pngme {

    static void check_structure(const std::vector<chunk>& chunks,
                                const std::vector<std::uint64_t>& offsets,
                                std::uint64_t end_offset,
                                const parse_options& options) {
        if (!options.on_warning) {
            return;
        }

        if (chunks.empty()) {
            options.on_warning(png::signature.size(), "structure", "Stream contains no chunks");
            return;
        }

        if (chunks.front().type() != chunk_types::IHDR) {
            options.on_warning(offsets.front(), "structure",
                build_error_msg("First chunk is ", chunks.front().type(), ", expected 'IHDR'"));
        }

        auto iend = std::find_if(chunks.begin(), chunks.end(),
            [](const chunk& c) { return c.type() == chunk_types::IEND; });
        if (iend == chunks.end()) {
            options.on_warning(end_offset, "structure", "Stream has no 'IEND' chunk");
        } else if (iend + 1 != chunks.end()) {
            auto index = static_cast<std::size_t>(iend - chunks.begin()) + 1;
            options.on_warning(offsets[index], "structure",
                build_error_msg(chunks.size() - index, " chunk(s) follow 'IEND'"));
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::read_all(reader_base& in, const parse_options& options) {
        std::array<std::uint8_t, 8> header{};
        std::size_t actual = in.read(header.data(), header.size());
        PNGME_THROW_PARSE_IF(actual != header.size() || header != signature,
                             error_kind::bad_signature, 0,
                             "Data does not start with the PNG signature");

        std::vector<chunk> chunks;
        std::vector<std::uint64_t> offsets;
        while (!in.at_end()) {
            offsets.push_back(in.tell());
            chunks.push_back(read_chunk(in, options));
        }

        check_structure(chunks, offsets, in.tell(), options);
        return png(std::move(chunks));
    }

    png png::decode(const void* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);
        return read_all(in, options);
    }

    png png::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    png png::read(std::istream& is, const parse_options& options) {
        stream_reader in(is);
        return read_all(in, options);
    }

    std::vector<std::byte> png::encode() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> bytes;
        bytes.reserve(total);
        for (auto b : signature) {
            bytes.push_back(static_cast<std::byte>(b));
        }
        for (const auto& c : m_chunks) {
            auto encoded = c.encode();
            bytes.insert(bytes.end(), encoded.begin(), encoded.end());
        }
        return bytes;
    }

    void png::write(std::ostream& os) const {
        os.write(reinterpret_cast<const char*>(signature.data()), static_cast<std::streamsize>(signature.size()));
        PNGME_THROW_IO_UNLESS(os.good(), "Failed to write PNG signature");
        for (const auto& c : m_chunks) {
            c.write(os);
        }
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    std::vector<const chunk*> png::chunks_by_type(std::string_view type) const {
        std::vector<const chunk*> result;
        for (const auto& c : m_chunks) {
            if (c.type().matches(type)) {
                result.push_back(&c);
            }
        }
        return result;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
            [type](const chunk& c) { return c.type().matches(type); });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_first_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
            [type](const chunk& c) { return c.type().matches(type); });
        if (it == m_chunks.end()) {
            PNGME_THROW(error_kind::not_found, "No chunk of type '", type, "' found");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::string png::to_string() const {
        std::ostringstream oss;
        for (const auto& c : m_chunks) {
            oss << c.to_string() << '\n';
        }
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        return os << p.to_string();
    }

} // namespace pngme
