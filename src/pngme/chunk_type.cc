//
// Created by igor on 14/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <ostream>
#include <iomanip>

namespace pngme {

    static bool is_ascii_letter(std::uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    chunk_type chunk_type::from_text(std::string_view text) {
        PNGME_THROW_PARSE_IF(text.size() != 4, error_kind::invalid_format, text.size(),
                             "Chunk type must be exactly 4 bytes, got ", text.size(),
                             " in \"", text, "\"");

        std::array<std::uint8_t, 4> bytes;
        for (std::size_t i = 0; i < 4; i++) {
            auto c = static_cast<std::uint8_t>(text[i]);
            PNGME_THROW_PARSE_IF(!is_ascii_letter(c), error_kind::invalid_format, i,
                                 "Invalid byte ", static_cast<unsigned>(c), " at position ", i,
                                 " in chunk type \"", text, "\"");
            bytes[i] = c;
        }
        return chunk_type(bytes);
    }

    bool chunk_type::is_alphabetic() const {
        return std::all_of(b.begin(), b.end(), is_ascii_letter);
    }

    std::string chunk_type::to_string() const {
        for (std::size_t i = 0; i < 4; i++) {
            PNGME_THROW_PARSE_IF(!is_ascii_letter(b[i]), error_kind::invalid_format, i,
                                 "Chunk type ", *this, " is not text: byte ",
                                 static_cast<unsigned>(b[i]), " at position ", i);
        }
        return {reinterpret_cast<const char*>(b.data()), 4};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        // Save and restore format flags
        auto flags = os.flags();
        auto fill = os.fill();
        os << '\'';
        for (std::uint8_t c : t.bytes()) {
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c) << std::dec;
            }
        }
        os << '\'';
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
