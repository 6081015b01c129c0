//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <iosfwd>
#include <functional>

#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Four byte PNG chunk type with its property bits
     *
     * Bit 5 (0x20) of each byte carries a property: ancillary, private,
     * reserved and safe-to-copy. Any four bytes are accepted by from_bytes();
     * from_text() accepts ASCII letters only.
     */
    class PNGME_EXPORT chunk_type {
    public:
        static constexpr std::uint8_t property_bit = 0x20;

        // Constructor from 4 individual chars (unchecked)
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes, never fails
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            return chunk_type(bytes);
        }

        static chunk_type from_bytes(const void* data) {
            std::array<std::uint8_t, 4> bytes;
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        /**
         * @brief Parse a chunk type from its textual form
         * @param text Exactly four ASCII letters
         * @throws parse_error (invalid_format) naming the offending byte and position
         */
        static chunk_type from_text(std::string_view text);

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const { return b; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] bool is_critical() const { return (b[0] & property_bit) == 0; }
        [[nodiscard]] bool is_public() const { return (b[1] & property_bit) == 0; }
        [[nodiscard]] bool is_reserved_bit_valid() const { return (b[2] & property_bit) == 0; }
        [[nodiscard]] bool is_safe_to_copy() const { return (b[3] & property_bit) != 0; }

        // Only the reserved bit gates validity
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        // Check if contains only ASCII letters
        [[nodiscard]] bool is_alphabetic() const;

        /**
         * @brief Compare against a textual type without rendering this one
         * @return True if text is exactly these four bytes
         */
        [[nodiscard]] bool matches(std::string_view text) const {
            return text.size() == 4 && std::memcmp(text.data(), b.data(), 4) == 0;
        }

        /**
         * @brief Render as four ASCII letters
         * @throws parse_error (invalid_format) if any byte is not an ASCII letter
         */
        [[nodiscard]] std::string to_string() const;

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

    private:
        explicit chunk_type(const std::array<std::uint8_t, 4>& bytes) : b(bytes) {}

        std::array<std::uint8_t, 4> b;
    };

    // Diagnostic output: quoted, non-printable bytes escaped as \xNN
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Well known chunk types
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
