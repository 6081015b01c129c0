//
// Created by igor on 14/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

namespace pngme {

    // CRC-32 (ISO-HDLC, the zlib/PNG polynomial) of a single block
    std::uint32_t crc32(const void* data, std::size_t size);

    // Running CRC-32, fed block by block
    class crc32_accumulator {
    public:
        crc32_accumulator();

        void update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const { return m_crc; }

    private:
        std::uint32_t m_crc;
    };

} // namespace pngme
