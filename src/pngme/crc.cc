//
// Created by igor on 14/08/2025.
//

#include "crc.hh"

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngme {

    crc32_accumulator::crc32_accumulator()
        : m_crc(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {}

    void crc32_accumulator::update(const void* data, std::size_t size) {
        auto p = static_cast<const Bytef*>(data);
        // zlib takes a uInt length, feed oversized blocks in pieces
        while (size > 0) {
            auto step = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            m_crc = static_cast<std::uint32_t>(::crc32(m_crc, p, step));
            p += step;
            size -= step;
        }
    }

    std::uint32_t crc32(const void* data, std::size_t size) {
        crc32_accumulator acc;
        acc.update(data, size);
        return acc.value();
    }

} // namespace pngme
