//
// Created by igor on 14/08/2025.
//

#pragma once

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include "input.hh"

namespace pngme {

    // Decode one chunk at the reader's position, leaving it just past the CRC
    chunk read_chunk(reader_base& in, const parse_options& options);

} // namespace pngme
