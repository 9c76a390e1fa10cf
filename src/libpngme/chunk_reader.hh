//
// Chunk record parsing over a byte_reader, shared by chunk::parse and
// container::parse.
//

#pragma once

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include "byte_reader.hh"

namespace pngme {

    // Parses the record at the reader's position and advances past it.
    // Warnings are reported with the record's absolute offset.
    chunk read_chunk(byte_reader& in, const parse_options& options);

}
