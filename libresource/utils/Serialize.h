/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_SERIALIZE_H
#define _RESC_ARSC_SERIALIZE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/Chunk.h"
#include "utils/ResTypes.h"

namespace arsc {

// Just a random thing to make it easy to see (when dumping bytes) if we forgot
// to go back and correct a chunk size.
constexpr uint32_t FILL_IN_LATER = 0xEEEEEEEE;

void align_vec(size_t s, std::vector<char>* vec);
void push_short(uint16_t data, std::vector<char>* vec);
void push_long(uint32_t data, std::vector<char>* vec);
void push_u8_length(size_t len, std::vector<char>* vec);
// aapt2 style UTF-8 pool entry: UTF-16 length, UTF-8 length, bytes, NUL.
void encode_string8(const std::string& s, std::vector<char>* vec);
void write_short_at_pos(size_t index, uint16_t data, std::vector<char>* vec);
void write_long_at_pos(size_t index, uint32_t data, std::vector<char>* vec);

/*
 * Chunks are written front to back. start_chunk() emits a header with
 * placeholder sizes, end_header() records the header size once the fixed
 * fields are out, and end_chunk() fills in the total size.
 */
size_t start_chunk(ChunkType type, std::vector<char>* out);
void end_header(size_t chunk_start, std::vector<char>* out);
void end_chunk(size_t chunk_start, std::vector<char>* out);

// Appends the serialized form of the chunk and all of its children.
void write_chunk(const Chunk& chunk, std::vector<char>* out);
std::vector<char> write_chunk(const Chunk& chunk);

// Write the data to the file; overwrite existing data. Asserts that is was
// successful.
void write_bytes_to_file(const std::vector<char>& data,
                         const std::string& filename);

} // namespace arsc

#endif
