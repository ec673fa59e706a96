//
// Created by cory on 5/1/25.
//

#ifndef KELP_CHUNK_CONSTANTS_HPP
#define KELP_CHUNK_CONSTANTS_HPP


#include <cstddef>
#include <cstdint>

constexpr int CHUNK_SIZE_X = 16;
constexpr int CHUNK_SIZE_Z = 16;
constexpr int CHUNK_SECTION_SIZE = 16;
constexpr int CHUNK_SECTION_COUNT = 16;
constexpr int CHUNK_SIZE_Y = CHUNK_SECTION_SIZE * CHUNK_SECTION_COUNT;

constexpr int SECTION_BLOCK_COUNT = CHUNK_SECTION_SIZE * CHUNK_SECTION_SIZE * CHUNK_SECTION_SIZE;

/**
 * Widest block index a section can store, enough for every global block state id.
 */
constexpr int MAX_BITS_PER_ENTRY = 16;
/**
 * Sections up to this width map local indices through a palette, wider ones store global ids.
 */
constexpr int PALETTE_MAXIMUM_BITS = 8;
constexpr int PALETTE_MAXIMUM_SIZE = 1 << PALETTE_MAXIMUM_BITS;

constexpr int DEFAULT_BITS_PER_ENTRY = 4;
constexpr int DEFAULT_BITS_INCREMENT = 1;

constexpr int HEIGHTMAP_BITS_PER_ENTRY = 9;
constexpr int HEIGHTMAP_SIZE = CHUNK_SIZE_X * CHUNK_SIZE_Z;

// block count, bits per entry, palette length (at most a 5 byte VarInt), block data length and
// the block data of a section at the maximum width, times every section in a chunk
constexpr size_t MAX_SECTION_BUFFER_SIZE =
        (sizeof(int16_t) + sizeof(int8_t) + 5 + 5 + SECTION_BLOCK_COUNT * MAX_BITS_PER_ENTRY / 64 * sizeof(int64_t))
        * CHUNK_SECTION_COUNT;

/**
 * @return Number of 64-bit words needed to hold the given number of entries at the given width.
 */
constexpr int packed_length(int entries, int bits_per_entry)
{
    return (entries * bits_per_entry + 63) / 64;
}


#endif //KELP_CHUNK_CONSTANTS_HPP
