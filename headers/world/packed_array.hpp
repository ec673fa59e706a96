//
// Created by cory on 5/1/25.
//

#ifndef KELP_PACKED_ARRAY_HPP
#define KELP_PACKED_ARRAY_HPP


#include <cstdint>
#include <vector>

// Entry i of a packed array occupies bits [i * bits, (i + 1) * bits) of the words, least significant
// bit first. An entry that doesn't fit in the rest of a word continues in the low bits of the next one.

uint32_t packed_get(const uint64_t* words, int index, int bits);

/**
 * Only the low bits of value are stored.
 */
void packed_set(uint64_t* words, int index, int bits, uint32_t value);

/**
 * Packs count values at the given width into as few longs as possible.
 */
std::vector<int64_t> encode_blocks(const int* values, int count, int bits);

/**
 * Inverse of encode_blocks. The longs have to hold at least count entries.
 */
void decode_blocks(const std::vector<int64_t>& longs, int* values, int count, int bits);


#endif //KELP_PACKED_ARRAY_HPP
