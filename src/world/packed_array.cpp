//
// Created by cory on 5/1/25.
//

#include <bit>
#include "world/packed_array.hpp"
#include "world/chunk_constants.hpp"

uint32_t packed_get(const uint64_t* words, int index, int bits)
{
    const uint64_t mask = (1ULL << bits) - 1;
    const uint64_t bit = static_cast<uint64_t>(index) * bits;
    const uint64_t word = bit / 64;
    const int offset = static_cast<int>(bit % 64);

    uint64_t value = words[word] >> offset;

    if (offset + bits > 64)
    {
        // the high bits of the entry are at the bottom of the next word
        value |= words[word + 1] << (64 - offset);
    }

    return static_cast<uint32_t>(value & mask);
}

void packed_set(uint64_t* words, int index, int bits, uint32_t value)
{
    const uint64_t mask = (1ULL << bits) - 1;
    const uint64_t bit = static_cast<uint64_t>(index) * bits;
    const uint64_t word = bit / 64;
    const int offset = static_cast<int>(bit % 64);
    const uint64_t x = value & mask;

    words[word] = (words[word] & ~(mask << offset)) | (x << offset);

    if (offset + bits > 64)
    {
        const int low_bits = 64 - offset;
        words[word + 1] = (words[word + 1] & ~(mask >> low_bits)) | (x >> low_bits);
    }
}

std::vector<int64_t> encode_blocks(const int* values, int count, int bits)
{
    std::vector<uint64_t> words(packed_length(count, bits));

    for (int i = 0; i < count; ++i)
    {
        packed_set(words.data(), i, bits, static_cast<uint32_t>(values[i]));
    }

    std::vector<int64_t> longs(words.size());

    for (size_t i = 0; i < words.size(); ++i)
    {
        longs[i] = std::bit_cast<int64_t>(words[i]);
    }

    return longs;
}

void decode_blocks(const std::vector<int64_t>& longs, int* values, int count, int bits)
{
    std::vector<uint64_t> words(longs.size());

    for (size_t i = 0; i < longs.size(); ++i)
    {
        words[i] = std::bit_cast<uint64_t>(longs[i]);
    }

    for (int i = 0; i < count; ++i)
    {
        values[i] = static_cast<int>(packed_get(words.data(), i, bits));
    }
}
