//
// Created by cory on 5/2/25.
//

#ifndef KELP_CHUNK_UTILS_HPP
#define KELP_CHUNK_UTILS_HPP


#include <cstdint>
#include "chunk_constants.hpp"

struct BlockPosition
{
    int32_t x;
    int32_t y;
    int32_t z;

    bool operator==(const BlockPosition& other) const = default;
};

/**
 * Index of a block within its chunk, (y << 8) | (z << 4) | x with chunk-local x and z. The low
 * 12 bits are the block's index within its section and the rest is the section index.
 */
constexpr int chunk_block_index(int x, int y, int z)
{
    return (y << 8) | ((z & 0xf) << 4) | (x & 0xf);
}

/**
 * @return The world position of a chunk block index in the given chunk.
 */
constexpr BlockPosition block_position(int index, int32_t chunk_x, int32_t chunk_z)
{
    return {chunk_x * CHUNK_SIZE_X + (index & 0xf), index >> 8, chunk_z * CHUNK_SIZE_Z + ((index >> 4) & 0xf)};
}

/**
 * @return The chunk block index of a world position, -1 if the position isn't in the chunk.
 */
constexpr int chunk_block_index(const BlockPosition& pos, int32_t chunk_x, int32_t chunk_z)
{
    int64_t x = static_cast<int64_t>(pos.x) - static_cast<int64_t>(chunk_x) * CHUNK_SIZE_X;
    int64_t z = static_cast<int64_t>(pos.z) - static_cast<int64_t>(chunk_z) * CHUNK_SIZE_Z;

    if (x < 0 || x >= CHUNK_SIZE_X || z < 0 || z >= CHUNK_SIZE_Z || pos.y < 0 || pos.y >= CHUNK_SIZE_Y)
    {
        return -1;
    }

    return chunk_block_index(static_cast<int>(x), pos.y, static_cast<int>(z));
}


#endif //KELP_CHUNK_UTILS_HPP
