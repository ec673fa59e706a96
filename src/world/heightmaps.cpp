//
// Created by cory on 5/2/25.
//

#include <stdexcept>
#include <string>
#include "world/heightmaps.hpp"
#include "world/packed_array.hpp"
#include "network/readbuffer.hpp"

#define MOTION_BLOCKING "MOTION_BLOCKING"
#define WORLD_SURFACE "WORLD_SURFACE"

static int column(int x, int z)
{
    if (x < 0 || x >= CHUNK_SIZE_X || z < 0 || z >= CHUNK_SIZE_Z)
    {
        throw std::out_of_range("Column (" + std::to_string(x) + ", " + std::to_string(z) + ") is outside of the chunk");
    }

    return x + z * CHUNK_SIZE_X;
}

static void check_height(int height)
{
    if (height < 0 || height >= (1 << HEIGHTMAP_BITS_PER_ENTRY))
    {
        throw std::out_of_range("Height " + std::to_string(height) + " doesn't fit in "
                                + std::to_string(HEIGHTMAP_BITS_PER_ENTRY) + " bits");
    }
}

Heightmaps::Heightmaps() : motion(), surface()
{
    // TODO: replace the placeholders once chunks carry real heightmaps
    motion.fill(4);
    surface.fill(5);
}

int Heightmaps::motion_blocking(int x, int z) const
{
    return motion[column(x, z)];
}

void Heightmaps::set_motion_blocking(int x, int z, int height)
{
    check_height(height);
    motion[column(x, z)] = height;
}

int Heightmaps::world_surface(int x, int z) const
{
    return surface[column(x, z)];
}

void Heightmaps::set_world_surface(int x, int z, int height)
{
    check_height(height);
    surface[column(x, z)] = height;
}

NBTCompound Heightmaps::to_nbt() const
{
    NBTCompound nbt;
    nbt.set_long_array(MOTION_BLOCKING, encode_blocks(motion.data(), HEIGHTMAP_SIZE, HEIGHTMAP_BITS_PER_ENTRY));
    nbt.set_long_array(WORLD_SURFACE, encode_blocks(surface.data(), HEIGHTMAP_SIZE, HEIGHTMAP_BITS_PER_ENTRY));
    return nbt;
}

static void read_heightmap(const NBTCompound& nbt, const char* name, std::array<int, HEIGHTMAP_SIZE>& out)
{
    if (!nbt.contains(name))
    {
        return;
    }

    const std::vector<int64_t>& longs = nbt.get_long_array(name);
    const size_t expected = packed_length(HEIGHTMAP_SIZE, HEIGHTMAP_BITS_PER_ENTRY);

    if (longs.size() != expected)
    {
        throw MalformedNBTException(std::string(name) + " holds " + std::to_string(longs.size()) + " longs, expected "
                                    + std::to_string(expected));
    }

    decode_blocks(longs, out.data(), HEIGHTMAP_SIZE, HEIGHTMAP_BITS_PER_ENTRY);
}

Heightmaps Heightmaps::from_nbt(const NBTCompound& nbt)
{
    Heightmaps rax;
    read_heightmap(nbt, MOTION_BLOCKING, rax.motion);
    read_heightmap(nbt, WORLD_SURFACE, rax.surface);
    return rax;
}
