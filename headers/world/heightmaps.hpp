//
// Created by cory on 5/2/25.
//

#ifndef KELP_HEIGHTMAPS_HPP
#define KELP_HEIGHTMAPS_HPP


#include <array>
#include "chunk_constants.hpp"
#include "nbt/nbt.hpp"

/**
 * Per column heights sent with a chunk, packed at HEIGHTMAP_BITS_PER_ENTRY bits. Nothing here
 * computes them, a new Heightmaps holds the placeholder heights 4 (MOTION_BLOCKING) and
 * 5 (WORLD_SURFACE) until the caller fills in real ones.
 */
class Heightmaps
{
public:
    Heightmaps();

    [[nodiscard]] int motion_blocking(int x, int z) const;

    void set_motion_blocking(int x, int z, int height);

    [[nodiscard]] int world_surface(int x, int z) const;

    void set_world_surface(int x, int z, int height);

    /**
     * @return A compound holding the MOTION_BLOCKING and WORLD_SURFACE long arrays.
     */
    [[nodiscard]] NBTCompound to_nbt() const;

    /**
     * Heightmaps missing from the compound keep their placeholder heights.
     *
     * @throws MalformedNBTException if a heightmap isn't a long array of the right length
     */
    static Heightmaps from_nbt(const NBTCompound& nbt);
private:
    /**
     * x + z * 16
     */
    std::array<int, HEIGHTMAP_SIZE> motion;
    std::array<int, HEIGHTMAP_SIZE> surface;
};


#endif //KELP_HEIGHTMAPS_HPP
