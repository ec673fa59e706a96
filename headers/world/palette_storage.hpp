//
// Created by cory on 5/1/25.
//

#ifndef KELP_PALETTE_STORAGE_HPP
#define KELP_PALETTE_STORAGE_HPP


#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include "section.hpp"

/**
 * The block sections of one chunk. Only sections that were touched exist, a missing section
 * is all air and isn't sent.
 */
class PaletteStorage
{
public:
    /**
     * @param bits_per_entry Width every new section starts out with
     * @param bits_increment How much a section widens when its palette runs out of room
     */
    explicit PaletteStorage(int bits_per_entry = DEFAULT_BITS_PER_ENTRY, int bits_increment = DEFAULT_BITS_INCREMENT);

    /**
     * @return The section at the index, created if it doesn't exist yet.
     * @throws std::out_of_range if the index isn't within [0, CHUNK_SECTION_COUNT)
     */
    Section& section(int index);

    /**
     * @return The section at the index, nullptr if it doesn't exist.
     */
    [[nodiscard]] const Section* find(int index) const;

    [[nodiscard]] bool has_section(int index) const;

    /**
     * @return Indices of the existing sections, ascending.
     */
    [[nodiscard]] std::vector<int> populated() const;

    [[nodiscard]] int section_count() const;

    /**
     * @param x Chunk-local x within [0, 16)
     * @param y Within [0, CHUNK_SIZE_Y)
     * @param z Chunk-local z within [0, 16)
     * @throws std::out_of_range if the position isn't in the chunk
     */
    void set_block(int x, int y, int z, uint16_t block_id);

    /**
     * @return The global id at the position, air for a section that doesn't exist.
     * @throws std::out_of_range if the position isn't in the chunk
     */
    [[nodiscard]] uint16_t get_block(int x, int y, int z) const;

    void remove(int index);

    void clear();

    [[nodiscard]] inline int bits_per_entry() const { return bits; }

    [[nodiscard]] inline int bits_increment() const { return increment; }
private:
    int bits;
    int increment;
    std::array<std::optional<Section>, CHUNK_SECTION_COUNT> sections;
};


#endif //KELP_PALETTE_STORAGE_HPP
