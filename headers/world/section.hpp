//
// Created by cory on 1/15/25.
//

#ifndef KELP_SECTION_HPP
#define KELP_SECTION_HPP


#include <array>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include "chunk_constants.hpp"

/**
 * Thrown when a section would need entries wider than MAX_BITS_PER_ENTRY.
 */
class PaletteOverflowException : public std::exception
{
public:
    explicit PaletteOverflowException(int bits_per_entry);

    [[nodiscard]] const char* what() const noexcept override { return message.c_str(); }
private:
    std::string message;
};

/**
 * A 16x16x16 cube of global block state ids, stored as indices packed into 64-bit words.
 *
 * While the width is at most PALETTE_MAXIMUM_BITS the indices are local: a palette maps them to
 * global ids in the order the ids were first set, with air (0) always at local index 0 of a new
 * section. Once the width grows past that the section stores global ids directly and never goes
 * back. The width only ever grows.
 */
class Section
{
public:
    /**
     * @throws std::invalid_argument if bits_per_entry is not in [1, MAX_BITS_PER_ENTRY] or bits_increment < 1
     */
    explicit Section(int bits_per_entry = DEFAULT_BITS_PER_ENTRY, int bits_increment = DEFAULT_BITS_INCREMENT);

    /**
     * @param index (y << 8) | (z << 4) | x
     * @return The global id at the index, air if nothing was set there.
     * @throws std::out_of_range if the index isn't within [0, SECTION_BLOCK_COUNT)
     */
    [[nodiscard]] uint16_t get(int index) const;

    /**
     * @throws std::out_of_range if a coordinate isn't within [0, CHUNK_SECTION_SIZE)
     */
    [[nodiscard]] uint16_t get(int x, int y, int z) const;

    /**
     * Stores a global id, growing the section first if its palette is full or the id is too
     * wide to be stored directly.
     *
     * @throws std::out_of_range if the index isn't within [0, SECTION_BLOCK_COUNT)
     */
    void set(int index, uint16_t block_id);

    void set(int x, int y, int z, uint16_t block_id);

    /**
     * Re-packs every entry at the new width. Growing past PALETTE_MAXIMUM_BITS converts local
     * indices to global ids and drops the palette, widening further if the palette holds an id
     * that doesn't fit in new_bits_per_entry.
     *
     * @throws std::invalid_argument if new_bits_per_entry is narrower than the current width
     * @throws PaletteOverflowException if new_bits_per_entry is wider than MAX_BITS_PER_ENTRY
     */
    void resize(int new_bits_per_entry);

    /**
     * Drops every entry and palette value and sets the width, leaving an all-air section.
     */
    void reset(int bits_per_entry);

    [[nodiscard]] inline int bits_per_entry() const { return bits; }

    [[nodiscard]] inline int bits_increment() const { return increment; }

    [[nodiscard]] inline bool is_direct() const { return bits > PALETTE_MAXIMUM_BITS; }

    /**
     * @return Number of palette entries, 0 for a direct section.
     */
    [[nodiscard]] inline int palette_size() const { return palette_len; }

    [[nodiscard]] uint16_t palette_value(int local_index) const;

    /**
     * @return The palette's local index for a global id, -1 if it isn't in the palette.
     */
    [[nodiscard]] int palette_index(uint16_t block_id) const;

    [[nodiscard]] inline const std::vector<uint64_t>& blocks() const { return data; }

    [[nodiscard]] inline int word_count() const { return static_cast<int>(data.size()); }

    /**
     * Replaces the palette with the given values, in local index order.
     *
     * @throws std::logic_error if the section is direct
     * @throws std::length_error if the values don't fit at the current width
     */
    void load_palette(const std::vector<uint16_t>& values);

    /**
     * Replaces the packed words. Words beyond the given ones are zeroed.
     *
     * @throws std::length_error if there are more words than the section holds
     */
    void load_blocks(const std::vector<uint64_t>& words);

    static constexpr int section_block_index(int x, int y, int z) { return (y << 8) | (z << 4) | x; }
private:
    /**
     * Grows by the increment, for when the palette is full.
     */
    void grow();

    void clear_palette();

    int insert_palette(uint16_t block_id);

    int bits;
    int increment;
    std::vector<uint64_t> data;

    int palette_len;
    /**
     * local index -> global id
     */
    std::array<uint16_t, PALETTE_MAXIMUM_SIZE> palette_block;
    /**
     * Open-addressed global id -> local index table, each slot is (global << 8) | local or -1 when empty.
     * Twice the palette capacity so probes stay short.
     */
    std::array<int32_t, 2 * PALETTE_MAXIMUM_SIZE> block_palette;
};


#endif //KELP_SECTION_HPP
