//
// Created by cory on 1/15/25.
//

#include <bit>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include "world/section.hpp"
#include "world/packed_array.hpp"

#define EMPTY_SLOT (-1)

PaletteOverflowException::PaletteOverflowException(int bits_per_entry) :
        message("Section width of " + std::to_string(bits_per_entry) + " bits exceeds the maximum of "
                + std::to_string(MAX_BITS_PER_ENTRY))
{}

static inline int slot_of(uint16_t block_id)
{
    // fibonacci hashing, the table has 2 * PALETTE_MAXIMUM_SIZE = 2^9 slots
    return static_cast<int>((block_id * 40503u) & 0xffff) >> 7;
}

Section::Section(int bits_per_entry, int bits_increment) : bits(bits_per_entry),
                                                           increment(bits_increment),
                                                           palette_len(0),
                                                           palette_block(),
                                                           block_palette()
{
    if (bits_per_entry < 1 || bits_per_entry > MAX_BITS_PER_ENTRY)
    {
        throw std::invalid_argument("Section width must be within [1, " + std::to_string(MAX_BITS_PER_ENTRY)
                                    + "], got " + std::to_string(bits_per_entry));
    }

    if (bits_increment < 1)
    {
        throw std::invalid_argument("Section width increment must be positive, got " + std::to_string(bits_increment));
    }

    reset(bits_per_entry);
}

void Section::clear_palette()
{
    palette_len = 0;
    block_palette.fill(EMPTY_SLOT);
}

int Section::palette_index(uint16_t block_id) const
{
    for (int slot = slot_of(block_id);; slot = (slot + 1) % static_cast<int>(block_palette.size()))
    {
        int32_t entry = block_palette[slot];

        if (entry == EMPTY_SLOT)
        {
            return -1;
        }

        if ((entry >> 8) == block_id)
        {
            return entry & 0xff;
        }
    }
}

int Section::insert_palette(uint16_t block_id)
{
    int local = palette_len++;
    palette_block[local] = block_id;

    int slot = slot_of(block_id);

    while (block_palette[slot] != EMPTY_SLOT)
    {
        slot = (slot + 1) % static_cast<int>(block_palette.size());
    }

    block_palette[slot] = (static_cast<int32_t>(block_id) << 8) | local;
    return local;
}

uint16_t Section::palette_value(int local_index) const
{
    if (local_index < 0 || local_index >= palette_len)
    {
        throw std::out_of_range("Palette index " + std::to_string(local_index) + " out of "
                                + std::to_string(palette_len));
    }

    return palette_block[local_index];
}

static void check_index(int index)
{
    if (index < 0 || index >= SECTION_BLOCK_COUNT)
    {
        throw std::out_of_range("Block index " + std::to_string(index) + " is outside of the section");
    }
}

static int checked_index(int x, int y, int z)
{
    if (x < 0 || x >= CHUNK_SECTION_SIZE || y < 0 || y >= CHUNK_SECTION_SIZE || z < 0 || z >= CHUNK_SECTION_SIZE)
    {
        throw std::out_of_range("Block (" + std::to_string(x) + ", " + std::to_string(y) + ", "
                                + std::to_string(z) + ") is outside of the section");
    }

    return Section::section_block_index(x, y, z);
}

uint16_t Section::get(int x, int y, int z) const
{
    return get(checked_index(x, y, z));
}

void Section::set(int x, int y, int z, uint16_t block_id)
{
    set(checked_index(x, y, z), block_id);
}

uint16_t Section::get(int index) const
{
    check_index(index);

    uint32_t value = packed_get(data.data(), index, bits);

    if (is_direct())
    {
        return static_cast<uint16_t>(value);
    }

    // an index nobody put in the palette reads as air
    return value < static_cast<uint32_t>(palette_len) ? palette_block[value] : 0;
}

void Section::set(int index, uint16_t block_id)
{
    check_index(index);

    if (!is_direct())
    {
        int local = palette_index(block_id);

        if (local == -1)
        {
            if (palette_len + 1 > (1 << bits))
            {
                grow();
            }

            if (!is_direct())
            {
                local = insert_palette(block_id);
            }
        }

        if (!is_direct())
        {
            packed_set(data.data(), index, bits, local);
            return;
        }
    }

    int needed = std::bit_width(block_id);

    if (needed > bits)
    {
        resize(needed);
    }

    packed_set(data.data(), index, bits, block_id);
}

void Section::grow()
{
    int grown = bits + increment;
    resize(grown > MAX_BITS_PER_ENTRY ? MAX_BITS_PER_ENTRY : grown);
}

void Section::resize(int new_bits_per_entry)
{
    if (new_bits_per_entry < bits)
    {
        throw std::invalid_argument("Cannot shrink a section from " + std::to_string(bits) + " to "
                                    + std::to_string(new_bits_per_entry) + " bits");
    }

    if (new_bits_per_entry > MAX_BITS_PER_ENTRY)
    {
        throw PaletteOverflowException(new_bits_per_entry);
    }

    if (new_bits_per_entry == bits)
    {
        return;
    }

    const bool to_direct = !is_direct() && new_bits_per_entry > PALETTE_MAXIMUM_BITS;

    if (to_direct)
    {
        // every id in the palette has to survive the switch
        for (int i = 0; i < palette_len; ++i)
        {
            int needed = std::bit_width(palette_block[i]);

            if (needed > new_bits_per_entry)
            {
                new_bits_per_entry = needed;
            }
        }
    }

    std::vector<uint64_t> resized(packed_length(SECTION_BLOCK_COUNT, new_bits_per_entry));

    for (int i = 0; i < SECTION_BLOCK_COUNT; ++i)
    {
        uint32_t value = packed_get(data.data(), i, bits);

        if (to_direct)
        {
            value = value < static_cast<uint32_t>(palette_len) ? palette_block[value] : 0;
        }

        packed_set(resized.data(), i, new_bits_per_entry, value);
    }

    data = std::move(resized);
    bits = new_bits_per_entry;

    if (to_direct)
    {
        clear_palette();
    }
}

void Section::reset(int bits_per_entry)
{
    if (bits_per_entry < 1 || bits_per_entry > MAX_BITS_PER_ENTRY)
    {
        throw PaletteOverflowException(bits_per_entry);
    }

    bits = bits_per_entry;
    data.assign(packed_length(SECTION_BLOCK_COUNT, bits), 0);
    clear_palette();

    if (!is_direct())
    {
        // every position starts out as local index 0
        insert_palette(0);
    }
}

void Section::load_palette(const std::vector<uint16_t>& values)
{
    if (is_direct())
    {
        throw std::logic_error("A section with " + std::to_string(bits) + " bits per entry has no palette");
    }

    if (values.size() > static_cast<size_t>(1 << bits))
    {
        throw std::length_error(std::to_string(values.size()) + " palette entries don't fit in "
                                + std::to_string(bits) + " bits");
    }

    clear_palette();

    for (uint16_t value : values)
    {
        if (palette_index(value) == -1)
        {
            insert_palette(value);
        } else
        {
            // a duplicate still takes up its local index, the first one wins lookups
            palette_block[palette_len++] = value;
        }
    }
}

void Section::load_blocks(const std::vector<uint64_t>& words)
{
    if (words.size() > data.size())
    {
        throw std::length_error(std::to_string(words.size()) + " words don't fit in a section of "
                                + std::to_string(data.size()));
    }

    std::copy(words.begin(), words.end(), data.begin());
    std::fill(data.begin() + static_cast<ptrdiff_t>(words.size()), data.end(), 0);
}
