//
// Created by cory on 5/1/25.
//

#include <stdexcept>
#include <string>
#include "world/palette_storage.hpp"

static void check_section_index(int index)
{
    if (index < 0 || index >= CHUNK_SECTION_COUNT)
    {
        throw std::out_of_range("Section index " + std::to_string(index) + " is outside of [0, "
                                + std::to_string(CHUNK_SECTION_COUNT) + ")");
    }
}

static void check_position(int x, int y, int z)
{
    if (x < 0 || x >= CHUNK_SIZE_X || y < 0 || y >= CHUNK_SIZE_Y || z < 0 || z >= CHUNK_SIZE_Z)
    {
        throw std::out_of_range("Block (" + std::to_string(x) + ", " + std::to_string(y) + ", "
                                + std::to_string(z) + ") is outside of the chunk");
    }
}

PaletteStorage::PaletteStorage(int bits_per_entry, int bits_increment) : bits(bits_per_entry),
                                                                         increment(bits_increment),
                                                                         sections()
{
    if (bits_per_entry < 1 || bits_per_entry > MAX_BITS_PER_ENTRY || bits_increment < 1)
    {
        throw std::invalid_argument("Invalid section width " + std::to_string(bits_per_entry) + " (+"
                                    + std::to_string(bits_increment) + ")");
    }
}

Section& PaletteStorage::section(int index)
{
    check_section_index(index);

    std::optional<Section>& slot = sections[index];

    if (!slot)
    {
        slot.emplace(bits, increment);
    }

    return *slot;
}

const Section* PaletteStorage::find(int index) const
{
    if (index < 0 || index >= CHUNK_SECTION_COUNT || !sections[index])
    {
        return nullptr;
    }

    return &*sections[index];
}

bool PaletteStorage::has_section(int index) const
{
    return find(index) != nullptr;
}

std::vector<int> PaletteStorage::populated() const
{
    std::vector<int> rax;

    for (int i = 0; i < CHUNK_SECTION_COUNT; ++i)
    {
        if (sections[i])
        {
            rax.push_back(i);
        }
    }

    return rax;
}

int PaletteStorage::section_count() const
{
    int count = 0;

    for (const auto& slot : sections)
    {
        count += slot.has_value();
    }

    return count;
}

void PaletteStorage::set_block(int x, int y, int z, uint16_t block_id)
{
    check_position(x, y, z);
    section(y / CHUNK_SECTION_SIZE).set(x, y % CHUNK_SECTION_SIZE, z, block_id);
}

uint16_t PaletteStorage::get_block(int x, int y, int z) const
{
    check_position(x, y, z);

    const Section* section = find(y / CHUNK_SECTION_SIZE);
    return section ? section->get(x, y % CHUNK_SECTION_SIZE, z) : 0;
}

void PaletteStorage::remove(int index)
{
    check_section_index(index);
    sections[index].reset();
}

void PaletteStorage::clear()
{
    for (auto& slot : sections)
    {
        slot.reset();
    }
}
