//
// Created by cory on 5/2/25.
//

#include <stdexcept>
#include <string>
#include "world/section_mask.hpp"

std::vector<uint64_t> compute_mask(const std::vector<int>& indices)
{
    std::vector<uint64_t> mask;

    for (int index : indices)
    {
        if (index < 0)
        {
            throw std::out_of_range("Negative section index " + std::to_string(index));
        }

        size_t word = index / 64;

        if (word >= mask.size())
        {
            mask.resize(word + 1, 0);
        }

        mask[word] |= 1ULL << (index % 64);
    }

    return mask;
}

bool mask_has_section(const std::vector<uint64_t>& mask, int index)
{
    if (index < 0)
    {
        return false;
    }

    size_t word = index / 64;
    return word < mask.size() && (mask[word] >> (index % 64)) & 1;
}
