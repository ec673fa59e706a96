//
// Created by cory on 5/2/25.
//

#ifndef KELP_SECTION_MASK_HPP
#define KELP_SECTION_MASK_HPP


#include <cstdint>
#include <vector>

/**
 * Sets bit (i % 64) of word (i / 64) for every section index. The mask is only as long as its
 * highest non-zero word, so no sections gives an empty mask.
 */
std::vector<uint64_t> compute_mask(const std::vector<int>& indices);

/**
 * @return true if the section's bit is set, indices past the end of the mask are absent.
 */
bool mask_has_section(const std::vector<uint64_t>& mask, int index);


#endif //KELP_SECTION_MASK_HPP
