//
// Created by cory on 5/2/25.
//

#ifndef KELP_BIOME_HPP
#define KELP_BIOME_HPP


#include <cstdint>
#include <string>

struct Biome
{
    int32_t id;
    std::string identifier;

    bool operator==(const Biome& other) const = default;
};


#endif //KELP_BIOME_HPP
