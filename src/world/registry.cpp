//
// Created by cory on 5/2/25.
//

#include <stdexcept>
#include "world/registry.hpp"

UnknownBiomeIdException::UnknownBiomeIdException(int32_t id) : biome_id(id),
                                                               message("Unknown biome id " + std::to_string(id))
{}

UnknownBlockIdentifierException::UnknownBlockIdentifierException(const std::string& identifier) :
        message("Unknown block identifier \"" + identifier + "\"")
{}

std::string namespaced(const std::string& identifier)
{
    if (identifier.find(':') == std::string::npos)
    {
        return "minecraft:" + identifier;
    }

    return identifier;
}

void MapRegistry::register_entry(int32_t id, const std::string& identifier)
{
    std::string name = namespaced(identifier);

    if (identifiers.contains(id))
    {
        throw std::invalid_argument("Id " + std::to_string(id) + " is already registered to " + identifiers[id]);
    }

    if (ids.contains(name))
    {
        throw std::invalid_argument(name + " is already registered to " + std::to_string(ids[name]));
    }

    identifiers.emplace(id, name);
    ids.emplace(name, id);
}

std::optional<int32_t> MapRegistry::id_for(const std::string& identifier) const
{
    auto itr = ids.find(namespaced(identifier));

    if (itr == ids.end())
    {
        return std::nullopt;
    }

    return itr->second;
}

std::optional<std::string> MapRegistry::identifier_for(int32_t id) const
{
    auto itr = identifiers.find(id);

    if (itr == identifiers.end())
    {
        return std::nullopt;
    }

    return itr->second;
}
