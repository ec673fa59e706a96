//
// Created by cory on 5/2/25.
//

#ifndef KELP_REGISTRY_HPP
#define KELP_REGISTRY_HPP


#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

class UnknownBiomeIdException : public std::exception
{
public:
    explicit UnknownBiomeIdException(int32_t id);

    [[nodiscard]] const char* what() const noexcept override { return message.c_str(); }

    [[nodiscard]] inline int32_t id() const { return biome_id; }
private:
    int32_t biome_id;
    std::string message;
};

class UnknownBlockIdentifierException : public std::exception
{
public:
    explicit UnknownBlockIdentifierException(const std::string& identifier);

    [[nodiscard]] const char* what() const noexcept override { return message.c_str(); }
private:
    std::string message;
};

/**
 * @return The identifier with the default "minecraft" namespace if it doesn't name one.
 */
std::string namespaced(const std::string& identifier);

/**
 * Read-only lookup between namespaced identifiers and their numeric protocol ids.
 */
class Registry
{
public:
    virtual ~Registry() = default;

    [[nodiscard]] virtual std::optional<int32_t> id_for(const std::string& identifier) const = 0;

    [[nodiscard]] virtual std::optional<std::string> identifier_for(int32_t id) const = 0;
};

class MapRegistry : public Registry
{
public:
    /**
     * @throws std::invalid_argument if the id or the identifier is already registered
     */
    void register_entry(int32_t id, const std::string& identifier);

    [[nodiscard]] std::optional<int32_t> id_for(const std::string& identifier) const override;

    [[nodiscard]] std::optional<std::string> identifier_for(int32_t id) const override;

    [[nodiscard]] inline size_t size() const { return identifiers.size(); }
private:
    std::unordered_map<int32_t, std::string> identifiers;
    std::unordered_map<std::string, int32_t> ids;
};


#endif //KELP_REGISTRY_HPP
