//
// Created by cory on 4/11/25.
//

#ifndef KELP_UUID_HPP
#define KELP_UUID_HPP


#include <cstdint>
#include <ostream>
#include <string>

class UUID
{
public:
    uint64_t most;
    uint64_t least;

    UUID(uint64_t most, uint64_t least);

    /**
     * Creates a version 4 (random) UUID from the OpenSSL CSPRNG.
     *
     * @throws std::runtime_error if OpenSSL could not produce random bytes
     */
    static UUID random();

    /**
     * @return The canonical 8-4-4-4-12 hex form.
     */
    [[nodiscard]] std::string str() const;

    bool operator==(const UUID& other) const = default;

    friend std::ostream& operator<<(std::ostream& os, const UUID& uuid);
};


#endif //KELP_UUID_HPP
