//
// Created by cory on 4/11/25.
//

#include <openssl/rand.h>
#include <openssl/err.h>
#include <cstdio>
#include <stdexcept>
#include "math/uuid.hpp"

UUID::UUID(uint64_t most, uint64_t least) : most(most), least(least)
{}

UUID UUID::random()
{
    unsigned char bytes[16];

    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("UUID::random(): RAND_bytes(): ") + reason);
    }

    uint64_t most = 0;
    uint64_t least = 0;

    for (int i = 0; i < 8; ++i)
    {
        most = (most << 8) | bytes[i];
        least = (least << 8) | bytes[i + 8];
    }

    // version 4
    most = (most & ~0xf000ULL) | 0x4000ULL;
    // IETF variant
    least = (least & ~(0xc0ULL << 56)) | (0x80ULL << 56);

    return {most, least};
}

std::string UUID::str() const
{
    char out[37];
    snprintf(out, sizeof(out), "%08x-%04x-%04x-%04x-%012llx",
             static_cast<unsigned int>(most >> 32),
             static_cast<unsigned int>((most >> 16) & 0xffff),
             static_cast<unsigned int>(most & 0xffff),
             static_cast<unsigned int>(least >> 48),
             static_cast<unsigned long long>(least & 0xffffffffffffULL));
    return out;
}

std::ostream& operator<<(std::ostream &os, const UUID &uuid)
{
    return os << uuid.str();
}
