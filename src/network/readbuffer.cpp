//
// Created by cory on 4/11/25.
//

#include <bit>
#include <cstring>
#include "network/readbuffer.hpp"

#define SEGMENT_BITS (0b01111111)
#define CONTINUE_BIT (0b10000000)

BufferOverflowException::BufferOverflowException(size_t wanted, size_t remaining) :
        MalformedStreamException("Tried to read " + std::to_string(wanted) + " bytes with only "
                                 + std::to_string(remaining) + " remaining")
{}

ReadBuffer::ReadBuffer() : start(nullptr), cursor(nullptr), end(nullptr)
{}

ReadBuffer::ReadBuffer(const char* buffer, size_t size) : start(buffer), cursor(buffer), end(buffer + size)
{}

void ReadBuffer::feed(const char* buffer, size_t size)
{
    start = buffer;
    cursor = buffer;
    end = buffer + size;
}

void ReadBuffer::ensure_remaining(size_t bytes) const
{
    if (remaining() < bytes)
    {
        throw BufferOverflowException(bytes, remaining());
    }
}

int8_t ReadBuffer::read_byte()
{
    ensure_remaining(sizeof(int8_t));
    return static_cast<int8_t>(*cursor++);
}

uint8_t ReadBuffer::read_ubyte()
{
    return static_cast<uint8_t>(read_byte());
}

int32_t ReadBuffer::read_varint()
{
    uint32_t value = 0;
    int position = 0;
    uint8_t c;

    while (true)
    {
        c = read_ubyte();
        // pos = 0     pos = 7     pos = 14    pos = 21    pos = 28   pos = 35 (ERR)
        // 0b10000001, 0b10000001, 0b10000001, 0b10000001, 0b00000001
        // for the last byte, the most significant half byte has to be 0000.
        value |= static_cast<uint32_t>(c & SEGMENT_BITS) << position;

        if (!(c & CONTINUE_BIT))
        {
            break;
        }

        position += 7;

        if (position > 21)
        {
            // we're reading the very last char, so we need to check for malformed data
            c = read_ubyte();
            if ((c & 0xf0))
            {
                /* The varint is trying to compile more than 5 bytes or data
                   in the last byte which is too large to fit into an int */
                throw MalformedVarintException();
            }

            value |= static_cast<uint32_t>(c & SEGMENT_BITS) << position;
            break;
        }
    }

    return std::bit_cast<int32_t>(value);
}

uint64_t ReadBuffer::read_ulong()
{
    ensure_remaining(sizeof(uint64_t));

    uint64_t rax;
    std::memcpy(&rax, cursor, sizeof(uint64_t));
    cursor += sizeof(uint64_t);
    return __builtin_bswap64(rax);
}

int64_t ReadBuffer::read_long()
{
    return std::bit_cast<int64_t>(read_ulong());
}

int32_t ReadBuffer::read_int()
{
    ensure_remaining(sizeof(uint32_t));

    uint32_t rax;
    std::memcpy(&rax, cursor, sizeof(uint32_t));
    cursor += sizeof(uint32_t);
    return std::bit_cast<int32_t>(__builtin_bswap32(rax));
}

uint16_t ReadBuffer::read_ushort()
{
    ensure_remaining(sizeof(uint16_t));

    uint16_t rax;
    std::memcpy(&rax, cursor, sizeof(uint16_t));
    cursor += sizeof(uint16_t);
    return __builtin_bswap16(rax);
}

int16_t ReadBuffer::read_short()
{
    return std::bit_cast<int16_t>(read_ushort());
}

float ReadBuffer::read_float()
{
    return std::bit_cast<float>(read_int());
}

double ReadBuffer::read_double()
{
    return std::bit_cast<double>(read_ulong());
}

void ReadBuffer::read_bytes(char* out, size_t size)
{
    ensure_remaining(size);
    std::memcpy(out, cursor, size);
    cursor += size;
}

std::string ReadBuffer::read_string()
{
    int32_t size = read_varint();

    if (size < 0)
    {
        throw MalformedStreamException("Negative string length " + std::to_string(size));
    }

    ensure_remaining(size);

    std::string rax = std::string(cursor, size);
    cursor += size;
    return rax;
}

UUID ReadBuffer::read_uuid()
{
    uint64_t most = read_ulong();
    uint64_t least = read_ulong();
    return {most, least};
}

NBTCompound ReadBuffer::read_nbt(std::string* name)
{
    return nbt_read_root(*this, name);
}
