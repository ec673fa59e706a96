//
// Created by cory on 4/15/25.
//

#include <bit>
#include <cstring>
#include "network/writebuffer.hpp"

WriteBuffer::WriteBuffer(size_t size) : buf(new char[size]), end(buf + size), cursor(buf)
{}

WriteBuffer::~WriteBuffer()
{
    delete[] buf;
}

void WriteBuffer::buffer_resize(size_t size)
{
    char* resized = new char[size];
    size_t to_copy = this->size();

    if (size < to_copy)
    {
        // if the new size is less than the number of bytes we need to copy,
        // we're not going to copy what doesn't fit in the new buf
        to_copy = size;
    }

    std::memcpy(resized, buf, to_copy);

    end = resized + size;
    cursor = resized + to_copy;
    delete[] buf;
    buf = resized;
}

#define EXTRA_CAPACITY (32)

void WriteBuffer::ensure_capacity(size_t bytes)
{
    if (remaining() < bytes)
    {
        // grow geometrically so a stream of small writes doesn't copy the buf every time
        size_t grown = capacity() * 2;
        size_t needed = size() + bytes + EXTRA_CAPACITY;
        buffer_resize(grown > needed ? grown : needed);
    }
}

#define WRITE(type, x) ensure_capacity(sizeof(type)); std::memcpy(cursor, &x, sizeof(type)); cursor += sizeof(type);

void WriteBuffer::write_byte(int8_t x)
{
    WRITE(int8_t, x)
}

void WriteBuffer::write_ubyte(uint8_t x)
{
    WRITE(uint8_t, x)
}

void WriteBuffer::write_bool(bool x)
{
    // This is implemented this way since bool isn't guaranteed to be 1 byte in size
    write_byte(x ? 1 : 0);
}

void WriteBuffer::write_ushort(uint16_t x)
{
    uint16_t be = __builtin_bswap16(x);
    WRITE(uint16_t, be)
}

void WriteBuffer::write_short(int16_t x)
{
    write_ushort(std::bit_cast<uint16_t>(x));
}

void WriteBuffer::write_int(int32_t x)
{
    uint32_t be = __builtin_bswap32(std::bit_cast<uint32_t>(x));
    WRITE(uint32_t, be)
}

void WriteBuffer::write_ulong(uint64_t x)
{
    uint64_t be = __builtin_bswap64(x);
    WRITE(uint64_t, be)
}

void WriteBuffer::write_long(int64_t x)
{
    write_ulong(std::bit_cast<uint64_t>(x));
}

void WriteBuffer::write_float(float x)
{
    write_int(std::bit_cast<int32_t>(x));
}

void WriteBuffer::write_double(double x)
{
    write_long(std::bit_cast<int64_t>(x));
}

// x has to be unsigned so that the shift doesn't drag the sign bit along
#define WRITE_VARINT(x)                                   \
    while (true)                                          \
    {                                                     \
        if ((x & ~0x7fULL) == 0)                          \
        {                                                 \
            write_ubyte(static_cast<uint8_t>(x));         \
            return;                                       \
        }                                                 \
        write_ubyte(static_cast<uint8_t>((x & 0x7f) | 0x80)); \
        x >>= 7;                                          \
    }                                                     \

void WriteBuffer::write_varint(int32_t x)
{
    auto ux = std::bit_cast<uint32_t>(x);
    WRITE_VARINT(ux)
}

void WriteBuffer::write_uuid(const UUID& uuid)
{
    write_ulong(uuid.most);
    write_ulong(uuid.least);
}

void WriteBuffer::write_bytes(const char* bytes, size_t size)
{
    if (size)
    {
        ensure_capacity(size);
        std::memcpy(cursor, bytes, size);
        cursor += size;
    }
}

void WriteBuffer::write_string(const std::string& str)
{
    write_varint(static_cast<int32_t>(str.size()));
    write_bytes(str.data(), str.size());
}

void WriteBuffer::write_nbt(const std::string& name, const NBTCompound& compound)
{
    nbt_write_root(*this, name, compound);
}

std::vector<char> WriteBuffer::bytes() const
{
    return std::vector<char>(buf, cursor);
}

void WriteBuffer::reset()
{
    cursor = buf;
}
