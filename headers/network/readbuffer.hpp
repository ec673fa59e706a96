//
// Created by cory on 4/11/25.
//

#ifndef KELP_READBUFFER_HPP
#define KELP_READBUFFER_HPP


#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include "math/uuid.hpp"
#include "nbt/nbt.hpp"

/**
 * Base of everything that can go wrong while parsing incoming bytes. Once one of these is
 * thrown the rest of the stream can no longer be trusted.
 */
class MalformedStreamException : public std::exception
{
public:
    explicit MalformedStreamException(std::string message) : message(std::move(message)) {}

    [[nodiscard]] const char* what() const noexcept override { return message.c_str(); }
private:
    std::string message;
};

class MalformedVarintException : public MalformedStreamException
{
public:
    MalformedVarintException() : MalformedStreamException("VarInt is longer than 5 bytes") {}
};

/**
 * Thrown when you try to read past the end of the bytes fed to the ReadBuffer.
 */
class BufferOverflowException : public MalformedStreamException
{
public:
    BufferOverflowException(size_t wanted, size_t remaining);
};

/**
 * Thrown for structurally invalid NBT: unknown tag types, negative lengths, nesting that is
 * too deep, or a required field that is missing or has the wrong type.
 */
class MalformedNBTException : public MalformedStreamException
{
public:
    explicit MalformedNBTException(const std::string& message) : MalformedStreamException("Malformed NBT: " + message) {}
};

/**
 * Reads big-endian protocol primitives from a contiguous range of bytes. The ReadBuffer
 * does not own the bytes, they must outlive it.
 */
class ReadBuffer
{
public:
    ReadBuffer();

    ReadBuffer(const char* buffer, size_t size);

    /**
     * Points the buffer at a new range of bytes and rewinds the cursor.
     */
    void feed(const char* buffer, size_t size);

    /**
     * @return Number of bytes that have not been read yet.
     */
    [[nodiscard]] inline size_t remaining() const { return end - cursor; }

    /**
     * @return Number of bytes read since the last feed.
     */
    [[nodiscard]] inline size_t position() const { return cursor - start; }

    int8_t read_byte();

    uint8_t read_ubyte();

    inline bool read_bool() { return read_byte(); }

    int16_t read_short();

    uint16_t read_ushort();

    int32_t read_int();

    uint64_t read_ulong();

    int64_t read_long();

    float read_float();

    double read_double();

    int32_t read_varint();

    /**
     * Reads a VarInt prefixed string.
     */
    std::string read_string();

    void read_bytes(char* out, size_t size);

    UUID read_uuid();

    /**
     * Reads a named root tag, which has to be a compound.
     *
     * @param name If not null, receives the root tag's name
     */
    NBTCompound read_nbt(std::string* name = nullptr);
private:
    /**
     * @throws BufferOverflowException if less than the given number of bytes remain
     */
    void ensure_remaining(size_t bytes) const;

    const char* start;
    const char* cursor;
    const char* end;
};


#endif //KELP_READBUFFER_HPP
