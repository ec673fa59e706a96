//
// Created by cory on 4/15/25.
//

#ifndef KELP_WRITEBUFFER_HPP
#define KELP_WRITEBUFFER_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "math/uuid.hpp"
#include "nbt/nbt.hpp"

/**
 * Growable byte buffer that protocol primitives are written into, big-endian unless noted.
 */
class WriteBuffer
{
public:
    explicit WriteBuffer(size_t size);

    ~WriteBuffer();

    WriteBuffer(const WriteBuffer&) = delete;

    WriteBuffer& operator=(const WriteBuffer&) = delete;

    void write_byte(int8_t x);

    void write_ubyte(uint8_t x);

    void write_bool(bool x);

    /**
     * Writes a signed 16-bit big-endian integer (defined for little-endian systems.)
     */
    void write_short(int16_t x);

    void write_ushort(uint16_t x);

    /**
     * Writes a signed 32-bit big-endian integer (defined for little-endian systems.)
     */
    void write_int(int32_t x);

    void write_long(int64_t x);

    void write_ulong(uint64_t x);

    void write_float(float x);

    void write_double(double x);

    /**
     * Negative values are written as their two's complement, which always takes 5 bytes.
     */
    void write_varint(int32_t x);

    void write_uuid(const UUID& uuid);

    void write_bytes(const char* bytes, size_t size);

    /**
     * Writes a VarInt prefixed string.
     */
    void write_string(const std::string& str);

    /**
     * Writes the compound as a named root tag.
     */
    void write_nbt(const std::string& name, const NBTCompound& compound);

    [[nodiscard]] inline const char* data() const noexcept { return buf; }

    /**
     * @return Measurement of how many bytes are written to.
     */
    [[nodiscard]] inline size_t size() const noexcept { return cursor - buf; }

    /**
     * @return Measurement of how many bytes are allocated in the byte buf.
     */
    [[nodiscard]] inline size_t capacity() const noexcept { return end - buf; }

    /**
     * @return A copy of the written bytes.
     */
    [[nodiscard]] std::vector<char> bytes() const;

    /**
     * Resets the cursor to the beginning of the buf so the write buf can be reused.
     *
     * @note This does not free the memory allocated for the buf.
     */
    void reset();
private:
    /**
     * @return Measurement of how many bytes the write cursor has until it runs out of space,
     *         computed as the distance between the cursor and the end of the buf.
     */
    [[nodiscard]] inline size_t remaining() const { return end - cursor; }

    void ensure_capacity(size_t bytes);

    void buffer_resize(size_t size);

    /**
     * Pointer to the beginning of the allocated buf owned by this write
     * buf. This should only change if the buf is resized.
     */
    char* buf;
    /**
     * Points to one past the last byte in the internal buf (buf + size).
     * Used to ensure that writes do not overflow the allocated memory region.
     */
    char* end;
    /**
     * Pointer to the current write position within the internal buf.
     */
    char* cursor;
};


#endif //KELP_WRITEBUFFER_HPP
