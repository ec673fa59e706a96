//
// Created by cory on 5/2/25.
//

#ifndef KELP_CHUNK_DATA_PACKET_HPP
#define KELP_CHUNK_DATA_PACKET_HPP


#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "math/uuid.hpp"
#include "nbt/nbt.hpp"
#include "readbuffer.hpp"
#include "writebuffer.hpp"
#include "world/biome.hpp"
#include "world/heightmaps.hpp"
#include "world/palette_storage.hpp"
#include "world/registry.hpp"

enum UnknownBiomePolicy
{
    FAIL_UNKNOWN_BIOME, SUBSTITUTE_UNKNOWN_BIOME
};

struct ChunkReadConfig
{
    /**
     * Resolves biome ids. Without one every biome id is unknown.
     */
    const Registry* biome_registry = nullptr;
    /**
     * If set, the id of every block entity has to resolve in it, and block entities are put in
     * the handler and NBT maps. Otherwise they are only kept as read.
     */
    const Registry* block_handler_registry = nullptr;
    UnknownBiomePolicy unknown_biome = FAIL_UNKNOWN_BIOME;
    /**
     * Identifier given to an unknown biome under SUBSTITUTE_UNKNOWN_BIOME.
     */
    std::string fallback_biome = "minecraft:plains";
    /**
     * Width decoded sections start with before adopting the sender's width.
     */
    int bits_per_entry = DEFAULT_BITS_PER_ENTRY;
};

/**
 * A finished packet body, shared between every connection the same chunk is sent to.
 */
struct EncodedPacket
{
    UUID identifier;
    int64_t timestamp;
    std::shared_ptr<const std::vector<char>> bytes;
};

/**
 * Chunk Data (without light)
 *
 * Field Name           Field Type
 * Chunk X              Int
 * Chunk Z              Int
 * Primary Bit Mask     Prefixed Array of Long
 * Heightmaps           NBT
 * Biomes               Prefixed Array of VarInt
 * Data                 Prefixed Array of Byte      sections present in the mask, ascending
 * Block Entities       Prefixed Array of NBT       id, x, y, z and the handler's own fields
 *
 * Section              Block Count         Short
 *                      Bits Per Entry      Unsigned Byte
 *                      Palette             Prefixed Array of VarInt, only if bits per entry < 9
 *                      Data                Prefixed Array of Long
 */
class ChunkDataPacket
{
public:
    int32_t chunk_x;
    int32_t chunk_z;

    PaletteStorage storage;
    std::vector<Biome> biomes;
    Heightmaps heightmaps;

    /**
     * Block entity ids by chunk block index (see chunk_block_index)
     */
    std::map<int, std::string> handler_map;
    /**
     * Extra block entity fields by chunk block index. id, x, y and z are always overwritten when written.
     */
    std::map<int, NBTCompound> nbt_map;

    /**
     * Heightmaps as read from raw packet data. Only filled by read().
     */
    NBTCompound heightmaps_nbt;
    /**
     * Block entities as read from raw packet data. Only filled by read().
     */
    std::vector<NBTCompound> block_entities_nbt;

    ChunkDataPacket();

    ChunkDataPacket(const UUID& identifier, int64_t timestamp);

    /**
     * @return An empty packet for the chunk with a random identifier, stamped with the current time.
     */
    static ChunkDataPacket create(int32_t chunk_x, int32_t chunk_z);

    [[nodiscard]] int id() const;

    [[nodiscard]] inline const UUID& identifier() const { return uid; }

    /**
     * @return Milliseconds since the epoch when the packet was created.
     */
    [[nodiscard]] inline int64_t timestamp() const { return created; }

    /**
     * Writes the packet body, assembling the sections in a scratch buffer of the worst case size.
     */
    void write(WriteBuffer& wbuf) const;

    /**
     * Writes the packet body, assembling the sections in the given scratch buffer. The scratch
     * buffer is reset first, so one can be reused for every packet.
     */
    void write(WriteBuffer& wbuf, WriteBuffer& scratch) const;

    /**
     * Replaces this packet's chunk with the one read from the buffer. On failure the exception
     * is handed to exception_manager() and the packet is left partially read, don't use it.
     *
     * @return true if the whole packet was read
     */
    bool read(ReadBuffer& rbuf, const ChunkReadConfig& config);

    /**
     * @return The packet body in an immutable buffer, together with the identifier and timestamp
     *         to cache it under.
     */
    [[nodiscard]] EncodedPacket encode() const;
private:
    void read_packet(ReadBuffer& rbuf, const ChunkReadConfig& config);

    void read_biomes(ReadBuffer& rbuf, const ChunkReadConfig& config);

    void read_block_entities(ReadBuffer& rbuf, const ChunkReadConfig& config);

    UUID uid;
    int64_t created;
};


#endif //KELP_CHUNK_DATA_PACKET_HPP
