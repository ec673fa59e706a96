//
// Created by cory on 5/2/25.
//

#include <chrono>
#include <optional>
#include <stdexcept>
#include "network/chunk_data_packet.hpp"
#include "network/clientbound_packet_ids.hpp"
#include "exceptions/exception_manager.hpp"
#include "world/chunk_utils.hpp"
#include "world/packed_array.hpp"
#include "world/section_mask.hpp"
#include "kelputil.hpp"

static int64_t current_time_millis()
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::system_clock;

    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ChunkDataPacket::ChunkDataPacket() : ChunkDataPacket(UUID(0, 0), 0)
{}

ChunkDataPacket::ChunkDataPacket(const UUID& identifier, int64_t timestamp) : chunk_x(0),
                                                                              chunk_z(0),
                                                                              uid(identifier),
                                                                              created(timestamp)
{}

ChunkDataPacket ChunkDataPacket::create(int32_t chunk_x, int32_t chunk_z)
{
    ChunkDataPacket packet(UUID::random(), current_time_millis());
    packet.chunk_x = chunk_x;
    packet.chunk_z = chunk_z;
    return packet;
}

int ChunkDataPacket::id() const
{
    return PLAY_CHUNK_DATA;
}

// Writing

static void write_section(WriteBuffer& wbuf, const Section& section)
{
    // sections are either filled in completely or not sent at all
    wbuf.write_short(SECTION_BLOCK_COUNT);
    wbuf.write_ubyte(static_cast<uint8_t>(section.bits_per_entry()));

    if (!section.is_direct())
    {
        wbuf.write_varint(section.palette_size());

        for (int i = 0; i < section.palette_size(); ++i)
        {
            wbuf.write_varint(section.palette_value(i));
        }
    }

    const std::vector<uint64_t>& blocks = section.blocks();
    wbuf.write_varint(static_cast<int32_t>(blocks.size()));

    for (uint64_t word : blocks)
    {
        wbuf.write_ulong(word);
    }
}

void ChunkDataPacket::write(WriteBuffer& wbuf) const
{
    WriteBuffer scratch(MAX_SECTION_BUFFER_SIZE);
    write(wbuf, scratch);
}

void ChunkDataPacket::write(WriteBuffer& wbuf, WriteBuffer& scratch) const
{
    wbuf.write_int(chunk_x);
    wbuf.write_int(chunk_z);

    scratch.reset();
    std::vector<int> present = storage.populated();

    for (int index : present)
    {
        write_section(scratch, *storage.find(index));
    }

    std::vector<uint64_t> mask = compute_mask(present);
    wbuf.write_varint(static_cast<int32_t>(mask.size()));

    for (uint64_t word : mask)
    {
        wbuf.write_ulong(word);
    }

    wbuf.write_nbt("", heightmaps.to_nbt());

    wbuf.write_varint(static_cast<int32_t>(biomes.size()));

    for (const Biome& biome : biomes)
    {
        wbuf.write_varint(biome.id);
    }

    wbuf.write_varint(static_cast<int32_t>(scratch.size()));
    wbuf.write_bytes(scratch.data(), scratch.size());

    wbuf.write_varint(static_cast<int32_t>(handler_map.size()));

    for (const auto& [index, handler] : handler_map)
    {
        BlockPosition pos = block_position(index, chunk_x, chunk_z);
        auto extra = nbt_map.find(index);
        NBTCompound nbt = extra == nbt_map.end() ? NBTCompound() : extra->second;

        nbt.set_string("id", namespaced(handler))
           .set_int("x", pos.x)
           .set_int("y", pos.y)
           .set_int("z", pos.z);
        wbuf.write_nbt("", nbt);
    }

    debug(logger().info("[S > ] chunk_data (%i, %i): %zu sections, %zu section bytes, %zu block entities",
                        chunk_x, chunk_z, present.size(), scratch.size(), handler_map.size());)
}

EncodedPacket ChunkDataPacket::encode() const
{
    WriteBuffer wbuf(MAX_SECTION_BUFFER_SIZE);
    write(wbuf);
    return {uid, created, std::make_shared<const std::vector<char>>(wbuf.bytes())};
}

// Reading

static int32_t read_length(ReadBuffer& rbuf, const char* what, size_t min_element_size)
{
    int32_t len = rbuf.read_varint();

    if (len < 0)
    {
        throw MalformedStreamException(std::string("Negative ") + what + " length " + std::to_string(len));
    }

    // don't allocate for elements that can't possibly be there
    if (static_cast<size_t>(len) * min_element_size > rbuf.remaining())
    {
        throw BufferOverflowException(static_cast<size_t>(len) * min_element_size, rbuf.remaining());
    }

    return len;
}

static void read_section(ReadBuffer& rbuf, Section& section, int index)
{
    [[maybe_unused]] int16_t block_count = rbuf.read_short();
    int bits = rbuf.read_ubyte();

    if (bits == 0)
    {
        throw MalformedStreamException("Section " + std::to_string(index) + " has 0 bits per entry");
    }

    if (bits > MAX_BITS_PER_ENTRY)
    {
        throw PaletteOverflowException(bits);
    }

    // Resize palette if necessary
    if (bits > section.bits_per_entry())
    {
        section.resize(bits);
    } else if (bits < section.bits_per_entry())
    {
        section.reset(bits);
    }

    if (bits <= PALETTE_MAXIMUM_BITS)
    {
        int32_t palette_size = read_length(rbuf, "palette", 1);

        if (palette_size > (1 << bits))
        {
            throw MalformedStreamException("Section " + std::to_string(index) + " has " + std::to_string(palette_size)
                                           + " palette entries at " + std::to_string(bits) + " bits per entry");
        }

        std::vector<uint16_t> palette(palette_size);

        for (int32_t i = 0; i < palette_size; ++i)
        {
            int32_t value = rbuf.read_varint();

            if (value < 0 || value > UINT16_MAX)
            {
                throw MalformedStreamException("Palette value " + std::to_string(value) + " is not a block state id");
            }

            palette[i] = static_cast<uint16_t>(value);
        }

        section.load_palette(palette);
    }

    int32_t data_length = read_length(rbuf, "block data", sizeof(uint64_t));

    if (data_length > section.word_count())
    {
        throw MalformedStreamException("Section " + std::to_string(index) + " has " + std::to_string(data_length)
                                       + " longs of block data, at most " + std::to_string(section.word_count())
                                       + " fit");
    }

    std::vector<uint64_t> data(data_length);

    for (int32_t i = 0; i < data_length; ++i)
    {
        data[i] = rbuf.read_ulong();
    }

    section.load_blocks(data);

    if (!section.is_direct())
    {
        // a local index without a palette entry would alias whatever gets that index next
        const uint64_t* words = section.blocks().data();

        for (int i = 0; i < SECTION_BLOCK_COUNT; ++i)
        {
            uint32_t local = packed_get(words, i, bits);

            if (local >= static_cast<uint32_t>(section.palette_size()))
            {
                throw MalformedStreamException("Section " + std::to_string(index) + " block " + std::to_string(i)
                                               + " points at palette index " + std::to_string(local) + " of "
                                               + std::to_string(section.palette_size()));
            }
        }
    }

    debug(logger().info("  section %i: %i blocks, %i bits, %i palette entries",
                        index, block_count, bits, section.palette_size());)
}

bool ChunkDataPacket::read(ReadBuffer& rbuf, const ChunkReadConfig& config)
{
    try
    {
        read_packet(rbuf, config);
        return true;
    } catch (const std::exception& e)
    {
        exception_manager().handle_exception(e);
        return false;
    }
}

void ChunkDataPacket::read_packet(ReadBuffer& rbuf, const ChunkReadConfig& config)
{
    chunk_x = rbuf.read_int();
    chunk_z = rbuf.read_int();

    int32_t mask_count = read_length(rbuf, "section mask", sizeof(uint64_t));
    std::vector<uint64_t> mask(mask_count);

    for (int32_t i = 0; i < mask_count; ++i)
    {
        mask[i] = rbuf.read_ulong();
    }

    debug(logger().info("[ > S] chunk_data (%i, %i)", chunk_x, chunk_z);)

    heightmaps_nbt = rbuf.read_nbt();
    heightmaps = Heightmaps::from_nbt(heightmaps_nbt);

    read_biomes(rbuf, config);

    // Data
    storage = PaletteStorage(config.bits_per_entry, DEFAULT_BITS_INCREMENT);

    for (size_t word = 0; word < mask.size(); ++word)
    {
        uint64_t out_of_chunk = word == 0 ? mask[0] >> CHUNK_SECTION_COUNT : mask[word];

        if (out_of_chunk)
        {
            throw MalformedStreamException("Section mask names sections above " + std::to_string(CHUNK_SECTION_COUNT - 1));
        }
    }

    int32_t data_length = read_length(rbuf, "section data", 1);
    size_t data_start = rbuf.position();

    for (int index = 0; index < CHUNK_SECTION_COUNT; ++index)
    {
        if (mask_has_section(mask, index))
        {
            read_section(rbuf, storage.section(index), index);
        }
    }

    size_t consumed = rbuf.position() - data_start;

    if (consumed != static_cast<size_t>(data_length))
    {
        throw MalformedStreamException("Section data declared " + std::to_string(data_length) + " bytes but "
                                       + std::to_string(consumed) + " were read");
    }

    read_block_entities(rbuf, config);
}

void ChunkDataPacket::read_biomes(ReadBuffer& rbuf, const ChunkReadConfig& config)
{
    int32_t biome_count = read_length(rbuf, "biome", 1);
    biomes.clear();
    biomes.reserve(biome_count);

    for (int32_t i = 0; i < biome_count; ++i)
    {
        int32_t id = rbuf.read_varint();
        std::optional<std::string> identifier;

        if (config.biome_registry)
        {
            identifier = config.biome_registry->identifier_for(id);
        }

        if (!identifier)
        {
            if (config.unknown_biome == FAIL_UNKNOWN_BIOME)
            {
                throw UnknownBiomeIdException(id);
            }

            identifier = config.fallback_biome;
        }

        biomes.push_back({id, *identifier});
    }
}

void ChunkDataPacket::read_block_entities(ReadBuffer& rbuf, const ChunkReadConfig& config)
{
    int32_t count = read_length(rbuf, "block entity", 1);
    handler_map.clear();
    nbt_map.clear();
    block_entities_nbt.clear();
    block_entities_nbt.reserve(count);

    for (int32_t i = 0; i < count; ++i)
    {
        NBTCompound tag = rbuf.read_nbt();
        const std::string id = namespaced(tag.get_string("id"));
        const BlockPosition pos = {tag.get_int("x"), tag.get_int("y"), tag.get_int("z")};

        debug(logger().info("  block entity %s at (%i, %i, %i)", id.c_str(), pos.x, pos.y, pos.z);)

        if (config.block_handler_registry)
        {
            if (!config.block_handler_registry->id_for(id))
            {
                throw UnknownBlockIdentifierException(id);
            }

            int index = chunk_block_index(pos, chunk_x, chunk_z);

            if (index == -1)
            {
                throw MalformedNBTException("block entity at (" + std::to_string(pos.x) + ", " + std::to_string(pos.y)
                                            + ", " + std::to_string(pos.z) + ") is outside of the chunk");
            }

            NBTCompound extra = tag;
            extra.remove("id");
            extra.remove("x");
            extra.remove("y");
            extra.remove("z");

            handler_map[index] = id;

            if (!extra.empty())
            {
                nbt_map[index] = std::move(extra);
            }
        }

        block_entities_nbt.push_back(std::move(tag));
    }
}
