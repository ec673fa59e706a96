// KELP Entry Point
// (Chunk packet codec for Minecraft-protocol servers)
//
// kelp encode <file> [chunk x] [chunk z]   writes a sample chunk's packet body to the file
// kelp decode <file>                       reads a packet body and prints what's in it

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "logger.hpp"
#include "network/chunk_data_packet.hpp"
#include "world/chunk_utils.hpp"

static MapRegistry biome_registry()
{
    MapRegistry biomes;
    biomes.register_entry(0, "minecraft:ocean");
    biomes.register_entry(1, "minecraft:plains");
    biomes.register_entry(2, "minecraft:desert");
    biomes.register_entry(5, "minecraft:taiga");
    return biomes;
}

static int encode(const char* path, int32_t cx, int32_t cz)
{
    ChunkDataPacket packet = ChunkDataPacket::create(cx, cz);

    // bedrock, stone and a layer of grass
    for (int x = 0; x < CHUNK_SIZE_X; ++x)
    {
        for (int z = 0; z < CHUNK_SIZE_Z; ++z)
        {
            for (int y = 0; y < CHUNK_SECTION_SIZE * 4; ++y)
            {
                uint16_t block = y == 0 ? 33 : y < 63 ? 1 : 9;
                packet.storage.set_block(x, y, z, block);
            }

            packet.heightmaps.set_motion_blocking(x, z, 64);
            packet.heightmaps.set_world_surface(x, z, 64);
        }
    }

    packet.biomes.assign(1024, {1, "minecraft:plains"});
    packet.handler_map[chunk_block_index(8, 63, 8)] = "minecraft:chest";
    packet.nbt_map[chunk_block_index(8, 63, 8)].set_string("CustomName", "{\"text\":\"KELP\"}");

    EncodedPacket encoded = packet.encode();
    std::ofstream out(path, std::ios::binary);

    if (!out.write(encoded.bytes->data(), static_cast<std::streamsize>(encoded.bytes->size())))
    {
        logger().err("Unable to write %s", path);
        return EXIT_FAILURE;
    }

    logger().info("Wrote chunk (%i, %i) to %s: %zu bytes, identifier %s",
                  cx, cz, path, encoded.bytes->size(), encoded.identifier.str().c_str());
    return EXIT_SUCCESS;
}

static int decode(const char* path)
{
    std::ifstream in(path, std::ios::binary);

    if (!in)
    {
        logger().err("Unable to open %s", path);
        return EXIT_FAILURE;
    }

    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    MapRegistry biomes = biome_registry();

    ChunkReadConfig config;
    config.biome_registry = &biomes;
    config.unknown_biome = SUBSTITUTE_UNKNOWN_BIOME;

    ChunkDataPacket packet;
    ReadBuffer rbuf(bytes.data(), bytes.size());

    if (!packet.read(rbuf, config))
    {
        logger().err("%s is not a valid chunk packet", path);
        return EXIT_FAILURE;
    }

    if (rbuf.remaining())
    {
        logger().warn("%zu trailing bytes after the packet", rbuf.remaining());
    }

    logger().info("Chunk (%i, %i)", packet.chunk_x, packet.chunk_z);

    for (int index : packet.storage.populated())
    {
        const Section* section = packet.storage.find(index);
        logger().info("  section %2i: %2i bits per entry, %3i palette entries",
                      index, section->bits_per_entry(), section->palette_size());
    }

    logger().info("  %zu biomes, %zu block entities", packet.biomes.size(), packet.block_entities_nbt.size());

    for (const NBTCompound& nbt : packet.block_entities_nbt)
    {
        logger().info("  %s at (%i, %i, %i)", nbt.get_string("id").c_str(),
                      nbt.get_int("x"), nbt.get_int("y"), nbt.get_int("z"));
    }

    return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
    if (argc >= 3 && !strcmp(argv[1], "encode"))
    {
        int32_t cx = argc > 3 ? static_cast<int32_t>(strtol(argv[3], nullptr, 10)) : 0;
        int32_t cz = argc > 4 ? static_cast<int32_t>(strtol(argv[4], nullptr, 10)) : 0;
        return encode(argv[2], cx, cz);
    }

    if (argc == 3 && !strcmp(argv[1], "decode"))
    {
        return decode(argv[2]);
    }

    logger().err("usage: %s encode <file> [chunk x] [chunk z] | decode <file>", argv[0]);
    return EXIT_FAILURE;
}
