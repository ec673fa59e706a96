//
// Created by cory on 5/5/25.
//

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <thread>
#include <typeindex>
#include <vector>
#include "exceptions/exception_manager.hpp"
#include "network/chunk_data_packet.hpp"
#include "network/clientbound_packet_ids.hpp"
#include "world/chunk_utils.hpp"

namespace {

std::vector<char> Encode(const ChunkDataPacket& packet) {
    WriteBuffer wbuf(64);
    packet.write(wbuf);
    return wbuf.bytes();
}

MapRegistry Biomes() {
    MapRegistry registry;
    registry.register_entry(0, "ocean");
    registry.register_entry(1, "plains");
    registry.register_entry(2, "desert");
    registry.register_entry(5, "taiga");
    return registry;
}

// The header fields every hand made packet starts with: position, mask, empty heightmaps, no biomes.
void WriteHeader(WriteBuffer& wbuf, const std::vector<uint64_t>& mask) {
    wbuf.write_int(0);
    wbuf.write_int(0);
    wbuf.write_varint(static_cast<int32_t>(mask.size()));
    for (uint64_t word : mask) {
        wbuf.write_ulong(word);
    }
    wbuf.write_nbt("", NBTCompound());
    wbuf.write_varint(0);
}

class ChunkDataPacketTest : public ::testing::Test {
protected:
    void SetUp() override {
        exception_manager().set_handler([this](const std::exception& e) {
            caught.emplace_back(typeid(e));
            messages.emplace_back(e.what());
        });
        biome_registry = Biomes();
        config.biome_registry = &biome_registry;
    }

    void TearDown() override {
        exception_manager().set_handler({});
    }

    bool Read(const std::vector<char>& bytes, ChunkDataPacket& packet) {
        ReadBuffer rbuf(bytes.data(), bytes.size());
        return packet.read(rbuf, config);
    }

    bool Read(const WriteBuffer& wbuf, ChunkDataPacket& packet) {
        return Read(wbuf.bytes(), packet);
    }

    MapRegistry biome_registry;
    ChunkReadConfig config;
    std::vector<std::type_index> caught;
    std::vector<std::string> messages;
};

} // namespace

TEST_F(ChunkDataPacketTest, EmptyChunkLayout) {
    ChunkDataPacket packet;
    packet.chunk_x = -1;
    packet.chunk_z = 2;

    const std::vector<char> bytes = Encode(packet);
    ReadBuffer rbuf(bytes.data(), bytes.size());

    EXPECT_EQ(rbuf.read_int(), -1);
    EXPECT_EQ(rbuf.read_int(), 2);
    EXPECT_EQ(rbuf.read_varint(), 0);
    const NBTCompound heightmaps = rbuf.read_nbt();
    EXPECT_EQ(heightmaps.get_long_array("MOTION_BLOCKING").size(), 36u);
    EXPECT_EQ(heightmaps.get_long_array("WORLD_SURFACE").size(), 36u);
    EXPECT_EQ(rbuf.read_varint(), 0);
    EXPECT_EQ(rbuf.read_varint(), 0);
    EXPECT_EQ(rbuf.read_varint(), 0);
    EXPECT_EQ(rbuf.remaining(), 0u);
    EXPECT_EQ(packet.id(), PLAY_CHUNK_DATA);
}

TEST_F(ChunkDataPacketTest, AirSectionBlob) {
    ChunkDataPacket packet;
    packet.storage.section(0);

    const std::vector<char> bytes = Encode(packet);
    ReadBuffer rbuf(bytes.data(), bytes.size());

    (void) rbuf.read_int();
    (void) rbuf.read_int();
    ASSERT_EQ(rbuf.read_varint(), 1);
    EXPECT_EQ(rbuf.read_ulong(), 1u);
    (void) rbuf.read_nbt();
    ASSERT_EQ(rbuf.read_varint(), 0);

    // block count, width, palette [0], 256 words of zeros
    ASSERT_EQ(rbuf.read_varint(), 2 + 1 + 1 + 1 + 2 + 256 * 8);
    EXPECT_EQ(rbuf.read_short(), 4096);
    EXPECT_EQ(rbuf.read_ubyte(), 4);
    EXPECT_EQ(rbuf.read_varint(), 1);
    EXPECT_EQ(rbuf.read_varint(), 0);
    ASSERT_EQ(rbuf.read_varint(), 256);
    for (int i = 0; i < 256; ++i) {
        ASSERT_EQ(rbuf.read_ulong(), 0u);
    }
    EXPECT_EQ(rbuf.read_varint(), 0);
    EXPECT_EQ(rbuf.remaining(), 0u);
}

TEST_F(ChunkDataPacketTest, BlocksSurviveAnEncodeDecode) {
    std::mt19937 rng(20250505);

    for (int section_count : {0, 1, 5, 16}) {
        ChunkDataPacket packet;
        packet.chunk_x = 12;
        packet.chunk_z = -40;

        std::vector<int> indices(CHUNK_SECTION_COUNT);
        for (int i = 0; i < CHUNK_SECTION_COUNT; ++i) {
            indices[i] = i;
        }
        std::shuffle(indices.begin(), indices.end(), rng);
        indices.resize(section_count);

        for (int index : indices) {
            // anything from a couple of ids to enough to go direct
            const int distinct[] = {1, 3, 20, 200, 512};
            std::uniform_int_distribution<int> ids(0, distinct[rng() % 5] - 1);
            Section& section = packet.storage.section(index);

            for (int i = 0; i < SECTION_BLOCK_COUNT; ++i) {
                section.set(i, static_cast<uint16_t>(ids(rng)));
            }
        }

        ChunkDataPacket read;
        ASSERT_TRUE(Read(Encode(packet), read)) << section_count << " sections";

        EXPECT_EQ(read.chunk_x, 12);
        EXPECT_EQ(read.chunk_z, -40);
        EXPECT_EQ(read.storage.populated(), packet.storage.populated());
        for (int index : packet.storage.populated()) {
            const Section& expected = *packet.storage.find(index);
            const Section& actual = *read.storage.find(index);

            EXPECT_EQ(actual.bits_per_entry(), expected.bits_per_entry());
            for (int i = 0; i < SECTION_BLOCK_COUNT; ++i) {
                ASSERT_EQ(actual.get(i), expected.get(i)) << "section " << index << " block " << i;
            }
        }
    }
    EXPECT_TRUE(caught.empty());
}

TEST_F(ChunkDataPacketTest, DecodesNarrowerSectionsThanConfigured) {
    ChunkDataPacket packet;
    packet.storage.set_block(1, 2, 3, 17);
    packet.storage.set_block(4, 5, 6, 33);
    config.bits_per_entry = 8;

    ChunkDataPacket read;
    ASSERT_TRUE(Read(Encode(packet), read));

    EXPECT_EQ(read.storage.find(0)->bits_per_entry(), 4);
    EXPECT_EQ(read.storage.get_block(1, 2, 3), 17);
    EXPECT_EQ(read.storage.get_block(4, 5, 6), 33);
    EXPECT_EQ(read.storage.get_block(0, 0, 0), 0);
}

TEST_F(ChunkDataPacketTest, HeightmapsSurviveAnEncodeDecode) {
    ChunkDataPacket packet;
    packet.heightmaps.set_motion_blocking(5, 6, 70);
    packet.heightmaps.set_world_surface(15, 0, 300);

    ChunkDataPacket read;
    ASSERT_TRUE(Read(Encode(packet), read));

    EXPECT_EQ(read.heightmaps.motion_blocking(5, 6), 70);
    EXPECT_EQ(read.heightmaps.world_surface(15, 0), 300);
    EXPECT_EQ(read.heightmaps.world_surface(0, 0), 5);
    EXPECT_TRUE(read.heightmaps_nbt.contains("MOTION_BLOCKING"));
}

TEST_F(ChunkDataPacketTest, BiomesResolveThroughTheRegistry) {
    ChunkDataPacket packet;
    packet.biomes = {{2, "minecraft:desert"}, {2, "minecraft:desert"}, {5, "minecraft:taiga"}};

    ChunkDataPacket read;
    ASSERT_TRUE(Read(Encode(packet), read));

    EXPECT_EQ(read.biomes, packet.biomes);
}

TEST_F(ChunkDataPacketTest, UnknownBiomeFailsTheRead) {
    ChunkDataPacket packet;
    packet.biomes = {{1, "minecraft:plains"}, {7, "minecraft:unregistered"}};

    ChunkDataPacket read;
    EXPECT_FALSE(Read(Encode(packet), read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(UnknownBiomeIdException)));
    EXPECT_EQ(messages[0], "Unknown biome id 7");
}

TEST_F(ChunkDataPacketTest, UnknownBiomeCanBeSubstituted) {
    ChunkDataPacket packet;
    packet.biomes = {{7, "minecraft:unregistered"}, {0, "minecraft:ocean"}};
    config.unknown_biome = SUBSTITUTE_UNKNOWN_BIOME;

    ChunkDataPacket read;
    ASSERT_TRUE(Read(Encode(packet), read));

    EXPECT_EQ(read.biomes, (std::vector<Biome>{{7, "minecraft:plains"}, {0, "minecraft:ocean"}}));
}

TEST_F(ChunkDataPacketTest, BlockEntitiesCarryAbsolutePositions) {
    ChunkDataPacket packet;
    packet.chunk_x = 2;
    packet.chunk_z = -3;
    const int index = chunk_block_index(1, 70, 15);
    packet.handler_map[index] = "chest";
    packet.nbt_map[index].set_string("Lock", "key");

    const std::vector<char> bytes = Encode(packet);

    ChunkDataPacket read;
    ASSERT_TRUE(Read(bytes, read));

    ASSERT_EQ(read.block_entities_nbt.size(), 1u);
    const NBTCompound& nbt = read.block_entities_nbt[0];
    EXPECT_EQ(nbt.get_string("id"), "minecraft:chest");
    EXPECT_EQ(nbt.get_int("x"), 33);
    EXPECT_EQ(nbt.get_int("y"), 70);
    EXPECT_EQ(nbt.get_int("z"), -33);
    EXPECT_EQ(nbt.get_string("Lock"), "key");

    // without a handler registry block entities aren't mapped
    EXPECT_TRUE(read.handler_map.empty());
    EXPECT_TRUE(read.nbt_map.empty());
}

TEST_F(ChunkDataPacketTest, BlockEntitiesMapThroughTheHandlerRegistry) {
    ChunkDataPacket packet;
    packet.chunk_x = 2;
    packet.chunk_z = -3;
    const int chest = chunk_block_index(1, 70, 15);
    const int sign = chunk_block_index(0, 0, 0);
    packet.handler_map[chest] = "minecraft:chest";
    packet.nbt_map[chest].set_string("Lock", "key");
    packet.handler_map[sign] = "sign";

    MapRegistry handlers;
    handlers.register_entry(0, "chest");
    handlers.register_entry(1, "sign");
    config.block_handler_registry = &handlers;

    ChunkDataPacket read;
    ASSERT_TRUE(Read(Encode(packet), read));

    EXPECT_EQ(read.handler_map, (std::map<int, std::string>{{sign, "minecraft:sign"}, {chest, "minecraft:chest"}}));
    ASSERT_EQ(read.nbt_map.size(), 1u);
    EXPECT_EQ(read.nbt_map[chest].names(), (std::vector<std::string>{"Lock"}));
    EXPECT_EQ(read.nbt_map[chest].get_string("Lock"), "key");
}

TEST_F(ChunkDataPacketTest, UnknownBlockEntityFailsTheRead) {
    ChunkDataPacket packet;
    packet.handler_map[0] = "furnace";

    MapRegistry handlers;
    handlers.register_entry(0, "chest");
    config.block_handler_registry = &handlers;

    ChunkDataPacket read;
    EXPECT_FALSE(Read(Encode(packet), read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(UnknownBlockIdentifierException)));
}

TEST_F(ChunkDataPacketTest, TruncatedPacketFailsTheRead) {
    ChunkDataPacket packet;
    packet.storage.set_block(0, 0, 0, 1);
    std::vector<char> bytes = Encode(packet);
    bytes.resize(bytes.size() - 100);

    ChunkDataPacket read;
    EXPECT_FALSE(Read(bytes, read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(BufferOverflowException)));
    EXPECT_EQ(exception_manager().handled() > 0, true);
}

TEST_F(ChunkDataPacketTest, SectionDataLengthMustMatch) {
    WriteBuffer section(64);
    section.write_short(4096);
    section.write_ubyte(4);
    section.write_varint(1);
    section.write_varint(0);
    section.write_varint(256);
    for (int i = 0; i < 256; ++i) {
        section.write_ulong(0);
    }

    WriteBuffer wbuf(64);
    WriteHeader(wbuf, {1});
    wbuf.write_varint(static_cast<int32_t>(section.size() - 1));
    wbuf.write_bytes(section.data(), section.size());
    wbuf.write_varint(0);

    ChunkDataPacket read;
    EXPECT_FALSE(Read(wbuf, read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(MalformedStreamException)));
}

TEST_F(ChunkDataPacketTest, PackedIndicesMustBeInThePalette) {
    WriteBuffer section(64);
    section.write_short(4096);
    section.write_ubyte(4);
    section.write_varint(2);
    section.write_varint(0);
    section.write_varint(5);
    section.write_varint(256);
    // block 0 points at local index 3 of a two entry palette
    section.write_ulong(0x3);
    for (int i = 1; i < 256; ++i) {
        section.write_ulong(0);
    }

    WriteBuffer wbuf(64);
    WriteHeader(wbuf, {1});
    wbuf.write_varint(static_cast<int32_t>(section.size()));
    wbuf.write_bytes(section.data(), section.size());
    wbuf.write_varint(0);

    ChunkDataPacket read;
    EXPECT_FALSE(Read(wbuf, read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(MalformedStreamException)));
}

TEST_F(ChunkDataPacketTest, FailuresFromSeveralThreadsAreAllCounted) {
    constexpr int kThreads = 4;
    constexpr int kReadsPerThread = 2000;
    // the recording handler isn't safe to share between threads
    exception_manager().set_handler([](const std::exception&) {});

    const std::vector<char> truncated = {0x00, 0x00, 0x00};
    const unsigned long before = exception_manager().handled();

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, &truncated] {
            for (int i = 0; i < kReadsPerThread; ++i) {
                ChunkDataPacket read;
                ReadBuffer rbuf(truncated.data(), truncated.size());
                EXPECT_FALSE(read.read(rbuf, config));
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(exception_manager().handled() - before, static_cast<unsigned long>(kThreads * kReadsPerThread));
}

TEST_F(ChunkDataPacketTest, SectionsOutsideTheChunkAreRejected) {
    WriteBuffer wbuf(64);
    WriteHeader(wbuf, {1ULL << 20});
    wbuf.write_varint(0);
    wbuf.write_varint(0);

    ChunkDataPacket read;
    EXPECT_FALSE(Read(wbuf, read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(MalformedStreamException)));
}

TEST_F(ChunkDataPacketTest, WidthsPastTheMaximumOverflow) {
    WriteBuffer wbuf(64);
    WriteHeader(wbuf, {1});
    wbuf.write_varint(3);
    wbuf.write_short(4096);
    wbuf.write_ubyte(17);
    wbuf.write_varint(0);

    ChunkDataPacket read;
    EXPECT_FALSE(Read(wbuf, read));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_EQ(caught[0], std::type_index(typeid(PaletteOverflowException)));
}

TEST_F(ChunkDataPacketTest, ScratchBufferCanBeReused) {
    ChunkDataPacket first;
    first.storage.set_block(3, 3, 3, 300);
    first.storage.set_block(3, 200, 3, 2);
    ChunkDataPacket second;
    second.storage.set_block(0, 20, 0, 9);

    WriteBuffer scratch(16);
    WriteBuffer a(64);
    WriteBuffer b(64);
    first.write(a, scratch);
    second.write(b, scratch);

    EXPECT_EQ(a.bytes(), Encode(first));
    EXPECT_EQ(b.bytes(), Encode(second));
}

TEST_F(ChunkDataPacketTest, EncodeKeepsIdentity) {
    ChunkDataPacket packet = ChunkDataPacket::create(4, 5);
    packet.storage.set_block(1, 1, 1, 1);

    const EncodedPacket encoded = packet.encode();

    EXPECT_EQ(encoded.identifier, packet.identifier());
    EXPECT_EQ(encoded.timestamp, packet.timestamp());
    EXPECT_GT(encoded.timestamp, 0);
    ASSERT_NE(encoded.bytes, nullptr);
    EXPECT_EQ(*encoded.bytes, Encode(packet));
    EXPECT_NE(ChunkDataPacket::create(4, 5).identifier(), packet.identifier());
}
