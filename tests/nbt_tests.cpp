//
// Created by cory on 5/4/25.
//

#include <gtest/gtest.h>

#include <vector>
#include "nbt/nbt.hpp"
#include "network/readbuffer.hpp"
#include "network/writebuffer.hpp"

namespace {

std::vector<uint8_t> WrittenBytes(const WriteBuffer& wbuf) {
    return {reinterpret_cast<const uint8_t*>(wbuf.data()), reinterpret_cast<const uint8_t*>(wbuf.data()) + wbuf.size()};
}

NBTCompound ReadRoot(const std::vector<uint8_t>& bytes) {
    ReadBuffer rbuf(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return rbuf.read_nbt();
}

} // namespace

TEST(NBTTest, WritesNamedRootCompound) {
    NBTCompound nbt;
    nbt.set_int("a", 1);

    WriteBuffer wbuf(16);
    wbuf.write_nbt("", nbt);

    const std::vector<uint8_t> expected{
        TAG_COMPOUND, 0x00, 0x00,
        TAG_INT, 0x00, 0x01, 'a', 0x00, 0x00, 0x00, 0x01,
        TAG_END
    };
    EXPECT_EQ(WrittenBytes(wbuf), expected);
}

TEST(NBTTest, NestedTagsSurviveReadAndWrite) {
    NBTCompound inner;
    inner.set_byte("Count", 3).set_string("id", "minecraft:diamond");

    NBTList items(TAG_COMPOUND);
    items.add(NBTTag(inner));

    NBTCompound nbt;
    nbt.set_string("id", "minecraft:chest")
       .set_short("s", -7)
       .set_long("l", 1LL << 40)
       .set_double("d", 2.5)
       .set_long_array("longs", {1, -1, 1LL << 62})
       .set("Items", NBTTag(items))
       .set("ints", NBTTag(std::vector<int32_t>{4, 5}))
       .set("bytes", NBTTag(std::vector<int8_t>{-1, 2}));

    WriteBuffer wbuf(16);
    wbuf.write_nbt("root", nbt);

    ReadBuffer rbuf(wbuf.data(), wbuf.size());
    std::string name;
    NBTCompound read = rbuf.read_nbt(&name);

    EXPECT_EQ(name, "root");
    EXPECT_EQ(rbuf.remaining(), 0u);
    ASSERT_EQ(read.names(), nbt.names());
    EXPECT_EQ(read.get_string("id"), "minecraft:chest");
    EXPECT_EQ(*read.get("s")->as<int16_t>(), -7);
    EXPECT_EQ(read.get_long("l"), 1LL << 40);
    EXPECT_EQ(*read.get("d")->as<double>(), 2.5);
    EXPECT_EQ(read.get_long_array("longs"), (std::vector<int64_t>{1, -1, 1LL << 62}));
    EXPECT_EQ(*read.get("ints")->as<std::vector<int32_t>>(), (std::vector<int32_t>{4, 5}));
    EXPECT_EQ(*read.get("bytes")->as<std::vector<int8_t>>(), (std::vector<int8_t>{-1, 2}));

    const NBTList* list = read.get("Items")->as<NBTList>();
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->size(), 1u);
    EXPECT_EQ(list->element_type(), TAG_COMPOUND);
    const NBTCompound* item = list->at(0).as<NBTCompound>();
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->get_byte("Count"), 3);
    EXPECT_EQ(item->get_string("id"), "minecraft:diamond");
}

TEST(NBTTest, ReplacingATagKeepsItsPosition) {
    NBTCompound nbt;
    nbt.set_int("x", 1).set_int("y", 2).set_int("z", 3);
    nbt.set_string("x", "moved?");

    EXPECT_EQ(nbt.names(), (std::vector<std::string>{"x", "y", "z"}));
    EXPECT_EQ(nbt.get_string("x"), "moved?");

    EXPECT_TRUE(nbt.remove("y"));
    EXPECT_FALSE(nbt.remove("y"));
    EXPECT_EQ(nbt.names(), (std::vector<std::string>{"x", "z"}));
}

TEST(NBTTest, TypedGettersRejectMissingAndMistypedTags) {
    NBTCompound nbt;
    nbt.set_string("id", "minecraft:sign");

    EXPECT_THROW((void) nbt.get_int("id"), MalformedNBTException);
    EXPECT_THROW((void) nbt.get_int("x"), MalformedNBTException);
    EXPECT_EQ(nbt.get("x"), nullptr);
}

TEST(NBTTest, ListRejectsOtherElementTypes) {
    NBTList list(TAG_INT);
    list.add(NBTTag(int32_t{1}));
    EXPECT_THROW(list.add(NBTTag(std::string("no"))), std::invalid_argument);
}

TEST(NBTTest, RootMustBeACompound) {
    EXPECT_THROW(ReadRoot({TAG_INT, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01}), MalformedNBTException);
}

TEST(NBTTest, UnknownTagTypeIsMalformed) {
    EXPECT_THROW(ReadRoot({TAG_COMPOUND, 0x00, 0x00, 0x0d, 0x00, 0x00, TAG_END}), MalformedNBTException);
}

TEST(NBTTest, NegativeArrayLengthIsMalformed) {
    EXPECT_THROW(ReadRoot({TAG_COMPOUND, 0x00, 0x00, TAG_LONG_ARRAY, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff, TAG_END}),
                 MalformedNBTException);
}

TEST(NBTTest, TruncatedCompoundOverflows) {
    EXPECT_THROW(ReadRoot({TAG_COMPOUND, 0x00, 0x00, TAG_INT, 0x00, 0x01, 'a', 0x00}), BufferOverflowException);
    EXPECT_THROW(ReadRoot({TAG_COMPOUND, 0x00, 0x00}), BufferOverflowException);
}

TEST(NBTTest, NestingIsLimited) {
    std::vector<uint8_t> bytes{TAG_COMPOUND, 0x00, 0x00};
    for (int i = 0; i < NBT_MAX_DEPTH + 10; ++i) {
        bytes.insert(bytes.end(), {TAG_COMPOUND, 0x00, 0x00});
    }

    EXPECT_THROW(ReadRoot(bytes), MalformedNBTException);
}
