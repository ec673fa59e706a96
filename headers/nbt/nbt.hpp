//
// Created by cory on 5/3/25.
//

#ifndef KELP_NBT_HPP
#define KELP_NBT_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

class ReadBuffer;
class WriteBuffer;

enum TagType : int8_t
{
    TAG_END,
    TAG_BYTE,
    TAG_SHORT,
    TAG_INT,
    TAG_LONG,
    TAG_FLOAT,
    TAG_DOUBLE,
    TAG_BYTE_ARRAY,
    TAG_STRING,
    TAG_LIST,
    TAG_COMPOUND,
    TAG_INT_ARRAY,
    TAG_LONG_ARRAY
};

/**
 * Deepest nesting of lists and compounds accepted while reading.
 */
#define NBT_MAX_DEPTH (512)

const char* tag_type_name(TagType type);

class NBTTag;

/**
 * A list of unnamed tags which all share one type.
 */
class NBTList
{
public:
    NBTList();

    explicit NBTList(TagType element_type);

    [[nodiscard]] inline TagType element_type() const { return type; }

    [[nodiscard]] size_t size() const;

    /**
     * @throws std::invalid_argument if the tag's type isn't the element type of this list
     */
    void add(NBTTag tag);

    [[nodiscard]] const NBTTag& at(size_t index) const;
private:
    TagType type;
    std::vector<NBTTag> elements;
};

/**
 * Named tags in insertion order. Writing a compound always emits its tags in that order, so
 * two equal compounds built the same way serialize to the same bytes.
 */
class NBTCompound
{
public:
    NBTCompound();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] inline bool empty() const { return keys.empty(); }

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @return The tag with the given name, nullptr if there is none.
     */
    [[nodiscard]] const NBTTag* get(const std::string& name) const;

    /**
     * Sets the tag with the given name. A replaced tag keeps its position.
     */
    NBTCompound& set(const std::string& name, NBTTag tag);

    NBTCompound& set_byte(const std::string& name, int8_t value);

    NBTCompound& set_short(const std::string& name, int16_t value);

    NBTCompound& set_int(const std::string& name, int32_t value);

    NBTCompound& set_long(const std::string& name, int64_t value);

    NBTCompound& set_float(const std::string& name, float value);

    NBTCompound& set_double(const std::string& name, double value);

    NBTCompound& set_string(const std::string& name, std::string value);

    NBTCompound& set_long_array(const std::string& name, std::vector<int64_t> value);

    NBTCompound& set_compound(const std::string& name, NBTCompound value);

    /**
     * @return true if a tag was removed
     */
    bool remove(const std::string& name);

    // The typed getters throw MalformedNBTException if the tag is missing or has another type

    [[nodiscard]] int8_t get_byte(const std::string& name) const;

    [[nodiscard]] int32_t get_int(const std::string& name) const;

    [[nodiscard]] int64_t get_long(const std::string& name) const;

    [[nodiscard]] const std::string& get_string(const std::string& name) const;

    [[nodiscard]] const std::vector<int64_t>& get_long_array(const std::string& name) const;

    [[nodiscard]] const NBTCompound& get_compound(const std::string& name) const;

    [[nodiscard]] inline const std::vector<std::string>& names() const { return keys; }

    [[nodiscard]] const NBTTag& tag_at(size_t index) const;
private:
    template<typename T>
    const T& get_as(const std::string& name, TagType expected) const;

    std::vector<std::string> keys;
    std::vector<NBTTag> tags;
};

class NBTTag
{
public:
    // Alternative i holds the payload of tag type i + 1
    typedef std::variant<int8_t,
                         int16_t,
                         int32_t,
                         int64_t,
                         float,
                         double,
                         std::vector<int8_t>,
                         std::string,
                         NBTList,
                         NBTCompound,
                         std::vector<int32_t>,
                         std::vector<int64_t>> value_type;

    explicit NBTTag(value_type value) : value(std::move(value)) {}

    [[nodiscard]] inline TagType type() const { return static_cast<TagType>(value.index() + 1); }

    /**
     * @return The payload if this tag holds a T, nullptr otherwise.
     */
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&value); }

    value_type value;
};

/**
 * Reads a named root tag (type, u16 name length, name, payload).
 *
 * @throws MalformedNBTException if the root isn't a compound or the payload is invalid
 * @throws BufferOverflowException if the tag is truncated
 */
NBTCompound nbt_read_root(ReadBuffer& rbuf, std::string* name);

void nbt_write_root(WriteBuffer& wbuf, const std::string& name, const NBTCompound& compound);


#endif //KELP_NBT_HPP
