//
// Created by cory on 5/3/25.
//

#include <stdexcept>
#include "nbt/nbt.hpp"
#include "network/readbuffer.hpp"
#include "network/writebuffer.hpp"

const char* tag_type_name(TagType type)
{
    switch (type)
    {
        case TAG_END:
            return "TAG_End";
        case TAG_BYTE:
            return "TAG_Byte";
        case TAG_SHORT:
            return "TAG_Short";
        case TAG_INT:
            return "TAG_Int";
        case TAG_LONG:
            return "TAG_Long";
        case TAG_FLOAT:
            return "TAG_Float";
        case TAG_DOUBLE:
            return "TAG_Double";
        case TAG_BYTE_ARRAY:
            return "TAG_Byte_Array";
        case TAG_STRING:
            return "TAG_String";
        case TAG_LIST:
            return "TAG_List";
        case TAG_COMPOUND:
            return "TAG_Compound";
        case TAG_INT_ARRAY:
            return "TAG_Int_Array";
        case TAG_LONG_ARRAY:
            return "TAG_Long_Array";
        default:
            return "TAG_Unknown";
    }
}

NBTList::NBTList() : type(TAG_END)
{}

NBTList::NBTList(TagType element_type) : type(element_type)
{}

size_t NBTList::size() const
{
    return elements.size();
}

void NBTList::add(NBTTag tag)
{
    if (elements.empty() && type == TAG_END)
    {
        // an untyped list takes the type of its first element
        type = tag.type();
    }

    if (tag.type() != type)
    {
        throw std::invalid_argument(std::string("Cannot add ") + tag_type_name(tag.type()) + " to a list of "
                                    + tag_type_name(type));
    }

    elements.push_back(std::move(tag));
}

const NBTTag& NBTList::at(size_t index) const
{
    return elements.at(index);
}

NBTCompound::NBTCompound() = default;

size_t NBTCompound::size() const
{
    return tags.size();
}

bool NBTCompound::contains(const std::string& name) const
{
    return get(name) != nullptr;
}

const NBTTag* NBTCompound::get(const std::string& name) const
{
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (keys[i] == name)
        {
            return &tags[i];
        }
    }

    return nullptr;
}

NBTCompound& NBTCompound::set(const std::string& name, NBTTag tag)
{
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (keys[i] == name)
        {
            tags[i] = std::move(tag);
            return *this;
        }
    }

    keys.push_back(name);
    tags.push_back(std::move(tag));
    return *this;
}

NBTCompound& NBTCompound::set_byte(const std::string& name, int8_t value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_short(const std::string& name, int16_t value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_int(const std::string& name, int32_t value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_long(const std::string& name, int64_t value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_float(const std::string& name, float value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_double(const std::string& name, double value)
{
    return set(name, NBTTag(value));
}

NBTCompound& NBTCompound::set_string(const std::string& name, std::string value)
{
    return set(name, NBTTag(std::move(value)));
}

NBTCompound& NBTCompound::set_long_array(const std::string& name, std::vector<int64_t> value)
{
    return set(name, NBTTag(std::move(value)));
}

NBTCompound& NBTCompound::set_compound(const std::string& name, NBTCompound value)
{
    return set(name, NBTTag(std::move(value)));
}

bool NBTCompound::remove(const std::string& name)
{
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (keys[i] == name)
        {
            keys.erase(keys.begin() + static_cast<ptrdiff_t>(i));
            tags.erase(tags.begin() + static_cast<ptrdiff_t>(i));
            return true;
        }
    }

    return false;
}

template<typename T>
const T& NBTCompound::get_as(const std::string& name, TagType expected) const
{
    const NBTTag* tag = get(name);

    if (!tag)
    {
        throw MalformedNBTException("missing " + std::string(tag_type_name(expected)) + " \"" + name + "\"");
    }

    const T* value = tag->as<T>();

    if (!value)
    {
        throw MalformedNBTException("\"" + name + "\" is a " + tag_type_name(tag->type()) + ", expected "
                                    + tag_type_name(expected));
    }

    return *value;
}

int8_t NBTCompound::get_byte(const std::string& name) const
{
    return get_as<int8_t>(name, TAG_BYTE);
}

int32_t NBTCompound::get_int(const std::string& name) const
{
    return get_as<int32_t>(name, TAG_INT);
}

int64_t NBTCompound::get_long(const std::string& name) const
{
    return get_as<int64_t>(name, TAG_LONG);
}

const std::string& NBTCompound::get_string(const std::string& name) const
{
    return get_as<std::string>(name, TAG_STRING);
}

const std::vector<int64_t>& NBTCompound::get_long_array(const std::string& name) const
{
    return get_as<std::vector<int64_t>>(name, TAG_LONG_ARRAY);
}

const NBTCompound& NBTCompound::get_compound(const std::string& name) const
{
    return get_as<NBTCompound>(name, TAG_COMPOUND);
}

const NBTTag& NBTCompound::tag_at(size_t index) const
{
    return tags.at(index);
}

// Reading

static std::string read_nbt_string(ReadBuffer& rbuf)
{
    uint16_t size = rbuf.read_ushort();
    std::string rax;
    rax.resize(size);
    rbuf.read_bytes(rax.data(), size);
    return rax;
}

static int32_t read_array_length(ReadBuffer& rbuf)
{
    int32_t len = rbuf.read_int();

    if (len < 0)
    {
        throw MalformedNBTException("negative array length " + std::to_string(len));
    }

    // every element takes at least a byte, anything longer than what's left is truncated
    if (static_cast<size_t>(len) > rbuf.remaining())
    {
        throw BufferOverflowException(len, rbuf.remaining());
    }

    return len;
}

static NBTTag read_payload(ReadBuffer& rbuf, TagType type, int depth);

static NBTCompound read_compound(ReadBuffer& rbuf, int depth)
{
    NBTCompound compound;

    while (true)
    {
        auto type = static_cast<TagType>(rbuf.read_byte());

        if (type == TAG_END)
        {
            return compound;
        }

        std::string name = read_nbt_string(rbuf);
        compound.set(name, read_payload(rbuf, type, depth + 1));
    }
}

static NBTTag read_payload(ReadBuffer& rbuf, TagType type, int depth)
{
    if (depth > NBT_MAX_DEPTH)
    {
        throw MalformedNBTException("nested deeper than " + std::to_string(NBT_MAX_DEPTH));
    }

    switch (type)
    {
        case TAG_BYTE:
            return NBTTag(rbuf.read_byte());
        case TAG_SHORT:
            return NBTTag(rbuf.read_short());
        case TAG_INT:
            return NBTTag(rbuf.read_int());
        case TAG_LONG:
            return NBTTag(rbuf.read_long());
        case TAG_FLOAT:
            return NBTTag(rbuf.read_float());
        case TAG_DOUBLE:
            return NBTTag(rbuf.read_double());
        case TAG_BYTE_ARRAY:
        {
            int32_t len = read_array_length(rbuf);
            std::vector<int8_t> array(len);
            rbuf.read_bytes(reinterpret_cast<char*>(array.data()), len);
            return NBTTag(std::move(array));
        }
        case TAG_STRING:
            return NBTTag(read_nbt_string(rbuf));
        case TAG_LIST:
        {
            auto element_type = static_cast<TagType>(rbuf.read_byte());
            int32_t len = read_array_length(rbuf);

            if (element_type == TAG_END && len > 0)
            {
                throw MalformedNBTException("non-empty list of TAG_End");
            }

            NBTList list(element_type);

            for (int32_t i = 0; i < len; ++i)
            {
                list.add(read_payload(rbuf, element_type, depth + 1));
            }

            return NBTTag(std::move(list));
        }
        case TAG_COMPOUND:
            return NBTTag(read_compound(rbuf, depth));
        case TAG_INT_ARRAY:
        {
            int32_t len = read_array_length(rbuf);
            std::vector<int32_t> array(len);

            for (int32_t i = 0; i < len; ++i)
            {
                array[i] = rbuf.read_int();
            }

            return NBTTag(std::move(array));
        }
        case TAG_LONG_ARRAY:
        {
            int32_t len = read_array_length(rbuf);
            std::vector<int64_t> array(len);

            for (int32_t i = 0; i < len; ++i)
            {
                array[i] = rbuf.read_long();
            }

            return NBTTag(std::move(array));
        }
        default:
            throw MalformedNBTException("unknown tag type " + std::to_string(static_cast<int>(type)));
    }
}

NBTCompound nbt_read_root(ReadBuffer& rbuf, std::string* name)
{
    auto type = static_cast<TagType>(rbuf.read_byte());

    if (type != TAG_COMPOUND)
    {
        throw MalformedNBTException(std::string("root tag is ") + tag_type_name(type) + ", expected TAG_Compound");
    }

    std::string root_name = read_nbt_string(rbuf);

    if (name)
    {
        *name = std::move(root_name);
    }

    return read_compound(rbuf, 0);
}

// Writing

static void write_nbt_string(WriteBuffer& wbuf, const std::string& str)
{
    if (str.size() > UINT16_MAX)
    {
        throw std::length_error("NBT string of " + std::to_string(str.size()) + " bytes is too long");
    }

    wbuf.write_ushort(static_cast<uint16_t>(str.size()));
    wbuf.write_bytes(str.data(), str.size());
}

static void write_payload(WriteBuffer& wbuf, const NBTTag& tag);

static void write_compound(WriteBuffer& wbuf, const NBTCompound& compound)
{
    for (size_t i = 0; i < compound.size(); ++i)
    {
        const NBTTag& tag = compound.tag_at(i);
        wbuf.write_byte(tag.type());
        write_nbt_string(wbuf, compound.names()[i]);
        write_payload(wbuf, tag);
    }

    wbuf.write_byte(TAG_END);
}

static void write_payload(WriteBuffer& wbuf, const NBTTag& tag)
{
    switch (tag.type())
    {
        case TAG_BYTE:
            wbuf.write_byte(*tag.as<int8_t>());
            break;
        case TAG_SHORT:
            wbuf.write_short(*tag.as<int16_t>());
            break;
        case TAG_INT:
            wbuf.write_int(*tag.as<int32_t>());
            break;
        case TAG_LONG:
            wbuf.write_long(*tag.as<int64_t>());
            break;
        case TAG_FLOAT:
            wbuf.write_float(*tag.as<float>());
            break;
        case TAG_DOUBLE:
            wbuf.write_double(*tag.as<double>());
            break;
        case TAG_BYTE_ARRAY:
        {
            const auto& array = *tag.as<std::vector<int8_t>>();
            wbuf.write_int(static_cast<int32_t>(array.size()));
            wbuf.write_bytes(reinterpret_cast<const char*>(array.data()), array.size());
            break;
        }
        case TAG_STRING:
            write_nbt_string(wbuf, *tag.as<std::string>());
            break;
        case TAG_LIST:
        {
            const auto& list = *tag.as<NBTList>();
            wbuf.write_byte(list.element_type());
            wbuf.write_int(static_cast<int32_t>(list.size()));

            for (size_t i = 0; i < list.size(); ++i)
            {
                write_payload(wbuf, list.at(i));
            }
            break;
        }
        case TAG_COMPOUND:
            write_compound(wbuf, *tag.as<NBTCompound>());
            break;
        case TAG_INT_ARRAY:
        {
            const auto& array = *tag.as<std::vector<int32_t>>();
            wbuf.write_int(static_cast<int32_t>(array.size()));

            for (int32_t x : array)
            {
                wbuf.write_int(x);
            }
            break;
        }
        case TAG_LONG_ARRAY:
        {
            const auto& array = *tag.as<std::vector<int64_t>>();
            wbuf.write_int(static_cast<int32_t>(array.size()));

            for (int64_t x : array)
            {
                wbuf.write_long(x);
            }
            break;
        }
        default:
            break;
    }
}

void nbt_write_root(WriteBuffer& wbuf, const std::string& name, const NBTCompound& compound)
{
    wbuf.write_byte(TAG_COMPOUND);
    write_nbt_string(wbuf, name);
    write_compound(wbuf, compound);
}
