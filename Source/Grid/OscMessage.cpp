#include "OscMessage.h"
#include <cstring>

namespace shapegrid {

namespace {

    // OSC string: null-terminated, padded to 4-byte boundary
    void writeString(std::vector<uint8_t>& buf, const std::string& s)
    {
        for (char c : s) buf.push_back((uint8_t)c);
        buf.push_back(0);
        while (buf.size() % 4 != 0) buf.push_back(0);
    }

    // OSC int32: big-endian
    void writeInt32(std::vector<uint8_t>& buf, int32_t val)
    {
        buf.push_back((uint8_t)((val >> 24) & 0xFF));
        buf.push_back((uint8_t)((val >> 16) & 0xFF));
        buf.push_back((uint8_t)((val >> 8) & 0xFF));
        buf.push_back((uint8_t)(val & 0xFF));
    }

    void writeFloat32(std::vector<uint8_t>& buf, float val)
    {
        uint32_t bits;
        std::memcpy(&bits, &val, 4);
        writeInt32(buf, (int32_t)bits);
    }

    bool readString(const uint8_t* data, int length, int& offset, std::string& out)
    {
        int start = offset;
        while (offset < length && data[offset] != 0) ++offset;
        if (offset >= length) return false;
        out.assign((const char*)data + start, (size_t)(offset - start));
        ++offset;
        while (offset % 4 != 0) ++offset;
        return offset <= length;
    }

    bool readInt32(const uint8_t* data, int length, int& offset, int32_t& out)
    {
        if (offset + 4 > length) return false;
        uint32_t v = ((uint32_t)data[offset] << 24) | ((uint32_t)data[offset + 1] << 16)
                   | ((uint32_t)data[offset + 2] << 8) | (uint32_t)data[offset + 3];
        offset += 4;
        out = (int32_t)v;
        return true;
    }

} // namespace

std::string OscMessage::typeTags() const
{
    std::string tags;
    for (auto& a : args_) tags.push_back(a.type);
    return tags;
}

std::vector<uint8_t> OscMessage::toBytes() const
{
    std::vector<uint8_t> buf;
    writeString(buf, address_);
    writeString(buf, "," + typeTags());
    for (auto& a : args_) {
        switch (a.type) {
            case 'i': writeInt32(buf, a.i); break;
            case 'f': writeFloat32(buf, a.f); break;
            case 's': writeString(buf, a.s); break;
            default: break;
        }
    }
    return buf;
}

bool OscMessage::parse(const uint8_t* data, int length, OscMessage& out)
{
    if (data == nullptr || length < 4 || length % 4 != 0) return false;

    int offset = 0;
    out = OscMessage();
    if (!readString(data, length, offset, out.address_)) return false;
    if (out.address_.empty() || out.address_[0] != '/') return false;

    // A message without a type tag string carries no arguments
    if (offset >= length) return true;

    std::string tags;
    if (!readString(data, length, offset, tags)) return false;
    if (tags.empty() || tags[0] != ',') return false;

    for (size_t t = 1; t < tags.size(); ++t) {
        Argument a;
        a.type = tags[t];
        switch (a.type) {
            case 'i':
                if (!readInt32(data, length, offset, a.i)) return false;
                break;
            case 'f': {
                int32_t bits;
                if (!readInt32(data, length, offset, bits)) return false;
                std::memcpy(&a.f, &bits, 4);
                break;
            }
            case 's':
                if (!readString(data, length, offset, a.s)) return false;
                break;
            default:
                return false;  // blobs and the rest are not used by serialosc
        }
        out.args_.push_back(std::move(a));
    }
    return true;
}

} // namespace shapegrid
