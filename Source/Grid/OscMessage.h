#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace shapegrid {

// ============================================================
// OscMessage — minimal OSC 1.0 packet: address, type tags and
// int32 / float32 / string arguments. Enough for serialosc.
// ============================================================
class OscMessage {
public:
    struct Argument {
        char type = 'i';  // 'i', 'f' or 's'
        int32_t i = 0;
        float f = 0.0f;
        std::string s;
    };

    OscMessage() = default;
    explicit OscMessage(std::string address) : address_(std::move(address)) {}

    OscMessage& addInt(int32_t v)            { args_.push_back({'i', v, 0.0f, {}}); return *this; }
    OscMessage& addFloat(float v)            { args_.push_back({'f', 0, v, {}}); return *this; }
    OscMessage& addString(std::string v)     { args_.push_back({'s', 0, 0.0f, std::move(v)}); return *this; }

    const std::string& getAddress() const { return address_; }
    int numArgs() const { return (int)args_.size(); }
    const Argument& arg(int index) const { return args_[(size_t)index]; }

    // ",iii" style tag string without the comma
    std::string typeTags() const;

    // True if the type tags are exactly `tags` (e.g. "iii")
    bool matches(const std::string& address, const std::string& tags) const
    {
        return address_ == address && typeTags() == tags;
    }

    std::vector<uint8_t> toBytes() const;

    // Returns false for anything malformed; `out` is then unspecified
    static bool parse(const uint8_t* data, int length, OscMessage& out);

private:
    std::string address_;
    std::vector<Argument> args_;
};

} // namespace shapegrid
