#pragma once

#include <juce_core/juce_core.h>
#include <string>

namespace shapegrid {

namespace IdGenerator {

    static constexpr int DefaultLength = 6;
    static constexpr const char* Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    static constexpr int AlphabetSize = 36;

    // Uniform draw from A-Z0-9, redrawn until it misses `existing`.
    // Container is anything with count(std::string): set or map keyed by ID.
    template <typename Container>
    std::string generateUniqueId(const Container& existing, juce::Random& random,
                                 int length = DefaultLength)
    {
        for (;;) {
            std::string id;
            id.reserve((size_t)length);
            for (int i = 0; i < length; ++i)
                id.push_back(Alphabet[random.nextInt(AlphabetSize)]);
            if (existing.count(id) == 0)
                return id;
        }
    }

    inline bool isValidId(const std::string& id, int length = DefaultLength)
    {
        if ((int)id.size() != length) return false;
        for (char c : id)
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')))
                return false;
        return true;
    }

} // namespace IdGenerator

} // namespace shapegrid
