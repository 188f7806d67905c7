#include "cipher/ADFGVX/keySchedule.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

KeyError KeyScheduler::validate(const std::string& key)
{
    if (key.size() < MIN_KEY_LENGTH)
        return KeyError::TooShort;
    if (key.size() > MAX_KEY_LENGTH)
        return KeyError::TooLong;
    if (!std::all_of(key.begin(), key.end(), isAlphanumeric))
        return KeyError::NotAlphanumeric;
    if (hasDuplicateCharacters(key))
        return KeyError::HasDuplicates;
    return KeyError::None;
}

std::string KeyScheduler::sortLexicographically(const std::string& key)
{
    std::string sorted = key;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](char a, char b) { return static_cast<unsigned char>(a) < static_cast<unsigned char>(b); });
    return sorted;
}

std::vector<std::size_t> KeyScheduler::sortedColumnOrigins(const std::string& originalKey, const std::string& sortedKey)
{
    if (originalKey.size() != sortedKey.size())
        throw std::invalid_argument("sortedColumnOrigins: key lengths differ");

    std::vector<std::size_t> indices(sortedKey.size());
    std::vector<bool> used(originalKey.size(), false);

    for (std::size_t i = 0; i < sortedKey.size(); ++i) {
        bool found = false;
        for (std::size_t j = 0; j < originalKey.size(); ++j) {
            if (!used[j] && originalKey[j] == sortedKey[i]) {
                indices[i] = j;
                used[j] = true;
                found = true;
                break;
            }
        }
        if (!found)
            throw std::invalid_argument("sortedColumnOrigins: sorted key is not a permutation of the key");
    }
    return indices;
}

std::vector<std::size_t> KeyScheduler::invert(const std::vector<std::size_t>& sortedIndices)
{
    std::vector<std::size_t> inverse(sortedIndices.size());
    for (std::size_t i = 0; i < sortedIndices.size(); ++i) {
        if (sortedIndices[i] >= sortedIndices.size())
            throw std::invalid_argument("invert: index out of range");
        inverse[sortedIndices[i]] = i;
    }
    return inverse;
}

KeyError KeyScheduler::schedule(const std::string& key, KeySchedule& out)
{
    KeyError error = validate(key);
    if (error != KeyError::None)
        return error;

    KeySchedule ks;
    ks.originalKey = key;
    ks.sortedKey = sortLexicographically(key);
    ks.sortedKeyIndices = sortedColumnOrigins(ks.originalKey, ks.sortedKey);
    ks.originalKeyIndices = invert(ks.sortedKeyIndices);

    out = std::move(ks);
    return KeyError::None;
}

bool KeyScheduler::isAlphanumeric(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// O(n^2), n <= 16
bool KeyScheduler::hasDuplicateCharacters(const std::string& key)
{
    for (std::size_t i = 0; i < key.size(); ++i) {
        for (std::size_t j = i + 1; j < key.size(); ++j) {
            if (key[i] == key[j])
                return true;
        }
    }
    return false;
}
