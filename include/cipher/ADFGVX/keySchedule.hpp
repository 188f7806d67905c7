#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <cipher/cipherResult.hpp>

struct KeySchedule {
	std::string originalKey;
	std::string sortedKey;
	// sortedKeyIndices[i] = original column of the char at sorted position i
	std::vector<std::size_t> sortedKeyIndices;
	// inverse of sortedKeyIndices
	std::vector<std::size_t> originalKeyIndices;
};

class KeyScheduler
{
public:
	static constexpr std::size_t MIN_KEY_LENGTH = 5;
	static constexpr std::size_t MAX_KEY_LENGTH = 16;

	static KeyError validate(const std::string& key);

	// Stable sort by code point: digits, then uppercase, then lowercase.
	static std::string sortLexicographically(const std::string& key);

	// For each sorted position take the first unclaimed original position holding the same char.
	// Throws std::invalid_argument if sortedKey is not a permutation of originalKey.
	static std::vector<std::size_t> sortedColumnOrigins(const std::string& originalKey, const std::string& sortedKey);

	static std::vector<std::size_t> invert(const std::vector<std::size_t>& sortedIndices);

	// Validates the key and fills out. out is left untouched on failure.
	static KeyError schedule(const std::string& key, KeySchedule& out);

private:
	static bool isAlphanumeric(char c);
	static bool hasDuplicateCharacters(const std::string& key);
};
