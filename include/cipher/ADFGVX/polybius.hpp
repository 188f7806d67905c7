#pragma once
#include <array>
#include <cstddef>
#include <optional>

struct SymbolPair {
	char row;
	char column;
};

class PolybiusSquare
{
public:
	static constexpr std::size_t SIZE = 6;

	using Grid = std::array<std::array<char, SIZE>, SIZE>;
	using Alphabet = std::array<char, SIZE>;

	static const Grid grid;
	static const Alphabet symbols;

	// Row symbol first, then column symbol. nullopt if c is not in the grid.
	static std::optional<SymbolPair> encodeChar(char c);

	// nullopt if either symbol is outside the ADFGVX alphabet
	static std::optional<char> decodeSymbolPair(char rowSymbol, char columnSymbol);

	// -1 if s is not an ADFGVX symbol
	static int symbolIndex(char s);
	static bool isSymbol(char s);
};
