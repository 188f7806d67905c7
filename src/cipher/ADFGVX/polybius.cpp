#include "cipher/ADFGVX/polybius.hpp"

// ================= Kwadrat Polibiusza 6x6 =================

const PolybiusSquare::Grid PolybiusSquare::grid = {{
    {{ 'P', 'H', '0', 'Q', 'G', '6' }},
    {{ '4', 'M', 'E', 'A', '1', 'Y' }},
    {{ 'L', '2', 'N', 'O', 'F', 'D' }},
    {{ 'X', 'K', 'R', '3', 'C', 'V' }},
    {{ 'S', '5', 'Z', 'W', '7', 'B' }},
    {{ 'J', '9', 'U', 'T', 'I', '8' }}
}};

const PolybiusSquare::Alphabet PolybiusSquare::symbols = { 'A', 'D', 'F', 'G', 'V', 'X' };

std::optional<SymbolPair> PolybiusSquare::encodeChar(char c)
{
    for (std::size_t row = 0; row < SIZE; ++row) {
        for (std::size_t col = 0; col < SIZE; ++col) {
            if (grid[row][col] == c)
                return SymbolPair{ symbols[row], symbols[col] };
        }
    }
    return std::nullopt;
}

std::optional<char> PolybiusSquare::decodeSymbolPair(char rowSymbol, char columnSymbol)
{
    int row = symbolIndex(rowSymbol);
    int col = symbolIndex(columnSymbol);
    if (row < 0 || col < 0)
        return std::nullopt;
    return grid[row][col];
}

int PolybiusSquare::symbolIndex(char s)
{
    for (std::size_t i = 0; i < SIZE; ++i) {
        if (symbols[i] == s)
            return static_cast<int>(i);
    }
    return -1;
}

bool PolybiusSquare::isSymbol(char s)
{
    return symbolIndex(s) >= 0;
}
