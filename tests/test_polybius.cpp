#include <gtest/gtest.h>
#include "cipher/ADFGVX/polybius.hpp"
#include <set>
#include <string>

static const std::string ALPHABET36 = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// Sprawdza, czy kazdy z 36 znakow wraca do siebie po zakodowaniu i odkodowaniu
TEST(Polybius, SubstitutionBijection)
{
    for (char c : ALPHABET36) {
        auto pair = PolybiusSquare::encodeChar(c);
        ASSERT_TRUE(pair.has_value()) << "No pair for " << c;

        auto back = PolybiusSquare::decodeSymbolPair(pair->row, pair->column);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, c);
    }
}

// Kazda para symboli jest unikalna
TEST(Polybius, PairsAreDistinct)
{
    std::set<std::string> seen;
    for (char c : ALPHABET36) {
        auto pair = PolybiusSquare::encodeChar(c);
        ASSERT_TRUE(pair.has_value());
        EXPECT_TRUE(seen.insert(std::string{ pair->row, pair->column }).second);
    }
    EXPECT_EQ(seen.size(), 36u);
}

TEST(Polybius, KnownCells)
{
    auto p = PolybiusSquare::encodeChar('P');
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->row, 'A');
    EXPECT_EQ(p->column, 'A');

    // row D (1), column G (3)
    auto a = PolybiusSquare::encodeChar('A');
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->row, 'D');
    EXPECT_EQ(a->column, 'G');

    auto eight = PolybiusSquare::encodeChar('8');
    ASSERT_TRUE(eight.has_value());
    EXPECT_EQ(eight->row, 'X');
    EXPECT_EQ(eight->column, 'X');

    EXPECT_EQ(PolybiusSquare::decodeSymbolPair('V', 'F').value_or('?'), 'Z');
    EXPECT_EQ(PolybiusSquare::decodeSymbolPair('A', 'F').value_or('?'), '0');
}

TEST(Polybius, UnmappableCharacters)
{
    EXPECT_FALSE(PolybiusSquare::encodeChar('a').has_value());
    EXPECT_FALSE(PolybiusSquare::encodeChar(' ').has_value());
    EXPECT_FALSE(PolybiusSquare::encodeChar('-').has_value());
    EXPECT_FALSE(PolybiusSquare::encodeChar('\0').has_value());
}

TEST(Polybius, InvalidSymbols)
{
    EXPECT_FALSE(PolybiusSquare::decodeSymbolPair('Z', 'A').has_value());
    EXPECT_FALSE(PolybiusSquare::decodeSymbolPair('A', 'Z').has_value());
    // lowercase is not part of the alphabet
    EXPECT_FALSE(PolybiusSquare::decodeSymbolPair('a', 'd').has_value());

    EXPECT_EQ(PolybiusSquare::symbolIndex('A'), 0);
    EXPECT_EQ(PolybiusSquare::symbolIndex('X'), 5);
    EXPECT_EQ(PolybiusSquare::symbolIndex('B'), -1);
    EXPECT_TRUE(PolybiusSquare::isSymbol('V'));
    EXPECT_FALSE(PolybiusSquare::isSymbol('v'));
}
