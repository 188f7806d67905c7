#include "cipher/ADFGVX/adfgvx.hpp"
#include "cipher/ADFGVX/matrix.hpp"
#include "cipher/ADFGVX/polybius.hpp"
#include <utility>

CipherResult ADFGVX::substitute(const std::string& plaintext)
{
    std::string symbols;
    symbols.reserve(plaintext.size() * 2);

    for (char c : plaintext) {
        auto pair = PolybiusSquare::encodeChar(c);
        if (!pair)
            return CipherResult::unmappableCharacter(c);
        symbols.push_back(pair->row);
        symbols.push_back(pair->column);
    }
    return CipherResult::success(std::move(symbols));
}

CipherResult ADFGVX::resolvePairs(const std::string& symbols)
{
    std::string plaintext;
    plaintext.reserve(symbols.size() / 2);

    // odd trailing symbol has no partner and is dropped
    for (std::size_t i = 0; i + 1 < symbols.size(); i += 2) {
        char rowSymbol = symbols[i];
        char columnSymbol = symbols[i + 1];
        auto c = PolybiusSquare::decodeSymbolPair(rowSymbol, columnSymbol);
        if (!c)
            return CipherResult::invalidSymbol(PolybiusSquare::isSymbol(rowSymbol) ? columnSymbol : rowSymbol);
        plaintext.push_back(*c);
    }
    return CipherResult::success(std::move(plaintext));
}

CipherResult ADFGVX::encrypt(const std::string& plaintext, const std::string& key) const
{
    KeySchedule ks;
    KeyError keyError = KeyScheduler::schedule(key, ks);
    if (keyError != KeyError::None)
        return CipherResult::invalidKey(keyError);

    CipherResult encoded = substitute(plaintext);
    if (!encoded)
        return encoded;

    // 1) wiersz 0 = klucz, tresc wierszami
    CharMatrix matrix = Transposition::fillRowMajor(ks.originalKey, encoded.text);
    // 2) kolumny wg kolejnosci posortowanego klucza
    CharMatrix reordered = Transposition::reorderColumns(matrix, ks.sortedKeyIndices);
    // 3) odczyt kolumnami
    return CipherResult::success(Transposition::readColumnMajor(reordered));
}

CipherResult ADFGVX::decrypt(const std::string& ciphertext, const std::string& key) const
{
    KeySchedule ks;
    KeyError keyError = KeyScheduler::schedule(key, ks);
    if (keyError != KeyError::None)
        return CipherResult::invalidKey(keyError);

    CharMatrix matrix = Transposition::fillColumnMajor(ks.sortedKey, ciphertext);
    CharMatrix restored = Transposition::reorderColumns(matrix, ks.originalKeyIndices);

    return resolvePairs(Transposition::readRowMajor(restored));
}
