#include "cipher/cipherResult.hpp"
#include <utility>

CipherResult CipherResult::success(std::string text)
{
    CipherResult result;
    result.text = std::move(text);
    return result;
}

CipherResult CipherResult::invalidKey(KeyError reason)
{
    CipherResult result;
    result.error.kind = CipherErrorKind::InvalidKey;
    result.error.keyError = reason;
    return result;
}

CipherResult CipherResult::unmappableCharacter(char c)
{
    CipherResult result;
    result.error.kind = CipherErrorKind::UnmappableCharacter;
    result.error.character = c;
    return result;
}

CipherResult CipherResult::invalidSymbol(char c)
{
    CipherResult result;
    result.error.kind = CipherErrorKind::InvalidSymbol;
    result.error.character = c;
    return result;
}

std::string toString(KeyError error)
{
    switch (error) {
    case KeyError::None:            return "None";
    case KeyError::TooShort:        return "TooShort";
    case KeyError::TooLong:         return "TooLong";
    case KeyError::NotAlphanumeric: return "NotAlphanumeric";
    case KeyError::HasDuplicates:   return "HasDuplicates";
    }
    return "Unknown";
}

std::string toString(CipherErrorKind kind)
{
    switch (kind) {
    case CipherErrorKind::None:                return "None";
    case CipherErrorKind::InvalidKey:          return "InvalidKey";
    case CipherErrorKind::UnmappableCharacter: return "UnmappableCharacter";
    case CipherErrorKind::InvalidSymbol:       return "InvalidSymbol";
    }
    return "Unknown";
}

std::string describe(const CipherError& error)
{
    switch (error.kind) {
    case CipherErrorKind::None:
        return "no error";
    case CipherErrorKind::InvalidKey:
        switch (error.keyError) {
        case KeyError::TooShort:
            return "Key is too short (minimum 5 characters)";
        case KeyError::TooLong:
            return "Key is too long (maximum 16 characters)";
        case KeyError::NotAlphanumeric:
            return "Key contains invalid characters. Use alphanumeric characters only";
        case KeyError::HasDuplicates:
            return "Key contains duplicate characters";
        case KeyError::None:
            break;
        }
        return "Invalid key";
    case CipherErrorKind::UnmappableCharacter:
        return std::string("Character not in Polybius square: ") + error.character;
    case CipherErrorKind::InvalidSymbol:
        return std::string("Character not in the ADFGVX alphabet: ") + error.character;
    }
    return "unknown error";
}
