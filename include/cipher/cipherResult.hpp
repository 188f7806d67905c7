#pragma once
#include <string>

// Reason a key was rejected. Checks run in this order, first failure wins.
enum class KeyError {
	None,
	TooShort,
	TooLong,
	NotAlphanumeric,
	HasDuplicates
};

enum class CipherErrorKind {
	None,
	InvalidKey,          // see KeyError
	UnmappableCharacter, // plaintext char outside the Polybius square
	InvalidSymbol        // ciphertext char outside ADFGVX
};

struct CipherError {
	CipherErrorKind kind = CipherErrorKind::None;
	KeyError keyError = KeyError::None;
	char character = '\0';
};

struct CipherResult {
	std::string text;
	CipherError error;

	bool ok() const noexcept { return error.kind == CipherErrorKind::None; }
	explicit operator bool() const noexcept { return ok(); }

	static CipherResult success(std::string text);
	static CipherResult invalidKey(KeyError reason);
	static CipherResult unmappableCharacter(char c);
	static CipherResult invalidSymbol(char c);
};

std::string toString(KeyError error);
std::string toString(CipherErrorKind kind);

// Human readable message for CLI / callers
std::string describe(const CipherError& error);
