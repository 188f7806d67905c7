#pragma once
#include <string>
#include <cipher/cipherResult.hpp>

class TextCipher {
public:
	virtual ~TextCipher() = default;

	// Encrypt the whole text with the given key
	virtual CipherResult encrypt(const std::string& plaintext, const std::string& key) const = 0;

	// Decrypt the whole text with the given key
	virtual CipherResult decrypt(const std::string& ciphertext, const std::string& key) const = 0;
};
