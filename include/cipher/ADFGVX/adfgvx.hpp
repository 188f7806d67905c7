#pragma once
#include <string>
#include <cipher/cipher.hpp>
#include <cipher/ADFGVX/keySchedule.hpp>

// ADFGVX field cipher: Polybius substitution followed by a keyed columnar transposition.
// Stateless, safe to share between threads.
class ADFGVX : public TextCipher
{
public:
	// plaintext must be A-Z0-9 only
	CipherResult encrypt(const std::string& plaintext, const std::string& key) const override;

	// ciphertext must be ADFGVX only
	CipherResult decrypt(const std::string& ciphertext, const std::string& key) const override;

	// Polybius stage on its own, exposed for tests and tools
	static CipherResult substitute(const std::string& plaintext);
	static CipherResult resolvePairs(const std::string& symbols);
};
