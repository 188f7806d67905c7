#pragma once
#include <cstddef>
#include <string>

namespace utils {

	// Brings raw input into the form ADFGVX::encrypt / decrypt expect.
	class TextCleaner {
	public:
		// Per line: trim, keep [A-Za-z0-9] only, uppercase. Lines are concatenated.
		static std::string cleanPlaintext(const std::string& raw);

		// Per line: keep [ADFGVXadfgvx] only, uppercase. Lines are concatenated.
		static std::string cleanCiphertext(const std::string& raw);

		// Characters outside the uppercase ADFGVX alphabet
		static std::size_t countInvalidSymbols(const std::string& text);

		static bool isValidCiphertext(const std::string& text);
	};

} // namespace utils
