#include "utils/TextCleaner.hpp"
#include "cipher/ADFGVX/polybius.hpp"
#include <algorithm>
#include <sstream>

namespace utils {

	namespace {

		char toUpperAscii(char c) {
			if (c >= 'a' && c <= 'z')
				return static_cast<char>(c - 'a' + 'A');
			return c;
		}

		bool isAlnumAscii(char c) {
			return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
		}

		template<typename Keep>
		std::string cleanLines(const std::string& raw, Keep keep) {
			std::istringstream in(raw);
			std::string line;
			std::string out;
			out.reserve(raw.size());

			while (std::getline(in, line)) {
				for (char c : line) {
					if (keep(c))
						out.push_back(toUpperAscii(c));
				}
			}
			return out;
		}

	} // namespace

	// Trimming is implied: whitespace is never kept.
	std::string TextCleaner::cleanPlaintext(const std::string& raw) {
		return cleanLines(raw, isAlnumAscii);
	}

	std::string TextCleaner::cleanCiphertext(const std::string& raw) {
		return cleanLines(raw, [](char c) {
			return PolybiusSquare::isSymbol(toUpperAscii(c));
		});
	}

	std::size_t TextCleaner::countInvalidSymbols(const std::string& text) {
		return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
			[](char c) { return !PolybiusSquare::isSymbol(c); }));
	}

	bool TextCleaner::isValidCiphertext(const std::string& text) {
		return countInvalidSymbols(text) == 0;
	}

} // namespace utils
