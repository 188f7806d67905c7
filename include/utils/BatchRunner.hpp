#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace utils {

	struct BatchJob {
		std::string source;
		std::string text;
	};

	struct BatchOptions {
		std::string operation = "encrypt"; // encrypt | decrypt
		std::string key;
		std::string text;                  // inline input
		std::string input;                 // file or directory
		std::string outputDir;             // empty: caller prints the results
		bool raw = false;                  // skip cleaning and ciphertext validation
		std::ostream* log = nullptr;       // progress lines, nullptr = silent
	};

	struct BatchOutcome {
		std::vector<std::string> results;
		std::vector<std::filesystem::path> written;
	};

	// Runs one CLI invocation. Every check and every job runs before anything is written,
	// so a thrown error leaves the output directory untouched.
	class BatchRunner {
	public:
		static BatchOutcome execute(const BatchOptions& options);

		// Throws std::runtime_error with the key validation reason
		static void validateKey(const std::string& key);

		static std::vector<BatchJob> loadJobs(const std::string& text, const std::string& input, std::ostream* log = nullptr);

		// Throws "Found N invalid characters in the cipher text." summed over all jobs
		static void validateCiphertext(const std::vector<BatchJob>& jobs);
	};

} // namespace utils
