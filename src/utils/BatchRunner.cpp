#include "utils/BatchRunner.hpp"
#include "cipher/ADFGVX/adfgvx.hpp"
#include "cipher/ADFGVX/keySchedule.hpp"
#include "utils/FileBatch.hpp"
#include "utils/TextCleaner.hpp"
#include <ostream>
#include <stdexcept>
#include <utility>

namespace utils {

	namespace {

		void progress(std::ostream* log, const std::string& message) {
			if (log) {
				*log << "[*] " << message << "\n";
			}
		}

	} // namespace

	void BatchRunner::validateKey(const std::string& key) {
		KeyError error = KeyScheduler::validate(key);
		if (error != KeyError::None) {
			CipherError details;
			details.kind = CipherErrorKind::InvalidKey;
			details.keyError = error;
			throw std::runtime_error("The key " + key + " is invalid: " + describe(details));
		}
	}

	std::vector<BatchJob> BatchRunner::loadJobs(const std::string& text, const std::string& input, std::ostream* log) {
		if (!text.empty()) {
			return { BatchJob{ "--text", text } };
		}

		std::vector<BatchJob> jobs;
		for (const auto& file : FileBatch::collectInputFiles(input)) {
			progress(log, "Reading " + file.string());
			jobs.push_back(BatchJob{ file.string(), FileBatch::readLines(file) });
		}
		return jobs;
	}

	void BatchRunner::validateCiphertext(const std::vector<BatchJob>& jobs) {
		std::size_t invalid = 0;
		for (const auto& job : jobs) {
			invalid += TextCleaner::countInvalidSymbols(job.text);
		}
		if (invalid > 0) {
			throw std::runtime_error("Found " + std::to_string(invalid) + " invalid characters in the cipher text.");
		}
	}

	BatchOutcome BatchRunner::execute(const BatchOptions& options) {
		if (options.operation != "encrypt" && options.operation != "decrypt") {
			throw std::runtime_error("Unknown operation: " + options.operation + ". Use 'encrypt' or 'decrypt'");
		}
		if (options.text.empty() == options.input.empty()) {
			throw std::runtime_error("Specify exactly one of --text or --input");
		}
		const bool encrypting = (options.operation == "encrypt");

		// Key first, before touching any input
		validateKey(options.key);

		std::vector<BatchJob> jobs = loadJobs(options.text, options.input, options.log);

		if (!encrypting && !options.raw) {
			validateCiphertext(jobs);
		}

		progress(options.log, encrypting ? "Encryption started" : "Decryption started");

		ADFGVX cipher;
		BatchOutcome outcome;
		outcome.results.reserve(jobs.size());

		for (const auto& job : jobs) {
			std::string prepared = job.text;
			if (!options.raw) {
				// After validateCiphertext only uppercase ADFGVX is left, so cleaning a
				// ciphertext changes nothing here. Kept for the validate-then-parse order.
				prepared = encrypting ? TextCleaner::cleanPlaintext(job.text)
				                      : TextCleaner::cleanCiphertext(job.text);
			}

			CipherResult result = encrypting ? cipher.encrypt(prepared, options.key) : cipher.decrypt(prepared, options.key);
			if (!result) {
				throw std::runtime_error("Error during " + options.operation + " of " + job.source + ": " + describe(result.error));
			}
			progress(options.log, job.source + ": " + std::to_string(prepared.size()) + " -> " + std::to_string(result.text.size()) + " characters");
			outcome.results.push_back(std::move(result.text));
		}

		if (!options.outputDir.empty()) {
			const std::string basename = encrypting ? "encrypted" : "decrypted";
			for (const auto& r : outcome.results) {
				outcome.written.push_back(FileBatch::writeNumbered(options.outputDir, basename, r));
				progress(options.log, "Wrote " + outcome.written.back().string());
			}
		}
		return outcome;
	}

} // namespace utils
