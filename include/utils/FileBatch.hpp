#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace utils {

	class FileBatch {
	public:
		// A regular file yields itself, a directory its regular files (not recursive), sorted.
		// Throws std::runtime_error if the path is missing or neither file nor directory.
		static std::vector<std::filesystem::path> collectInputFiles(const std::filesystem::path& path);

		// File contents with line breaks removed. Throws std::runtime_error if it cannot be opened.
		static std::string readLines(const std::filesystem::path& file);

		// Writes to the first free <basename><N>.txt in directory (N from 1), creating the directory if needed.
		// Returns the written path. Throws std::runtime_error on failure.
		static std::filesystem::path writeNumbered(const std::filesystem::path& directory,
			const std::string& basename,
			const std::string& content);
	};

} // namespace utils
