#include "utils/FileBatch.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace utils {

	std::vector<fs::path> FileBatch::collectInputFiles(const fs::path& path) {
		std::error_code ec;
		if (!fs::exists(path, ec))
			throw std::runtime_error("The path does not exist: " + path.string());

		if (fs::is_regular_file(path, ec))
			return { path };

		if (!fs::is_directory(path, ec))
			throw std::runtime_error("The path is not a file or a directory: " + path.string());

		std::vector<fs::path> files;
		for (const auto& entry : fs::directory_iterator(path)) {
			if (entry.is_regular_file())
				files.push_back(entry.path());
		}
		std::sort(files.begin(), files.end());
		return files;
	}

	std::string FileBatch::readLines(const fs::path& file) {
		std::ifstream in(file);
		if (!in.is_open())
			throw std::runtime_error("Error reading file " + file.string());

		std::string content;
		std::string line;
		while (std::getline(in, line)) {
			// CRLF files
			if (!line.empty() && line.back() == '\r')
				line.pop_back();
			content += line;
		}
		if (in.bad())
			throw std::runtime_error("Error reading file " + file.string());
		return content;
	}

	fs::path FileBatch::writeNumbered(const fs::path& directory,
		const std::string& basename,
		const std::string& content) {
		std::error_code ec;
		fs::create_directories(directory, ec);
		if (ec)
			throw std::runtime_error("Cannot create directory " + directory.string() + ": " + ec.message());

		fs::path target;
		for (unsigned counter = 1;; ++counter) {
			target = directory / (basename + std::to_string(counter) + ".txt");
			if (!fs::exists(target))
				break;
		}

		std::ofstream out(target, std::ios::binary);
		if (!out.is_open())
			throw std::runtime_error("Failed to write to file: " + target.string());
		out << content;
		out.close();
		if (!out)
			throw std::runtime_error("Failed to write to file: " + target.string());
		return target;
	}

} // namespace utils
