#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Row 0 is the header row (the key), rows 1..n hold the content.
class CharMatrix
{
public:
	CharMatrix(std::size_t rows, std::size_t columns);

	std::size_t rows() const noexcept { return rows_; }
	std::size_t columns() const noexcept { return columns_; }

	char& at(std::size_t row, std::size_t column);
	char at(std::size_t row, std::size_t column) const;

	std::string header() const;

private:
	std::size_t rows_;
	std::size_t columns_;
	std::vector<char> cells_;
};

class Transposition
{
public:
	// Largest multiple of divisor not above length. Throws std::invalid_argument on divisor == 0.
	static std::size_t truncateToMultipleOf(std::size_t length, std::size_t divisor);

	// (truncated length / columns) content rows + 1 header row.
	// Up to columns-1 trailing content characters do not fit and are lost.
	static CharMatrix createSized(std::size_t contentLength, std::size_t columns);

	static CharMatrix fillRowMajor(const std::string& header, const std::string& content);
	static CharMatrix fillColumnMajor(const std::string& header, const std::string& content);

	// Destination column c takes source column indices[c], header row included.
	static CharMatrix reorderColumns(const CharMatrix& matrix, const std::vector<std::size_t>& indices);

	// Both readers skip the header row
	static std::string readRowMajor(const CharMatrix& matrix);
	static std::string readColumnMajor(const CharMatrix& matrix);
};
