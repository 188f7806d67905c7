#include "cipher/ADFGVX/matrix.hpp"
#include <stdexcept>

CharMatrix::CharMatrix(std::size_t rows, std::size_t columns)
    : rows_(rows), columns_(columns), cells_(rows * columns, '\0')
{
}

char& CharMatrix::at(std::size_t row, std::size_t column)
{
    if (row >= rows_ || column >= columns_)
        throw std::out_of_range("CharMatrix::at: index out of range");
    return cells_[row * columns_ + column];
}

char CharMatrix::at(std::size_t row, std::size_t column) const
{
    if (row >= rows_ || column >= columns_)
        throw std::out_of_range("CharMatrix::at: index out of range");
    return cells_[row * columns_ + column];
}

std::string CharMatrix::header() const
{
    if (rows_ == 0)
        return {};
    return std::string(cells_.begin(), cells_.begin() + columns_);
}

std::size_t Transposition::truncateToMultipleOf(std::size_t length, std::size_t divisor)
{
    if (divisor == 0)
        throw std::invalid_argument("truncateToMultipleOf: divisor must be non-zero");
    return length - (length % divisor);
}

CharMatrix Transposition::createSized(std::size_t contentLength, std::size_t columns)
{
    std::size_t usable = truncateToMultipleOf(contentLength, columns);
    return CharMatrix(usable / columns + 1, columns);
}

CharMatrix Transposition::fillRowMajor(const std::string& header, const std::string& content)
{
    CharMatrix matrix = createSized(content.size(), header.size());

    for (std::size_t col = 0; col < matrix.columns(); ++col)
        matrix.at(0, col) = header[col];

    std::size_t pos = 0;
    for (std::size_t row = 1; row < matrix.rows(); ++row) {
        for (std::size_t col = 0; col < matrix.columns(); ++col)
            matrix.at(row, col) = content[pos++];
    }
    return matrix;
}

CharMatrix Transposition::fillColumnMajor(const std::string& header, const std::string& content)
{
    CharMatrix matrix = createSized(content.size(), header.size());

    for (std::size_t col = 0; col < matrix.columns(); ++col)
        matrix.at(0, col) = header[col];

    std::size_t pos = 0;
    for (std::size_t col = 0; col < matrix.columns(); ++col) {
        for (std::size_t row = 1; row < matrix.rows(); ++row)
            matrix.at(row, col) = content[pos++];
    }
    return matrix;
}

CharMatrix Transposition::reorderColumns(const CharMatrix& matrix, const std::vector<std::size_t>& indices)
{
    if (indices.size() != matrix.columns())
        throw std::invalid_argument("reorderColumns: index count does not match column count");

    CharMatrix reordered(matrix.rows(), matrix.columns());
    for (std::size_t row = 0; row < matrix.rows(); ++row) {
        for (std::size_t col = 0; col < matrix.columns(); ++col)
            reordered.at(row, col) = matrix.at(row, indices[col]);
    }
    return reordered;
}

std::string Transposition::readRowMajor(const CharMatrix& matrix)
{
    std::string out;
    if (matrix.rows() > 1)
        out.reserve((matrix.rows() - 1) * matrix.columns());

    for (std::size_t row = 1; row < matrix.rows(); ++row) {
        for (std::size_t col = 0; col < matrix.columns(); ++col)
            out.push_back(matrix.at(row, col));
    }
    return out;
}

std::string Transposition::readColumnMajor(const CharMatrix& matrix)
{
    std::string out;
    if (matrix.rows() > 1)
        out.reserve((matrix.rows() - 1) * matrix.columns());

    for (std::size_t col = 0; col < matrix.columns(); ++col) {
        for (std::size_t row = 1; row < matrix.rows(); ++row)
            out.push_back(matrix.at(row, col));
    }
    return out;
}
