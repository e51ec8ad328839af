// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "NumericMatrix.h"
#include "SimStatsException.h"
#include <algorithm>
#include <string>

namespace simcompare
{
  NumericMatrix::NumericMatrix()
    : mNumRows(0),
      mNumColumns(0),
      mValues()
  {}

  NumericMatrix::NumericMatrix(std::size_t numRows, std::size_t numColumns, double fill)
    : mNumRows(numRows),
      mNumColumns(numColumns),
      mValues(numRows * numColumns, fill)
  {}

  NumericMatrix::NumericMatrix(std::initializer_list<std::initializer_list<double>> rows)
    : mNumRows(rows.size()),
      mNumColumns(rows.size() ? rows.begin()->size() : 0),
      mValues()
  {
    mValues.reserve(mNumRows * mNumColumns);
    for (const auto& row : rows)
      {
	if (row.size() != mNumColumns)
	  throw ArgumentMismatchException("NumericMatrix: all rows must have "
					  + std::to_string(mNumColumns) + " columns");
	mValues.insert(mValues.end(), row.begin(), row.end());
      }
  }

  NumericMatrix NumericMatrix::fromRows(const std::vector<std::vector<double>>& rows)
  {
    const std::size_t numColumns = rows.empty() ? 0 : rows.front().size();
    NumericMatrix result(rows.size(), numColumns);

    for (std::size_t r = 0; r < rows.size(); ++r)
      result.setRow(r, rows[r]);

    return result;
  }

  double NumericMatrix::at(std::size_t row, std::size_t column) const
  {
    if (row >= mNumRows || column >= mNumColumns)
      throw IndexOutOfRangeException("NumericMatrix::at: (" + std::to_string(row) + ", "
				     + std::to_string(column) + ") outside "
				     + std::to_string(mNumRows) + " x "
				     + std::to_string(mNumColumns) + " matrix");
    return (*this)(row, column);
  }

  std::vector<double> NumericMatrix::getRow(std::size_t row) const
  {
    if (row >= mNumRows)
      throw IndexOutOfRangeException("NumericMatrix::getRow: row " + std::to_string(row)
				     + " outside " + std::to_string(mNumRows) + " rows");

    auto first = mValues.begin() + static_cast<std::ptrdiff_t>(row * mNumColumns);
    return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(mNumColumns));
  }

  std::vector<double> NumericMatrix::getColumn(std::size_t column) const
  {
    if (column >= mNumColumns)
      throw IndexOutOfRangeException("NumericMatrix::getColumn: column " + std::to_string(column)
				     + " outside " + std::to_string(mNumColumns) + " columns");

    std::vector<double> values;
    values.reserve(mNumRows);
    for (std::size_t r = 0; r < mNumRows; ++r)
      values.push_back((*this)(r, column));

    return values;
  }

  void NumericMatrix::setRow(std::size_t row, const std::vector<double>& values)
  {
    if (row >= mNumRows)
      throw IndexOutOfRangeException("NumericMatrix::setRow: row " + std::to_string(row)
				     + " outside " + std::to_string(mNumRows) + " rows");
    if (values.size() != mNumColumns)
      throw ArgumentMismatchException("NumericMatrix::setRow: expected "
				      + std::to_string(mNumColumns) + " values, got "
				      + std::to_string(values.size()));

    std::copy(values.begin(), values.end(),
	      mValues.begin() + static_cast<std::ptrdiff_t>(row * mNumColumns));
  }

  NumericMatrix NumericMatrix::transpose() const
  {
    NumericMatrix result(mNumColumns, mNumRows);

    for (std::size_t r = 0; r < mNumRows; ++r)
      for (std::size_t c = 0; c < mNumColumns; ++c)
	result(c, r) = (*this)(r, c);

    return result;
  }

  std::vector<double> NumericMatrix::flattenColumnMajor() const
  {
    std::vector<double> flat;
    flat.reserve(mValues.size());

    for (std::size_t c = 0; c < mNumColumns; ++c)
      for (std::size_t r = 0; r < mNumRows; ++r)
	flat.push_back((*this)(r, c));

    return flat;
  }

  NumericMatrix NumericMatrix::fromColumnMajor(const std::vector<double>& values,
					       std::size_t numRows,
					       std::size_t numColumns)
  {
    if (values.size() != numRows * numColumns)
      throw ArgumentMismatchException("NumericMatrix::fromColumnMajor: "
				      + std::to_string(values.size())
				      + " values cannot fill a "
				      + std::to_string(numRows) + " x "
				      + std::to_string(numColumns) + " matrix");

    NumericMatrix result(numRows, numColumns);
    std::size_t k = 0;
    for (std::size_t c = 0; c < numColumns; ++c)
      for (std::size_t r = 0; r < numRows; ++r)
	result(r, c) = values[k++];

    return result;
  }

  bool NumericMatrix::operator==(const NumericMatrix& rhs) const
  {
    return mNumRows == rhs.mNumRows
      && mNumColumns == rhs.mNumColumns
      && mValues == rhs.mValues;
  }

  std::ostream& operator<<(std::ostream& os, const NumericMatrix& matrix)
  {
    for (std::size_t r = 0; r < matrix.getNumRows(); ++r)
      {
	for (std::size_t c = 0; c < matrix.getNumColumns(); ++c)
	  {
	    if (c > 0)
	      os << '\t';
	    os << matrix(r, c);
	  }
	os << '\n';
      }
    return os;
  }

} // namespace simcompare
