// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __NUMERIC_MATRIX_H
#define __NUMERIC_MATRIX_H 1

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <vector>

namespace simcompare
{
  /**
   * @brief Dense row-major matrix of doubles.
   *
   * Serves as the in-memory form of a simulation output table (rows are
   * iterations, columns are outputs), of a per-file summary block
   * (summaries x outputs), of a gathered dataset (observations x focal
   * measures) and of p-value tables.
   */
  class NumericMatrix
  {
  public:
    NumericMatrix();
    NumericMatrix(std::size_t numRows, std::size_t numColumns, double fill = 0.0);

    // Builds a matrix from nested rows; all rows must have the same length.
    NumericMatrix(std::initializer_list<std::initializer_list<double>> rows);

    static NumericMatrix fromRows(const std::vector<std::vector<double>>& rows);

    std::size_t getNumRows() const
    {
      return mNumRows;
    }

    std::size_t getNumColumns() const
    {
      return mNumColumns;
    }

    bool empty() const
    {
      return mValues.empty();
    }

    double& operator()(std::size_t row, std::size_t column)
    {
      return mValues[row * mNumColumns + column];
    }

    double operator()(std::size_t row, std::size_t column) const
    {
      return mValues[row * mNumColumns + column];
    }

    // Bounds-checked access; throws IndexOutOfRangeException.
    double at(std::size_t row, std::size_t column) const;

    std::vector<double> getRow(std::size_t row) const;
    std::vector<double> getColumn(std::size_t column) const;

    void setRow(std::size_t row, const std::vector<double>& values);

    NumericMatrix transpose() const;

    /**
     * @brief Flatten column by column into a single vector.
     *
     * For a summaries x outputs block this yields every summary of output 1,
     * then every summary of output 2, and so on, which is the column order of
     * a gathered dataset.
     */
    std::vector<double> flattenColumnMajor() const;

    // Inverse of flattenColumnMajor().
    static NumericMatrix fromColumnMajor(const std::vector<double>& values,
					 std::size_t numRows,
					 std::size_t numColumns);

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

    bool operator==(const NumericMatrix& rhs) const;
    bool operator!=(const NumericMatrix& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::size_t mNumRows;
    std::size_t mNumColumns;
    std::vector<double> mValues;
  };

  std::ostream& operator<<(std::ostream& os, const NumericMatrix& matrix);

} // namespace simcompare

#endif // __NUMERIC_MATRIX_H
