// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __NUMERIC_TABLE_READER_H
#define __NUMERIC_TABLE_READER_H 1

#include <istream>
#include <string>
#include "NumericMatrix.h"

namespace simcompare
{
  /**
   * @brief Reads a whitespace or tab delimited table of numbers.
   *
   * Each non-blank line is one iteration of a simulation run and each field
   * (separated by blanks, tabs or commas)
   * one output. Every line must carry the same number of fields.
   */
  class NumericTableReader
  {
  public:
    // Throws TableReadException when the file cannot be opened or parsed.
    static NumericMatrix read(const std::string& fileName);

    // sourceName is only used in error messages.
    static NumericMatrix read(std::istream& input, const std::string& sourceName);

  private:
    NumericTableReader() = delete;
  };
}

#endif // __NUMERIC_TABLE_READER_H
