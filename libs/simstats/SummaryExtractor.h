// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SUMMARY_EXTRACTOR_H
#define __SUMMARY_EXTRACTOR_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "NumericMatrix.h"

namespace simcompare
{
  /**
   * @brief Display labels of the summaries an extractor produces.
   *
   * text and latex are parallel: entry i of each names summary i.
   */
  struct SummaryNames
  {
    std::vector<std::string> text;
    std::vector<std::string> latex;

    std::size_t size() const
    {
      return text.size();
    }

    bool operator==(const SummaryNames& rhs) const
    {
      return text == rhs.text && latex == rhs.latex;
    }
  };

  /**
   * @brief Strategy that reduces one simulation output table to a small
   * block of statistical summaries.
   *
   * Parameters (steady-state start, iteration list, ...) are bound when the
   * strategy is constructed, so every file gathered with one instance is
   * summarised the same way.
   */
  class SummaryExtractor
  {
  public:
    virtual ~SummaryExtractor() = default;

    // Labels of the summaries, independent of any data.
    virtual SummaryNames getSummaryNames() const = 0;

    std::size_t getNumSummaries() const
    {
      return getSummaryNames().size();
    }

    /**
     * @brief Summarise the first numOutputs columns of table.
     *
     * @return numSummaries x numOutputs matrix.
     * @throws IndexOutOfRangeException if table is too short or too narrow
     *         for the requested iterations or outputs.
     */
    virtual NumericMatrix extract(const NumericMatrix& table, std::size_t numOutputs) const = 0;

    // Short identifier used in configuration files and reports.
    virtual std::string getName() const = 0;

  protected:
    // Shared check that table has at least numOutputs columns.
    static void checkOutputCount(const NumericMatrix& table, std::size_t numOutputs);
  };
}

#endif // __SUMMARY_EXTRACTOR_H
