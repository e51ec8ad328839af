// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __GATHERED_DATASET_H
#define __GATHERED_DATASET_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "NumericMatrix.h"
#include "OutputNames.h"
#include "SummaryExtractor.h"

namespace simcompare
{
  /**
   * @brief Summaries of every replication of one model configuration.
   *
   * Row r of getData() holds the summaries of file r. Column
   * output * getNumSummaries() + summary holds one focal measure, i.e. the
   * summaries of an output are contiguous. Instances are immutable.
   */
  class GatheredDataset
  {
  public:
    /**
     * @throws ArgumentMismatchException if data does not have
     *         outputs.size() * summaryNames.size() columns or the two label
     *         lists differ in length.
     * @throws InvalidParameterException if data has no rows.
     */
    GatheredDataset(std::string name,
		    OutputNames outputs,
		    SummaryNames summaryNames,
		    NumericMatrix data);

    const std::string& getName() const
    {
      return mName;
    }

    const OutputNames& getOutputs() const
    {
      return mOutputs;
    }

    const SummaryNames& getSummaryNames() const
    {
      return mSummaryNames;
    }

    const NumericMatrix& getData() const
    {
      return mData;
    }

    std::size_t getNumOutputs() const
    {
      return mOutputs.size();
    }

    std::size_t getNumSummaries() const
    {
      return mSummaryNames.size();
    }

    std::size_t getNumObservations() const
    {
      return mData.getNumRows();
    }

    std::size_t getNumFocalMeasures() const
    {
      return mData.getNumColumns();
    }

    std::size_t getColumnIndex(std::size_t output, std::size_t summary) const;

    // All observations of one focal measure.
    std::vector<double> getFocalMeasure(std::size_t output, std::size_t summary) const;

    // Observation row reshaped back to summaries x outputs.
    NumericMatrix getSummaryBlock(std::size_t observation) const;

  private:
    std::string mName;
    OutputNames mOutputs;
    SummaryNames mSummaryNames;
    NumericMatrix mData;
  };
}

#endif // __GATHERED_DATASET_H
