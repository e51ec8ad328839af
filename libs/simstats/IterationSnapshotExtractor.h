// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ITERATION_SNAPSHOT_EXTRACTOR_H
#define __ITERATION_SNAPSHOT_EXTRACTOR_H 1

#include <vector>
#include "SummaryExtractor.h"

namespace simcompare
{
  /**
   * @brief Uses the raw output values at chosen iterations as summaries.
   *
   * Summary j of an output is its value at iterations[j] (1-based), so the
   * number of summaries equals the number of requested iterations.
   */
  class IterationSnapshotExtractor : public SummaryExtractor
  {
  public:
    explicit IterationSnapshotExtractor(std::vector<std::size_t> iterations);

    SummaryNames getSummaryNames() const override;
    NumericMatrix extract(const NumericMatrix& table, std::size_t numOutputs) const override;
    std::string getName() const override;

    const std::vector<std::size_t>& getIterations() const
    {
      return mIterations;
    }

  private:
    std::vector<std::size_t> mIterations;
  };
}

#endif // __ITERATION_SNAPSHOT_EXTRACTOR_H
