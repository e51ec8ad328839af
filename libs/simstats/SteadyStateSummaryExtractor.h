// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __STEADY_STATE_SUMMARY_EXTRACTOR_H
#define __STEADY_STATE_SUMMARY_EXTRACTOR_H 1

#include "SummaryExtractor.h"

namespace simcompare
{
  /**
   * @brief Six summaries per output: max, argmax, min, argmin, steady-state
   * mean and steady-state standard deviation.
   *
   * Iterations are numbered from 1. argmax and argmin report the first
   * iteration at which the extreme occurs. The steady-state mean and (n - 1)
   * standard deviation use only iterations steadyStateStart..end.
   */
  class SteadyStateSummaryExtractor : public SummaryExtractor
  {
  public:
    static constexpr std::size_t NumSummaries = 6;

    enum SummaryIndex
      {
	Max = 0,
	ArgMax,
	Min,
	ArgMin,
	SteadyStateMean,
	SteadyStateStdDev
      };

    // steadyStateStart is the first 1-based iteration of the steady state.
    explicit SteadyStateSummaryExtractor(std::size_t steadyStateStart);

    SummaryNames getSummaryNames() const override;
    NumericMatrix extract(const NumericMatrix& table, std::size_t numOutputs) const override;
    std::string getName() const override;

    std::size_t getSteadyStateStart() const
    {
      return mSteadyStateStart;
    }

  private:
    std::size_t mSteadyStateStart;
  };
}

#endif // __STEADY_STATE_SUMMARY_EXTRACTOR_H
