// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SteadyStateSummaryExtractor.h"
#include "SampleMoments.h"
#include "SimStatsException.h"

namespace simcompare
{
  SteadyStateSummaryExtractor::SteadyStateSummaryExtractor(std::size_t steadyStateStart)
    : mSteadyStateStart(steadyStateStart)
  {
    if (mSteadyStateStart == 0)
      throw IndexOutOfRangeException("Steady-state start iteration is 1-based; got 0");
  }

  SummaryNames SteadyStateSummaryExtractor::getSummaryNames() const
  {
    return SummaryNames{
      {"max", "argmax", "min", "argmin", "mean", "std"},
      {"$\\max$", "$\\operatorname{arg\\,max}$", "$\\min$",
       "$\\operatorname{arg\\,min}$", "$\\bar{X}^{ss}$", "$S^{ss}$"}
    };
  }

  std::string SteadyStateSummaryExtractor::getName() const
  {
    return "steady-state";
  }

  NumericMatrix SteadyStateSummaryExtractor::extract(const NumericMatrix& table,
						     std::size_t numOutputs) const
  {
    checkOutputCount(table, numOutputs);

    const std::size_t numIterations = table.getNumRows();
    if (mSteadyStateStart > numIterations)
      throw IndexOutOfRangeException("Steady-state start iteration "
				     + std::to_string(mSteadyStateStart)
				     + " is beyond the " + std::to_string(numIterations)
				     + " available iterations");

    NumericMatrix summaries(NumSummaries, numOutputs);

    for (std::size_t o = 0; o < numOutputs; ++o)
      {
	std::size_t argMax = 0;
	std::size_t argMin = 0;

	// Strict comparisons keep the first occurrence of a tied extreme.
	for (std::size_t i = 1; i < numIterations; ++i)
	  {
	    if (table(i, o) > table(argMax, o))
	      argMax = i;
	    if (table(i, o) < table(argMin, o))
	      argMin = i;
	  }

	std::vector<double> steadyState;
	steadyState.reserve(numIterations - mSteadyStateStart + 1);
	for (std::size_t i = mSteadyStateStart - 1; i < numIterations; ++i)
	  steadyState.push_back(table(i, o));

	const SampleMoments moments = computeSampleMoments(steadyState);

	summaries(Max, o) = table(argMax, o);
	summaries(ArgMax, o) = static_cast<double>(argMax + 1);
	summaries(Min, o) = table(argMin, o);
	summaries(ArgMin, o) = static_cast<double>(argMin + 1);
	summaries(SteadyStateMean, o) = moments.mean;
	summaries(SteadyStateStdDev, o) = steadyState.size() > 1 ? moments.getStdDev() : 0.0;
      }

    return summaries;
  }
}
