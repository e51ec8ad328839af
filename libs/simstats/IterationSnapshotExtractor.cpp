// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "IterationSnapshotExtractor.h"
#include "SimStatsException.h"

namespace simcompare
{
  IterationSnapshotExtractor::IterationSnapshotExtractor(std::vector<std::size_t> iterations)
    : mIterations(std::move(iterations))
  {
    if (mIterations.empty())
      throw InvalidParameterException("IterationSnapshotExtractor: at least one iteration is required");

    for (std::size_t it : mIterations)
      if (it == 0)
	throw IndexOutOfRangeException("IterationSnapshotExtractor: iterations are 1-based; got 0");
  }

  SummaryNames IterationSnapshotExtractor::getSummaryNames() const
  {
    SummaryNames names;
    for (std::size_t it : mIterations)
      {
	names.text.push_back("it" + std::to_string(it));
	names.latex.push_back("$i_{" + std::to_string(it) + "}$");
      }
    return names;
  }

  std::string IterationSnapshotExtractor::getName() const
  {
    return "iterations";
  }

  NumericMatrix IterationSnapshotExtractor::extract(const NumericMatrix& table,
						    std::size_t numOutputs) const
  {
    checkOutputCount(table, numOutputs);

    NumericMatrix summaries(mIterations.size(), numOutputs);

    for (std::size_t j = 0; j < mIterations.size(); ++j)
      {
	const std::size_t it = mIterations[j];
	if (it > table.getNumRows())
	  throw IndexOutOfRangeException("Iteration " + std::to_string(it)
					 + " requested but table has only "
					 + std::to_string(table.getNumRows()) + " iterations");

	for (std::size_t o = 0; o < numOutputs; ++o)
	  summaries(j, o) = table(it - 1, o);
      }

    return summaries;
  }
}
