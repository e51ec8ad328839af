// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PairwiseConflictMatrix.h"
#include "SimStatsException.h"

namespace simcompare
{
  ConflictMatrix::ConflictMatrix(std::vector<std::string> datasetNames)
    : mNames(std::move(datasetNames)),
      mCounts(mNames.size() * mNames.size(), 0)
  {}

  std::size_t ConflictMatrix::at(std::size_t i, std::size_t j) const
  {
    if (i >= size() || j >= size())
      throw IndexOutOfRangeException("ConflictMatrix::at: (" + std::to_string(i) + ", "
				     + std::to_string(j) + ") outside "
				     + std::to_string(size()) + " x " + std::to_string(size()));
    return (*this)(i, j);
  }

  void ConflictMatrix::setConflicts(std::size_t i, std::size_t j, std::size_t failCount)
  {
    if (i >= size() || j >= size())
      throw IndexOutOfRangeException("ConflictMatrix::setConflicts: index outside matrix");
    if (i == j)
      throw InvalidParameterException("ConflictMatrix::setConflicts: the diagonal is always zero");

    mCounts[i * size() + j] = failCount;
    mCounts[j * size() + i] = failCount;
  }

  std::size_t ConflictMatrix::getTotalConflicts(std::size_t i) const
  {
    std::size_t total = 0;
    for (std::size_t j = 0; j < size(); ++j)
      total += at(i, j);
    return total;
  }

  ConflictMatrix PairwiseConflictMatrixBuilder::build(double alpha,
						      const TestSelector& selector,
						      const std::vector<GatheredDataset>& datasets)
  {
    if (datasets.size() < 2)
      throw ArgumentMismatchException("At least two datasets are required for a pairwise comparison; got "
				      + std::to_string(datasets.size()));

    std::vector<std::string> names;
    std::vector<const GatheredDataset*> all;
    for (const auto& ds : datasets)
      {
	names.push_back(ds.getName());
	all.push_back(&ds);
      }

    // Reports misalignment once for the whole set rather than per pair.
    ImplementationComparator::checkAlignment(all);

    ConflictMatrix matrix(std::move(names));

    for (std::size_t i = 0; i < datasets.size(); ++i)
      for (std::size_t j = i + 1; j < datasets.size(); ++j)
	{
	  const std::vector<const GatheredDataset*> pairOfDatasets{&datasets[i], &datasets[j]};
	  const ComparisonResult pair =
	    ImplementationComparator::compare(alpha, selector, pairOfDatasets);
	  matrix.setConflicts(i, j, pair.getFailCount());
	}

    return matrix;
  }
}
