// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __PAIRWISE_CONFLICT_MATRIX_H
#define __PAIRWISE_CONFLICT_MATRIX_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "GatheredDataset.h"
#include "ImplementationComparator.h"

namespace simcompare
{
  /**
   * @brief Symmetric k x k table of failed-test counts between datasets.
   *
   * Entry (i, j) is the fail count of comparing dataset i with dataset j
   * alone; the diagonal is zero. Counts are raw tallies: no correction for
   * the k(k-1)/2 comparisons is applied, so with many implementations some
   * conflicts are expected by chance alone.
   */
  class ConflictMatrix
  {
  public:
    explicit ConflictMatrix(std::vector<std::string> datasetNames);

    std::size_t size() const
    {
      return mNames.size();
    }

    const std::vector<std::string>& getDatasetNames() const
    {
      return mNames;
    }

    std::size_t operator()(std::size_t i, std::size_t j) const
    {
      return mCounts[i * mNames.size() + j];
    }

    std::size_t at(std::size_t i, std::size_t j) const;

    // Sets (i, j) and (j, i); i must differ from j.
    void setConflicts(std::size_t i, std::size_t j, std::size_t failCount);

    // Sum of row i: how strongly dataset i disagrees with all the others.
    std::size_t getTotalConflicts(std::size_t i) const;

  private:
    std::vector<std::string> mNames;
    std::vector<std::size_t> mCounts;
  };

  class PairwiseConflictMatrixBuilder
  {
  public:
    /**
     * @brief Compare every unordered pair of datasets with the two-sample tests.
     *
     * Preconditions and exceptions are those of ImplementationComparator::compare.
     */
    static ConflictMatrix build(double alpha,
				const TestSelector& selector,
				const std::vector<GatheredDataset>& datasets);

  private:
    PairwiseConflictMatrixBuilder() = delete;
  };
}

#endif // __PAIRWISE_CONFLICT_MATRIX_H
