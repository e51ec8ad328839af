// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IMPLEMENTATION_COMPARATOR_H
#define __IMPLEMENTATION_COMPARATOR_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "GatheredDataset.h"
#include "NumericMatrix.h"

namespace simcompare
{
  enum class TestKind
    {
      Parametric,
      NonParametric
    };

  // One entry per summary; applies to that summary of every output.
  using TestSelector = std::vector<TestKind>;

  enum class TestFamily
    {
      TwoSample,   // t-test / Mann-Whitney
      MultiSample  // one-way ANOVA / Kruskal-Wallis
    };

  /**
   * @brief Parse "p" / "np" (also "parametric" / "nonparametric").
   * @throws ConfigurationException on anything else.
   */
  TestKind parseTestKind(const std::string& token);

  std::string toString(TestKind kind);

  // Selector with the same kind for every summary.
  TestSelector uniformSelector(std::size_t numSummaries, TestKind kind);

  /**
   * @brief p-values of one comparison between two or more datasets.
   *
   * getPValues() is numOutputs x numSummaries. getFailCount() is the number
   * of cells whose p-value is below alpha; NaN p-values never count.
   */
  class ComparisonResult
  {
  public:
    ComparisonResult(std::vector<std::string> datasetNames,
		     TestFamily family,
		     double alpha,
		     NumericMatrix pValues);

    const std::vector<std::string>& getDatasetNames() const
    {
      return mDatasetNames;
    }

    TestFamily getTestFamily() const
    {
      return mFamily;
    }

    double getAlpha() const
    {
      return mAlpha;
    }

    const NumericMatrix& getPValues() const
    {
      return mPValues;
    }

    double getPValue(std::size_t output, std::size_t summary) const
    {
      return mPValues.at(output, summary);
    }

    std::size_t getFailCount() const
    {
      return mFailCount;
    }

  private:
    std::vector<std::string> mDatasetNames;
    TestFamily mFamily;
    double mAlpha;
    NumericMatrix mPValues;
    std::size_t mFailCount;
  };

  /**
   * @brief Tests whether several implementations of the same model produce
   * statistically equivalent focal measures.
   */
  class ImplementationComparator
  {
  public:
    /**
     * @brief Run one test per focal measure across all datasets jointly.
     *
     * Two datasets use the t-test (parametric) or Mann-Whitney test
     * (non-parametric); three or more use one-way ANOVA or Kruskal-Wallis.
     *
     * @throws InvalidParameterException unless 0 < alpha < 1.
     * @throws ArgumentMismatchException if fewer than two datasets are given
     *         or selector.size() differs from the number of summaries.
     * @throws MisalignedDatasetsException if the datasets disagree on the
     *         number of outputs or of summaries.
     */
    static ComparisonResult compare(double alpha,
				    const TestSelector& selector,
				    const std::vector<GatheredDataset>& datasets);

    static ComparisonResult compare(double alpha,
				    const TestSelector& selector,
				    const std::vector<const GatheredDataset*>& datasets);

    // Alignment check on its own; throws MisalignedDatasetsException.
    static void checkAlignment(const std::vector<const GatheredDataset*>& datasets);

  private:
    ImplementationComparator() = delete;
  };
}

#endif // __IMPLEMENTATION_COMPARATOR_H
