// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DISTRIBUTION_ANALYZER_H
#define __DISTRIBUTION_ANALYZER_H 1

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>
#include "ConfidenceIntervals.h"
#include "GatheredDataset.h"
#include "NumericMatrix.h"

namespace simcompare
{
  /**
   * @brief Distributional properties of one focal measure across replications.
   *
   * normalityPValue and skewness are NaN when undefined (constant focal
   * measure, too few observations).
   */
  struct FocalMeasureAnalysis
  {
    std::size_t numObservations = 0;
    double mean = std::numeric_limits<double>::quiet_NaN();
    double variance = std::numeric_limits<double>::quiet_NaN();
    ConfidenceInterval tInterval;
    ConfidenceInterval willinkInterval;
    double normalityPValue = std::numeric_limits<double>::quiet_NaN();
    double skewness = std::numeric_limits<double>::quiet_NaN();

    bool isNormalityDefined() const
    {
      return !std::isnan(normalityPValue);
    }
  };

  /**
   * @brief Per-focal-measure analysis of one dataset.
   *
   * Focal measures are stored in dataset column order, so get(output, summary)
   * reads entry output * numSummaries + summary.
   */
  class AnalysisResult
  {
  public:
    AnalysisResult(std::string name,
		   double alpha,
		   std::size_t numSummaries,
		   std::vector<FocalMeasureAnalysis> measures);

    const std::string& getName() const
    {
      return mName;
    }

    double getAlpha() const
    {
      return mAlpha;
    }

    std::size_t getNumFocalMeasures() const
    {
      return mMeasures.size();
    }

    std::size_t getNumSummaries() const
    {
      return mNumSummaries;
    }

    std::size_t getNumOutputs() const
    {
      return mNumSummaries ? mMeasures.size() / mNumSummaries : 0;
    }

    const FocalMeasureAnalysis& operator[](std::size_t focalMeasure) const
    {
      return mMeasures[focalMeasure];
    }

    const FocalMeasureAnalysis& get(std::size_t output, std::size_t summary) const;

    const std::vector<FocalMeasureAnalysis>& getMeasures() const
    {
      return mMeasures;
    }

  private:
    std::string mName;
    double mAlpha;
    std::size_t mNumSummaries;
    std::vector<FocalMeasureAnalysis> mMeasures;
  };

  class DistributionAnalyzer
  {
  public:
    /**
     * @brief Analyse every focal measure of dataset at significance level alpha.
     * @throws InvalidParameterException unless 0 < alpha < 1.
     */
    static AnalysisResult analyze(const GatheredDataset& dataset, double alpha);

    /**
     * @brief Analyse rows of a focal-measures x observations matrix.
     *
     * The result treats the matrix as one output whose summaries are its rows.
     */
    static AnalysisResult analyze(const NumericMatrix& focalMeasuresByObservations, double alpha);

    static FocalMeasureAnalysis analyzeSample(const std::vector<double>& observations, double alpha);

  private:
    DistributionAnalyzer() = delete;
  };
}

#endif // __DISTRIBUTION_ANALYZER_H
