// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "DistributionAnalyzer.h"
#include "SampleMoments.h"
#include "ShapiroWilkTest.h"
#include "SimStatsException.h"

namespace simcompare
{
  namespace
  {
    void checkAlpha(double alpha)
    {
      if (!(alpha > 0.0 && alpha < 1.0))
	throw InvalidParameterException("Significance level must lie in (0, 1); got "
					+ std::to_string(alpha));
    }
  }

  AnalysisResult::AnalysisResult(std::string name,
				 double alpha,
				 std::size_t numSummaries,
				 std::vector<FocalMeasureAnalysis> measures)
    : mName(std::move(name)),
      mAlpha(alpha),
      mNumSummaries(numSummaries),
      mMeasures(std::move(measures))
  {}

  const FocalMeasureAnalysis& AnalysisResult::get(std::size_t output, std::size_t summary) const
  {
    if (summary >= mNumSummaries || output >= getNumOutputs())
      throw IndexOutOfRangeException("AnalysisResult '" + mName + "': focal measure ("
				     + std::to_string(output) + ", " + std::to_string(summary)
				     + ") does not exist");

    return mMeasures[output * mNumSummaries + summary];
  }

  FocalMeasureAnalysis DistributionAnalyzer::analyzeSample(const std::vector<double>& observations,
							   double alpha)
  {
    checkAlpha(alpha);
    if (observations.empty())
      throw InvalidParameterException("Cannot analyse a focal measure with no observations");

    const SampleMoments moments = computeSampleMoments(observations);

    FocalMeasureAnalysis analysis;
    analysis.numObservations = moments.count;
    analysis.mean = moments.mean;
    analysis.variance = moments.count > 1 ? moments.variance : 0.0;
    analysis.tInterval = ConfidenceIntervals::tInterval(moments, alpha);
    analysis.willinkInterval = ConfidenceIntervals::willinkInterval(moments, alpha);
    analysis.normalityPValue = ShapiroWilkTest::run(observations).pValue;
    analysis.skewness = moments.skewness;
    return analysis;
  }

  AnalysisResult DistributionAnalyzer::analyze(const GatheredDataset& dataset, double alpha)
  {
    checkAlpha(alpha);

    const NumericMatrix& data = dataset.getData();
    std::vector<FocalMeasureAnalysis> measures;
    measures.reserve(data.getNumColumns());

    for (std::size_t c = 0; c < data.getNumColumns(); ++c)
      measures.push_back(analyzeSample(data.getColumn(c), alpha));

    return AnalysisResult(dataset.getName(), alpha, dataset.getNumSummaries(), std::move(measures));
  }

  AnalysisResult DistributionAnalyzer::analyze(const NumericMatrix& focalMeasuresByObservations,
					       double alpha)
  {
    checkAlpha(alpha);

    std::vector<FocalMeasureAnalysis> measures;
    measures.reserve(focalMeasuresByObservations.getNumRows());

    for (std::size_t r = 0; r < focalMeasuresByObservations.getNumRows(); ++r)
      measures.push_back(analyzeSample(focalMeasuresByObservations.getRow(r), alpha));

    return AnalysisResult("", alpha, measures.size(), std::move(measures));
  }
}
