#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ConfidenceIntervals.h"
#include "DistributionAnalyzer.h"
#include "SampleMoments.h"
#include "SimStatsException.h"
#include <cmath>
#include <random>

using namespace simcompare;
using Catch::Approx;

TEST_CASE("SampleMoments", "[SampleMoments]")
{
  const SampleMoments m = computeSampleMoments({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
  REQUIRE(m.count == 8);
  REQUIRE(m.mean == Approx(5.0));
  REQUIRE(m.variance == Approx(32.0 / 7.0));
  REQUIRE(m.minimum == 2.0);
  REQUIRE(m.maximum == 9.0);

  const SampleMoments c = computeSampleMoments({1.5, 1.5, 1.5});
  REQUIRE(c.isConstant());
  REQUIRE(c.mean == 1.5);
  REQUIRE(c.variance == 0.0);
  REQUIRE(std::isnan(c.skewness));
}

TEST_CASE("Confidence intervals", "[ConfidenceIntervals]")
{
  const SampleMoments m = computeSampleMoments({1.0, 2.0, 3.0, 4.0, 5.0});

  SECTION("t-interval matches the textbook formula")
  {
    const ConfidenceInterval ci = ConfidenceIntervals::tInterval(m, 0.05);
    REQUIRE(ci.lower == Approx(1.036757).margin(1e-5));
    REQUIRE(ci.upper == Approx(4.963243).margin(1e-5));
    REQUIRE(ci.contains(m.mean));
  }

  SECTION("Willink reduces to the t-interval for a symmetric sample")
  {
    const ConfidenceInterval t = ConfidenceIntervals::tInterval(m, 0.05);
    const ConfidenceInterval w = ConfidenceIntervals::willinkInterval(m, 0.05);
    REQUIRE(w.lower == Approx(t.lower));
    REQUIRE(w.upper == Approx(t.upper));
  }

  SECTION("Willink shifts towards the long tail of a right-skewed sample")
  {
    const SampleMoments skewed = computeSampleMoments({1.0, 1.1, 1.2, 1.3, 1.5, 2.0, 3.0, 6.0});
    REQUIRE(skewed.skewness > 0.0);

    const ConfidenceInterval t = ConfidenceIntervals::tInterval(skewed, 0.05);
    const ConfidenceInterval w = ConfidenceIntervals::willinkInterval(skewed, 0.05);
    REQUIRE(w.lower > t.lower);
    REQUIRE(w.upper > t.upper);
    REQUIRE(w.contains(skewed.mean));
  }

  SECTION("Willink interval of a skewed sample")
  {
    const SampleMoments skewed = computeSampleMoments({1.0, 1.0, 2.0, 2.0, 3.0, 5.0, 9.0, 20.0});
    const ConfidenceInterval w = ConfidenceIntervals::willinkInterval(skewed, 0.05);
    REQUIRE(w.lower == Approx(1.77136).margin(1e-4));
    REQUIRE(w.upper == Approx(23.7018).margin(1e-3));
  }

  SECTION("Smaller alpha widens the interval")
  {
    REQUIRE(ConfidenceIntervals::tInterval(m, 0.01).getWidth()
	    > ConfidenceIntervals::tInterval(m, 0.05).getWidth());
  }

  SECTION("Alpha outside (0, 1) is rejected")
  {
    REQUIRE_THROWS_AS(ConfidenceIntervals::criticalT(0.0, 10), InvalidParameterException);
    REQUIRE_THROWS_AS(ConfidenceIntervals::criticalT(1.0, 10), InvalidParameterException);
  }
}

TEST_CASE("DistributionAnalyzer on a gathered dataset", "[DistributionAnalyzer]")
{
  // 40 observations of 1 output x 2 summaries; summary 1 is constant.
  std::mt19937 rng(12345);
  std::normal_distribution<double> normal(100.0, 5.0);

  NumericMatrix data(40, 2);
  for (std::size_t r = 0; r < data.getNumRows(); ++r)
    {
      data(r, 0) = normal(rng);
      data(r, 1) = 7.0;
    }

  const GatheredDataset ds("impl", OutputNames::fromCount(1),
			   SummaryNames{{"mean", "flat"}, {"$m$", "$f$"}}, data);
  const AnalysisResult result = DistributionAnalyzer::analyze(ds, 0.05);

  REQUIRE(result.getName() == "impl");
  REQUIRE(result.getNumFocalMeasures() == 2);
  REQUIRE(result.getNumOutputs() == 1);

  SECTION("The t-interval of a varying measure contains its mean")
  {
    const FocalMeasureAnalysis& fm = result.get(0, 0);
    REQUIRE(fm.numObservations == 40);
    REQUIRE(fm.variance > 0.0);
    REQUIRE(fm.tInterval.contains(fm.mean));
    REQUIRE(fm.willinkInterval.contains(fm.mean));
    REQUIRE(fm.isNormalityDefined());
  }

  SECTION("A constant measure has zero variance, a point interval and no normality test")
  {
    const FocalMeasureAnalysis& fm = result.get(0, 1);
    REQUIRE(fm.mean == 7.0);
    REQUIRE(fm.variance == 0.0);
    REQUIRE(fm.tInterval.lower == 7.0);
    REQUIRE(fm.tInterval.upper == 7.0);
    REQUIRE(fm.willinkInterval.getWidth() == 0.0);
    REQUIRE_FALSE(fm.isNormalityDefined());
    REQUIRE(std::isnan(fm.skewness));
  }

  SECTION("Out-of-range focal measure")
  {
    REQUIRE_THROWS_AS(result.get(1, 0), IndexOutOfRangeException);
  }
}

TEST_CASE("DistributionAnalyzer edge cases", "[DistributionAnalyzer]")
{
  SECTION("A single observation")
  {
    const FocalMeasureAnalysis fm = DistributionAnalyzer::analyzeSample({3.25}, 0.05);
    REQUIRE(fm.variance == 0.0);
    REQUIRE(fm.tInterval.lower == 3.25);
    REQUIRE(fm.tInterval.upper == 3.25);
    REQUIRE(std::isnan(fm.normalityPValue));
    REQUIRE(std::isnan(fm.skewness));
  }

  SECTION("Focal measures given as rows")
  {
    const NumericMatrix byObservations{{1.0, 2.0, 3.0, 4.0},
				       {5.0, 5.0, 5.0, 5.0}};
    const AnalysisResult result = DistributionAnalyzer::analyze(byObservations, 0.1);
    REQUIRE(result.getNumFocalMeasures() == 2);
    REQUIRE(result[0].mean == Approx(2.5));
    REQUIRE(result[1].variance == 0.0);
  }

  SECTION("Invalid alpha")
  {
    REQUIRE_THROWS_AS(DistributionAnalyzer::analyzeSample({1.0, 2.0}, 1.5), InvalidParameterException);
  }
}
