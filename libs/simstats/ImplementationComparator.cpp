// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ImplementationComparator.h"
#include "HypothesisTests.h"
#include "SimStatsException.h"
#include <cmath>
#include <boost/algorithm/string/case_conv.hpp>

namespace simcompare
{
  TestKind parseTestKind(const std::string& token)
  {
    const std::string lowered = boost::algorithm::to_lower_copy(token);

    if (lowered == "p" || lowered == "parametric")
      return TestKind::Parametric;
    if (lowered == "np" || lowered == "nonparametric" || lowered == "non-parametric")
      return TestKind::NonParametric;

    throw ConfigurationException("Unknown test kind '" + token + "' (expected p or np)");
  }

  std::string toString(TestKind kind)
  {
    return kind == TestKind::Parametric ? "p" : "np";
  }

  TestSelector uniformSelector(std::size_t numSummaries, TestKind kind)
  {
    return TestSelector(numSummaries, kind);
  }

  ComparisonResult::ComparisonResult(std::vector<std::string> datasetNames,
				     TestFamily family,
				     double alpha,
				     NumericMatrix pValues)
    : mDatasetNames(std::move(datasetNames)),
      mFamily(family),
      mAlpha(alpha),
      mPValues(std::move(pValues)),
      mFailCount(0)
  {
    for (double p : mPValues.getValues())
      if (p < mAlpha)
	++mFailCount;
  }

  void ImplementationComparator::checkAlignment(const std::vector<const GatheredDataset*>& datasets)
  {
    if (datasets.empty())
      return;

    const GatheredDataset& reference = *datasets.front();
    for (const GatheredDataset* ds : datasets)
      {
	if (ds->getNumOutputs() != reference.getNumOutputs())
	  throw MisalignedDatasetsException("Datasets do not have the same number of outputs");
	if (ds->getNumSummaries() != reference.getNumSummaries())
	  throw MisalignedDatasetsException("Datasets do not have the same number of statistical summaries");
      }
  }

  ComparisonResult ImplementationComparator::compare(double alpha,
						     const TestSelector& selector,
						     const std::vector<GatheredDataset>& datasets)
  {
    std::vector<const GatheredDataset*> pointers;
    pointers.reserve(datasets.size());
    for (const auto& ds : datasets)
      pointers.push_back(&ds);

    return compare(alpha, selector, pointers);
  }

  ComparisonResult ImplementationComparator::compare(double alpha,
						     const TestSelector& selector,
						     const std::vector<const GatheredDataset*>& datasets)
  {
    if (!(alpha > 0.0 && alpha < 1.0))
      throw InvalidParameterException("Significance level must lie in (0, 1); got "
				      + std::to_string(alpha));

    if (datasets.size() < 2)
      throw ArgumentMismatchException("At least two datasets are required for a comparison; got "
				      + std::to_string(datasets.size()));

    checkAlignment(datasets);

    const std::size_t numOutputs = datasets.front()->getNumOutputs();
    const std::size_t numSummaries = datasets.front()->getNumSummaries();

    if (selector.size() != numSummaries)
      throw ArgumentMismatchException("Test selector has " + std::to_string(selector.size())
				      + " entries but datasets have "
				      + std::to_string(numSummaries) + " statistical summaries");

    const TestFamily family = datasets.size() == 2 ? TestFamily::TwoSample : TestFamily::MultiSample;

    std::vector<std::string> names;
    for (const GatheredDataset* ds : datasets)
      names.push_back(ds->getName());

    NumericMatrix pValues(numOutputs, numSummaries);

    for (std::size_t o = 0; o < numOutputs; ++o)
      {
	for (std::size_t s = 0; s < numSummaries; ++s)
	  {
	    std::vector<std::vector<double>> samples;
	    samples.reserve(datasets.size());
	    for (const GatheredDataset* ds : datasets)
	      samples.push_back(ds->getFocalMeasure(o, s));

	    TestOutcome outcome;
	    if (family == TestFamily::TwoSample)
	      outcome = selector[s] == TestKind::Parametric
		? HypothesisTests::studentTTest(samples[0], samples[1])
		: HypothesisTests::mannWhitneyTest(samples[0], samples[1]);
	    else
	      outcome = selector[s] == TestKind::Parametric
		? HypothesisTests::oneWayAnova(samples)
		: HypothesisTests::kruskalWallisTest(samples);

	    pValues(o, s) = outcome.pValue;
	  }
      }

    return ComparisonResult(std::move(names), family, alpha, std::move(pValues));
  }
}
