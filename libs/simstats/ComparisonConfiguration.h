// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __COMPARISON_CONFIGURATION_H
#define __COMPARISON_CONFIGURATION_H 1

#include <cstddef>
#include <string>
#include "ImplementationComparator.h"
#include "ImplementationSet.h"
#include "OutputNames.h"
#include "SummaryExtractorFactory.h"

namespace simcompare
{
  /**
   * @brief Everything needed to gather, analyse and compare a set of
   * model implementations.
   *
   * Usually read from a JSON file:
   *
   *   {
   *     "implementations": [ { "name": "NL", "folder": "data/nl", "files": "stats*.txt" }, ... ],
   *     "outputs": 6,
   *     "extractor": { "type": "steady-state", "steadyStateStart": 1001 },
   *     "alpha": 0.05,
   *     "tests": [ "p", "np", "p", "np", "p", "p" ],
   *     "threads": 4
   *   }
   *
   * "outputs" may also be an array of names. "tests" and "threads" are
   * optional; without "tests" every summary uses the parametric test.
   */
  class ComparisonConfiguration
  {
  public:
    ComparisonConfiguration(ImplementationSet implementations,
			    OutputNames outputs,
			    ExtractorSettings extractor,
			    double alpha,
			    TestSelector tests,
			    std::size_t threads);

    // @throws ConfigurationException naming the source and the offending member.
    static ComparisonConfiguration fromJson(const std::string& json,
					    const std::string& sourceName = "<string>");

    static ComparisonConfiguration loadFromFile(const std::string& filePath);

    const ImplementationSet& getImplementations() const
    {
      return mImplementations;
    }

    const OutputNames& getOutputs() const
    {
      return mOutputs;
    }

    const ExtractorSettings& getExtractorSettings() const
    {
      return mExtractor;
    }

    double getAlpha() const
    {
      return mAlpha;
    }

    std::size_t getNumThreads() const
    {
      return mThreads;
    }

    bool hasExplicitTests() const
    {
      return !mTests.empty();
    }

    // The configured tests, or all-parametric for numSummaries when none were given.
    TestSelector getTestSelector(std::size_t numSummaries) const;

  private:
    ImplementationSet mImplementations;
    OutputNames mOutputs;
    ExtractorSettings mExtractor;
    double mAlpha;
    TestSelector mTests;
    std::size_t mThreads;
  };
}

#endif // __COMPARISON_CONFIGURATION_H
