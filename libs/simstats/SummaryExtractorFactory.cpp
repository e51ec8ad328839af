// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SummaryExtractorFactory.h"
#include "SteadyStateSummaryExtractor.h"
#include "IterationSnapshotExtractor.h"
#include "SimStatsException.h"
#include <boost/algorithm/string/case_conv.hpp>

namespace simcompare
{
  std::shared_ptr<const SummaryExtractor>
  SummaryExtractorFactory::create(const ExtractorSettings& settings)
  {
    switch (settings.kind)
      {
      case ExtractorSettings::Kind::SteadyState:
	return std::make_shared<SteadyStateSummaryExtractor>(settings.steadyStateStart);
      case ExtractorSettings::Kind::IterationSnapshot:
	return std::make_shared<IterationSnapshotExtractor>(settings.iterations);
      }

    throw ConfigurationException("SummaryExtractorFactory: unknown extractor kind");
  }

  ExtractorSettings::Kind SummaryExtractorFactory::parseKind(const std::string& name)
  {
    const std::string lowered = boost::algorithm::to_lower_copy(name);

    if (lowered == "steady-state" || lowered == "pphpc")
      return ExtractorSettings::Kind::SteadyState;
    if (lowered == "iterations" || lowered == "iters")
      return ExtractorSettings::Kind::IterationSnapshot;

    throw ConfigurationException("Unknown extractor type '" + name
				 + "' (expected steady-state or iterations)");
  }
}
