// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ImplementationSet.h"
#include "SimStatsException.h"

namespace simcompare
{
  ImplementationSet::ImplementationSet(std::vector<ModelImplementation> implementations)
    : mImplementations(std::move(implementations))
  {}

  ImplementationSet ImplementationSet::fromLists(const std::vector<std::string>& names,
						 const std::vector<std::string>& folders,
						 const std::vector<std::string>& patterns)
  {
    if (names.size() != folders.size() || folders.size() != patterns.size())
      throw ArgumentMismatchException("Implementation names (" + std::to_string(names.size())
				      + "), folders (" + std::to_string(folders.size())
				      + ") and file patterns (" + std::to_string(patterns.size())
				      + ") must contain the same number of elements");

    ImplementationSet set;
    for (std::size_t i = 0; i < names.size(); ++i)
      set.add(ModelImplementation{names[i], FileSelection{folders[i], patterns[i]}});

    return set;
  }

  void ImplementationSet::add(ModelImplementation implementation)
  {
    mImplementations.push_back(std::move(implementation));
  }

  std::vector<std::string> ImplementationSet::getNames() const
  {
    std::vector<std::string> names;
    names.reserve(mImplementations.size());
    for (const auto& impl : mImplementations)
      names.push_back(impl.name);
    return names;
  }

  std::vector<GatheredDataset> ImplementationSet::gatherAll(const DatasetGatherer& gatherer,
							    const OutputNames& outputs,
							    concurrency::IParallelExecutor& executor) const
  {
    std::vector<GatheredDataset> datasets;
    datasets.reserve(mImplementations.size());

    for (const auto& impl : mImplementations)
      datasets.push_back(gatherer.gather(impl.name, impl.selection, outputs, executor));

    return datasets;
  }
}
