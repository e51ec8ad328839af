// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IMPLEMENTATION_SET_H
#define __IMPLEMENTATION_SET_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "DatasetGatherer.h"
#include "FileDiscovery.h"
#include "GatheredDataset.h"
#include "IParallelExecutor.h"
#include "OutputNames.h"

namespace simcompare
{
  // One model implementation and where its replication files live.
  struct ModelImplementation
  {
    std::string name;
    FileSelection selection;
  };

  /**
   * @brief Ordered collection of model implementations to analyse or compare.
   */
  class ImplementationSet
  {
  public:
    using const_iterator = std::vector<ModelImplementation>::const_iterator;

    ImplementationSet() = default;
    explicit ImplementationSet(std::vector<ModelImplementation> implementations);

    /**
     * @brief Build from parallel lists, entry i of each describing implementation i.
     * @throws ArgumentMismatchException if the three lists differ in length.
     */
    static ImplementationSet fromLists(const std::vector<std::string>& names,
				       const std::vector<std::string>& folders,
				       const std::vector<std::string>& patterns);

    void add(ModelImplementation implementation);

    std::size_t size() const
    {
      return mImplementations.size();
    }

    bool empty() const
    {
      return mImplementations.empty();
    }

    const ModelImplementation& operator[](std::size_t i) const
    {
      return mImplementations[i];
    }

    const_iterator begin() const
    {
      return mImplementations.begin();
    }

    const_iterator end() const
    {
      return mImplementations.end();
    }

    std::vector<std::string> getNames() const;

    // Gather every implementation in order; the first failure aborts.
    std::vector<GatheredDataset> gatherAll(const DatasetGatherer& gatherer,
					   const OutputNames& outputs,
					   concurrency::IParallelExecutor& executor) const;

  private:
    std::vector<ModelImplementation> mImplementations;
  };
}

#endif // __IMPLEMENTATION_SET_H
