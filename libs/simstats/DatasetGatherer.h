// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DATASET_GATHERER_H
#define __DATASET_GATHERER_H 1

#include <memory>
#include <string>
#include <vector>
#include "FileDiscovery.h"
#include "GatheredDataset.h"
#include "IParallelExecutor.h"
#include "NumericMatrix.h"
#include "OutputNames.h"
#include "SummaryExtractor.h"
#include "TableSource.h"

namespace simcompare
{
  /**
   * @brief Applies one SummaryExtractor to every file of a selection and
   * stacks the results into a GatheredDataset.
   *
   * File listing and table reading are injected so that callers (and tests)
   * can substitute in-memory sources; by default they are
   * defaultFileLister() and defaultTableReader().
   */
  class DatasetGatherer
  {
  public:
    explicit DatasetGatherer(std::shared_ptr<const SummaryExtractor> extractor);

    DatasetGatherer(std::shared_ptr<const SummaryExtractor> extractor,
		    FileLister lister,
		    TableReader reader);

    /**
     * @brief Gather one dataset, reading files on the calling thread.
     *
     * @throws NoFilesFoundException when the selection matches no file.
     * Any exception raised while reading or extracting one file aborts the
     * whole gather.
     */
    GatheredDataset gather(const std::string& name,
			   const FileSelection& selection,
			   const OutputNames& outputs) const;

    /**
     * @brief Gather one dataset, spreading files over executor.
     *
     * Row i of the result always corresponds to file i of the listing.
     */
    GatheredDataset gather(const std::string& name,
			   const FileSelection& selection,
			   const OutputNames& outputs,
			   concurrency::IParallelExecutor& executor) const;

    const SummaryExtractor& getExtractor() const
    {
      return *mExtractor;
    }

  private:
    std::shared_ptr<const SummaryExtractor> mExtractor;
    FileLister mLister;
    TableReader mReader;
  };
}

#endif // __DATASET_GATHERER_H
