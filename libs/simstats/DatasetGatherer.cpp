// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "DatasetGatherer.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "SimStatsException.h"

namespace simcompare
{
  DatasetGatherer::DatasetGatherer(std::shared_ptr<const SummaryExtractor> extractor)
    : DatasetGatherer(std::move(extractor), defaultFileLister(), defaultTableReader())
  {}

  DatasetGatherer::DatasetGatherer(std::shared_ptr<const SummaryExtractor> extractor,
				   FileLister lister,
				   TableReader reader)
    : mExtractor(std::move(extractor)),
      mLister(std::move(lister)),
      mReader(std::move(reader))
  {
    if (!mExtractor)
      throw InvalidParameterException("DatasetGatherer: extractor must not be null");
  }

  GatheredDataset DatasetGatherer::gather(const std::string& name,
					  const FileSelection& selection,
					  const OutputNames& outputs) const
  {
    concurrency::SingleThreadExecutor executor;
    return gather(name, selection, outputs, executor);
  }

  GatheredDataset DatasetGatherer::gather(const std::string& name,
					  const FileSelection& selection,
					  const OutputNames& outputs,
					  concurrency::IParallelExecutor& executor) const
  {
    const SummaryNames summaryNames = mExtractor->getSummaryNames();
    const std::size_t numOutputs = outputs.size();
    const std::size_t numColumns = numOutputs * summaryNames.size();

    const std::vector<std::string> files = mLister(selection);
    if (files.empty())
      throw NoFilesFoundException("No files matching '" + selection.pattern
				  + "' were found in '" + selection.folder + "'");

    NumericMatrix data(files.size(), numColumns);

    // Each task writes only its own row.
    concurrency::parallel_for(files.size(), executor, [&](std::size_t i) {
	const NumericMatrix table = mReader(files[i]);

	NumericMatrix summaries;
	try
	  {
	    summaries = mExtractor->extract(table, numOutputs);
	  }
	catch (const IndexOutOfRangeException& e)
	  {
	    throw IndexOutOfRangeException(files[i] + ": " + e.what());
	  }

	data.setRow(i, summaries.flattenColumnMajor());
      });

    return GatheredDataset(name, outputs, summaryNames, std::move(data));
  }
}
