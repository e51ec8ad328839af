// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "OutputAverager.h"
#include "SimStatsException.h"

namespace simcompare
{
  OutputAverager::OutputAverager()
    : OutputAverager(defaultFileLister(), defaultTableReader())
  {}

  OutputAverager::OutputAverager(FileLister lister, TableReader reader)
    : mLister(std::move(lister)),
      mReader(std::move(reader))
  {}

  std::vector<double> OutputAverager::movingAverage(const std::vector<double>& u, std::size_t window)
  {
    if (window >= u.size())
      throw InvalidParameterException("Moving-average window " + std::to_string(window)
				      + " must be smaller than the series length "
				      + std::to_string(u.size()));

    const std::size_t length = u.size() - window;
    std::vector<double> v(length, 0.0);

    double sum = 0.0;
    for (std::size_t k = 0; k <= window; ++k)
      sum += u[k];

    const double span = static_cast<double>(window + 1);
    for (std::size_t i = 0; i < length; ++i)
      {
	if (i > 0)
	  sum += u[i + window] - u[i - 1];
	v[i] = sum / span;
      }

    return v;
  }

  std::vector<std::string> OutputAverager::listOrThrow(const ImplementationSet& implementations,
						       std::size_t index) const
  {
    const ModelImplementation& impl = implementations[index];
    std::vector<std::string> files = mLister(impl.selection);
    if (files.empty())
      throw NoFilesFoundException("No files found for model implementation "
				  + std::to_string(index + 1) + " ('" + impl.name + "')");
    return files;
  }

  std::vector<NumericMatrix> OutputAverager::average(const ImplementationSet& implementations,
						     const OutputNames& outputs,
						     const AveragingOptions& options) const
  {
    if (implementations.empty())
      throw ArgumentMismatchException("OutputAverager: no implementations given");

    std::size_t iterations = options.iterations;
    if (iterations == 0)
      iterations = mReader(listOrThrow(implementations, 0).front()).getNumRows();

    if (options.windowSize >= iterations)
      throw InvalidParameterException("Moving-average window " + std::to_string(options.windowSize)
				      + " must be smaller than the number of iterations "
				      + std::to_string(iterations));

    const std::size_t numOutputs = outputs.size();
    std::vector<NumericMatrix> result;
    result.reserve(implementations.size());

    for (std::size_t i = 0; i < implementations.size(); ++i)
      {
	const std::vector<std::string> files = listOrThrow(implementations, i);
	NumericMatrix sums(numOutputs, iterations, 0.0);

	for (const auto& file : files)
	  {
	    const NumericMatrix table = mReader(file);
	    if (table.getNumRows() < iterations)
	      throw IndexOutOfRangeException(file + ": " + std::to_string(iterations)
					     + " iterations requested but only "
					     + std::to_string(table.getNumRows()) + " available");
	    if (table.getNumColumns() < numOutputs)
	      throw IndexOutOfRangeException(file + ": " + std::to_string(numOutputs)
					     + " outputs requested but only "
					     + std::to_string(table.getNumColumns()) + " columns");

	    for (std::size_t o = 0; o < numOutputs; ++o)
	      for (std::size_t t = 0; t < iterations; ++t)
		sums(o, t) += table(t, o);
	  }

	const double numFiles = static_cast<double>(files.size());
	NumericMatrix averaged(numOutputs, iterations - options.windowSize);

	for (std::size_t o = 0; o < numOutputs; ++o)
	  {
	    std::vector<double> meanSeries = sums.getRow(o);
	    for (double& v : meanSeries)
	      v /= numFiles;

	    averaged.setRow(o, movingAverage(meanSeries, options.windowSize));
	  }

	result.push_back(std::move(averaged));
      }

    return result;
  }
}
