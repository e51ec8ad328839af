// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __OUTPUT_AVERAGER_H
#define __OUTPUT_AVERAGER_H 1

#include <cstddef>
#include <vector>
#include "ImplementationSet.h"
#include "NumericMatrix.h"
#include "OutputNames.h"
#include "TableSource.h"

namespace simcompare
{
  struct AveragingOptions
  {
    // Moving-average window; 0 keeps the plain replication mean.
    std::size_t windowSize = 0;

    // Leading iterations to use; 0 means the length of the first file of
    // the first implementation.
    std::size_t iterations = 0;
  };

  /**
   * @brief Mean output trajectory of each implementation across its replications.
   *
   * For implementation i, entry (o, t) of the result is the moving average,
   * starting at iteration t, of the per-iteration mean of output o over all
   * of the implementation's files. Each matrix is
   * numOutputs x (iterations - windowSize).
   */
  class OutputAverager
  {
  public:
    OutputAverager();
    OutputAverager(FileLister lister, TableReader reader);

    /**
     * @throws NoFilesFoundException naming the implementation with no files.
     * @throws IndexOutOfRangeException if a file is shorter than the
     *         requested iterations or narrower than the outputs.
     * @throws InvalidParameterException if windowSize >= iterations.
     */
    std::vector<NumericMatrix> average(const ImplementationSet& implementations,
				       const OutputNames& outputs,
				       const AveragingOptions& options) const;

    // v[i] = mean(u[i .. i + window]); size u.size() - window.
    static std::vector<double> movingAverage(const std::vector<double>& u, std::size_t window);

  private:
    std::vector<std::string> listOrThrow(const ImplementationSet& implementations,
					 std::size_t index) const;

    FileLister mLister;
    TableReader mReader;
  };
}

#endif // __OUTPUT_AVERAGER_H
