// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RESULT_SERIALIZER_H
#define __RESULT_SERIALIZER_H 1

#include <string>
#include <vector>
#include "DistributionAnalyzer.h"
#include "GatheredDataset.h"
#include "ImplementationComparator.h"
#include "PairwiseConflictMatrix.h"

namespace simcompare
{
  /**
   * @brief Everything one run produced. Pointers are optional parts; null
   * members are left out of the JSON document.
   */
  struct RunResults
  {
    std::vector<GatheredDataset> datasets;
    std::vector<AnalysisResult> analyses;
    const ComparisonResult* comparison = nullptr;
    const ConflictMatrix* conflicts = nullptr;
  };

  /**
   * @brief Writes run results as pretty-printed JSON.
   *
   * NaN values (undefined p-values, skewness of constant samples) are
   * written as null.
   */
  class ResultSerializer
  {
  public:
    static std::string toJson(const RunResults& results);

    static std::string toJson(const GatheredDataset& dataset);
    static std::string toJson(const AnalysisResult& analysis);
    static std::string toJson(const ComparisonResult& comparison);
    static std::string toJson(const ConflictMatrix& conflicts);

    // @throws std::runtime_error if the file cannot be written.
    static void saveToFile(const RunResults& results, const std::string& filePath);

  private:
    ResultSerializer() = delete;
  };
}

#endif // __RESULT_SERIALIZER_H
