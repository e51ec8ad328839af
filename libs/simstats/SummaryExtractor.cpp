// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SummaryExtractor.h"
#include "SimStatsException.h"

namespace simcompare
{
  void SummaryExtractor::checkOutputCount(const NumericMatrix& table, std::size_t numOutputs)
  {
    if (numOutputs > table.getNumColumns())
      throw IndexOutOfRangeException("Requested " + std::to_string(numOutputs)
				     + " outputs but table only has "
				     + std::to_string(table.getNumColumns()) + " columns");
  }
}
