// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "OutputNames.h"
#include "SimStatsException.h"

namespace simcompare
{
  OutputNames::OutputNames(std::vector<std::string> names)
    : mNames(std::move(names))
  {}

  OutputNames OutputNames::fromCount(std::size_t numOutputs)
  {
    if (numOutputs == 0)
      throw InvalidParameterException("OutputNames: number of outputs must be at least 1");

    std::vector<std::string> names;
    names.reserve(numOutputs);
    for (std::size_t i = 1; i <= numOutputs; ++i)
      names.push_back("o" + std::to_string(i));

    return OutputNames(std::move(names));
  }

  OutputNames OutputNames::fromList(const std::vector<std::string>& names)
  {
    if (names.empty())
      throw InvalidParameterException("OutputNames: output name list is empty");

    return OutputNames(names);
  }
}
