// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace simcompare
{
  /**
   * @brief Ordered names of the outputs (table columns) taken from each file.
   *
   * Built either from a count, which yields "o1".."oN", or from an explicit
   * list. The count fixes how many leading columns of every file are used.
   */
  class OutputNames
  {
  public:
    static OutputNames fromCount(std::size_t numOutputs);
    static OutputNames fromList(const std::vector<std::string>& names);

    std::size_t size() const
    {
      return mNames.size();
    }

    const std::string& operator[](std::size_t i) const
    {
      return mNames[i];
    }

    const std::vector<std::string>& getNames() const
    {
      return mNames;
    }

  private:
    explicit OutputNames(std::vector<std::string> names);

    std::vector<std::string> mNames;
  };
}
