// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <functional>
#include <string>
#include <vector>
#include "FileDiscovery.h"
#include "NumericMatrix.h"
#include "NumericTableReader.h"

namespace simcompare
{
  // Resolves a selection to an ordered list of file names.
  using FileLister = std::function<std::vector<std::string>(const FileSelection&)>;

  // Loads the output table stored in one file.
  using TableReader = std::function<NumericMatrix(const std::string&)>;

  inline FileLister defaultFileLister()
  {
    return [](const FileSelection& selection) { return FileDiscovery::listFiles(selection); };
  }

  inline TableReader defaultTableReader()
  {
    return [](const std::string& fileName) { return NumericTableReader::read(fileName); };
  }
}
