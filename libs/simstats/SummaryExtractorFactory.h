// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "SummaryExtractor.h"

namespace simcompare
{
  /**
   * @brief Value describing which extraction strategy to use and with what
   * parameters. Filled from the command line or a configuration file.
   */
  struct ExtractorSettings
  {
    enum class Kind
      {
	SteadyState,
	IterationSnapshot
      };

    Kind kind = Kind::SteadyState;
    std::size_t steadyStateStart = 1;
    std::vector<std::size_t> iterations;
  };

  class SummaryExtractorFactory
  {
  public:
    static std::shared_ptr<const SummaryExtractor> create(const ExtractorSettings& settings);

    // Accepts "steady-state" (alias "pphpc") and "iterations" (alias "iters").
    static ExtractorSettings::Kind parseKind(const std::string& name);

  private:
    SummaryExtractorFactory() = delete;
  };
}
