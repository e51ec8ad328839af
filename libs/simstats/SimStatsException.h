// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SIMSTATS_EXCEPTION_H
#define __SIMSTATS_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace simcompare
{
  // Root of every error raised by the statistics pipeline.
  class SimStatsException : public std::runtime_error
  {
  public:
    explicit SimStatsException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~SimStatsException() = default;
  };

  // A file selection matched nothing.
  class NoFilesFoundException : public SimStatsException
  {
  public:
    explicit NoFilesFoundException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  // An iteration, truncation point or output column lies outside a table.
  class IndexOutOfRangeException : public SimStatsException
  {
  public:
    explicit IndexOutOfRangeException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  // Parallel argument lists disagree in length (test selector vs summaries,
  // implementation names vs folders vs file patterns, too few datasets).
  class ArgumentMismatchException : public SimStatsException
  {
  public:
    explicit ArgumentMismatchException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  // Datasets handed to a comparison disagree on outputs or summaries.
  class MisalignedDatasetsException : public SimStatsException
  {
  public:
    explicit MisalignedDatasetsException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  // A scalar parameter is outside its valid domain.
  class InvalidParameterException : public SimStatsException
  {
  public:
    explicit InvalidParameterException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  // A table file could not be opened or parsed.
  class TableReadException : public SimStatsException
  {
  public:
    explicit TableReadException(const std::string& msg)
      : SimStatsException(msg) {}
  };

  class ConfigurationException : public SimStatsException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : SimStatsException(msg) {}
  };

} // namespace simcompare

#endif // __SIMSTATS_EXCEPTION_H
