#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "IterationSnapshotExtractor.h"
#include "SimStatsException.h"
#include "SteadyStateSummaryExtractor.h"
#include "SummaryExtractorFactory.h"
#include <cmath>

using namespace simcompare;
using Catch::Approx;

TEST_CASE("SteadyStateSummaryExtractor computes the six summaries", "[SummaryExtractor][steady-state]")
{
  const NumericMatrix table{{10.0, 1.0},
			    {30.0, 1.0},
			    {5.0, 1.0},
			    {30.0, 1.0},
			    {8.0, 1.0}};

  SteadyStateSummaryExtractor extractor(3);
  const NumericMatrix s = extractor.extract(table, 1);

  REQUIRE(s.getNumRows() == SteadyStateSummaryExtractor::NumSummaries);
  REQUIRE(s.getNumColumns() == 1);

  SECTION("Extremes report the first occurrence, 1-based")
  {
    REQUIRE(s(SteadyStateSummaryExtractor::Max, 0) == 30.0);
    REQUIRE(s(SteadyStateSummaryExtractor::ArgMax, 0) == 2.0);
    REQUIRE(s(SteadyStateSummaryExtractor::Min, 0) == 5.0);
    REQUIRE(s(SteadyStateSummaryExtractor::ArgMin, 0) == 3.0);
  }

  SECTION("Steady-state mean and sample standard deviation over rows 3..5")
  {
    REQUIRE(s(SteadyStateSummaryExtractor::SteadyStateMean, 0) == Approx(43.0 / 3.0));
    REQUIRE(s(SteadyStateSummaryExtractor::SteadyStateStdDev, 0) == Approx(std::sqrt(186.0 + 1.0 / 3.0)));
  }

  SECTION("Constant output has zero std")
  {
    const NumericMatrix both = extractor.extract(table, 2);
    REQUIRE(both(SteadyStateSummaryExtractor::SteadyStateStdDev, 1) == 0.0);
    REQUIRE(both(SteadyStateSummaryExtractor::ArgMax, 1) == 1.0);
  }
}

TEST_CASE("SteadyStateSummaryExtractor edge cases", "[SummaryExtractor][steady-state]")
{
  const NumericMatrix table{{1.0}, {2.0}, {4.0}};

  SECTION("Start on the last row gives std 0")
  {
    const NumericMatrix s = SteadyStateSummaryExtractor(3).extract(table, 1);
    REQUIRE(s(SteadyStateSummaryExtractor::SteadyStateMean, 0) == 4.0);
    REQUIRE(s(SteadyStateSummaryExtractor::SteadyStateStdDev, 0) == 0.0);
  }

  SECTION("Start beyond the table is out of range")
  {
    REQUIRE_THROWS_AS(SteadyStateSummaryExtractor(4).extract(table, 1), IndexOutOfRangeException);
  }

  SECTION("Start 0 is rejected")
  {
    REQUIRE_THROWS_AS(SteadyStateSummaryExtractor(0), IndexOutOfRangeException);
  }

  SECTION("More outputs than columns is out of range")
  {
    REQUIRE_THROWS_AS(SteadyStateSummaryExtractor(1).extract(table, 2), IndexOutOfRangeException);
  }

  SECTION("Labels")
  {
    const SummaryNames names = SteadyStateSummaryExtractor(1).getSummaryNames();
    REQUIRE(names.text == std::vector<std::string>{"max", "argmax", "min", "argmin", "mean", "std"});
    REQUIRE(names.latex.size() == 6);
    REQUIRE(names.latex[4] == "$\\bar{X}^{ss}$");
  }
}

TEST_CASE("IterationSnapshotExtractor picks rows", "[SummaryExtractor][iterations]")
{
  const NumericMatrix table{{1.0, 10.0},
			    {2.0, 20.0},
			    {3.0, 30.0},
			    {4.0, 40.0}};

  IterationSnapshotExtractor extractor({1, 4});
  const NumericMatrix s = extractor.extract(table, 2);

  REQUIRE(s.getNumRows() == 2);
  REQUIRE(s(0, 0) == 1.0);
  REQUIRE(s(1, 0) == 4.0);
  REQUIRE(s(1, 1) == 40.0);

  const SummaryNames names = extractor.getSummaryNames();
  REQUIRE(names.text == std::vector<std::string>{"it1", "it4"});
  REQUIRE(names.latex == std::vector<std::string>{"$i_{1}$", "$i_{4}$"});

  SECTION("Invalid iteration lists")
  {
    REQUIRE_THROWS_AS(IterationSnapshotExtractor({}), InvalidParameterException);
    REQUIRE_THROWS_AS(IterationSnapshotExtractor({0, 2}), IndexOutOfRangeException);
    REQUIRE_THROWS_AS(IterationSnapshotExtractor({5}).extract(table, 1), IndexOutOfRangeException);
  }
}

TEST_CASE("SummaryExtractorFactory selects the strategy by value", "[SummaryExtractor][factory]")
{
  ExtractorSettings settings;
  settings.kind = ExtractorSettings::Kind::SteadyState;
  settings.steadyStateStart = 2;
  REQUIRE(SummaryExtractorFactory::create(settings)->getNumSummaries() == 6);

  settings.kind = ExtractorSettings::Kind::IterationSnapshot;
  settings.iterations = {10, 20, 30};
  auto snapshot = SummaryExtractorFactory::create(settings);
  REQUIRE(snapshot->getNumSummaries() == 3);
  REQUIRE(snapshot->getName() == "iterations");

  REQUIRE(SummaryExtractorFactory::parseKind("pphpc") == ExtractorSettings::Kind::SteadyState);
  REQUIRE(SummaryExtractorFactory::parseKind("Iters") == ExtractorSettings::Kind::IterationSnapshot);
  REQUIRE_THROWS_AS(SummaryExtractorFactory::parseKind("median"), ConfigurationException);
}
