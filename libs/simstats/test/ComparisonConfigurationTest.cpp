#include <catch2/catch_test_macros.hpp>
#include "ComparisonConfiguration.h"
#include "SimStatsException.h"
#include <boost/filesystem.hpp>
#include <fstream>

using namespace simcompare;
namespace fs = boost::filesystem;

namespace
{
  const char* kFullConfig = R"({
    "implementations": [
      { "name": "NetLogo", "folder": "data/nl", "files": "stats*.txt" },
      { "name": "Java", "folder": "data/java", "files": "stats*.txt" }
    ],
    "outputs": ["sheep", "wolves", "grass"],
    "extractor": { "type": "steady-state", "steadyStateStart": 1001 },
    "alpha": 0.01,
    "tests": ["p", "np", "p", "np", "p", "p"],
    "threads": 4
  })";
}

TEST_CASE("ComparisonConfiguration reads a complete file", "[ComparisonConfiguration]")
{
  const ComparisonConfiguration config = ComparisonConfiguration::fromJson(kFullConfig);

  REQUIRE(config.getImplementations().size() == 2);
  REQUIRE(config.getImplementations()[1].name == "Java");
  REQUIRE(config.getImplementations()[0].selection.folder == "data/nl");
  REQUIRE(config.getOutputs().getNames() == std::vector<std::string>{"sheep", "wolves", "grass"});
  REQUIRE(config.getExtractorSettings().kind == ExtractorSettings::Kind::SteadyState);
  REQUIRE(config.getExtractorSettings().steadyStateStart == 1001);
  REQUIRE(config.getAlpha() == 0.01);
  REQUIRE(config.getNumThreads() == 4);
  REQUIRE(config.hasExplicitTests());

  const TestSelector tests = config.getTestSelector(6);
  REQUIRE(tests.size() == 6);
  REQUIRE(tests[1] == TestKind::NonParametric);
}

TEST_CASE("ComparisonConfiguration defaults", "[ComparisonConfiguration]")
{
  const ComparisonConfiguration config = ComparisonConfiguration::fromJson(R"({
    "implementations": [ { "name": "A", "folder": "a", "files": "*" } ],
    "outputs": 2,
    "extractor": { "type": "iterations", "iterations": [100, 500] }
  })");

  REQUIRE(config.getOutputs().getNames() == std::vector<std::string>{"o1", "o2"});
  REQUIRE(config.getExtractorSettings().kind == ExtractorSettings::Kind::IterationSnapshot);
  REQUIRE(config.getExtractorSettings().iterations == std::vector<std::size_t>{100, 500});
  REQUIRE(config.getAlpha() == 0.05);
  REQUIRE(config.getNumThreads() == 1);
  REQUIRE_FALSE(config.hasExplicitTests());
  REQUIRE(config.getTestSelector(2) == uniformSelector(2, TestKind::Parametric));
}

TEST_CASE("ComparisonConfiguration rejects bad input", "[ComparisonConfiguration]")
{
  SECTION("Malformed JSON")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson("{ \"outputs\": "), ConfigurationException);
  }

  SECTION("Missing implementations")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson(R"({
      "outputs": 2, "extractor": { "type": "steady-state", "steadyStateStart": 1 } })"),
		      ConfigurationException);
  }

  SECTION("Alpha outside (0, 1)")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson(R"({
      "implementations": [ { "name": "A", "folder": "a", "files": "*" } ],
      "outputs": 2, "alpha": 1.5,
      "extractor": { "type": "steady-state", "steadyStateStart": 1 } })"),
		      ConfigurationException);
  }

  SECTION("Unknown extractor and test kinds")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson(R"({
      "implementations": [ { "name": "A", "folder": "a", "files": "*" } ],
      "outputs": 2, "extractor": { "type": "median" } })"),
		      ConfigurationException);

    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson(R"({
      "implementations": [ { "name": "A", "folder": "a", "files": "*" } ],
      "outputs": 2, "tests": ["p", "maybe"],
      "extractor": { "type": "steady-state", "steadyStateStart": 1 } })"),
		      ConfigurationException);
  }

  SECTION("Zero outputs")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::fromJson(R"({
      "implementations": [ { "name": "A", "folder": "a", "files": "*" } ],
      "outputs": 0, "extractor": { "type": "steady-state", "steadyStateStart": 1 } })"),
		      ConfigurationException);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(ComparisonConfiguration::loadFromFile("/nonexistent/run.json"),
		      ConfigurationException);
  }
}

TEST_CASE("ComparisonConfiguration loads from disk", "[ComparisonConfiguration]")
{
  const fs::path file = fs::temp_directory_path() / fs::unique_path("simstats-config-%%%%-%%%%.json");
  {
    std::ofstream out(file.string());
    out << kFullConfig;
  }

  const ComparisonConfiguration config = ComparisonConfiguration::loadFromFile(file.string());
  REQUIRE(config.getImplementations().getNames() == std::vector<std::string>{"NetLogo", "Java"});

  fs::remove(file);
}
