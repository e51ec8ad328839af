#include <catch2/catch_test_macros.hpp>
#include "FileDiscovery.h"
#include <boost/filesystem.hpp>
#include <fstream>

using namespace simcompare;
namespace fs = boost::filesystem;

TEST_CASE("FileDiscovery glob matching", "[FileDiscovery]")
{
  REQUIRE(FileDiscovery::matches("stats*.txt", "stats001.txt"));
  REQUIRE(FileDiscovery::matches("stats*.txt", "stats.txt"));
  REQUIRE(FileDiscovery::matches("stats??.txt", "stats12.txt"));
  REQUIRE_FALSE(FileDiscovery::matches("stats??.txt", "stats123.txt"));
  REQUIRE_FALSE(FileDiscovery::matches("stats*.txt", "config.txt"));
  REQUIRE(FileDiscovery::matches("*", "anything"));
}

TEST_CASE("FileDiscovery lists matching regular files in sorted order", "[FileDiscovery]")
{
  const fs::path dir = fs::temp_directory_path() / fs::unique_path("simstats-discovery-%%%%-%%%%");
  fs::create_directories(dir / "stats_sub.txt");

  for (const char* name : {"stats3.txt", "stats1.txt", "stats2.txt", "other.csv"})
    {
      std::ofstream out((dir / name).string());
      out << "1\n";
    }

  SECTION("Only files matching the pattern, directories excluded")
  {
    const auto files = FileDiscovery::listFiles(FileSelection{dir.string(), "stats*.txt"});

    REQUIRE(files.size() == 3);
    REQUIRE(fs::path(files[0]).filename().string() == "stats1.txt");
    REQUIRE(fs::path(files[1]).filename().string() == "stats2.txt");
    REQUIRE(fs::path(files[2]).filename().string() == "stats3.txt");
  }

  SECTION("No match yields an empty list")
  {
    REQUIRE(FileDiscovery::listFiles(FileSelection{dir.string(), "*.dat"}).empty());
  }

  SECTION("A missing folder yields an empty list")
  {
    REQUIRE(FileDiscovery::listFiles(FileSelection{(dir / "nope").string(), "*"}).empty());
  }

  fs::remove_all(dir);
}
