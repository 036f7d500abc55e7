#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/filesystem.hpp>
#include "OutputUtils.h"

using namespace rebalancer::utils;

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
  std::ostringstream console;
  std::ostringstream logFile;

  {
    TeeStream tee(console, logFile);
    tee << "Rebalance 2021-04-01: portfolio value " << 1089730 << std::endl;
    tee << 'x';
    tee.flush();
  }

  REQUIRE(console.str() == "Rebalance 2021-04-01: portfolio value 1089730\nx");
  REQUIRE(logFile.str() == console.str());
}

TEST_CASE("createOutputFileName", "[OutputUtils]")
{
  namespace fs = boost::filesystem;
  const fs::path dir = fs::temp_directory_path() / fs::unique_path("rebalancer-out-%%%%-%%%%");

  REQUIRE_FALSE(fs::exists(dir));
  const std::string name = createOutputFileName(dir.string(), "Momentum", "QUARTERLY", "history");

  REQUIRE(fs::is_directory(dir));
  REQUIRE(fs::path(name).filename().string() == "momentum_quarterly_history.csv");
  REQUIRE(fs::path(name).parent_path() == dir);

  fs::remove_all(dir);
}
