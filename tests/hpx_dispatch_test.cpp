#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <hpx/hpx_init.hpp>
#include <hpx/include/runtime.hpp>

#include <mandelmap/dispatch_harness.hpp>
#include <mandelmap/errors.hpp>
#include <mandelmap/execution_context.hpp>
#include <mandelmap/hpx_execution_context.hpp>
#include <mandelmap/opencv_execution_context.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

TEST_CASE("HpxExecutionContext: runs on the default pool") {
  mandelmap::HpxExecutionContext context;
  CHECK(context.pool_name() == "default");
  CHECK(context.name() == "hpx:default");
  CHECK(context.num_lanes() >= 1);
  CHECK_NOTHROW(context.acquire());
}

TEST_CASE("HpxExecutionContext: matches the sequential reference") {
  mandelmap::SequentialExecutionContext reference;
  mandelmap::HpxExecutionContext context;

  const int width = 115, height = 77, bound = 100;
  mandelmap::DivergenceMap expected =
      mandelmap::DispatchHarness(reference).run(width, height, bound);
  mandelmap::DivergenceMap actual =
      mandelmap::DispatchHarness(context).run(width, height, bound);

  REQUIRE(actual.width() == width);
  REQUIRE(actual.height() == height);
  CHECK(actual == expected);
}

TEST_CASE("HpxExecutionContext: repeated runs are identical") {
  mandelmap::HpxExecutionContext context("default", 3);
  mandelmap::DispatchHarness harness(context);

  mandelmap::DivergenceMap first = harness.run(64, 48, 80);
  mandelmap::DivergenceMap second = harness.run(64, 48, 80);
  CHECK(first == second);
}

TEST_CASE("HpxExecutionContext: reference points") {
  mandelmap::HpxExecutionContext context;
  mandelmap::DispatchHarness harness(context);

  mandelmap::DivergenceMap boundary = harness.run(2, 2, 1);
  CHECK(boundary.at(0, 0) == 1);

  mandelmap::DivergenceMap small = harness.run(4, 3, 500);
  CHECK(small.at(2, 1) == 0);
  CHECK(small.at(3, 1) == 3);
}

TEST_CASE("HpxExecutionContext: padded geometry and chunking") {
  mandelmap::SequentialExecutionContext reference;
  mandelmap::DivergenceMap expected =
      mandelmap::DispatchHarness(reference).run(33, 17, 60);

  for (std::size_t chunk : {std::size_t(1), std::size_t(7), std::size_t(0)})
  {
    mandelmap::HpxExecutionContext context("default", chunk);
    mandelmap::LaunchConfig config;
    config.lane_group_size = 16;
    mandelmap::DivergenceMap actual =
        mandelmap::DispatchHarness(context, config).run(33, 17, 60);
    CHECK(actual == expected);
  }
}

TEST_CASE("HpxExecutionContext: every entry within the bound") {
  mandelmap::HpxExecutionContext context;
  const int bound = 25;
  mandelmap::DivergenceMap map =
      mandelmap::DispatchHarness(context).run(90, 60, bound);

  double min_val = 0.0, max_val = 0.0;
  cv::minMaxLoc(map.mat(), &min_val, &max_val);
  CHECK(min_val >= 0);
  CHECK(max_val <= bound);
  CHECK(map.max_value() == static_cast<std::int32_t>(max_val));
}

TEST_CASE("HpxExecutionContext: missing pool is an environment error") {
  mandelmap::HpxExecutionContext context("no-such-pool");
  mandelmap::DispatchHarness harness(context);

  CHECK(context.num_lanes() == 0);
  CHECK_THROWS_AS(harness.run(8, 8, 10), mandelmap::environment_error);
}

TEST_CASE("OpenCVExecutionContext: matches the sequential reference") {
  mandelmap::SequentialExecutionContext reference;
  mandelmap::DivergenceMap expected =
      mandelmap::DispatchHarness(reference).run(101, 67, 120);

  for (double nstripes : {-1., 4., 1000.})
  {
    mandelmap::OpenCVExecutionContext context(nstripes);
    CHECK(context.name().find("opencv:") == 0);
    mandelmap::DivergenceMap actual =
        mandelmap::DispatchHarness(context).run(101, 67, 120);
    CHECK(actual == expected);
  }
}

TEST_CASE("DispatchHarness: logs launch and timing") {
  mandelmap::HpxExecutionContext context;
  mandelmap::DispatchHarness harness(context);

  std::ostringstream log;
  harness.setLog(&log);
  harness.run(16, 9, 20);

  std::string text = log.str();
  CHECK(text.find("[dispatch] hpx:default grid=16x9") != std::string::npos);
  CHECK(text.find("execution time") != std::string::npos);
}

///////////////////////////////////////////////////////////////////////////
int hpx_main(int argc, char* argv[])
{
    doctest::Context context(argc, argv);
    int result = context.run();

    hpx::finalize();
    return result;
}

int main(int argc, char* argv[])
{
    // let doctest options pass through the HPX command line handling
    std::vector<std::string> const cfg = {
        "hpx.commandline.allow_unknown!=1"
    };

    return hpx::init(argc, argv, cfg);
}
