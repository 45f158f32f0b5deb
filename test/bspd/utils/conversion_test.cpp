#include "bspd/utils/conversion.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bspd::ProblemPosition;
using bspd::ToBspRange;

TEST_CASE("ToBspRange with no fields is the origin", "[conversion]") {
  auto range = ToBspRange(ProblemPosition{});

  REQUIRE(range.start == bsp::Position{.line = 0, .character = 0});
  REQUIRE(range.end == bsp::Position{.line = 0, .character = 0});
}

TEST_CASE("ToBspRange pointer only is an empty range", "[conversion]") {
  auto range = ToBspRange(ProblemPosition{.pointer = 7});

  REQUIRE(range.start == bsp::Position{.line = 0, .character = 7});
  REQUIRE(range.end == range.start);
}

TEST_CASE("ToBspRange shifts line to 0-based", "[conversion]") {
  auto range = ToBspRange(ProblemPosition{.line = 5});

  REQUIRE(range.start.line == 4);
  REQUIRE(range.end.line == 4);
  REQUIRE(range.start.character == 0);
  REQUIRE(range.end.character == 0);
}

TEST_CASE("ToBspRange line and pointer", "[conversion]") {
  auto range = ToBspRange(ProblemPosition{.line = 10, .pointer = 2});

  REQUIRE(range.start == bsp::Position{.line = 9, .character = 2});
  REQUIRE(range.end == bsp::Position{.line = 9, .character = 2});
}

TEST_CASE("ToBspRange end defaults to start", "[conversion]") {
  auto range =
      ToBspRange(ProblemPosition{.start_line = 3, .start_column = 12});

  REQUIRE(range.start == bsp::Position{.line = 2, .character = 12});
  REQUIRE(range.end == range.start);
}

TEST_CASE("ToBspRange full span", "[conversion]") {
  auto range = ToBspRange(ProblemPosition{
      .line = 1,
      .start_line = 2,
      .start_column = 4,
      .end_line = 6,
      .end_column = 9,
      .pointer = 5});

  REQUIRE(range.start == bsp::Position{.line = 1, .character = 4});
  REQUIRE(range.end == bsp::Position{.line = 5, .character = 9});
}

TEST_CASE("ToBspRange explicit fields win over line and pointer", "[conversion]") {
  SECTION("start line over line") {
    auto range = ToBspRange(ProblemPosition{.line = 20, .start_line = 8});
    REQUIRE(range.start.line == 7);
    // End line has no explicit value and falls back to line
    REQUIRE(range.end.line == 19);
  }

  SECTION("end column over pointer") {
    auto range = ToBspRange(ProblemPosition{.end_column = 30, .pointer = 3});
    REQUIRE(range.start.character == 3);
    REQUIRE(range.end.character == 30);
  }
}

TEST_CASE("ToBspRange end line falls back to resolved start", "[conversion]") {
  // No line and no end line: end takes the start line computed from
  // start_line, not 0
  auto range = ToBspRange(ProblemPosition{.start_line = 4, .end_column = 6});

  REQUIRE(range.start == bsp::Position{.line = 3, .character = 0});
  REQUIRE(range.end == bsp::Position{.line = 3, .character = 6});
}
