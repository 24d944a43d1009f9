#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace mcpv;

TEST_CASE("trim strips surrounding whitespace", "[StringUtils]") {
  REQUIRE(trim("  hello world \t") == "hello world");
  REQUIRE(trim("{\"id\":1}\r") == "{\"id\":1}");
  REQUIRE(trim("no-op") == "no-op");
}

TEST_CASE("trim handles blank input", "[StringUtils]") {
  REQUIRE(trim("") == "");
  REQUIRE(trim(" \r\n\t ") == "");
}

TEST_CASE("toIsoTimestamp formats UTC with milliseconds", "[StringUtils]") {
  auto tp = std::chrono::system_clock::from_time_t(86400) +
            std::chrono::milliseconds(42);
  REQUIRE(toIsoTimestamp(tp) == "1970-01-02T00:00:00.042Z");
}
