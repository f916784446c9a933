#include <worldvault/worldvault.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and defaults match the documented policy", "[headers]") {
  worldvault::retention::RetentionPolicy p{};
  REQUIRE(p.max_aggregate_bytes == 5ull * 1024 * 1024 * 1024);
  REQUIRE(p.min_keep_per_world == 3);
  worldvault::config::Config c{};
  REQUIRE(c.enforce_after_backup);
  REQUIRE(c.active_world_guard == std::chrono::seconds{60});
}
