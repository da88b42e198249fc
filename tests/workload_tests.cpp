#include <catch2/catch_test_macros.hpp>
#include "../benchmarks/workloads.hpp"

TEST_CASE("update_scan workload caps the heap size") {
  Row r = run_heap_update(4 * kUpdateMaxN, Dist::Uniform, HeapMode::Max, 0, 42);
  REQUIRE(r.workload == "update_scan");
  REQUIRE(r.N == kUpdateMaxN);

  Row small = run_heap_update(100, Dist::Few, HeapMode::Min, 0, 42);
  REQUIRE(small.N == 100);
  REQUIRE(small.params == "min");
}
