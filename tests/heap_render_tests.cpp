#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include "../src/heap_render.hpp"

TEST_CASE("render_flat lists the array in layout order") {
  BinaryHeap<int> h;
  REQUIRE(render_flat(h) == "[]");
  for (int v : {10, 8, 5, 12, 7}) h.insert(v);
  REQUIRE(render_flat(h) == "[12, 10, 5, 8, 7]");

  std::ostringstream os;
  os << h;
  REQUIRE(os.str() == "[12, 10, 5, 8, 7]");
}

TEST_CASE("render_levels prints one tree level per line") {
  BinaryHeap<int> h;
  REQUIRE(render_levels(h) == "- Empty heap -");
  h.insert(42);
  REQUIRE(render_levels(h) == "[42]");
  h.clear();
  for (int v : {10, 8, 5, 12, 7}) h.insert(v);
  REQUIRE(render_levels(h) == "[12]\n[10][5]\n[8][7]");
}

TEST_CASE("render_levels on a full three-level tree") {
  auto h = BinaryHeap<std::string>::build({"a", "b", "c", "d", "e", "f", "g"}, HeapMode::Min);
  REQUIRE(render_levels(h) == "[a]\n[b][c]\n[d][e][f][g]");
}
