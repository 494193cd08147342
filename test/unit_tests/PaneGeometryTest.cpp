#include "PaneGeometry.hpp"

#include "TestHeaders.hpp"

using namespace tt;

namespace {
// 2x2 grid of 400x300 panes: 0 1 / 2 3
vector<PaneLayout> grid() {
  return {
      PaneLayout{0, 0, 0, 400, 300},
      PaneLayout{1, 400, 0, 400, 300},
      PaneLayout{2, 0, 300, 400, 300},
      PaneLayout{3, 400, 300, 400, 300},
  };
}
}  // namespace

TEST_CASE("Directional focus picks the nearest pane on that side",
          "[PaneGeometry]") {
  auto layouts = grid();
  REQUIRE(*findPaneInDirection(layouts, 0, FocusDirection::Right) == 1);
  REQUIRE(*findPaneInDirection(layouts, 0, FocusDirection::Down) == 2);
  REQUIRE(*findPaneInDirection(layouts, 3, FocusDirection::Left) == 2);
  REQUIRE(*findPaneInDirection(layouts, 3, FocusDirection::Up) == 1);
  REQUIRE(!findPaneInDirection(layouts, 0, FocusDirection::Left));
  REQUIRE(!findPaneInDirection(layouts, 0, FocusDirection::Up));
  REQUIRE(!findPaneInDirection(layouts, 42, FocusDirection::Up));
}

TEST_CASE("Directional focus ignores tree order", "[PaneGeometry]") {
  // A tall pane on the left and two stacked panes on the right
  vector<PaneLayout> layouts = {
      PaneLayout{5, 0, 0, 400, 600},
      PaneLayout{6, 400, 0, 400, 200},
      PaneLayout{7, 400, 200, 400, 400},
  };
  // Both right panes qualify; pane 7's center (600,400) is closer to (200,300)
  REQUIRE(*findPaneInDirection(layouts, 5, FocusDirection::Right) == 7);
  REQUIRE(*findPaneInDirection(layouts, 6, FocusDirection::Left) == 5);
  REQUIRE(*findPaneInDirection(layouts, 6, FocusDirection::Down) == 7);
  // Pane 5's center is not strictly below pane 6's center
  REQUIRE(!findPaneInDirection(layouts, 7, FocusDirection::Down));
}

TEST_CASE("Pane hit testing uses half-open rectangles", "[PaneGeometry]") {
  auto layouts = grid();
  REQUIRE(*findPaneAt(layouts, 0, 0) == 0);
  REQUIRE(*findPaneAt(layouts, 399.5f, 299.5f) == 0);
  REQUIRE(*findPaneAt(layouts, 400, 0) == 1);
  REQUIRE(*findPaneAt(layouts, 400, 300) == 3);
  REQUIRE(!findPaneAt(layouts, 800, 10));
  REQUIRE(!findPaneAt(layouts, -1, 10));
}

TEST_CASE("Divider hit testing", "[PaneGeometry]") {
  DividerInfo vertical{SplitAxis::Vertical, 400, 0, 800, 0, 600, {}};
  DividerInfo horizontal{SplitAxis::Horizontal, 300, 0, 600, 400, 800, {true}};
  vector<DividerInfo> dividers = {vertical, horizontal};

  auto hit = findDividerAt(dividers, 403, 100, 4);
  REQUIRE(hit.has_value());
  REQUIRE(hit->axis == SplitAxis::Vertical);

  REQUIRE(!findDividerAt(dividers, 405, 100, 4));
  REQUIRE(!findDividerAt(dividers, 400, 601, 4));

  hit = findDividerAt(dividers, 600, 297, 4);
  REQUIRE(hit.has_value());
  REQUIRE(hit->path == DividerPath{true});
  // The horizontal divider only spans the right half
  REQUIRE(!findDividerAt(dividers, 200, 300, 4));
}

TEST_CASE("Drag ratio follows the cursor within bounds", "[PaneGeometry]") {
  DividerInfo vertical{SplitAxis::Vertical, 400, 0, 800, 0, 600, {}};
  REQUIRE(*dragRatio(vertical, 200, 50, 0.1f, 0.9f) == Catch::Approx(0.25f));
  REQUIRE(*dragRatio(vertical, 10, 50, 0.1f, 0.9f) == Catch::Approx(0.1f));
  REQUIRE(*dragRatio(vertical, 790, 50, 0.1f, 0.9f) == Catch::Approx(0.9f));

  DividerInfo nested{SplitAxis::Horizontal, 450, 300, 300, 400, 800, {true}};
  REQUIRE(*dragRatio(nested, 0, 375, 0.1f, 0.9f) == Catch::Approx(0.25f));

  DividerInfo collapsed{SplitAxis::Vertical, 0, 0, 0.5f, 0, 600, {}};
  REQUIRE(!dragRatio(collapsed, 10, 10, 0.1f, 0.9f));
}

TEST_CASE("Grid size from pixels", "[PaneGeometry]") {
  GridSize g = gridForRect(800, 600, 8, 16);
  REQUIRE(g.columns == 100);
  REQUIRE(g.rows == 37);

  g = gridForRect(10, 5, 8, 16);
  REQUIRE(g.columns == MIN_GRID_COLUMNS);
  REQUIRE(g.rows == MIN_GRID_ROWS);

  g = gridForRect(0, 0, 8, 16);
  REQUIRE(g.columns == 2);
  REQUIRE(g.rows == 1);
}

TEST_CASE("Focus direction names", "[PaneGeometry]") {
  REQUIRE(parseFocusDirection("left") == FocusDirection::Left);
  REQUIRE(parseFocusDirection("down") == FocusDirection::Down);
  REQUIRE_THROWS_AS(parseFocusDirection("sideways"), std::invalid_argument);
}
