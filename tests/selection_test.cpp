/**
 * Selection and Backpropagation Unit Tests
 */

#include <doctest/doctest.h>
#include <lats/backprop.hpp>
#include <lats/config.hpp>
#include <lats/selection.hpp>
#include <lats/tree.hpp>

using namespace lats;

namespace {

MCTSConfig depth_config(int max_depth) {
  MCTSConfig c;
  c.max_depth = max_depth;
  return c;
}

}  // namespace

// ============================================================================
// Selection
// ============================================================================

TEST_CASE("selection: a lone root is selected") {
  Tree t("p");
  CHECK(selection::select(t, depth_config(3)) == ROOT_NODE);
}

TEST_CASE("selection: unvisited children come first, in order") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  NodeIndex c = t.add_child(ROOT_NODE, "c");

  CHECK(selection::select(t, depth_config(3)) == a);

  t.at(a).update_q_value(1.0);
  t.root().update_q_value(1.0);
  CHECK(selection::select(t, depth_config(3)) == b);

  t.at(b).update_q_value(0.0);
  t.root().update_q_value(0.0);
  CHECK(selection::select(t, depth_config(3)) == c);
}

TEST_CASE("selection: highest UCB wins among visited children") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  backprop::backpropagate(t, a, 0.2);
  backprop::backpropagate(t, b, 0.9);

  CHECK(selection::select(t, depth_config(3)) == b);
}

TEST_CASE("selection: exploration favors rarely visited children") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  for (int i = 0; i < 50; ++i) backprop::backpropagate(t, a, 0.6);
  backprop::backpropagate(t, b, 0.5);

  MCTSConfig c = depth_config(3);
  c.exploration_constant = 1.4;
  CHECK(selection::select(t, c) == b);

  c.exploration_constant = 0.0;
  CHECK(selection::select(t, c) == a);
}

TEST_CASE("selection: ties keep the first child") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  backprop::backpropagate(t, a, 0.5);
  backprop::backpropagate(t, b, 0.5);

  CHECK(selection::select(t, depth_config(3)) == a);
}

TEST_CASE("selection: descends to a leaf") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex a0 = t.add_child(a, "a0");
  backprop::backpropagate(t, a0, 0.7);

  CHECK(selection::select(t, depth_config(5)) == a0);
}

TEST_CASE("selection: stops at max_depth") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  t.add_child(a, "a0");
  backprop::backpropagate(t, a, 0.7);

  CHECK(selection::select(t, depth_config(1)) == a);
}

TEST_CASE("selection: is deterministic for a fixed tree") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  t.add_child(a, "a0");
  t.add_child(b, "b0");
  backprop::backpropagate(t, a, 0.3);
  backprop::backpropagate(t, b, 0.4);

  NodeIndex first = selection::select(t, depth_config(4));
  for (int i = 0; i < 5; ++i) {
    CHECK(selection::select(t, depth_config(4)) == first);
  }
}

// ============================================================================
// Backpropagation
// ============================================================================

TEST_CASE("backprop: updates every ancestor once") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex b = t.add_child(ROOT_NODE, "b");
  NodeIndex a0 = t.add_child(a, "a0");

  backprop::backpropagate(t, a0, 1.0);
  backprop::backpropagate(t, b, 0.0);

  CHECK(t.at(a0).visit_count == 1);
  CHECK(t.at(a).visit_count == 1);
  CHECK(t.at(b).visit_count == 1);
  CHECK(t.root().visit_count == 2);
  CHECK(t.root().q_value == doctest::Approx(0.5));
  CHECK(t.at(a).q_value == doctest::Approx(1.0));
}

TEST_CASE("backprop: root visits equal the number of backpropagations") {
  Tree t("p");
  NodeIndex a = t.add_child(ROOT_NODE, "a");
  NodeIndex a0 = t.add_child(a, "a0");
  for (int i = 0; i < 7; ++i) backprop::backpropagate(t, i % 2 ? a : a0, 0.25);

  CHECK(t.root().visit_count == 7);
  CHECK(t.at(a).visit_count == 7);
  CHECK(t.at(a0).visit_count == 4);
}

TEST_CASE("backprop: root-only update") {
  Tree t("p");
  backprop::backpropagate(t, ROOT_NODE, 0.3);
  CHECK(t.root().visit_count == 1);
  CHECK(t.root().q_value == doctest::Approx(0.3));
}
