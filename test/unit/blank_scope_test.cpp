#include <rdfdec/blank_scope.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace rdfdec;

TEST_CASE("blank_scope: labels keep their spelling", "[blank_scope]") {
  blank_scope scope;
  CHECK(scope.labelled("alice") == blank_node("alice"));
  CHECK(scope.labelled("alice") == blank_node("alice"));
  CHECK(scope.size() == 1);
}

TEST_CASE("blank_scope: fresh nodes are distinct", "[blank_scope]") {
  blank_scope scope;
  auto a = scope.fresh();
  auto b = scope.fresh();
  CHECK(a != b);
  CHECK(a.id() == "b1");
  CHECK(b.id() == "b2");
}

TEST_CASE("blank_scope: fresh nodes skip labels in use", "[blank_scope]") {
  blank_scope scope;
  scope.labelled("b1");
  CHECK(scope.fresh().id() == "b2");
}

TEST_CASE("blank_scope: a label taken by a fresh node is renamed",
          "[blank_scope]") {
  blank_scope scope;
  auto generated = scope.fresh();
  auto labelled = scope.labelled("b1");
  CHECK(generated.id() == "b1");
  CHECK(labelled != generated);
  CHECK(scope.labelled("b1") == labelled);
}
