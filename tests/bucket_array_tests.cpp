#include <catch2/catch.hpp>
#include <utility>
#include "bucket_array.hpp"

TEST_CASE("BucketArray slots start empty") {
  BucketArray<int*> a(8);
  REQUIRE(a.size() == 8);
  REQUIRE_FALSE(a.empty());
  for (std::size_t i = 0; i < a.size(); ++i) {
    REQUIRE(a[i] == nullptr);
  }
}

TEST_CASE("grown copies the prefix and leaves the tail empty") {
  int x = 1, y = 2;
  BucketArray<int*> a(4);
  a[0] = &x;
  a[3] = &y;
  BucketArray<int*> b = a.grown(16);
  REQUIRE(b.size() == 16);
  REQUIRE(b[0] == &x);
  REQUIRE(b[3] == &y);
  for (std::size_t i = 4; i < b.size(); ++i) {
    REQUIRE(b[i] == nullptr);
  }
  // source untouched
  REQUIRE(a[0] == &x);
  REQUIRE(a.data() != b.data());
}

TEST_CASE("fill resets every slot") {
  int x = 0;
  BucketArray<int*> a(4);
  a[1] = &x;
  a[2] = &x;
  a.fill(nullptr);
  for (std::size_t i = 0; i < a.size(); ++i) {
    REQUIRE(a[i] == nullptr);
  }
}

TEST_CASE("move transfers the storage and empties the source") {
  BucketArray<int*> a(8);
  int* const* slots = a.data();
  BucketArray<int*> b(std::move(a));
  REQUIRE(b.data() == slots);
  REQUIRE(b.size() == 8);
  REQUIRE(a.size() == 0);
  REQUIRE(a.empty());

  BucketArray<int*> c(2);
  c = std::move(b);
  REQUIRE(c.data() == slots);
  REQUIRE(c.size() == 8);
}

TEST_CASE("default-constructed array has no slots") {
  BucketArray<int*> a;
  REQUIRE(a.size() == 0);
  REQUIRE(a.data() == nullptr);
  BucketArray<int*> b = a.grown(4);
  REQUIRE(b.size() == 4);
}
