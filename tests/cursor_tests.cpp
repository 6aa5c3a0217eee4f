#include <catch2/catch.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "hash_table.hpp"
#include "table_checks.hpp"

TEST_CASE("cursors over an empty table are exhausted immediately") {
  HashTable<std::string, int> t;
  auto e = t.entries();
  REQUIRE_FALSE(e.has_next());
  REQUIRE_THROWS_AS(e.next(), std::out_of_range);
  REQUIRE_THROWS_AS(t.keys().next(), std::out_of_range);
  REQUIRE_THROWS_AS(t.values().next(), std::out_of_range);

  std::size_t n = 0;
  for (const auto& k : t.keys()) {
    (void)k;
    ++n;
  }
  REQUIRE(n == 0);
}

TEST_CASE("pulling past the end throws") {
  HashTable<int, int> t;
  t.update(1, 10);
  t.update(2, 20);
  auto c = t.values();
  c.next();
  c.next();
  REQUIRE_FALSE(c.has_next());
  REQUIRE_THROWS_AS(c.next(), std::out_of_range);
}

TEST_CASE("has_next is idempotent") {
  HashTable<int, int> t;
  t.update(7, 70);
  auto c = t.entries();
  REQUIRE(c.has_next());
  REQUIRE(c.has_next());
  auto kv = c.next();
  REQUIRE(kv.first == 7);
  REQUIRE(kv.second == 70);
  REQUIRE_FALSE(c.has_next());
  REQUIRE_FALSE(c.has_next());
}

TEST_CASE("entries, keys and values walk the same order") {
  HashTable<int, std::string, CollidingHash> t;
  for (int i = 0; i < 200; ++i) t.update(i, std::to_string(i));

  std::vector<int> from_entries, from_keys;
  std::vector<std::string> from_values;
  auto e = t.entries();
  while (e.has_next()) {
    auto kv = e.next();
    REQUIRE(kv.second == std::to_string(kv.first));
    from_entries.push_back(kv.first);
  }
  for (const auto& k : t.keys()) from_keys.push_back(k);
  for (const auto& v : t.values()) from_values.push_back(v);

  REQUIRE(from_entries == from_keys);
  REQUIRE(from_values.size() == from_keys.size());
  for (std::size_t i = 0; i < from_keys.size(); ++i) {
    REQUIRE(from_values[i] == std::to_string(from_keys[i]));
  }
}

TEST_CASE("iteration yields each present key exactly once") {
  HashTable<int, int> t;
  for (int i = 0; i < 1000; ++i) t.update(i * 7, i);
  for (int i = 0; i < 1000; i += 3) t.remove(i * 7);

  std::set<int> expected;
  for (int i = 0; i < 1000; ++i) {
    if (i % 3 != 0) expected.insert(i * 7);
  }
  auto walked = walk_keys(t);
  REQUIRE(walked.first == t.size());
  REQUIRE_FALSE(walked.second);

  std::set<int> seen;
  for (const auto& k : t.keys()) seen.insert(k);
  REQUIRE(seen == expected);
}

TEST_CASE("order is stable for an unmodified table") {
  HashTable<std::string, int> t;
  for (int i = 0; i < 100; ++i) t.update("k" + std::to_string(i), i);
  std::vector<std::string> first, second;
  for (const auto& k : t.keys()) first.push_back(k);
  for (const auto& k : t.keys()) second.push_back(k);
  REQUIRE(first == second);
}

TEST_CASE("a cursor is one-shot") {
  HashTable<int, int> t;
  for (int i = 0; i < 10; ++i) t.update(i, i);
  auto c = t.keys();
  std::size_t n = 0;
  for (const auto& k : c) {
    (void)k;
    ++n;
  }
  REQUIRE(n == 10);
  REQUIRE_FALSE(c.has_next());
  REQUIRE(c.begin() == c.end());
}

TEST_CASE("cursor value types are plain values, references stay references") {
  using Table = HashTable<int, std::string>;
  using Keys = Table::key_cursor;
  using Values = Table::value_cursor;
  using Entries = Table::entry_cursor;

  STATIC_REQUIRE(std::is_same_v<Keys::value_type, int>);
  STATIC_REQUIRE(std::is_same_v<Keys::reference, const int&>);
  STATIC_REQUIRE(std::is_same_v<Values::value_type, std::string>);
  STATIC_REQUIRE(std::is_same_v<Values::reference, const std::string&>);
  STATIC_REQUIRE(std::is_same_v<Entries::value_type, std::pair<const int&, const std::string&>>);
  STATIC_REQUIRE(std::is_same_v<Entries::reference, Entries::value_type>);

  using It = Keys::iterator;
  STATIC_REQUIRE(std::is_same_v<std::iterator_traits<It>::value_type, int>);
  STATIC_REQUIRE(std::is_same_v<std::iterator_traits<It>::reference, const int&>);
}
