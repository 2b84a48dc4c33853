#include <catch2/catch.hpp>
#include <cstdint>
#include <string>
#include "string_hash.hpp"

TEST_CASE("string_hash is h*31 + byte") {
  REQUIRE(string_hash("") == 0);
  REQUIRE(string_hash("a") == 97);
  REQUIRE(string_hash("ab") == 97u * 31 + 98);
  REQUIRE(string_hash("abc") == 96354);
}

TEST_CASE("string_hash treats bytes as unsigned and wraps") {
  const std::string high(3, '\xff');
  REQUIRE(string_hash(high) == (255ull * 31 + 255) * 31 + 255);

  // long key overflows 64 bits many times over
  const std::string big(4096, 'z');
  std::uint64_t expect = 0;
  for (char c : big)
    expect = expect * 31 + static_cast<unsigned char>(c);
  REQUIRE(string_hash(big) == expect);
  REQUIRE(string_hash(big) == string_hash(std::string(4096, 'z')));
}

TEST_CASE("fold_address keeps in-range addresses and folds the rest") {
  // 40 buckets at 6 bits: addresses 40..63 are not materialized yet
  REQUIRE(fold_address(39, 6, 40) == 39);
  REQUIRE(fold_address(45, 6, 40) == 13);
  REQUIRE(fold_address(63, 6, 40) == 31);
  REQUIRE(fold_address(64 + 5, 6, 40) == 5); // only low bits count
  // full round: nothing to fold
  REQUIRE(fold_address(63, 6, 64) == 63);
  for (std::uint64_t h = 0; h < 1000; ++h)
    REQUIRE(fold_address(h, 6, 33) < 33);
}

TEST_CASE("bit_string renders msb first") {
  REQUIRE(bit_string(0) == std::string(64, '0'));
  REQUIRE(bit_string(5) == std::string(61, '0') + "101");
  const std::string top = bit_string(1ull << 63);
  REQUIRE(top.size() == 64);
  REQUIRE(top.front() == '1');
  REQUIRE(top.substr(1) == std::string(63, '0'));
}
