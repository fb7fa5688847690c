#include <catch2/catch_test_macros.hpp>
#include <random>
#include <set>
#include <vector>

#include "RngUtils.h"
#include "randutils.hpp"

using stratval::rng_utils::get_engine;
using stratval::rng_utils::get_random_index;
using stratval::rng_utils::get_random_value;
using stratval::rng_utils::make_seed_seq;
using stratval::rng_utils::construct_seeded_engine;
using stratval::rng_utils::CRNKey;
using stratval::rng_utils::CRNEngineProvider;
using stratval::rng_utils::splitmix64;
using stratval::rng_utils::hash_combine64;
using stratval::rng_utils::hash_double64;
using stratval::rng_utils::hash_string64;

TEST_CASE("RngUtils: get_engine aliases wrapped and bare engines", "[rng][engine]") {
  std::mt19937_64 stdrng(12345u);
  REQUIRE(&get_engine(stdrng) == &stdrng);

  randutils::seed_seq_fe128 seed{1u, 2u, 3u, 4u};
  randutils::mt19937_rng rrng(seed);
  REQUIRE(&get_engine(rrng) == &rrng.engine());

  auto copy = rrng.engine();
  REQUIRE(get_random_value(rrng) == static_cast<std::uint64_t>(copy()));
}

TEST_CASE("RngUtils: get_random_index stays in range", "[rng]") {
  std::mt19937_64 rng(7u);
  std::set<std::size_t> seen;
  for (int i = 0; i < 2000; ++i)
    {
      const std::size_t idx = get_random_index(rng, 10);
      REQUIRE(idx < 10);
      seen.insert(idx);
    }
  REQUIRE(seen.size() == 10);
  REQUIRE(get_random_index(rng, 0) == 0);
}

TEST_CASE("RngUtils: hashing is deterministic and input sensitive", "[rng][hash]") {
  REQUIRE(splitmix64(42) == splitmix64(42));
  REQUIRE(splitmix64(42) != splitmix64(43));

  REQUIRE(hash_combine64({1, 2, 3}) == hash_combine64({1, 2, 3}));
  REQUIRE(hash_combine64({1, 2, 3}) != hash_combine64({3, 2, 1}));

  REQUIRE(hash_double64(0.25) == hash_double64(0.25));
  REQUIRE(hash_double64(0.25) != hash_double64(0.2500000001));

  REQUIRE(hash_string64("0050") == hash_string64("0050"));
  REQUIRE(hash_string64("0050") != hash_string64("0051"));
  REQUIRE(hash_string64("") != hash_string64("a"));
}

TEST_CASE("RngUtils: CRNKey derives distinct per-replicate seeds", "[rng][crn]") {
  CRNKey key(2024u);
  std::set<uint64_t> seeds;
  for (std::size_t b = 0; b < 500; ++b)
    seeds.insert(key.make_seed_for(b));
  REQUIRE(seeds.size() == 500);

  CRNKey tagged = key.with_tag(7u);
  REQUIRE(tagged.tags() == std::vector<uint64_t>{7u});
  REQUIRE(tagged.masterSeed() == 2024u);
  REQUIRE(tagged.make_seed_for(0) != key.make_seed_for(0));
}

TEST_CASE("RngUtils: CRNEngineProvider is reproducible", "[rng][crn]") {
  CRNEngineProvider<> provider(CRNKey(99u));

  auto a = provider.make_engine(3);
  auto b = provider.make_engine(3);
  auto c = provider.make_engine(4);

  const auto a0 = a();
  REQUIRE(a0 == b());
  REQUIRE(a0 != c());

  CRNEngineProvider<randutils::mt19937_rng> wrapped(CRNKey(99u));
  auto r1 = wrapped.make_engine(0);
  auto r2 = wrapped.make_engine(0);
  REQUIRE(r1.engine()() == r2.engine()());

  auto seq = make_seed_seq(123u);
  auto e1 = construct_seeded_engine<std::mt19937_64>(seq);
  auto seq2 = make_seed_seq(123u);
  auto e2 = construct_seeded_engine<std::mt19937_64>(seq2);
  REQUIRE(e1() == e2());
}
