// ============================================================================
// test_spike_generator.cpp -- Test Markov and Hawkes spike-train generators
// ============================================================================
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "errors.hpp"
#include "random_source.hpp"
#include "spike_generator.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using simcad::Engine;
using simcad::GenerationExhausted;
using simcad::HawkesParams;
using simcad::HawkesSpikeGenerator;
using simcad::InvalidParameter;
using simcad::MarkovSpikeGenerator;
using simcad::RandomSource;
using simcad::SpikeTrain;
using simcad::Stream;
using simcad::TransitionMatrix;

static std::size_t count_spikes(const SpikeTrain& s) {
  std::size_t n = 0;
  for (auto v : s) n += v;
  return n;
}

/// Variance / mean of spike counts in consecutive windows.
static double fano_factor(const SpikeTrain& s, std::size_t window) {
  std::vector<double> counts;
  for (std::size_t i = 0; i + window <= s.size(); i += window) {
    double c = 0.0;
    for (std::size_t k = i; k < i + window; ++k) c += s[k];
    counts.push_back(c);
  }
  double mean = 0.0;
  for (auto c : counts) mean += c;
  mean /= double(counts.size());
  double var = 0.0;
  for (auto c : counts) var += (c - mean) * (c - mean);
  var /= double(counts.size() - 1);
  return mean > 0.0 ? var / mean : 0.0;
}

// ============================================================================
// Test 1: Markov trains have the right length, start silent, never all-zero
// ============================================================================
void test_markov_nonzero() {
  const TransitionMatrix mats[] = {
    simcad::kDefaultTransitionMatrix,
    {{ {{0.5, 0.5}}, {{0.5, 0.5}} }},
    {{ {{0.999, 0.001}}, {{0.3, 0.7}} }},
  };
  const RandomSource src(1234);

  for (const auto& P : mats) {
    MarkovSpikeGenerator gen(P, /*max_retries=*/1000);
    for (std::uint64_t cell = 0; cell < 25; ++cell) {
      Engine eng = src.stream(Stream::Spikes, cell);
      int attempts = 0;
      SpikeTrain s = gen.generate(200, eng, &attempts);
      EXPECT_EQ(s.size(), std::size_t(200));
      EXPECT_EQ(s[0], 0);
      EXPECT_TRUE(count_spikes(s) >= 1);
      EXPECT_TRUE(attempts >= 1);
      for (auto v : s) EXPECT_TRUE(v == 0 || v == 1);
    }
  }
  std::puts("markov trains non-empty: OK");
}

// ============================================================================
// Test 2: bad transition matrices are rejected
// ============================================================================
void test_markov_invalid_matrix() {
  const TransitionMatrix bad_sum{{ {{0.9, 0.2}}, {{0.5, 0.5}} }};
  const TransitionMatrix bad_entry{{ {{1.2, -0.2}}, {{0.5, 0.5}} }};
  const TransitionMatrix near_one{{ {{0.98, 0.020000001}}, {{0.02, 0.98}} }};

  int threw = 0;
  try {
    MarkovSpikeGenerator gen(bad_sum);
  } catch (const InvalidParameter&) { ++threw; }
  try {
    MarkovSpikeGenerator gen(bad_entry);
  } catch (const InvalidParameter&) { ++threw; }
  try {
    MarkovSpikeGenerator gen(simcad::kDefaultTransitionMatrix, /*max_retries=*/0);
  } catch (const InvalidParameter&) { ++threw; }
  EXPECT_EQ(threw, 3);

  // within allclose tolerance is accepted
  MarkovSpikeGenerator ok(near_one);
  (void)ok;
  std::puts("markov matrix validation: OK");
}

// ============================================================================
// Test 3: a chain that can never leave the silent state exhausts its retries
// ============================================================================
void test_markov_exhausted() {
  const TransitionMatrix stuck{{ {{1.0, 0.0}}, {{0.0, 1.0}} }};
  MarkovSpikeGenerator gen(stuck, /*max_retries=*/7);
  Engine eng = RandomSource(1).stream(Stream::Spikes, 0);
  bool threw = false;
  try {
    (void)gen.generate(100, eng);
  } catch (const GenerationExhausted& e) {
    threw = true;
    EXPECT_EQ(e.attempts(), 7);
  }
  EXPECT_TRUE(threw);

  // one frame: state[0] is always silent
  bool threw_short = false;
  MarkovSpikeGenerator gen2(simcad::kDefaultTransitionMatrix, 3);
  try {
    (void)gen2.generate(1, eng);
  } catch (const GenerationExhausted&) { threw_short = true; }
  EXPECT_TRUE(threw_short);
  std::puts("markov retry cap: OK");
}

// ============================================================================
// Test 4: Hawkes trains are never all-zero
// ============================================================================
void test_hawkes_nonzero() {
  HawkesSpikeGenerator gen(HawkesParams{0.01, 0.05, 10.0});
  const RandomSource src(99);
  for (std::uint64_t cell = 0; cell < 50; ++cell) {
    Engine eng = src.stream(Stream::Spikes, cell);
    SpikeTrain s = gen.generate(200, eng);
    EXPECT_EQ(s.size(), std::size_t(200));
    EXPECT_TRUE(count_spikes(s) >= 1);
  }
  std::puts("hawkes trains non-empty: OK");
}

// ============================================================================
// Test 5: the running-sum intensity matches the direct double sum
// ============================================================================
void test_hawkes_matches_direct_sum() {
  const HawkesParams p{0.02, 0.08, 7.0};
  HawkesSpikeGenerator gen(p, 1000);

  for (std::uint64_t cell = 0; cell < 10; ++cell) {
    Engine a = RandomSource(555).stream(Stream::Spikes, cell);
    Engine b = RandomSource(555).stream(Stream::Spikes, cell);

    SpikeTrain fast = gen.generate(300, a);

    // reference: O(N^2) intensity, same draws, same rejection loop
    SpikeTrain ref;
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    for (;;) {
      ref.assign(300, 0);
      for (std::size_t i = 0; i < ref.size(); ++i) {
        double lam = p.mu;
        for (std::size_t k = 0; k < i; ++k) {
          if (ref[k]) lam += p.alpha * std::exp(-double(i - k) / p.tau);
        }
        lam = std::min(lam, 1.0);
        if (u01(b) < lam) ref[i] = 1;
      }
      if (count_spikes(ref) > 0) break;
    }

    EXPECT_TRUE(fast == ref);
  }
  std::puts("hawkes running sum == direct sum: OK");
}

// ============================================================================
// Test 6: self-excitation shows up as burstiness vs. a memoryless chain
// ============================================================================
void test_hawkes_burstier_than_markov() {
  const std::size_t N = 40000;
  HawkesSpikeGenerator hawkes(HawkesParams{0.01, 0.05, 10.0});
  Engine eh = RandomSource(2024).stream(Stream::Spikes, 0);
  SpikeTrain sh = hawkes.generate(N, eh);

  // Markov chain whose rows are equal is i.i.d. Bernoulli at the same rate
  const double rate = double(count_spikes(sh)) / double(N);
  EXPECT_TRUE(rate > 0.0 && rate < 0.5);
  const TransitionMatrix memoryless{{ {{1.0 - rate, rate}}, {{1.0 - rate, rate}} }};
  MarkovSpikeGenerator markov(memoryless);
  Engine em = RandomSource(2024).stream(Stream::Spikes, 1);
  SpikeTrain sm = markov.generate(N, em);

  const double fh = fano_factor(sh, 100);
  const double fm = fano_factor(sm, 100);
  std::printf("  fano: hawkes=%.2f markov=%.2f (rate=%.4f)\n", fh, fm, rate);
  EXPECT_TRUE(fh > 1.5);
  EXPECT_TRUE(fm < 1.3);
  EXPECT_TRUE(fh > fm);
  std::puts("hawkes burstiness: OK");
}

// ============================================================================
// Test 7: Hawkes parameter validation and exhaustion
// ============================================================================
void test_hawkes_invalid_and_exhausted() {
  const HawkesParams bad[] = {
    {0.0, 0.05, 10.0},
    {1.0, 0.05, 10.0},
    {0.01, 0.0, 10.0},
    {0.01, 0.05, 0.0},
    {0.01, 0.05, -3.0},
  };
  int threw = 0;
  for (const auto& p : bad) {
    try {
      HawkesSpikeGenerator gen(p);
    } catch (const InvalidParameter&) { ++threw; }
  }
  EXPECT_EQ(threw, 5);

  HawkesSpikeGenerator quiet(HawkesParams{1e-15, 1e-15, 1.0}, 4);
  Engine eng = RandomSource(3).stream(Stream::Spikes, 0);
  bool exhausted = false;
  try {
    (void)quiet.generate(20, eng);
  } catch (const GenerationExhausted& e) {
    exhausted = true;
    EXPECT_EQ(e.attempts(), 4);
  }
  EXPECT_TRUE(exhausted);
  std::puts("hawkes validation and retry cap: OK");
}

// ============================================================================
// Test 8: factory and strategy names
// ============================================================================
void test_factory() {
  simcad::SpikeConfig cfg;
  cfg.strategy = simcad::parse_spike_strategy("hawkes");
  auto g = simcad::make_spike_generator(cfg);
  EXPECT_TRUE(g->strategy() == simcad::SpikeStrategy::Hawkes);

  cfg.strategy = simcad::parse_spike_strategy("markov");
  g = simcad::make_spike_generator(cfg);
  EXPECT_TRUE(g->strategy() == simcad::SpikeStrategy::Markov);

  bool threw = false;
  try {
    (void)simcad::parse_spike_strategy("poisson");
  } catch (const InvalidParameter&) { threw = true; }
  EXPECT_TRUE(threw);
  std::puts("spike generator factory: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running SpikeGenerator tests...");
  test_markov_nonzero();
  test_markov_invalid_matrix();
  test_markov_exhausted();
  test_hawkes_nonzero();
  test_hawkes_matches_direct_sum();
  test_hawkes_burstier_than_markov();
  test_hawkes_invalid_and_exhausted();
  test_factory();
  std::puts("All SpikeGenerator tests PASSED.");
  return 0;
}
