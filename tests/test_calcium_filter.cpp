// ============================================================================
// test_calcium_filter.cpp -- Test AR(2) and bi-exponential calcium filters
// ============================================================================
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "calcium_filter.hpp"
#include "errors.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_NEAR(a,b,tol) do{ \
  double _va=(a); double _vb=(b); \
  if(!(std::fabs(_va-_vb) <= (tol))){ \
    std::fprintf(stderr,"EXPECT_NEAR failed: %s=%.12g %s=%.12g @ %s:%d\n", \
                 #a,_va,#b,_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using simcad::CalciumFilter;
using simcad::CalciumStrategy;
using simcad::CalciumTrace;
using simcad::SpikeTrain;

// ============================================================================
// Test 1: equal time constants collapse to a double pole
// ============================================================================
void test_ar2_coeffs_equal_tau() {
  for (double t : {1.0, 2.5, 10.0, 40.0}) {
    auto [th1, th2] = simcad::ar2_coeffs(t, t);
    EXPECT_NEAR(th1, 2.0 * std::exp(-1.0 / t), 1e-12);
    EXPECT_NEAR(th2, -std::exp(-2.0 / t), 1e-12);
  }
  std::puts("ar2 coefficients for equal taus: OK");
}

// ============================================================================
// Test 2: no spikes, no calcium
// ============================================================================
void test_zero_spikes_zero_trace() {
  const SpikeTrain zeros(128, 0);
  for (auto s : {CalciumStrategy::AR2, CalciumStrategy::BiExp}) {
    CalciumFilter f(s, 10.0, 4.0);
    CalciumTrace c = f.apply(zeros);
    EXPECT_TRUE(c.size() == zeros.size());
    for (double v : c) EXPECT_TRUE(v == 0.0);
  }
  std::puts("all-zero spikes give all-zero traces: OK");
}

// ============================================================================
// Test 3: AR(2) impulse response follows the recurrence
// ============================================================================
void test_ar2_impulse() {
  SpikeTrain s(6, 0);
  s[0] = 1;
  CalciumFilter f(CalciumStrategy::AR2, 10.0, 4.0);
  auto [th1, th2] = f.theta();
  CalciumTrace c = f.apply(s);

  EXPECT_NEAR(c[0], 1.0, 1e-12);
  EXPECT_NEAR(c[1], th1, 1e-12);
  EXPECT_NEAR(c[2], th1 * th1 + th2, 1e-12);
  EXPECT_NEAR(c[3], th1 * c[2] + th2 * c[1], 1e-12);

  // closed form: h[n] = (z1^(n+1) - z2^(n+1)) / (z1 - z2)
  const double z1 = std::exp(-1.0 / 10.0), z2 = std::exp(-1.0 / 4.0);
  for (std::size_t n = 0; n < c.size(); ++n) {
    const double h = (std::pow(z1, n + 1) - std::pow(z2, n + 1)) / (z1 - z2);
    EXPECT_NEAR(c[n], h, 1e-12);
  }
  std::puts("ar2 impulse response: OK");
}

// ============================================================================
// Test 4: bi-exponential output is the shifted kernel, and causal
// ============================================================================
void test_biexp_impulse_and_causality() {
  const double td = 12.0, tr = 3.0;
  SpikeTrain s(40, 0);
  s[7] = 1;
  CalciumFilter f(CalciumStrategy::BiExp, td, tr);
  CalciumTrace c = f.apply(s);

  for (std::size_t n = 0; n < 7; ++n) EXPECT_TRUE(c[n] == 0.0);
  EXPECT_NEAR(c[7], 0.0, 1e-15);   // kernel(0) = 1 - 1
  for (std::size_t n = 7; n < s.size(); ++n) {
    const double t = double(n - 7);
    EXPECT_NEAR(c[n], std::exp(-t / td) - std::exp(-t / tr), 1e-12);
  }
  std::puts("biexp impulse response and causality: OK");
}

// ============================================================================
// Test 5: both filters are linear and causal
// ============================================================================
void test_linear_and_causal() {
  SpikeTrain a(60, 0), b(60, 0), ab(60, 0);
  a[3] = 1; b[20] = 1; ab[3] = 1; ab[20] = 1;

  for (auto strat : {CalciumStrategy::AR2, CalciumStrategy::BiExp}) {
    CalciumFilter f(strat, 15.0, 5.0);
    CalciumTrace ca = f.apply(a), cb = f.apply(b), cab = f.apply(ab);
    for (std::size_t n = 0; n < ab.size(); ++n) {
      EXPECT_NEAR(cab[n], ca[n] + cb[n], 1e-12);
    }
    // a later spike never changes earlier samples
    for (std::size_t n = 0; n < 20; ++n) EXPECT_NEAR(cab[n], ca[n], 0.0);
  }
  std::puts("filters linear and causal: OK");
}

// ============================================================================
// Test 6: the two strategies share poles: biexp[n+1] = (z1 - z2) * ar2[n]
// ============================================================================
void test_biexp_matches_ar2_shape() {
  const double td = 20.0, tr = 5.0;
  SpikeTrain s(50, 0);
  s[0] = 1;
  CalciumTrace ar2 = CalciumFilter(CalciumStrategy::AR2, td, tr).apply(s);
  CalciumTrace bx  = CalciumFilter(CalciumStrategy::BiExp, td, tr).apply(s);
  const double z1 = std::exp(-1.0 / td), z2 = std::exp(-1.0 / tr);
  for (std::size_t n = 0; n + 1 < s.size(); ++n) {
    EXPECT_NEAR(bx[n + 1], (z1 - z2) * ar2[n], 1e-12);
  }
  std::puts("biexp and ar2 share the same dynamics: OK");
}

// ============================================================================
// Test 7: non-positive taus rejected, strategy names parsed
// ============================================================================
void test_invalid_tau() {
  int threw = 0;
  try { CalciumFilter f(CalciumStrategy::AR2, 0.0, 4.0); }
  catch (const simcad::InvalidParameter&) { ++threw; }
  try { CalciumFilter f(CalciumStrategy::BiExp, 10.0, -1.0); }
  catch (const simcad::InvalidParameter&) { ++threw; }
  try { (void)simcad::parse_calcium_strategy("ar3"); }
  catch (const simcad::InvalidParameter&) { ++threw; }
  EXPECT_TRUE(threw == 3);
  EXPECT_TRUE(simcad::parse_calcium_strategy("biexp") == CalciumStrategy::BiExp);

  // rise slower than decay is accepted
  CalciumFilter swapped(CalciumStrategy::AR2, 2.0, 8.0);
  (void)swapped;
  std::puts("calcium parameter validation: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running CalciumFilter tests...");
  test_ar2_coeffs_equal_tau();
  test_zero_spikes_zero_trace();
  test_ar2_impulse();
  test_biexp_impulse_and_causality();
  test_linear_and_causal();
  test_biexp_matches_ar2_shape();
  test_invalid_tau();
  std::puts("All CalciumFilter tests PASSED.");
  return 0;
}
