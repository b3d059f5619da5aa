// Ticket: 0009_adaptive_cutoff

#include <benchmark/benchmark.h>
#include <cmath>
#include <numbers>
#include <random>
#include <vector>
#include "mocap-core/src/Filtering/ButterworthFilter.hpp"
#include "mocap-core/src/Filtering/CutoffSelector.hpp"
#include "mocap-core/src/Filtering/HampelFilter.hpp"

using namespace mocap_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

constexpr double kFs = 120.0;

// 2 Hz movement plus white noise, fixed seed for deterministic benchmarks
std::vector<double> noisyMovement(std::size_t n)
{
  static std::mt19937 rng{42};
  std::normal_distribution<double> noise{0.0, 1.0};
  std::vector<double> x(n);
  for (std::size_t i = 0; i < n; ++i)
  {
    double const t = static_cast<double>(i) / kFs;
    x[i] = 50.0 * std::sin(2.0 * std::numbers::pi * 2.0 * t) + noise(rng);
  }
  return x;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Zero-phase low-pass of one channel
 *
 * Innermost operation of the residual analysis, run once per test cutoff.
 */
static void BM_Butterworth_Lowpass(benchmark::State& state)
{
  auto const x = noisyMovement(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state)
  {
    auto y = ButterworthFilter::lowpass(x, 6.0, kFs);
    benchmark::DoNotOptimize(y);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Butterworth_Lowpass)
  ->Args({600})    // 5 s take
  ->Args({7200})   // 1 min take
  ->Args({72000})  // 10 min take
  ->Complexity(benchmark::oN);

/**
 * @brief Residual analysis over the default 1-16 Hz search range
 *
 * Dominates the global filtering strategy, which analyzes five channels.
 *
 * @ticket 0009_adaptive_cutoff
 */
static void BM_CutoffSelector_Analyze(benchmark::State& state)
{
  auto const x = noisyMovement(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state)
  {
    auto result = CutoffSelector::analyze(x, kFs, CutoffSelector::Config{});
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CutoffSelector_Analyze)
  ->Args({600})
  ->Args({7200})
  ->Args({72000})
  ->Complexity(benchmark::oN);

static void BM_Hampel_Apply(benchmark::State& state)
{
  auto const x = noisyMovement(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state)
  {
    auto result = HampelFilter::apply(x);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Hampel_Apply)->Args({7200});

// Google Benchmark provides main() via benchmark::benchmark_main
