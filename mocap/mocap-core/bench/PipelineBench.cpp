// Ticket: 0016_conditioning_pipeline

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>
#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"
#include "mocap-core/src/Resampling/TemporalResampler.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

namespace
{

MotionSession captureOf(double movingSeconds)
{
  SyntheticCapture settings;
  settings.movingSeconds = movingSeconds;
  return SyntheticSession::capture(settings);
}

}  // namespace

/**
 * @brief Resampling onto the uniform grid, including artifact masking
 */
static void BM_TemporalResampler_Resample(benchmark::State& state)
{
  spdlog::set_level(spdlog::level::warn);
  auto const session = captureOf(static_cast<double>(state.range(0)));
  for (auto _ : state)
  {
    auto result = TemporalResampler::resample(session, TemporalResampler::Config{});
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_TemporalResampler_Resample)
  ->Args({10})   // 10 s of movement
  ->Args({60});  // 1 min of movement

/**
 * @brief Full conditioning of a nine-joint session
 *
 * Measures every stage from gap filling to the gate verdict.
 *
 * @ticket 0016_conditioning_pipeline
 */
static void BM_ConditioningPipeline_Run(benchmark::State& state)
{
  spdlog::set_level(spdlog::level::warn);
  auto const session = captureOf(static_cast<double>(state.range(0)));
  for (auto _ : state)
  {
    auto result = ConditioningPipeline::run(session);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ConditioningPipeline_Run)
  ->Args({10})
  ->Args({60})
  ->Unit(benchmark::kMillisecond);

// Google Benchmark provides main() via benchmark::benchmark_main
