// Ticket: 0018_pipeline_executable

#include <exception>
#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "mocap-core/src/DataRecorder/SessionRecorder.hpp"
#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"
#include "mocap-exe/src/ConfigLoader.hpp"
#include "mocap-exe/src/SessionCsvLoader.hpp"
#include "mocap-utils/src/PathUtils.hpp"

namespace
{

void printUsage(const char* program)
{
  spdlog::error("usage: {} <session.csv> <skeleton.csv> [config.yaml]", program);
}

int runSession(const std::filesystem::path& sessionPath,
               const std::filesystem::path& skeletonPath,
               const mocap_exe::RunSettings& settings)
{
  auto const skeleton = mocap_exe::SessionCsvLoader::loadSkeleton(skeletonPath);
  auto const session = mocap_exe::SessionCsvLoader::loadSession(sessionPath, skeleton);

  auto const result = mocap_core::ConditioningPipeline::run(session, settings.pipeline);

  mocap_core::SessionRecorder::Config recorderConfig;
  recorderConfig.outputDir = settings.outputDir;
  recorderConfig.recordKinematics = settings.recordKinematics;
  mocap_core::SessionRecorder recorder{result.runId, recorderConfig};
  recorder.recordAll(result);

  spdlog::info("Run {}: {} ({} Hz, cutoff {:.1f} Hz)",
               result.runId,
               mocap_core::toString(result.verdict.status),
               result.samplingRate,
               result.filter.cutoffHz);
  for (const auto& reason : result.verdict.reasons)
  {
    spdlog::warn("  {}", reason);
  }
  spdlog::info("Artifacts written to {}", recorder.databasePath().string());
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 3 || argc > 4)
  {
    printUsage(argv[0]);
    return 1;
  }

  try
  {
    mocap_exe::RunSettings settings;
    if (argc == 4)
    {
      settings = mocap_exe::ConfigLoader::loadFile(argv[3]);
    }
    else if (auto const fallback =
               mocap_utils::absolutePath("../config/pipeline.yaml");
             std::filesystem::exists(fallback))
    {
      settings = mocap_exe::ConfigLoader::loadFile(fallback);
    }
    spdlog::set_level(settings.logLevel);
    return runSession(argv[1], argv[2], settings);
  }
  catch (const std::exception& e)
  {
    spdlog::error("mocap_exe: {}", e.what());
    return 1;
  }
}
