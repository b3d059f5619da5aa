// Ticket: 0018_pipeline_executable

#include "mocap-exe/src/ConfigLoader.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mocap_exe
{

namespace
{

template <typename T>
void read(const YAML::Node& section, const char* key, T& target)
{
  // Absent section or key keeps the default
  if (!section || !section[key])
  {
    return;
  }
  try
  {
    target = section[key].as<T>();
  }
  catch (const YAML::Exception& e)
  {
    throw std::invalid_argument{
      fmt::format("ConfigLoader: bad value for '{}': {}", key, e.what())};
  }
}

void requirePositive(double value, const char* key)
{
  if (!(value > 0.0))
  {
    throw std::invalid_argument{
      fmt::format("ConfigLoader: '{}' must be positive, got {}", key, value)};
  }
}

mocap_core::FilterMode parseFilterMode(const std::string& text)
{
  if (text == "global")
  {
    return mocap_core::FilterMode::Global;
  }
  if (text == "per_region")
  {
    return mocap_core::FilterMode::PerRegion;
  }
  if (text == "fixed")
  {
    return mocap_core::FilterMode::Fixed;
  }
  throw std::invalid_argument{
    fmt::format("ConfigLoader: unknown filter mode '{}'", text)};
}

mocap_core::PositionInterpolation parsePositionMethod(const std::string& text)
{
  if (text == "linear")
  {
    return mocap_core::PositionInterpolation::Linear;
  }
  if (text == "monotone_cubic")
  {
    return mocap_core::PositionInterpolation::MonotoneCubic;
  }
  throw std::invalid_argument{
    fmt::format("ConfigLoader: unknown position method '{}'", text)};
}

mocap_core::RotationFrame parseFrame(const std::string& text)
{
  if (text == "local")
  {
    return mocap_core::RotationFrame::Local;
  }
  if (text == "global")
  {
    return mocap_core::RotationFrame::Global;
  }
  throw std::invalid_argument{
    fmt::format("ConfigLoader: unknown rotation frame '{}'", text)};
}

void loadGaps(const YAML::Node& node, mocap_core::GapFiller::Config& gaps)
{
  if (!node)
  {
    return;
  }
  read(node, "max_position_gap_s", gaps.maxPositionGapSeconds);
  read(node, "max_orientation_gap_s", gaps.maxOrientationGapSeconds);
  requirePositive(gaps.maxPositionGapSeconds, "max_position_gap_s");
  requirePositive(gaps.maxOrientationGapSeconds, "max_orientation_gap_s");
}

void loadResampler(const YAML::Node& node,
                   mocap_core::TemporalResampler::Config& resampler)
{
  if (!node)
  {
    return;
  }
  read(node, "target_rate_hz", resampler.targetRate);
  read(node, "mask_velocity_artifacts", resampler.maskVelocityArtifacts);
  read(node, "artifact_sigma", resampler.artifacts.thresholdSigma);
  if (node["position_method"])
  {
    std::string method;
    read(node, "position_method", method);
    resampler.positionMethod = parsePositionMethod(method);
  }
  requirePositive(resampler.targetRate, "target_rate_hz");
  requirePositive(resampler.artifacts.thresholdSigma, "artifact_sigma");
}

void loadFilter(const YAML::Node& node, mocap_core::PositionFilter::Config& filter)
{
  if (!node)
  {
    return;
  }
  if (node["mode"])
  {
    std::string mode;
    read(node, "mode", mode);
    filter.mode = parseFilterMode(mode);
  }
  read(node, "fixed_cutoff_hz", filter.fixedCutoffHz);
  read(node, "fmin_hz", filter.fmin);
  read(node, "fmax_hz", filter.fmax);
  read(node, "representatives", filter.representativeCount);
  read(node, "trunk_min_cutoff_hz", filter.trunkMinCutoff);
  read(node, "distal_min_cutoff_hz", filter.distalMinCutoff);
  read(node, "hampel", filter.hampelPrefilter);

  requirePositive(filter.fixedCutoffHz, "fixed_cutoff_hz");
  if (filter.fmin < 1 || filter.fmax < filter.fmin)
  {
    throw std::invalid_argument{fmt::format(
      "ConfigLoader: invalid cutoff search range [{}, {}] Hz", filter.fmin, filter.fmax)};
  }
  if (filter.representativeCount == 0)
  {
    throw std::invalid_argument{"ConfigLoader: 'representatives' must be at least 1"};
  }
}

void loadCalibration(const YAML::Node& node, mocap_core::PipelineConfig& pipeline)
{
  if (!node)
  {
    return;
  }
  auto& calibration = pipeline.calibration;
  read(node, "search_s", calibration.window.searchSeconds);
  read(node, "window_s", calibration.window.windowSeconds);
  read(node, "step_s", calibration.window.stepSeconds);
  read(node, "motion_mean_rad_s", calibration.window.motionMeanThreshold);
  read(node, "motion_std_rad_s", calibration.window.motionStdThreshold);
  read(node, "tolerance_deg", calibration.toleranceDeg);
  read(node, "apply_pose_correction", pipeline.applyPoseCorrection);

  requirePositive(calibration.window.searchSeconds, "search_s");
  requirePositive(calibration.window.windowSeconds, "window_s");
  requirePositive(calibration.window.stepSeconds, "step_s");
  requirePositive(calibration.toleranceDeg, "tolerance_deg");
}

void loadKinematics(const YAML::Node& node, mocap_core::PipelineConfig& pipeline)
{
  if (!node)
  {
    return;
  }
  auto& kinematics = pipeline.kinematics;
  read(node, "sg_window_s", kinematics.sgWindowSeconds);
  read(node, "sg_polyorder", kinematics.sgPolyorder);
  read(node, "surgical_repair", pipeline.surgicalRepair);
  if (node["frame"])
  {
    std::string frame;
    read(node, "frame", frame);
    kinematics.frame = parseFrame(frame);
  }
  requirePositive(kinematics.sgWindowSeconds, "sg_window_s");
  if (kinematics.sgPolyorder < 1)
  {
    throw std::invalid_argument{"ConfigLoader: 'sg_polyorder' must be at least 1"};
  }
}

void loadGates(const YAML::Node& node, mocap_core::PipelineConfig& pipeline)
{
  if (!node)
  {
    return;
  }
  auto& gates = pipeline.gates;
  read(node, "jitter_review_ms", gates.jitterReviewMs);
  read(node, "fallback_review_percent", gates.fallbackReviewPercent);
  read(node, "fallback_reject_percent", gates.fallbackRejectPercent);
  read(node, "norm_error_review", gates.normErrorReview);
  read(node, "norm_error_reject", gates.normErrorReject);
  read(node, "velocity_trigger_deg_s", pipeline.bursts.velocityTrigger);
  read(node, "velocity_extreme_deg_s", pipeline.bursts.velocityExtreme);
  read(node, "snr_min_acceptable_db", pipeline.snr.minAcceptableDb);
  read(node, "bone_cv_warn", pipeline.bones.cvWarn);
  read(node, "bone_cv_alert", pipeline.bones.cvAlert);
  read(node, "bone_p95_abs_dev_warn_mm", pipeline.bones.p95AbsDevWarn);
  read(node, "bone_max_jump_alert_mm", pipeline.bones.maxJumpAlert);

  if (gates.fallbackRejectPercent < gates.fallbackReviewPercent)
  {
    throw std::invalid_argument{
      "ConfigLoader: fallback reject threshold below review threshold"};
  }
  if (gates.normErrorReject < gates.normErrorReview)
  {
    throw std::invalid_argument{
      "ConfigLoader: norm error reject threshold below review threshold"};
  }
  if (pipeline.bursts.velocityExtreme < pipeline.bursts.velocityTrigger)
  {
    throw std::invalid_argument{
      "ConfigLoader: extreme velocity below trigger velocity"};
  }
  if (pipeline.bones.cvAlert < pipeline.bones.cvWarn)
  {
    throw std::invalid_argument{
      "ConfigLoader: bone cv alert threshold below warn threshold"};
  }
}

}  // namespace

RunSettings ConfigLoader::fromNode(const YAML::Node& root)
{
  RunSettings settings;
  if (!root || root.IsNull())
  {
    return settings;
  }
  if (!root.IsMap())
  {
    throw std::invalid_argument{"ConfigLoader: top level must be a mapping"};
  }

  std::string outputDir = settings.outputDir.string();
  read(root, "output_dir", outputDir);
  settings.outputDir = outputDir;
  read(root, "record_kinematics", settings.recordKinematics);

  if (root["log_level"])
  {
    std::string level;
    read(root, "log_level", level);
    settings.logLevel = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (settings.logLevel == spdlog::level::off && level != "off")
    {
      throw std::invalid_argument{
        fmt::format("ConfigLoader: unknown log level '{}'", level)};
    }
  }

  auto& pipeline = settings.pipeline;
  loadGaps(root["gaps"], pipeline.gaps);
  loadResampler(root["resampler"], pipeline.resampler);
  loadFilter(root["filter"], pipeline.filter);
  loadCalibration(root["calibration"], pipeline);
  loadKinematics(root["kinematics"], pipeline);
  loadGates(root["gates"], pipeline);
  return settings;
}

RunSettings ConfigLoader::loadString(const std::string& yaml)
{
  YAML::Node root;
  try
  {
    root = YAML::Load(yaml);
  }
  catch (const YAML::Exception& e)
  {
    throw std::invalid_argument{
      fmt::format("ConfigLoader: failed to parse config: {}", e.what())};
  }
  return fromNode(root);
}

RunSettings ConfigLoader::loadFile(const std::filesystem::path& path)
{
  YAML::Node root;
  try
  {
    root = YAML::LoadFile(path.string());
  }
  catch (const YAML::Exception& e)
  {
    throw std::invalid_argument{fmt::format(
      "ConfigLoader: failed to load {}: {}", path.string(), e.what())};
  }
  spdlog::info("ConfigLoader: loaded {}", path.string());
  return fromNode(root);
}

}  // namespace mocap_exe
