// Ticket: 0018_pipeline_executable

#ifndef MOCAP_EXE_CONFIG_LOADER_HPP
#define MOCAP_EXE_CONFIG_LOADER_HPP

#include <filesystem>
#include <string>

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"

namespace mocap_exe
{

/**
 * @brief Settings of one executable invocation
 */
struct RunSettings
{
  mocap_core::PipelineConfig pipeline{};
  std::filesystem::path outputDir{"output"};
  bool recordKinematics{true};
  spdlog::level::level_enum logLevel{spdlog::level::info};
};

/**
 * @brief Reads RunSettings from YAML
 *
 * Sections mirror the stage configs:
 *
 *   log_level: info
 *   output_dir: out
 *   record_kinematics: true
 *   gaps:        { max_position_gap_s, max_orientation_gap_s }
 *   resampler:   { target_rate_hz, position_method, mask_velocity_artifacts,
 *                  artifact_sigma }
 *   filter:      { mode, fixed_cutoff_hz, fmin_hz, fmax_hz, representatives,
 *                  trunk_min_cutoff_hz, distal_min_cutoff_hz, hampel }
 *   calibration: { search_s, window_s, step_s, motion_mean_rad_s,
 *                  motion_std_rad_s, tolerance_deg, apply_pose_correction }
 *   kinematics:  { sg_window_s, sg_polyorder, frame, surgical_repair }
 *   gates:       { jitter_review_ms, fallback_review_percent,
 *                  fallback_reject_percent, norm_error_review,
 *                  norm_error_reject, velocity_trigger_deg_s,
 *                  velocity_extreme_deg_s }
 *
 * Missing keys keep their defaults.
 *
 * @ticket 0018_pipeline_executable
 */
class ConfigLoader
{
public:
  /**
   * @throws std::invalid_argument if the file cannot be parsed or a value is
   *         out of range
   */
  [[nodiscard]] static RunSettings loadFile(const std::filesystem::path& path);

  // Same as loadFile on an in-memory document
  [[nodiscard]] static RunSettings loadString(const std::string& yaml);

  [[nodiscard]] static RunSettings fromNode(const YAML::Node& root);
};

}  // namespace mocap_exe

#endif  // MOCAP_EXE_CONFIG_LOADER_HPP
