// Ticket: 0019_bone_length_qc

#ifndef MOCAP_CORE_BONE_LENGTH_QC_HPP
#define MOCAP_CORE_BONE_LENGTH_QC_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "mocap-core/src/DataTypes/MotionSession.hpp"

namespace mocap_core
{

enum class BoneStatus
{
  Pass,
  Warn,
  Alert
};

[[nodiscard]] std::string toString(BoneStatus status);

/**
 * @brief Length statistics of one parent -> child segment [mm]
 */
struct BoneLengthStats
{
  std::string parent;
  std::string child;
  std::size_t validFrames{0};
  double medianLength{0.0};
  double meanLength{0.0};
  double stdLength{0.0};
  double cv{0.0};              // std / mean
  double p95AbsDeviation{0.0};  // 95th percentile of |L - median|
  double maxJump{0.0};          // max |L[t+1] - L[t]|
  BoneStatus status{BoneStatus::Pass};

  [[nodiscard]] std::string name() const
  {
    return parent + "->" + child;
  }
};

/**
 * @brief Rigidity check of the skeleton segments in a position stream
 *
 * For every joint with a parent, L(t) = |p_child(t) - p_parent(t)| over the
 * frames where both positions are finite. A segment alerts when its
 * coefficient of variation exceeds cvAlert or a single frame step exceeds
 * maxJumpAlert, and warns when cv exceeds cvWarn or the 95th percentile
 * deviation from the median exceeds p95AbsDevWarn. Segments with fewer
 * than minValidFrames finite frames are skipped.
 *
 * The result is advisory: it is reported on Gate 4 but never changes its
 * status.
 *
 * @ticket 0019_bone_length_qc
 */
class BoneLengthQc
{
public:
  struct Config
  {
    double cvWarn{0.02};
    double cvAlert{0.05};
    double p95AbsDevWarn{10.0};  // [mm]
    double maxJumpAlert{30.0};   // [mm]
    std::size_t minValidFrames{10};
  };

  struct Report
  {
    std::vector<BoneLengthStats> bones;
    std::size_t warnCount{0};
    std::size_t alertCount{0};
    double maxCv{0.0};

    [[nodiscard]] std::vector<std::string> flaggedBones() const;
  };

  [[nodiscard]] static Report analyze(const MotionSession& session,
                                      const Config& config);

  [[nodiscard]] static Report analyze(const MotionSession& session);

  /**
   * @brief Statistics of one length series
   *
   * @param lengths Finite segment lengths in frame order [mm]
   * @throws std::invalid_argument if lengths is empty
   */
  [[nodiscard]] static BoneLengthStats measure(const std::vector<double>& lengths,
                                               const Config& config);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_BONE_LENGTH_QC_HPP
