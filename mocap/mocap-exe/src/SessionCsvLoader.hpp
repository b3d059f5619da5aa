// Ticket: 0018_pipeline_executable

#ifndef MOCAP_EXE_SESSION_CSV_LOADER_HPP
#define MOCAP_EXE_SESSION_CSV_LOADER_HPP

#include <filesystem>
#include <istream>
#include <string>

#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/DataTypes/Skeleton.hpp"

namespace mocap_exe
{

/**
 * @brief Minimal CSV reader for sessions and skeletons
 *
 * Session file: header row with `time_s` followed, for every joint, by
 * `<Joint>__px`, `<Joint>__py`, `<Joint>__pz` [mm] and `<Joint>__qw`,
 * `<Joint>__qx`, `<Joint>__qy`, `<Joint>__qz`, in any column order. Empty
 * cells and `nan` are missing samples.
 *
 * Skeleton file: one `joint,parent` row per joint, parent empty for the
 * root. An optional `joint,parent` header row is skipped.
 *
 * @ticket 0018_pipeline_executable
 */
class SessionCsvLoader
{
public:
  static constexpr char kTimeColumn[] = "time_s";
  static constexpr char kSeparator[] = "__";

  [[nodiscard]] static mocap_core::Skeleton readSkeleton(std::istream& in);

  /**
   * @throws std::invalid_argument if the file cannot be opened
   */
  [[nodiscard]] static mocap_core::Skeleton loadSkeleton(
    const std::filesystem::path& path);

  /**
   * @brief Parse a session table against a skeleton
   *
   * @throws std::invalid_argument on a missing time column, a skeleton joint
   *         without its seven columns, a ragged row or a malformed number
   * @throws std::runtime_error if time is not strictly increasing
   */
  [[nodiscard]] static mocap_core::MotionSession readSession(
    std::istream& in,
    const std::string& runId,
    const mocap_core::Skeleton& skeleton);

  // Run id defaults to the file stem
  [[nodiscard]] static mocap_core::MotionSession loadSession(
    const std::filesystem::path& path,
    const mocap_core::Skeleton& skeleton);
};

}  // namespace mocap_exe

#endif  // MOCAP_EXE_SESSION_CSV_LOADER_HPP
