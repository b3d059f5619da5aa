// Ticket: 0017_session_recorder

#ifndef MOCAP_CORE_SESSION_RECORDER_HPP
#define MOCAP_CORE_SESSION_RECORDER_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"

namespace mocap_core
{

/**
 * @brief Persists the artifacts of one run to its own SQLite database
 *
 * The database lives at outputDir / runId / databaseName, so concurrent
 * workers on different sessions never share a file. Records are buffered
 * per stage and written by flush() inside one transaction.
 *
 * All DAOs are created in the constructor, run record first, so nested
 * record tables exist before any flush and the creation order follows the
 * foreign keys.
 *
 * @ticket 0017_session_recorder
 */
class SessionRecorder
{
public:
  static constexpr uint32_t kRunRecordId = 1;

  struct Config
  {
    std::filesystem::path outputDir{"."};
    std::string databaseName{"session.db"};
    bool recordKinematics{true};
  };

  /**
   * @brief Open (create) the run database
   *
   * @throws std::invalid_argument if runId cannot name a directory
   * @throws std::runtime_error if the database cannot be opened
   */
  SessionRecorder(const std::string& runId, const Config& config);

  ~SessionRecorder() = default;

  SessionRecorder(const SessionRecorder&) = delete;
  SessionRecorder& operator=(const SessionRecorder&) = delete;
  SessionRecorder(SessionRecorder&&) = delete;
  SessionRecorder& operator=(SessionRecorder&&) = delete;

  // Buffers the run row every other record references
  void recordRun(const PipelineResult& result);

  void recordCalibration(const CalibrationResult& calibration);

  void recordFilterDecision(const FilterDecision& decision);

  void recordGates(const OverallVerdict& verdict, const BurstClassification& bursts);

  /**
   * @brief One row per joint per frame
   *
   * @param statusMask Gate 5 frame mask (frames x joints), may be empty
   */
  void recordKinematics(const KinematicsResult& kinematics,
                        const Eigen::MatrixXi& statusMask);

  // recordRun followed by every stage, then flush
  void recordAll(const PipelineResult& result);

  // Write all buffered records in one transaction
  void flush();

  [[nodiscard]] const std::filesystem::path& databasePath() const
  {
    return databasePath_;
  }

  [[nodiscard]] const cpp_sqlite::Database& getDatabase() const;

  template <typename T>
  cpp_sqlite::DataAccessObject<T>& getDAO()
  {
    return database_->getDAO<T>();
  }

private:
  std::string runId_;
  Config config_;
  std::filesystem::path databasePath_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<cpp_sqlite::Database> database_;
  uint32_t nextDecisionId_{1};
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_SESSION_RECORDER_HPP
