// Ticket: 0017_session_recorder

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "mocap-core/src/DataRecorder/SessionRecorder.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"
#include "mocap-transfer/src/Records.hpp"

namespace mocap_core
{
namespace test
{

class SessionRecorderTest : public ::testing::Test
{
protected:
  static void SetUpTestSuite()
  {
    SyntheticCapture settings;
    settings.movingSeconds = 2.0;
    settings.runId = "recorder take/1";
    result_ = std::make_unique<PipelineResult>(
      ConditioningPipeline::run(SyntheticSession::capture(settings)));
  }

  static void TearDownTestSuite()
  {
    result_.reset();
  }

  void SetUp() override
  {
    // Unique output directory for each test
    outputDir_ = std::filesystem::temp_directory_path() /
                 ("session_recorder_test_" + std::to_string(testCounter_++));
  }

  void TearDown() override
  {
    std::filesystem::remove_all(outputDir_);
  }

  SessionRecorder::Config config() const
  {
    SessionRecorder::Config c;
    c.outputDir = outputDir_;
    return c;
  }

  std::filesystem::path outputDir_;
  static int testCounter_;
  static std::unique_ptr<PipelineResult> result_;
};

int SessionRecorderTest::testCounter_ = 0;
std::unique_ptr<PipelineResult> SessionRecorderTest::result_;

// ========== Construction Tests ==========

TEST_F(SessionRecorderTest, Constructor_CreatesDatabaseInRunDirectory)
{
  SessionRecorder recorder{"recorder take/1", config()};

  EXPECT_TRUE(std::filesystem::exists(recorder.databasePath()));
  EXPECT_EQ(recorder.databasePath(), outputDir_ / "recorder_take_1" / "session.db");
}

TEST_F(SessionRecorderTest, Constructor_InvalidRunId_Throws)
{
  EXPECT_THROW((SessionRecorder{"..", config()}), std::invalid_argument);
}

// ========== recordAll Tests ==========

TEST_F(SessionRecorderTest, RecordAll_WritesOneRunRow)
{
  {
    SessionRecorder recorder{result_->runId, config()};
    recorder.recordAll(*result_);
  }

  cpp_sqlite::Database db{(outputDir_ / "recorder_take_1" / "session.db").string(), true};
  auto runs = db.getDAO<mocap_transfer::RunRecord>().selectAll();

  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].run_id, "recorder take/1");
  EXPECT_EQ(runs[0].frame_count, result_->conditioned.frameCount());
  EXPECT_EQ(runs[0].overall_status, toString(result_->verdict.status));
}

TEST_F(SessionRecorderTest, RecordAll_GatesAndOffsetsReferenceRun)
{
  SessionRecorder recorder{result_->runId, config()};
  recorder.recordAll(*result_);

  auto gates = recorder.getDAO<mocap_transfer::GateVerdictRecord>().selectAll();
  auto offsets = recorder.getDAO<mocap_transfer::CalibrationOffsetRecord>().selectAll();

  ASSERT_EQ(gates.size(), result_->verdict.gates.size());
  EXPECT_EQ(offsets.size(), result_->calibration.offsets.size());
  for (const auto& gate : gates)
  {
    EXPECT_EQ(gate.run.id, SessionRecorder::kRunRecordId);
  }
}

TEST_F(SessionRecorderTest, RecordAll_ResidualCurveLinkedToDecision)
{
  SessionRecorder recorder{result_->runId, config()};
  recorder.recordAll(*result_);

  auto decisions = recorder.getDAO<mocap_transfer::FilterDecisionRecord>().selectAll();
  auto points = recorder.getDAO<mocap_transfer::ResidualPointRecord>().selectAll();

  ASSERT_EQ(decisions.size(), 1u);
  EXPECT_EQ(points.size(), result_->filter.testFrequencies.size());
  for (const auto& point : points)
  {
    EXPECT_EQ(point.decision.id, decisions[0].id);
  }
}

TEST_F(SessionRecorderTest, RecordAll_KinematicsOptional)
{
  auto c = config();
  c.recordKinematics = false;
  {
    SessionRecorder recorder{result_->runId, c};
    recorder.recordAll(*result_);
    EXPECT_TRUE(recorder.getDAO<mocap_transfer::KinematicFrameRecord>().selectAll().empty());
  }

  SessionRecorder full{"second run", config()};
  full.recordAll(*result_);
  EXPECT_EQ(full.getDAO<mocap_transfer::KinematicFrameRecord>().selectAll().size(),
            result_->kinematics.times.size() * result_->kinematics.joints.size());
}

// ========== flush Tests ==========

TEST_F(SessionRecorderTest, Flush_WritesBufferedRecords)
{
  SessionRecorder recorder{result_->runId, config()};
  recorder.recordRun(*result_);
  recorder.recordGates(result_->verdict, result_->bursts);

  recorder.flush();

  auto& gateDAO =
    const_cast<cpp_sqlite::Database&>(recorder.getDatabase())
      .getDAO<mocap_transfer::GateVerdictRecord>();
  EXPECT_EQ(gateDAO.selectAll().size(), result_->verdict.gates.size());
}

}  // namespace test
}  // namespace mocap_core
