#include <gtest/gtest.h>

#include <stdexcept>

#include "mocap-utils/src/PathUtils.hpp"

TEST(PathUtils, AbsolutePath_RelativeInput_IsAbsoluteAndNormal)
{
  auto const path = mocap_utils::absolutePath("../config/pipeline.yaml");
  EXPECT_TRUE(path.is_absolute());
  EXPECT_EQ(path, path.lexically_normal());
  EXPECT_EQ(path.filename(), "pipeline.yaml");
}

TEST(PathUtils, AbsolutePath_Dot_IsExecutableDirectory)
{
  auto const dir = mocap_utils::absolutePath(".");
  auto const file = mocap_utils::absolutePath("x.db");
  // dir is "<exe dir>/" after normalization
  EXPECT_EQ(file.parent_path(), dir.parent_path());
}

TEST(PathUtils, SanitizeRunId_SpecialCharacters_Replaced)
{
  EXPECT_EQ(mocap_utils::sanitizeRunId("S01 take/2"), "S01_take_2");
  EXPECT_EQ(mocap_utils::sanitizeRunId("run-01.a_b"), "run-01.a_b");
}

TEST(PathUtils, SanitizeRunId_EmptyOrDots_Throws)
{
  EXPECT_THROW((void)mocap_utils::sanitizeRunId(""), std::invalid_argument);
  EXPECT_THROW((void)mocap_utils::sanitizeRunId("."), std::invalid_argument);
  EXPECT_THROW((void)mocap_utils::sanitizeRunId(".."), std::invalid_argument);
}

TEST(PathUtils, RunArtifactPath_DistinctRuns_DistinctDirectories)
{
  auto const a = mocap_utils::runArtifactPath("out", "run_a", "session.db");
  auto const b = mocap_utils::runArtifactPath("out", "run_b", "session.db");
  EXPECT_NE(a, b);
  EXPECT_EQ(a, std::filesystem::path("out/run_a/session.db"));
  EXPECT_EQ(a.parent_path().filename(), "run_a");
}

TEST(PathUtils, RunArtifactPath_TraversalInRunId_StaysUnderBase)
{
  auto const p = mocap_utils::runArtifactPath("out", "../escape", "session.db");
  EXPECT_EQ(p, std::filesystem::path("out/.._escape/session.db"));
}

TEST(PathUtils, RunArtifactPath_EmptyArtifact_Throws)
{
  EXPECT_THROW((void)mocap_utils::runArtifactPath("out", "run", ""),
               std::invalid_argument);
}
