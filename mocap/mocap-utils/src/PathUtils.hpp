#ifndef MOCAP_UTILS_PATH_UTILS_HPP
#define MOCAP_UTILS_PATH_UTILS_HPP

#include <filesystem>
#include <string>

namespace mocap_utils
{

/**
 * Convert a string path to an absolute filesystem path relative to the
 * directory containing the current executable.
 *
 * @param relativePath The path string relative to the executable directory
 * @return An absolute filesystem path
 *
 * Example:
 *   If executable is at: /home/user/app/bin/mocap_exe
 *   And relativePath is: "../config/pipeline.yaml"
 *   Returns: /home/user/app/config/pipeline.yaml
 */
std::filesystem::path absolutePath(const std::string& relativePath);

/**
 * Replace every character outside [A-Za-z0-9._-] with '_'.
 *
 * @throws std::invalid_argument if runId is empty, "." or ".."
 */
std::string sanitizeRunId(const std::string& runId);

/**
 * Output location of one artifact of one run: baseDir / runId / artifact.
 *
 * Runs never share a directory, so workers processing different sessions
 * never write to the same file.
 *
 * Example:
 *   runArtifactPath("out", "S01 take/2", "session.db")
 *   Returns: out/S01_take_2/session.db
 */
std::filesystem::path runArtifactPath(const std::filesystem::path& baseDir,
                                      const std::string& runId,
                                      const std::string& artifact);

}  // namespace mocap_utils

#endif  // MOCAP_UTILS_PATH_UTILS_HPP
