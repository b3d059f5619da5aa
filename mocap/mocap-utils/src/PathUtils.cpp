#include "mocap-utils/src/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#include <climits>
#include <cstdint>
#elif defined(__linux__)
#include <limits.h>
#include <unistd.h>
#endif

#include <stdexcept>

namespace mocap_utils
{

std::filesystem::path absolutePath(const std::string& relativePath)
{
  std::filesystem::path executablePath;

#if defined(__APPLE__)
  char buffer[PATH_MAX];
  uint32_t size = sizeof(buffer);
  if (_NSGetExecutablePath(buffer, &size) != 0)
  {
    throw std::runtime_error("Failed to get executable path on macOS");
  }
  executablePath = std::filesystem::canonical(buffer);

#elif defined(__linux__)
  char buffer[PATH_MAX];
  ssize_t length = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (length == -1)
  {
    throw std::runtime_error("Failed to get executable path on Linux");
  }
  buffer[length] = '\0';
  executablePath = std::filesystem::path(buffer);

#else
#error "Unsupported platform for absolutePath"
#endif

  std::filesystem::path const fullPath =
    executablePath.parent_path() / relativePath;

  // absolute() rather than canonical() so the target need not exist yet
  return std::filesystem::absolute(fullPath).lexically_normal();
}

std::string sanitizeRunId(const std::string& runId)
{
  if (runId.empty() || runId == "." || runId == "..")
  {
    throw std::invalid_argument("Run id must name a directory: '" + runId + "'");
  }
  std::string out = runId;
  std::replace_if(
    out.begin(),
    out.end(),
    [](char c)
    {
      auto const u = static_cast<unsigned char>(c);
      return !(std::isalnum(u) || c == '.' || c == '_' || c == '-');
    },
    '_');
  return out;
}

std::filesystem::path runArtifactPath(const std::filesystem::path& baseDir,
                                      const std::string& runId,
                                      const std::string& artifact)
{
  if (artifact.empty())
  {
    throw std::invalid_argument("Artifact name must not be empty");
  }
  return (baseDir / sanitizeRunId(runId) / artifact).lexically_normal();
}

}  // namespace mocap_utils
