// Ticket: 0018_pipeline_executable

#include "mocap-exe/src/SessionCsvLoader.hpp"

#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mocap_exe
{

namespace
{

constexpr std::array<const char*, 3> kPositionSuffixes{"px", "py", "pz"};
constexpr std::array<const char*, 4> kQuaternionSuffixes{"qw", "qx", "qy", "qz"};

std::string trim(const std::string& text)
{
  auto const first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos)
  {
    return {};
  }
  auto const last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

std::vector<std::string> splitRow(const std::string& line)
{
  std::vector<std::string> cells;
  std::stringstream stream{line};
  std::string cell;
  while (std::getline(stream, cell, ','))
  {
    cells.push_back(trim(cell));
  }
  // Trailing separator yields an empty last cell
  if (!line.empty() && line.back() == ',')
  {
    cells.emplace_back();
  }
  return cells;
}

double parseCell(const std::string& cell, std::size_t lineNumber)
{
  if (cell.empty() || cell == "nan" || cell == "NaN" || cell == "NAN")
  {
    return std::numeric_limits<double>::quiet_NaN();
  }
  char* end = nullptr;
  errno = 0;
  double const value = std::strtod(cell.c_str(), &end);
  if (end != cell.c_str() + cell.size() || errno == ERANGE)
  {
    throw std::invalid_argument{fmt::format(
      "SessionCsvLoader: malformed number '{}' on line {}", cell, lineNumber)};
  }
  return value;
}

std::ifstream openFile(const std::filesystem::path& path)
{
  std::ifstream in{path};
  if (!in)
  {
    throw std::invalid_argument{
      fmt::format("SessionCsvLoader: cannot open {}", path.string())};
  }
  return in;
}

}  // namespace

mocap_core::Skeleton SessionCsvLoader::readSkeleton(std::istream& in)
{
  std::vector<std::pair<std::string, std::string>> joints;
  std::string line;
  std::size_t lineNumber = 0;
  while (std::getline(in, line))
  {
    ++lineNumber;
    if (trim(line).empty())
    {
      continue;
    }
    auto cells = splitRow(line);
    if (cells.size() == 1)
    {
      cells.emplace_back();
    }
    if (cells.size() != 2 || cells[0].empty())
    {
      throw std::invalid_argument{fmt::format(
        "SessionCsvLoader: expected 'joint,parent' on skeleton line {}", lineNumber)};
    }
    if (lineNumber == 1 && cells[0] == "joint" && cells[1] == "parent")
    {
      continue;
    }
    joints.emplace_back(cells[0], cells[1]);
  }
  if (joints.empty())
  {
    throw std::invalid_argument{"SessionCsvLoader: skeleton has no joints"};
  }
  return mocap_core::Skeleton::fromParentNames(joints);
}

mocap_core::Skeleton SessionCsvLoader::loadSkeleton(const std::filesystem::path& path)
{
  auto in = openFile(path);
  return readSkeleton(in);
}

mocap_core::MotionSession SessionCsvLoader::readSession(
  std::istream& in,
  const std::string& runId,
  const mocap_core::Skeleton& skeleton)
{
  std::string line;
  if (!std::getline(in, line))
  {
    throw std::invalid_argument{"SessionCsvLoader: session file is empty"};
  }
  auto const header = splitRow(line);

  std::unordered_map<std::string, std::size_t> columnOf;
  for (std::size_t c = 0; c < header.size(); ++c)
  {
    columnOf.emplace(header[c], c);
  }

  auto const timeIt = columnOf.find(kTimeColumn);
  if (timeIt == columnOf.end())
  {
    throw std::invalid_argument{
      fmt::format("SessionCsvLoader: missing '{}' column", kTimeColumn)};
  }
  std::size_t const timeColumn = timeIt->second;

  // Seven column indices per joint: px py pz qw qx qy qz
  std::vector<std::array<std::size_t, 7>> jointColumns(skeleton.size());
  for (mocap_core::JointIndex j = 0; j < skeleton.size(); ++j)
  {
    auto& columns = jointColumns[j];
    std::size_t k = 0;
    auto lookup = [&](const char* suffix)
    {
      std::string const name = skeleton.name(j) + kSeparator + suffix;
      auto const it = columnOf.find(name);
      if (it == columnOf.end())
      {
        throw std::invalid_argument{
          fmt::format("SessionCsvLoader: missing column '{}'", name)};
      }
      columns[k++] = it->second;
    };
    for (const char* suffix : kPositionSuffixes)
    {
      lookup(suffix);
    }
    for (const char* suffix : kQuaternionSuffixes)
    {
      lookup(suffix);
    }
  }

  std::vector<double> times;
  std::vector<std::vector<double>> rows;
  std::size_t lineNumber = 1;
  while (std::getline(in, line))
  {
    ++lineNumber;
    if (trim(line).empty())
    {
      continue;
    }
    auto const cells = splitRow(line);
    if (cells.size() != header.size())
    {
      throw std::invalid_argument{fmt::format(
        "SessionCsvLoader: line {} has {} cells, header has {}",
        lineNumber,
        cells.size(),
        header.size())};
    }
    std::vector<double> values(cells.size());
    for (std::size_t c = 0; c < cells.size(); ++c)
    {
      values[c] = parseCell(cells[c], lineNumber);
    }
    if (std::isnan(values[timeColumn]))
    {
      throw std::invalid_argument{
        fmt::format("SessionCsvLoader: missing timestamp on line {}", lineNumber)};
    }
    times.push_back(values[timeColumn]);
    rows.push_back(std::move(values));
  }

  std::size_t const n = rows.size();
  std::vector<mocap_core::JointTrack> tracks(skeleton.size());
  for (mocap_core::JointIndex j = 0; j < skeleton.size(); ++j)
  {
    const auto& columns = jointColumns[j];
    auto& track = tracks[j];
    track.positions.resize(static_cast<Eigen::Index>(n), 3);
    track.orientations.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
      const auto& row = rows[i];
      auto const r = static_cast<Eigen::Index>(i);
      track.positions(r, 0) = row[columns[0]];
      track.positions(r, 1) = row[columns[1]];
      track.positions(r, 2) = row[columns[2]];
      track.orientations.emplace_back(
        row[columns[3]], row[columns[4]], row[columns[5]], row[columns[6]]);
    }
  }

  spdlog::info("SessionCsvLoader: run {} with {} frame(s), {} joint(s)",
               runId,
               n,
               skeleton.size());
  return mocap_core::MotionSession{
    runId, skeleton, std::move(times), std::move(tracks)};
}

mocap_core::MotionSession SessionCsvLoader::loadSession(
  const std::filesystem::path& path,
  const mocap_core::Skeleton& skeleton)
{
  auto in = openFile(path);
  return readSession(in, path.stem().string(), skeleton);
}

}  // namespace mocap_exe
