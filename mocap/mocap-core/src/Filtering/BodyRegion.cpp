// Ticket: 0009_adaptive_cutoff

#include "mocap-core/src/Filtering/BodyRegion.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <vector>

namespace mocap_core
{

namespace
{

struct RegionPatterns
{
  BodyRegion region;
  std::vector<std::string_view> patterns;
};

const std::array<RegionPatterns, 6>& regionTable()
{
  static const std::array<RegionPatterns, 6> table{{
    {BodyRegion::Trunk,
     {"pelvis", "spine", "torso", "hips", "abdomen", "chest", "back"}},
    {BodyRegion::Head, {"head", "neck"}},
    {BodyRegion::UpperProximal,
     {"shoulder", "clavicle", "scapula", "upperarm", "arm"}},
    {BodyRegion::UpperDistal,
     {"elbow",
      "forearm",
      "wrist",
      "hand",
      "finger",
      "thumb",
      "index",
      "middle",
      "ring",
      "pinky"}},
    {BodyRegion::LowerProximal, {"thigh", "upleg", "upperleg", "knee"}},
    {BodyRegion::LowerDistal,
     {"ankle", "leg", "lowerleg", "foot", "toe", "toebase", "heel"}},
  }};
  return table;
}

bool containsAny(const std::string& text,
                 const std::vector<std::string_view>& patterns)
{
  return std::any_of(patterns.begin(),
                     patterns.end(),
                     [&text](std::string_view p)
                     { return text.find(p) != std::string::npos; });
}

}  // namespace

std::string toLower(std::string text)
{
  std::transform(text.begin(),
                 text.end(),
                 text.begin(),
                 [](unsigned char ch)
                 { return static_cast<char>(std::tolower(ch)); });
  return text;
}

std::string toString(BodyRegion region)
{
  switch (region)
  {
    case BodyRegion::Trunk:
      return "trunk";
    case BodyRegion::Head:
      return "head";
    case BodyRegion::UpperProximal:
      return "upper_proximal";
    case BodyRegion::UpperDistal:
      return "upper_distal";
    case BodyRegion::LowerProximal:
      return "lower_proximal";
    case BodyRegion::LowerDistal:
      return "lower_distal";
  }
  return "unknown";
}

RegionProfile profileOf(BodyRegion region)
{
  switch (region)
  {
    case BodyRegion::Trunk:
      return RegionProfile{6.0, 4.0, 10.0};
    case BodyRegion::Head:
    case BodyRegion::UpperProximal:
    case BodyRegion::LowerProximal:
      return RegionProfile{8.0, 6.0, 12.0};
    case BodyRegion::UpperDistal:
    case BodyRegion::LowerDistal:
      return RegionProfile{10.0, 8.0, 14.0};
  }
  return RegionProfile{};
}

BodyRegion classifyJoint(const std::string& jointName)
{
  std::string const name = toLower(jointName);
  for (const auto& entry : regionTable())
  {
    if (containsAny(name, entry.patterns))
    {
      return entry.region;
    }
  }
  return BodyRegion::UpperDistal;
}

bool isTrunkJoint(const std::string& jointName)
{
  static const std::vector<std::string_view> trunk{
    "pelvis", "spine", "torso", "hips", "abdomen", "chest", "neck"};
  return containsAny(toLower(jointName), trunk);
}

}  // namespace mocap_core
