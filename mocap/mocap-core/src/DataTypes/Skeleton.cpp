// Ticket: 0003_session_data_model

#include "mocap-core/src/DataTypes/Skeleton.hpp"

#include <stdexcept>
#include <unordered_map>

namespace mocap_core
{

Skeleton::Skeleton(std::vector<std::string> names, std::vector<int> parents)
  : names_{std::move(names)}, parents_{std::move(parents)}
{
  if (names_.size() != parents_.size())
  {
    throw std::invalid_argument{
      "Skeleton: names and parents must have the same length"};
  }

  std::unordered_map<std::string, JointIndex> seen;
  for (JointIndex i = 0; i < names_.size(); ++i)
  {
    if (!seen.emplace(names_[i], i).second)
    {
      throw std::invalid_argument{"Skeleton: duplicate joint name '" +
                                  names_[i] + "'"};
    }
    int const p = parents_[i];
    if (p != kNoParent &&
        (p < 0 || static_cast<std::size_t>(p) >= names_.size() ||
         static_cast<JointIndex>(p) == i))
    {
      throw std::invalid_argument{"Skeleton: invalid parent index for joint '" +
                                  names_[i] + "'"};
    }
  }

  // Kahn-style ordering: a joint is emitted once its parent has been emitted
  std::vector<bool> placed(names_.size(), false);
  order_.reserve(names_.size());
  bool progress = true;
  while (order_.size() < names_.size() && progress)
  {
    progress = false;
    for (JointIndex i = 0; i < names_.size(); ++i)
    {
      if (placed[i])
      {
        continue;
      }
      int const p = parents_[i];
      if (p == kNoParent || placed[static_cast<JointIndex>(p)])
      {
        placed[i] = true;
        order_.push_back(i);
        progress = true;
      }
    }
  }

  if (order_.size() != names_.size())
  {
    throw std::invalid_argument{"Skeleton: parent graph contains a cycle"};
  }
}

Skeleton Skeleton::fromParentNames(
  const std::vector<std::pair<std::string, std::string>>& joints)
{
  std::unordered_map<std::string, int> index;
  std::vector<std::string> names;
  names.reserve(joints.size());
  for (const auto& [name, parentName] : joints)
  {
    index.emplace(name, static_cast<int>(names.size()));
    names.push_back(name);
  }

  std::vector<int> parents;
  parents.reserve(joints.size());
  for (const auto& [name, parentName] : joints)
  {
    if (parentName.empty())
    {
      parents.push_back(kNoParent);
      continue;
    }
    auto it = index.find(parentName);
    if (it == index.end())
    {
      throw std::invalid_argument{"Skeleton: unknown parent '" + parentName +
                                  "' for joint '" + name + "'"};
    }
    parents.push_back(it->second);
  }

  return Skeleton{std::move(names), std::move(parents)};
}

const std::string& Skeleton::name(JointIndex joint) const
{
  return names_.at(joint);
}

std::optional<JointIndex> Skeleton::parent(JointIndex joint) const
{
  int const p = parents_.at(joint);
  if (p == kNoParent)
  {
    return std::nullopt;
  }
  return static_cast<JointIndex>(p);
}

std::optional<JointIndex> Skeleton::indexOf(const std::string& name) const
{
  for (JointIndex i = 0; i < names_.size(); ++i)
  {
    if (names_[i] == name)
    {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<JointIndex> Skeleton::root() const
{
  for (JointIndex i = 0; i < parents_.size(); ++i)
  {
    if (parents_[i] == kNoParent)
    {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace mocap_core
