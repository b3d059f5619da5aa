// Ticket: 0003_session_data_model

#ifndef MOCAP_CORE_SKELETON_HPP
#define MOCAP_CORE_SKELETON_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mocap_core
{

using JointIndex = std::size_t;

/**
 * @brief Ordered joint list with a parent index array
 *
 * Joints are addressed by index on every hot path; names are only resolved
 * at the I/O boundary via indexOf(). The root joint has no parent.
 *
 * Invariant: the parent graph is a forest (no cycles, every parent index is
 * in range). Checked on construction.
 *
 * @ticket 0003_session_data_model
 */
class Skeleton
{
public:
  static constexpr int kNoParent = -1;

  Skeleton() = default;

  /**
   * @brief Build a skeleton from names and parent indices
   *
   * @param names Joint names, unique
   * @param parents Parent index per joint, kNoParent for roots
   * @throws std::invalid_argument on size mismatch, duplicate names,
   *         out-of-range parents or cycles
   */
  Skeleton(std::vector<std::string> names, std::vector<int> parents);

  /**
   * @brief Build a skeleton from (name, parent name) pairs
   *
   * Empty parent name marks a root. Parent names must be declared in the
   * list, in any order.
   */
  static Skeleton fromParentNames(
    const std::vector<std::pair<std::string, std::string>>& joints);

  [[nodiscard]] std::size_t size() const
  {
    return names_.size();
  }

  [[nodiscard]] const std::string& name(JointIndex joint) const;

  [[nodiscard]] std::optional<JointIndex> parent(JointIndex joint) const;

  [[nodiscard]] std::optional<JointIndex> indexOf(const std::string& name) const;

  [[nodiscard]] const std::vector<std::string>& names() const
  {
    return names_;
  }

  // Parent-before-child traversal order
  [[nodiscard]] const std::vector<JointIndex>& topologicalOrder() const
  {
    return order_;
  }

  // First root joint in declaration order
  [[nodiscard]] std::optional<JointIndex> root() const;

private:
  std::vector<std::string> names_;
  std::vector<int> parents_;
  std::vector<JointIndex> order_;
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_SKELETON_HPP
