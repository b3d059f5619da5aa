#ifndef MOCAP_CORE_UTILS_HPP
#define MOCAP_CORE_UTILS_HPP

#include <numbers>

namespace mocap_core
{

constexpr double kRadToDeg = 180.0 / std::numbers::pi;
constexpr double kDegToRad = std::numbers::pi / 180.0;

}  // namespace mocap_core

#endif  // MOCAP_CORE_UTILS_HPP
