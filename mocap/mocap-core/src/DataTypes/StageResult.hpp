// Ticket: 0002_stage_result

#ifndef MOCAP_CORE_STAGE_RESULT_HPP
#define MOCAP_CORE_STAGE_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace mocap_core
{

/**
 * @brief Outcome of a pipeline stage that can fail softly
 *
 * Structural violations are thrown. Recoverable degradations (a cutoff that
 * collapsed to the search ceiling, a calibration window chosen by fallback)
 * are carried by value in this tagged union so that the gate layer can turn
 * them into a REVIEW verdict instead of them being swallowed.
 *
 * - Success:  value produced as intended
 * - Degraded: value usable, but produced by a fallback path (reason set)
 * - Failed:   no usable value (reason set)
 *
 * @tparam T Stage artifact type
 * @ticket 0002_stage_result
 */
template <typename T>
class StageResult
{
public:
  struct Success
  {
    T value;
  };

  struct Degraded
  {
    T value;
    std::string reason;
  };

  struct Failed
  {
    std::string reason;
  };

  static StageResult success(T value)
  {
    return StageResult{Success{std::move(value)}};
  }

  static StageResult degraded(T value, std::string reason)
  {
    return StageResult{Degraded{std::move(value), std::move(reason)}};
  }

  static StageResult failed(std::string reason)
  {
    return StageResult{Failed{std::move(reason)}};
  }

  [[nodiscard]] bool isSuccess() const
  {
    return std::holds_alternative<Success>(state_);
  }

  [[nodiscard]] bool isDegraded() const
  {
    return std::holds_alternative<Degraded>(state_);
  }

  [[nodiscard]] bool isFailed() const
  {
    return std::holds_alternative<Failed>(state_);
  }

  // True when a value can be consumed (Success or Degraded)
  [[nodiscard]] bool hasValue() const
  {
    return !isFailed();
  }

  /**
   * @brief Access the produced value
   * @throws std::logic_error if the stage failed
   */
  [[nodiscard]] const T& value() const
  {
    if (const auto* s = std::get_if<Success>(&state_))
    {
      return s->value;
    }
    if (const auto* d = std::get_if<Degraded>(&state_))
    {
      return d->value;
    }
    throw std::logic_error{"StageResult: value() called on failed result: " +
                           std::get<Failed>(state_).reason};
  }

  // Empty for Success
  [[nodiscard]] std::string reason() const
  {
    if (const auto* d = std::get_if<Degraded>(&state_))
    {
      return d->reason;
    }
    if (const auto* f = std::get_if<Failed>(&state_))
    {
      return f->reason;
    }
    return {};
  }

  [[nodiscard]] std::optional<T> valueOr() const
  {
    if (hasValue())
    {
      return value();
    }
    return std::nullopt;
  }

private:
  explicit StageResult(std::variant<Success, Degraded, Failed> state)
    : state_{std::move(state)}
  {
  }

  std::variant<Success, Degraded, Failed> state_;
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_STAGE_RESULT_HPP
