/**
 * @file snooze.hpp
 * @brief Notification snooze state.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <optional>
#include <qtypes.h>

#include "mailbell/common.hpp"

namespace mailbell::engine {

/**
 * @brief Snooze state machine, either inactive or active until a deadline.
 *
 * Expiry is detected lazily: there is no timer, every query compares the
 * deadline with the given time and collapses an expired state to inactive.
 */
class MAILBELL_PUBLIC Snooze
{
public:
  constexpr static qint64 DURATION_SECS = 3600; /**< Snooze length. */

private:
  std::optional<qint64> _until;

public:
  /**
   * @brief Flip the state.
   *
   * @param now Current epoch seconds.
   * @return true Snooze is active now.
   * @return false Snooze is inactive now.
   */
  bool toggle(qint64 now);

  /**
   * @brief Activate snooze from a notification action.
   *
   * Does nothing while already active, so repeated triggers never extend
   * the deadline.
   *
   * @param now Current epoch seconds.
   */
  void snooze_from_external_trigger(qint64 now);

  /**
   * @brief Check the state, expiring it if the deadline has passed.
   *
   * @param now Current epoch seconds.
   * @return true Snooze is active.
   * @return false Snooze is inactive.
   */
  bool is_active(qint64 now);

  /**
   * @brief Seconds left until expiry.
   *
   * @param now Current epoch seconds.
   * @return qint64 Remaining seconds, 0 when inactive.
   */
  qint64 remaining(qint64 now);

  /**
   * @brief Get the deadline.
   *
   * @return std::optional<qint64> Epoch seconds, empty when inactive.
   */
  [[nodiscard]] MAILBELL_INLINE auto until() const { return _until; }
};

}
