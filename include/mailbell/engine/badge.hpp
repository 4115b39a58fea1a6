/**
 * @file badge.hpp
 * @brief Badge state shown over the application icon.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstdint>
#include <qobject.h>

#include "mailbell/common.hpp"

namespace mailbell::engine {

Q_NAMESPACE_EXPORT(MAILBELL_PUBLIC)

/**
 * @brief Badge states.
 *
 */
enum class BadgeState : uint8_t
{
  NONE,    /**< Nothing to show. */
  UNREAD,  /**< Unread mail exists. */
  SNOOZED, /**< Notifications are snoozed. */
  ERROR,   /**< Last poll or action failed. */
};

Q_ENUM_NS(BadgeState)

/**
 * @brief Map engine flags to a badge, `ERROR > SNOOZED > UNREAD > NONE`.
 *
 * @note Snooze hides the unread indicator instead of stacking with it.
 */
constexpr BadgeState
derive_badge(bool has_unread, bool is_snoozed, bool is_error)
{
  if (is_error) {
    return BadgeState::ERROR;
  }

  if (is_snoozed) {
    return BadgeState::SNOOZED;
  }

  return has_unread ? BadgeState::UNREAD : BadgeState::NONE;
}

}
