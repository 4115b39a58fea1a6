/**
 * @file transport.hpp
 * @brief Desktop notification requests and the transport interface.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <qstring.h>

#include "mailbell/common.hpp"

namespace mailbell::notify {

/**
 * @brief One notification to display.
 *
 */
struct Request
{
  /**
   * @brief Notification urgency.
   *
   */
  enum class Level : uint8_t
  {
    INFORMATION, /**< New mail. */
    WARNING,     /**< Error report. */
  };

  QString title;
  QString body;
  Level level{ Level::INFORMATION };
  QString link; /**< Opened by the "open" action, no action when empty. */
  std::function<void()> on_snooze; /**< "Snooze" action, none when empty. */
};

/**
 * @brief Fire-and-forget notification transport.
 *
 */
class MAILBELL_PUBLIC Transport
{
public:
  virtual ~Transport() = default;

  /**
   * @brief Display a notification, never blocks.
   *
   * @param request Notification to display.
   */
  virtual void show(const Request& request) = 0;
};

}
