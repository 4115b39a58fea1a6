/**
 * @file scheduler.hpp
 * @brief Rate-limited, staggered new-mail notifications.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <functional>
#include <qlist.h>
#include <qobject.h>
#include <qstring.h>
#include <qtypes.h>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/notify/transport.hpp"

namespace mailbell::engine {

/**
 * @brief Notification request with its dispatch delay.
 *
 */
struct ScheduledNotification
{
  int delay_msecs{ 0 };
  notify::Request request;
};

using Schedule = QList<ScheduledNotification>;

/**
 * @brief Turns a batch of fresh mail into notification requests.
 *
 */
class MAILBELL_PUBLIC Scheduler
{
public:
  constexpr static qsizetype MAX_INDIVIDUAL =
    5; /**< Individual notifications per batch. */
  constexpr static int STAGGER_MSECS =
    300; /**< Gap between two notifications. */

  inline static const QString SUMMARY_TITLE = "New Emails";

private:
  qsizetype _max;
  int _stagger;

public:
  /**
   * @brief Construct a new Scheduler.
   *
   * @param max Individual notifications per batch.
   * @param stagger Gap between two notifications in milliseconds.
   */
  explicit Scheduler(qsizetype max = MAX_INDIVIDUAL, int stagger = STAGGER_MSECS)
    : _max{ max }
    , _stagger{ stagger }
  {
  }

  /**
   * @brief Build the schedule for a batch.
   *
   * The first `max` records get one notification each, k-th after
   * `k * stagger`. Remaining records are summarised in one more
   * notification after the last individual one.
   *
   * @param fresh Unnotified records, newest first.
   * @param inbox_url Link of the summary notification.
   * @param on_snooze Snooze action attached to every request.
   * @return Schedule Requests with their delays.
   */
  [[nodiscard]] Schedule plan(const model::EmailList& fresh,
                              const QString& inbox_url,
                              const std::function<void()>& on_snooze) const;

  /**
   * @brief Start one single-shot timer per scheduled request.
   *
   * Every timer owns a copy of its request. Nothing is tracked after this
   * call, timers die with `context`.
   *
   * @param schedule Requests to dispatch.
   * @param transport Notification transport, must outlive `context`.
   * @param context Timer context.
   */
  static void dispatch(const Schedule& schedule,
                       notify::Transport* transport,
                       QObject* context);

  /**
   * @brief Build the body of the summary notification.
   *
   * @param count Records without their own notification.
   * @return QString "And N more new email(s)...".
   */
  static QString summary_body(qsizetype count);

  [[nodiscard]] MAILBELL_INLINE auto max() const { return _max; }

  [[nodiscard]] MAILBELL_INLINE auto stagger() const { return _stagger; }
};

}
