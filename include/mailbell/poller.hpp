/**
 * @file poller.hpp
 * @brief Poll worker, drives the mail source from its own thread.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <atomic>
#include <qobject.h>
#include <qsharedpointer.h>
#include <qstring.h>
#include <qtimer.h>
#include <qtmetamacros.h>
#include <qtypes.h>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/source/base.hpp"

namespace mailbell {

/**
 * @brief Poll worker.
 *
 * Lives on a worker thread, polls the source when the interval has elapsed
 * or a check was requested. Results leave the thread only through signals.
 */
class MAILBELL_PUBLIC Poller : public QObject
{
  Q_OBJECT

public:
  constexpr static int DEFAULT_TICK_MSECS = 1000; /**< Timer resolution. */

private:
  QSharedPointer<source::Base> _source;
  std::atomic<qint64> _interval;
  qint64 _last_check;
  int _tick;

  QTimer* _timer{ nullptr };
  bool _active{ false };
  bool _polling{ false };
  std::atomic<bool> _force{ true };

public:
  /**
   * @brief Construct a new Poller object.
   *
   * @param source Mail source, shared with delete tasks.
   * @param interval Seconds between polls.
   * @param last_check Epoch seconds of the last poll.
   * @param tick Timer resolution in milliseconds.
   * @param parent Parent object.
   */
  Poller(QSharedPointer<source::Base> source,
         qint64 interval,
         qint64 last_check,
         int tick = DEFAULT_TICK_MSECS,
         QObject* parent = nullptr);

  /**
   * @brief Change the poll interval, may be called from any thread.
   *
   * @param interval Seconds between polls.
   */
  MAILBELL_INLINE void set_interval(qint64 interval) { _interval = interval; }

  [[nodiscard]] MAILBELL_INLINE qint64 interval() const { return _interval; }

  [[nodiscard]] MAILBELL_INLINE auto last_check() const { return _last_check; }

  [[nodiscard]] MAILBELL_INLINE auto is_running() const { return _active; }

public slots: // NOLINT
  /**
   * @brief Start ticking, the first tick polls immediately.
   *
   */
  void start();

  /**
   * @brief Stop ticking.
   *
   */
  void stop();

  /**
   * @brief Request a poll on the next tick, may be called from any thread.
   *
   */
  void check_now();

  /**
   * @brief Poll once, blocking the worker thread.
   *
   */
  void poll();

private slots: // NOLINT
  void _on_tick();

signals:
  /**
   * @brief Emitted with the records of a successful poll.
   *
   * @param records Raw records in source order.
   * @param started_at `common::steady_msecs` when the fetch was issued.
   */
  void polled(const mailbell::model::EmailList& records, qint64 started_at);

  /**
   * @brief Emitted when a poll failed with a reportable error.
   *
   */
  void poll_failed(mailbell::source::Base::ErrorType type,
                   const QString& message);

  /**
   * @brief Emitted after every poll attempt.
   *
   */
  void checked(qint64 at);
};

}
