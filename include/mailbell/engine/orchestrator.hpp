/**
 * @file orchestrator.hpp
 * @brief Owner of the canonical mail state.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <functional>
#include <qhash.h>
#include <qobject.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtmetamacros.h>
#include <qtypes.h>

#include "mailbell/common.hpp"
#include "mailbell/engine/badge.hpp"
#include "mailbell/engine/notified.hpp"
#include "mailbell/engine/scheduler.hpp"
#include "mailbell/engine/snooze.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/notify/transport.hpp"

namespace mailbell::engine {

/**
 * @brief Reconciles poll results and user actions into the canonical state.
 *
 * The orchestrator exclusively owns the canonical mail list, the notified
 * set, the snooze state and the error flag. All of its slots must run on
 * the thread it lives in: other threads reach it through queued
 * connections only. Network work (poll, delete) never runs here, deletes
 * are handed out through `remove_requested`.
 */
class MAILBELL_PUBLIC Orchestrator : public QObject
{
  Q_OBJECT

public:
  using Clock = std::function<qint64()>;

  constexpr static int RECHECK_DELAY_MSECS =
    20000; /**< Delay of the forced poll after marking mail read. */

  inline static const QString DEFAULT_INBOX_URL = "https://mail.google.com";
  inline static const QString ERROR_TITLE = "Mailbell Error";

private:
  notify::Transport* _transport;
  Scheduler _scheduler;
  Clock _clock;
  QString _inbox_url{ DEFAULT_INBOX_URL };
  int _recheck_delay{ RECHECK_DELAY_MSECS };

  model::EmailList _all_emails;
  model::ThreadList _grouped;
  NotifiedSet _notified;
  Snooze _snooze;
  bool _error{ false };
  BadgeState _badge{ BadgeState::NONE };

  // id -> steady time of the local mark read or delete. Results of polls
  // started before that moment still contain the id and must not revive it.
  QHash<QString, qint64> _removed;

public:
  /**
   * @brief Construct a new Orchestrator.
   *
   * @param transport Notification transport, must outlive the orchestrator.
   * @param parent Parent object.
   */
  explicit Orchestrator(notify::Transport* transport,
                        QObject* parent = nullptr);

  /**
   * @brief Replace the wall clock (epoch seconds).
   *
   */
  MAILBELL_INLINE void set_clock(Clock clock) { _clock = std::move(clock); }

  MAILBELL_INLINE void set_scheduler(const Scheduler& scheduler)
  {
    _scheduler = scheduler;
  }

  MAILBELL_INLINE void set_inbox_url(const QString& url) { _inbox_url = url; }

  MAILBELL_INLINE void set_recheck_delay(int msecs) { _recheck_delay = msecs; }

  /**
   * @brief Get the canonical list, newest first.
   *
   */
  [[nodiscard]] MAILBELL_INLINE auto& all_emails() const
  {
    return _all_emails;
  }

  /**
   * @brief Get the display list, one entry per thread.
   *
   */
  [[nodiscard]] MAILBELL_INLINE auto& grouped() const { return _grouped; }

  [[nodiscard]] MAILBELL_INLINE auto& notified() const { return _notified; }

  [[nodiscard]] MAILBELL_INLINE auto badge() const { return _badge; }

  [[nodiscard]] MAILBELL_INLINE auto is_error() const { return _error; }

  /**
   * @brief Ids removed locally that no poll has confirmed yet.
   *
   */
  [[nodiscard]] MAILBELL_INLINE auto& pending_removals() const
  {
    return _removed;
  }

  /**
   * @brief Check snooze state, expiring it when due.
   *
   */
  bool is_snoozed();

  /**
   * @brief Seconds left until the snooze expires.
   *
   */
  qint64 snooze_remaining();

public slots: // NOLINT
  /**
   * @brief Handles a successful poll.
   *
   * Ids dropped locally after `started_at` are filtered from `records`.
   *
   * @param records Raw records in source order.
   * @param started_at `common::steady_msecs` when the poll was issued.
   */
  void on_polled(const mailbell::model::EmailList& records,
                 qint64 started_at);

  /**
   * @brief Handles a failed poll, keeps the current mail state.
   *
   * @param message Error message shown to the user.
   */
  void on_poll_failed(const QString& message);

  /**
   * @brief Handles a failed delete, the local removal is kept.
   *
   * @param message Error message of the mail source.
   */
  void on_remove_failed(const QString& message);

  /**
   * @brief Request an immediate poll.
   *
   */
  void check_now();

  /**
   * @brief Drop a message locally and re-poll after the recheck delay.
   *
   * @param id Message id.
   */
  void mark_read(const QString& id);

  /**
   * @brief Drop messages locally and ask the mail source to delete them.
   *
   * @param ids Message ids.
   */
  void remove(const QStringList& ids);

  /**
   * @brief Remove every message of the thread containing `id`.
   *
   * @param id Id of any thread member.
   */
  void remove_thread(const QString& id);

  /**
   * @brief Flip snooze state.
   *
   */
  void toggle_snooze();

  /**
   * @brief Snooze requested from a notification action.
   *
   */
  void snooze_from_notification();

signals:
  /**
   * @brief Emitted when the display list has been recomputed.
   *
   */
  void grouped_changed(const mailbell::model::ThreadList& grouped);

  /**
   * @brief Emitted when the badge has been recomputed.
   *
   */
  void badge_changed(mailbell::engine::BadgeState badge);

  /**
   * @brief Emitted when snooze state has been changed by an action.
   *
   */
  void snooze_changed(bool active);

  /**
   * @brief Emitted when a poll should run as soon as possible.
   *
   */
  void check_requested();

  /**
   * @brief Emitted with ids the mail source should delete.
   *
   */
  void remove_requested(const QStringList& ids);

private:
  qint64 _now() const;

  void _publish_view();

  void _publish_badge();

  void _report_error(const QString& message);

  void _drop_locally(const QStringList& ids);
};

}
