#include <qdatetime.h>
#include <qdebug.h>
#include <qlogging.h>
#include <qpointer.h>
#include <qstring.h>
#include <qtimer.h>

#include "mailbell/common.hpp"
#include "mailbell/engine/badge.hpp"
#include "mailbell/engine/notified.hpp"
#include "mailbell/engine/orchestrator.hpp"
#include "mailbell/engine/reconcile.hpp"
#include "mailbell/engine/scheduler.hpp"

namespace mailbell::engine {

Orchestrator::Orchestrator(notify::Transport* transport, QObject* parent)
  : QObject{ parent }
  , _transport{ transport }
  , _clock{ [] { return QDateTime::currentSecsSinceEpoch(); } }
{
}

bool
Orchestrator::is_snoozed()
{
  return _snooze.is_active(_now());
}

qint64
Orchestrator::snooze_remaining()
{
  return _snooze.remaining(_now());
}

void
Orchestrator::on_polled(const model::EmailList& records, qint64 started_at)
{
  MAILBELL_ASSERT_AFFINITY();

  _error = false;

  // a poll issued after the removal has seen it, the tombstone is done.
  for (auto it = _removed.begin(); it != _removed.end();) {
    if (started_at > it.value()) {
      it = _removed.erase(it);
    } else {
      ++it;
    }
  }

  auto current = _removed.isEmpty() ? records
                                     : remove_ids(records, _removed.keys());
  if (current.size() != records.size()) {
    qDebug() << "Orchestrator: Stale poll," << records.size() - current.size()
             << "records were removed meanwhile.";
  }

  auto emails = dedup(current);
  auto notified = prune(_notified, emails);

  _all_emails = emails;
  _publish_view();
  _publish_badge();

  auto fresh = filter_unnotified(emails, notified);

  qDebug() << "Orchestrator: Poll with" << records.size() << "records,"
           << emails.size() << "unique," << fresh.size() << "unnotified.";

  // while snoozed, fresh mail stays unnotified and is replayed on expiry.
  if (!fresh.isEmpty() && !is_snoozed()) {
    auto self = QPointer<Orchestrator>{ this };
    auto schedule =
      _scheduler.plan(fresh, _inbox_url, [self]() {
        if (self) {
          self->snooze_from_notification();
        }
      });

    Scheduler::dispatch(schedule, _transport, this);

    auto ids = QStringList{};
    for (const auto& email : fresh) {
      ids.push_back(email.id);
    }
    notified = mark_notified(notified, ids);
  }

  _notified = notified;
}

void
Orchestrator::on_poll_failed(const QString& message)
{
  MAILBELL_ASSERT_AFFINITY();

  qWarning() << "Orchestrator: Poll failed:" << message;
  _report_error(message);
}

void
Orchestrator::on_remove_failed(const QString& message)
{
  MAILBELL_ASSERT_AFFINITY();

  qWarning() << "Orchestrator: Delete failed:" << message;
  _report_error(QString{ "Failed to delete thread: %1" }.arg(message));
}

void
Orchestrator::check_now()
{
  MAILBELL_ASSERT_AFFINITY();

  emit check_requested();
}

void
Orchestrator::mark_read(const QString& id)
{
  MAILBELL_ASSERT_AFFINITY();

  _drop_locally({ id });

  qDebug() << "Orchestrator: Marked" << id << "read, recheck in"
           << _recheck_delay << "ms.";

  QTimer::singleShot(_recheck_delay, this, &Orchestrator::check_now);
}

void
Orchestrator::remove(const QStringList& ids)
{
  MAILBELL_ASSERT_AFFINITY();

  if (ids.isEmpty()) {
    return;
  }

  _drop_locally(ids);

  qDebug() << "Orchestrator: Removed" << ids << "locally.";

  emit remove_requested(ids);
}

void
Orchestrator::remove_thread(const QString& id)
{
  remove(find_thread_ids(_all_emails, id));
}

void
Orchestrator::toggle_snooze()
{
  MAILBELL_ASSERT_AFFINITY();

  auto active = _snooze.toggle(_now());
  qInfo() << "Orchestrator: Snooze" << (active ? "enabled." : "disabled.");

  _publish_badge();
  emit snooze_changed(active);
}

void
Orchestrator::snooze_from_notification()
{
  MAILBELL_ASSERT_AFFINITY();

  auto now = _now();
  if (_snooze.is_active(now)) {
    return;
  }

  _snooze.snooze_from_external_trigger(now);
  qInfo() << "Orchestrator: Snooze enabled from notification.";

  _publish_badge();
  emit snooze_changed(true);
}

qint64
Orchestrator::_now() const
{
  return _clock();
}

void
Orchestrator::_publish_view()
{
  _grouped = group_by_thread(_all_emails);
  emit grouped_changed(_grouped);
}

void
Orchestrator::_publish_badge()
{
  _badge = derive_badge(!_all_emails.isEmpty(), is_snoozed(), _error);
  emit badge_changed(_badge);
}

void
Orchestrator::_drop_locally(const QStringList& ids)
{
  auto now = common::steady_msecs();
  for (const auto& id : ids) {
    _removed.insert(id, now);
  }

  _all_emails = remove_ids(_all_emails, ids);
  _publish_view();
  _publish_badge();
}

void
Orchestrator::_report_error(const QString& message)
{
  _error = true;
  _publish_badge();

  auto request = notify::Request{};
  request.title = ERROR_TITLE;
  request.body = message;
  request.level = notify::Request::Level::WARNING;

  _transport->show(request);
}

}
