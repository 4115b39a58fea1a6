#include <qdatetime.h>
#include <qdebug.h>
#include <qlogging.h>
#include <qmetatype.h>
#include <qsharedpointer.h>
#include <qstring.h>
#include <qtimer.h>
#include <utility>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/poller.hpp"
#include "mailbell/source/base.hpp"

namespace mailbell {

Poller::Poller(QSharedPointer<source::Base> source,
               qint64 interval,
               qint64 last_check,
               int tick,
               QObject* parent)
  : QObject{ parent }
  , _source{ std::move(source) }
  , _interval{ interval }
  , _last_check{ last_check }
  , _tick{ tick }
{
  qRegisterMetaType<model::EmailList>();
  qRegisterMetaType<source::Base::ErrorType>();
}

void
Poller::start()
{
  MAILBELL_ASSERT_AFFINITY();

  if (_timer == nullptr) {
    _timer = new QTimer{ this };
    connect(_timer, &QTimer::timeout, this, &Poller::_on_tick);
  }

  qInfo() << "Poller: Started with interval" << _interval.load() << "seconds.";

  _active = true;
  _timer->start(_tick);
  _on_tick();
}

void
Poller::stop()
{
  MAILBELL_ASSERT_AFFINITY();

  _active = false;
  if (_timer != nullptr) {
    _timer->stop();
  }

  qInfo() << "Poller: Stopped.";
}

void
Poller::check_now()
{
  _force = true;
}

void
Poller::poll()
{
  MAILBELL_ASSERT_AFFINITY();

  // the source runs a nested event loop, which may deliver another request.
  if (_polling) {
    qDebug() << "Poller: Poll already in progress.";
    return;
  }
  _polling = true;

  auto now = QDateTime::currentSecsSinceEpoch();
  auto started_at = common::steady_msecs();

  qDebug() << "Poller: Checking for new mail.";

  _source->fetch_unread(
    [this, started_at](const model::EmailList& records) {
      qDebug() << "Poller: Poll returned" << records.size() << "records.";
      emit polled(records, started_at);
    },
    [this](source::Base::ErrorType type, const QString& message) {
      if (type == source::Base::E_MALFORMED) {
        qWarning() << "Poller: Ignore malformed response:" << message;
        return;
      }
      emit poll_failed(type, message);
    });

  _polling = false;
  _last_check = now;
  emit checked(now);
}

void
Poller::_on_tick()
{
  auto now = QDateTime::currentSecsSinceEpoch();
  auto forced = _force.exchange(false);

  if (!forced && now - _last_check < _interval) {
    return;
  }

  // a poll may outlast a tick, keep ticks from piling up.
  if (_timer != nullptr) {
    _timer->stop();
  }

  poll();

  // `stop` may have been delivered while polling.
  if (_active && _timer != nullptr) {
    _timer->start(_tick);
  }
}

}
