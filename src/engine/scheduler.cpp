#include <algorithm>
#include <qdebug.h>
#include <qlogging.h>
#include <qobject.h>
#include <qstring.h>
#include <qtimer.h>

#include "mailbell/engine/scheduler.hpp"
#include "mailbell/notify/transport.hpp"

namespace mailbell::engine {

Schedule
Scheduler::plan(const model::EmailList& fresh,
                const QString& inbox_url,
                const std::function<void()>& on_snooze) const
{
  auto schedule = Schedule{};
  auto shown = std::min(_max, fresh.size());

  for (qsizetype i = 0; i < shown; ++i) {
    const auto& email = fresh[i];

    auto request = notify::Request{};
    request.title = QString{ "New email from %1" }.arg(email.sender);
    request.body = email.subject;
    request.link = email.link;
    request.on_snooze = on_snooze;

    schedule.push_back({ static_cast<int>(i) * _stagger, std::move(request) });
  }

  if (fresh.size() > shown) {
    auto request = notify::Request{};
    request.title = SUMMARY_TITLE;
    request.body = summary_body(fresh.size() - shown);
    request.link = inbox_url;
    request.on_snooze = on_snooze;

    schedule.push_back({ static_cast<int>(shown) * _stagger,
                         std::move(request) });
  }

  return schedule;
}

void
Scheduler::dispatch(const Schedule& schedule,
                    notify::Transport* transport,
                    QObject* context)
{
  for (const auto& item : schedule) {
    qDebug() << "Scheduler: Notification" << item.request.title << "in"
             << item.delay_msecs << "ms.";

    QTimer::singleShot(
      item.delay_msecs, context, [transport, request = item.request]() {
        transport->show(request);
      });
  }
}

QString
Scheduler::summary_body(qsizetype count)
{
  return QString{ "And %1 more new email%2..." }
    .arg(count)
    .arg(count > 1 ? QString{ "s" } : QString{});
}

}
