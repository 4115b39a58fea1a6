#include <qdebug.h>
#include <qlogging.h>
#include <qprocess.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtimer.h>
#include <utility>

#include "mailbell/notify/notify_send.hpp"
#include "mailbell/notify/transport.hpp"

namespace mailbell::notify {

NotifySend::NotifySend(QString fallback_url, QObject* parent)
  : QObject{ parent }
  , _program{ PROGRAM }
  , _fallback_url{ std::move(fallback_url) }
  , _kill_msecs{ KILL_MSECS }
{
}

void
NotifySend::show(const Request& request)
{
  auto* process = new QProcess{ this };

  connect(process,
          &QProcess::finished,
          this,
          [this, process, request](int /*code*/, QProcess::ExitStatus status) {
            process->deleteLater();

            if (status != QProcess::NormalExit) {
              qDebug() << "NotifySend: Notification expired without action.";
              return;
            }

            auto action =
              QString::fromUtf8(process->readAllStandardOutput()).trimmed();
            if (handle_action(action, request, _fallback_url)) {
              emit action_invoked(action);
            }
          });

  connect(process,
          &QProcess::errorOccurred,
          this,
          [this, process](QProcess::ProcessError error) {
            if (error != QProcess::FailedToStart) {
              return;
            }

            qWarning() << "NotifySend: Failed to run" << _program << ":"
                       << process->errorString();
            process->deleteLater();
          });

  // kill a notification nobody answered, the server keeps the popup.
  QTimer::singleShot(_kill_msecs, process, [process]() {
    if (process->state() != QProcess::NotRunning) {
      process->kill();
    }
  });

  qDebug() << "NotifySend: Show" << request.title;

  process->start(_program, arguments(request));
}

QStringList
NotifySend::arguments(const Request& request)
{
  auto args = QStringList{
    "-a",
    APP_NAME,
    "-i",
    request.level == Request::Level::WARNING ? ICON_WARNING : ICON_MAIL,
    "-e",
    "-t",
    QString::number(EXPIRE_MSECS),
  };

  if (request.level == Request::Level::WARNING) {
    args << "-u"
         << "critical";
  } else {
    args << "-A"
         << (request.link.isEmpty() ? "open=Open Gmail" : "open=Open Email");
  }

  if (request.on_snooze) {
    args << "-A"
         << "snooze=Snooze 1 hour";
  }

  args << request.title << request.body;

  return args;
}

bool
NotifySend::handle_action(const QString& action,
                          const Request& request,
                          const QString& fallback_url)
{
  if (action == ACTION_OPEN) {
    auto url = request.link.isEmpty() ? fallback_url : request.link;
    if (!QProcess::startDetached(OPENER, { url })) {
      qWarning() << "NotifySend: Failed to open" << url;
    }
    return true;
  }

  if (action == ACTION_SNOOZE && request.on_snooze) {
    request.on_snooze();
    return true;
  }

  if (!action.isEmpty()) {
    qDebug() << "NotifySend: Ignore unknown action" << action;
  }

  return false;
}

}
