#include <algorithm>
#include <csignal>
#include <cstdio>
#include <qcommandlineoption.h>
#include <qcommandlineparser.h>
#include <qcoreapplication.h>
#include <qdebug.h>
#include <qlogging.h>
#include <qloggingcategory.h>
#include <qmetaobject.h>
#include <qsharedpointer.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtextstream.h>
#include <qthread.h>
#include <qthreadpool.h>
#include <qtimer.h>

#include "mailbell/common.hpp"
#include "mailbell/credentials.hpp"
#include "mailbell/engine/badge.hpp"
#include "mailbell/engine/orchestrator.hpp"
#include "mailbell/engine/reconcile.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/notify/notify_send.hpp"
#include "mailbell/notify/transport.hpp"
#include "mailbell/poller.hpp"
#include "mailbell/settings.hpp"
#include "mailbell/source/base.hpp"
#include "mailbell/source/imap.hpp"

namespace {

using namespace mailbell;

constexpr int DEFAULT_INTERVAL_MINUTES = 5;
constexpr int SIGNAL_CHECK_MSECS = 200;
constexpr int SHUTDOWN_WAIT_MSECS = 5000;

volatile std::sig_atomic_t quit_requested = 0;

void
on_signal(int /*signum*/)
{
  quit_requested = 1;
}

int
parse_interval_minutes(const QString& value)
{
  bool ok = false;
  auto minutes = value.toInt(&ok);
  if (!ok) {
    qWarning() << "Mailbell: Invalid interval" << value << ", using"
               << DEFAULT_INTERVAL_MINUTES << "minutes.";
    minutes = DEFAULT_INTERVAL_MINUTES;
  }

  return std::max(minutes, 1);
}

void
print_grouped(const model::ThreadList& grouped)
{
  auto out = QTextStream{ stdout };

  if (grouped.isEmpty()) {
    out << "No unread mail.\n";
    return;
  }

  for (const auto& group : grouped) {
    const auto& rep = group.representative;
    out << rep.sender << " | " << rep.subject;
    if (group.member_count > 1) {
      out << " (" << group.member_count << ")";
    }
    out << " | " << rep.link << "\n";
  }
}

int
configure(const QCommandLineParser& parser,
          SettingsStore& store,
          Settings& settings,
          CredentialStore& credentials)
{
  if (parser.isSet("username")) {
    settings.username = parser.value("username").trimmed();
  }

  if (parser.isSet("interval")) {
    settings.check_interval =
      parse_interval_minutes(parser.value("interval")) * 60;
  }

  if (!store.save(settings)) {
    qCritical() << "Mailbell: Failed to save settings to" << store.path();
    return 1;
  }

  if (parser.isSet("password-stdin")) {
    if (settings.username.isEmpty()) {
      qCritical() << "Mailbell: Set a username before the password.";
      return 1;
    }

    auto in = QTextStream{ stdin };
    auto password = in.readLine();
    if (!credentials.store(settings.username, password)) {
      qCritical() << "Mailbell: Failed to store the password.";
      return 1;
    }
  }

  qInfo() << "Mailbell: Configuration saved.";
  return 0;
}

int
check_once(source::Base& mail)
{
  auto status = 1;

  mail.fetch_unread(
    [&status](const model::EmailList& records) {
      print_grouped(engine::group_by_thread(engine::dedup(records)));
      status = 0;
    },
    [](source::Base::ErrorType type, const QString& message) {
      qCritical("Mailbell: Check failed (%s): %s",
                common::enum_name(type),
                qPrintable(message));
    });

  return status;
}

int
test_connection(source::Base& mail)
{
  auto status = 1;

  mail.test_connection(
    [&status]() {
      QTextStream{ stdout } << "Connection successful.\n";
      status = 0;
    },
    [](source::Base::ErrorType /*type*/, const QString& message) {
      QTextStream{ stderr } << "Connection failed: " << message << "\n";
    });

  return status;
}

int
test_notification(QCoreApplication& app, notify::NotifySend& transport)
{
  QObject::connect(&transport,
                   &notify::NotifySend::action_invoked,
                   &app,
                   &QCoreApplication::quit,
                   Qt::QueuedConnection);
  QTimer::singleShot(
    notify::NotifySend::KILL_MSECS, &app, &QCoreApplication::quit);

  auto request = notify::Request{};
  request.title = "Mailbell";
  request.body = "Notifications are working.";
  request.on_snooze = []() { qInfo() << "Mailbell: Snooze pressed."; };
  transport.show(request);

  return QCoreApplication::exec();
}

int
run(QCoreApplication& app,
    const QSharedPointer<source::Base>& mail,
    SettingsStore& store,
    Settings& settings,
    notify::NotifySend& transport)
{
  auto orchestrator = engine::Orchestrator{ &transport };
  orchestrator.set_inbox_url(settings.gmail_url);
  orchestrator.set_recheck_delay(settings.recheck_delay);

  auto thread = QThread{};
  thread.setObjectName("poller");

  auto* poller = new Poller{ mail,
                             settings.check_interval,
                             settings.last_check_time,
                             settings.poll_tick };
  poller->moveToThread(&thread);

  QObject::connect(&thread, &QThread::started, poller, &Poller::start);
  QObject::connect(&thread, &QThread::finished, poller, &QObject::deleteLater);

  QObject::connect(
    poller, &Poller::polled, &orchestrator, &engine::Orchestrator::on_polled);
  QObject::connect(
    poller,
    &Poller::poll_failed,
    &orchestrator,
    [&orchestrator](source::Base::ErrorType /*type*/, const QString& message) {
      orchestrator.on_poll_failed(message);
    });
  QObject::connect(
    poller, &Poller::checked, &app, [&store, &settings](qint64 at) {
      settings.last_check_time = at;
      store.save_async(settings);
    });

  QObject::connect(&orchestrator,
                   &engine::Orchestrator::check_requested,
                   poller,
                   &Poller::check_now,
                   Qt::DirectConnection);
  QObject::connect(
    &orchestrator,
    &engine::Orchestrator::remove_requested,
    &app,
    [mail, &orchestrator](const QStringList& ids) {
      auto* target = &orchestrator;
      QThreadPool::globalInstance()->start([mail, target, ids]() {
        mail->remove(
          ids,
          [&ids]() {
            qInfo() << "Mailbell: Moved" << ids.size() << "messages to trash.";
          },
          [target](source::Base::ErrorType /*type*/, const QString& message) {
            QMetaObject::invokeMethod(target,
                                      "on_remove_failed",
                                      Qt::QueuedConnection,
                                      Q_ARG(QString, message));
          });
      });
    });

  QObject::connect(&orchestrator,
                   &engine::Orchestrator::grouped_changed,
                   &app,
                   [](const model::ThreadList& grouped) {
                     qInfo() << "Mailbell:" << grouped.size()
                             << "unread threads.";
                     for (const auto& group : grouped) {
                       qDebug() << group;
                     }
                   });
  QObject::connect(&orchestrator,
                   &engine::Orchestrator::badge_changed,
                   &app,
                   [](engine::BadgeState badge) {
                     qInfo() << "Mailbell: Badge" << common::enum_name(badge);
                   });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  auto signal_check = QTimer{};
  QObject::connect(&signal_check, &QTimer::timeout, &app, []() {
    if (quit_requested != 0) {
      qInfo() << "Mailbell: Quit requested.";
      QCoreApplication::quit();
    }
  });
  signal_check.start(SIGNAL_CHECK_MSECS);

  thread.start();

  auto code = QCoreApplication::exec();

  QMetaObject::invokeMethod(poller, &Poller::stop, Qt::BlockingQueuedConnection);
  thread.quit();
  if (!thread.wait(SHUTDOWN_WAIT_MSECS)) {
    qWarning() << "Mailbell: Waiting for the running poll to finish.";
    thread.wait();
  }

  if (!QThreadPool::globalInstance()->waitForDone(SHUTDOWN_WAIT_MSECS)) {
    qWarning() << "Mailbell: Pending deletes did not finish.";
  }

  if (!store.save(settings)) {
    qWarning() << "Mailbell: Failed to save settings on exit.";
  }

  return code;
}

}

int
main(int argc, char** argv)
{
  using namespace mailbell;

  auto app = QCoreApplication{ argc, argv };
  QCoreApplication::setApplicationName("mailbell");
  QCoreApplication::setApplicationVersion("0.1.0");

  qSetMessagePattern(
    "%{time yyyy-MM-dd hh:mm:ss.zzz} "
    "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
    "%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}");

  auto parser = QCommandLineParser{};
  parser.setApplicationDescription("Desktop notifier for unread Gmail mail.");
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addOptions({
    { "once", "Check once, print unread threads and exit." },
    { "username", "Set the account name and exit.", "address" },
    { "interval", "Set the check interval and exit.", "minutes" },
    { "password-stdin", "Read the password from stdin, store it and exit." },
    { "test-connection", "Check that the account is reachable and exit." },
    { "test-notification", "Show a sample notification and exit." },
    { "verbose", "Print debug output." },
  });
  parser.process(app);

  if (!parser.isSet("verbose")) {
    QLoggingCategory::setFilterRules("*.debug=false");
  }

  if (!SettingsStore::init_config_dir()) {
    qCritical() << "Mailbell: Failed to create" << SettingsStore::config_dir();
    return 1;
  }

  auto store = SettingsStore{};
  auto settings = store.load();
  auto credentials = KeychainCredentialStore{};

  if (parser.isSet("username") || parser.isSet("interval") ||
      parser.isSet("password-stdin")) {
    return configure(parser, store, settings, credentials);
  }

  auto transport = notify::NotifySend{ settings.gmail_url };
  if (parser.isSet("test-notification")) {
    return test_notification(app, transport);
  }

  auto account = source::IMAP::Account{};
  account.host = settings.imap_host;
  account.username = settings.username;
  account.password = credentials.password(settings.username);
  account.inbox_url = settings.gmail_url;

  auto mail = QSharedPointer<source::IMAP>::create(account);

  if (parser.isSet("test-connection")) {
    return test_connection(*mail);
  }

  if (parser.isSet("once")) {
    return check_once(*mail);
  }

  return run(app, mail, store, settings, transport);
}
