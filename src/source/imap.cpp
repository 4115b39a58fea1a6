#include <algorithm>
#include <cstddef>
#include <qdatetime.h>
#include <qdebug.h>
#include <qlist.h>
#include <qlogging.h>
#include <qstring.h>
#include <qstringlist.h>
#include <utility>

#include "mailbell/client/base.hpp"
#include "mailbell/client/imap.hpp"
#include "mailbell/client/request.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/source/header.hpp"
#include "mailbell/source/imap.hpp"

namespace mailbell::source {

IMAP::IMAP(Account account, int timeout)
  : _account{ std::move(account) }
  , _timeout{ timeout }
{
}

void
IMAP::fetch_unread(const FetchCallback& callback,
                   const ErrorCallback& error_callback)
{
  auto client = client::IMAP{};
  if (!_open(client, error_callback)) {
    return;
  }

  client.select(INBOX);
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "SELECT", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  auto since = QDate::currentDate().addDays(-SINCE_DAYS);
  client.uid_search(
    client::request::Search::keys(client::request::Search::UNSEEN, since));
  if (!client.wait_for_ready_read(_timeout)) {
    auto type = client.error() == client::Base::E_REFERENCE ||
                    client.error() == client::Base::E_BADCOMMAND
                  ? E_MALFORMED
                  : E_TRANSPORT;
    _fail(client, "SEARCH", type, error_callback);
    return;
  }

  auto uids = client.read().value<client::response::Search>();
  if (uids.size() > MAX_FETCH) {
    uids = uids.mid(uids.size() - MAX_FETCH);
  }

  qDebug() << "IMAP Source: Found" << uids.size() << "unread messages.";

  auto records = model::EmailList{};

  if (!uids.isEmpty()) {
    client.uid_fetch(uids,
                     client::request::Fetch::UID |
                       client::request::Fetch::THREAD |
                       client::request::Fetch::ENVELOPE);
    if (!client.wait_for_ready_read(_timeout)) {
      _fail(client, "FETCH", E_TRANSPORT, error_callback);
      return;
    }

    for (const auto& item : client.read().value<client::response::Fetch>()) {
      // skip untagged FETCH updates which do not belong to the request.
      if (item.uid == 0) {
        continue;
      }
      records.push_back(to_record(item, _account.inbox_url));
    }
  }

  client.close();
  if (client.wait_for_ready_read(_timeout)) {
    client.read();
  } else {
    qWarning() << "IMAP Source: CLOSE failed:" << client.error_string();
    client.reset_error();
  }

  _shutdown(client);

  std::stable_sort(records.begin(),
                   records.end(),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.timestamp > rhs.timestamp;
                   });

  callback(records);
}

void
IMAP::remove(const QStringList& ids,
             const CommandCallback& callback,
             const ErrorCallback& error_callback)
{
  auto uids = QList<std::size_t>{};
  for (const auto& id : ids) {
    bool ok = false;
    auto uid = id.toULongLong(&ok);
    if (!ok || uid == 0) {
      qWarning() << "IMAP Source: Skip invalid uid" << id;
      continue;
    }
    uids.push_back(uid);
  }

  if (uids.isEmpty()) {
    callback();
    return;
  }

  auto client = client::IMAP{};
  if (!_open(client, error_callback)) {
    return;
  }

  client.select(INBOX);
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "SELECT", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  client.uid_copy(uids, TRASH);
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "COPY", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  client.uid_store(
    uids, client::request::Store::ADD, { client::request::Store::DELETED });
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "STORE", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  client.expunge();
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "EXPUNGE", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  _shutdown(client);

  qInfo() << "IMAP Source: Moved" << uids.size() << "messages to" << TRASH;

  callback();
}

void
IMAP::test_connection(const CommandCallback& callback,
                      const ErrorCallback& error_callback)
{
  auto client = client::IMAP{};
  if (!_open(client, error_callback)) {
    return;
  }

  client.select(INBOX);
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "SELECT", E_TRANSPORT, error_callback);
    return;
  }
  qInfo() << "IMAP Source:" << client.read().value<client::response::Select>();

  client.close();
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "CLOSE", E_TRANSPORT, error_callback);
    return;
  }
  client.read();

  _shutdown(client);

  callback();
}

model::EmailRecord
IMAP::to_record(const client::response::FetchItem& item,
                const QString& inbox_url)
{
  auto fields = header::parse_fields(item.header);

  auto record = model::EmailRecord{};
  record.id = QString::number(item.uid);
  record.thread_id = thread_hex(item.thread_id);
  record.link = record.thread_id.isEmpty()
                  ? inbox_url
                  : THREAD_LINK.arg(record.thread_id);

  if (fields.contains("subject")) {
    record.subject = header::decode(fields.value("subject"));
  }

  record.sender = header::display_name(header::decode(fields.value("from")));
  record.timestamp =
    header::parse_date(QString::fromLatin1(fields.value("date")));

  return record;
}

QString
IMAP::thread_hex(const QString& thread_id)
{
  bool ok = false;
  auto value = thread_id.toULongLong(&ok);
  if (!ok || value == 0) {
    return {};
  }

  return QString::number(value, 16);
}

bool
IMAP::_open(client::IMAP& client, const ErrorCallback& error_callback) const
{
  if (_account.username.isEmpty() || _account.password.isEmpty()) {
    qWarning() << "IMAP Source:" << CONFIG_INCOMPLETE_MESSAGE;
    error_callback(E_CONFIG, CONFIG_INCOMPLETE_MESSAGE);
    return false;
  }

  client.connect_to_host(_account.host, _account.port);
  if (!client.wait_for_connected(_timeout)) {
    _fail(client, "CONNECT", E_TRANSPORT, error_callback);
    return false;
  }

  client.login(_account.username, _account.password);
  if (!client.wait_for_ready_read(_timeout)) {
    _fail(client, "LOGIN", E_TRANSPORT, error_callback);
    return false;
  }
  client.read();

  return true;
}

void
IMAP::_shutdown(client::IMAP& client) const
{
  client.reset_error();
  client.logout();
  if (!client.wait_for_disconnected(_timeout)) {
    qWarning() << "IMAP Source: LOGOUT failed:" << client.error_string();
  }
}

void
IMAP::_fail(const client::IMAP& client,
            const char* what,
            ErrorType type,
            const ErrorCallback& error_callback)
{
  auto message = client.error_string().isEmpty()
                   ? QString{ "%1 failed" }.arg(what)
                   : client.error_string();

  qWarning("IMAP Source: %s failed with %s: %s",
           what,
           common::enum_name(client.error()),
           qPrintable(message));

  error_callback(type, message);
}

}
