#include <cstddef>
#include <cstdint>
#include <qanystringview.h>
#include <qbytearray.h>
#include <qdebug.h>
#include <qlist.h>
#include <qlogging.h>
#include <qmap.h>
#include <qmutex.h>
#include <qpair.h>
#include <qsslsocket.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qvariant.h>
#include <utility>

#include "mailbell/client/base.hpp"
#include "mailbell/client/imap.hpp"
#include "mailbell/client/request.hpp"
#include "mailbell/common.hpp"
#include "mailbell/private/client/imap/fetch.hpp"
#include "mailbell/private/client/imap/login.hpp"
#include "mailbell/private/client/imap/logout.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/search.hpp"
#include "mailbell/private/client/imap/select.hpp"
#include "mailbell/private/client/imap/status.hpp"
#include "mailbell/tag.hpp"

namespace mailbell::client {

const QMap<IMAP::Command, IMAP::ResponseHandler> IMAP::RESPONSE_HANDLER{
  { IMAP::Command::LOGIN, detail::imap_handle_login },
  { IMAP::Command::LOGOUT, detail::imap_handle_logout },
  { IMAP::Command::SELECT, detail::imap_handle_select },
  { IMAP::Command::CLOSE, detail::imap_handle_status },
  { IMAP::Command::EXPUNGE, detail::imap_handle_status },
  { IMAP::Command::SEARCH, detail::imap_handle_search },
  { IMAP::Command::FETCH, detail::imap_handle_fetch },
  { IMAP::Command::COPY, detail::imap_handle_status },
  { IMAP::Command::STORE, detail::imap_handle_status },
};

IMAP::IMAP(QObject* parent)
  : Base{ parent }
{
  connect(&_sock, &QSslSocket::connected, this, &IMAP::_on_connected);
  connect(&_sock, &QSslSocket::disconnected, this, &IMAP::_on_disconnected);
}

IMAP::~IMAP()
{
  // no event loop may run here, drop the connection without LOGOUT.
  disconnect(&_sock, nullptr, this, nullptr);
  if (_sock.state() != QAbstractSocket::UnconnectedState) {
    _sock.abort();
  }
}

void
IMAP::connect_to_host(const QString& url,
                      uint16_t port,
                      SslOption ssl,
                      const CommandCallback& callback)
{
  QMutexLocker request_guard{ &_request_lock };

  _add_handler(CONNECT_TAG, callback, _default_error_handler);

  if (is_connected()) {
    _tag_error(CONNECT_TAG, E_DUPLICATE, "Already connected");
    return;
  }

  if (port == 0) {
    port = (ssl == USE_SSL) ? PORT_USE_SSL : PORT_NO_SSL;
  }

  qDebug().nospace() << "IMAP Client: Connecting to " << url << ":" << port
                    << (ssl == USE_SSL ? " over TLS." : " in plain text.");

  connect(&_sock,
          &QSslSocket::errorOccurred,
          this,
          &IMAP::_on_error_occurred,
          Qt::UniqueConnection);

  if (ssl == USE_SSL) {
    _sock.connectToHostEncrypted(url, port);
  } else {
    _sock.connectToHost(url, port);
  }
}

void
IMAP::disconnect_from_host(const CommandCallback& callback)
{
  QMutexLocker request_guard{ &_request_lock };

  _add_handler(DISCONNECT_TAG, callback, _default_error_handler);

  if (is_disconnected()) {
    _tag_error(DISCONNECT_TAG, E_DUPLICATE, "Not connected");
    return;
  }

  qDebug() << "IMAP Client: Closing the connection.";

  _sock.disconnectFromHost();
}

void
IMAP::login(const QString& username,
            const QString& password,
            const CommandCallback& callback)
{
  _request(Command::LOGIN,
           QString{ "LOGIN %1 %2" }.arg(quote(username), quote(password)),
           callback);
}

void
IMAP::logout(const CommandCallback& callback)
{
  _request(Command::LOGOUT, "LOGOUT", callback);
}

void
IMAP::select(const QString& mailbox, const CommandCallback& callback)
{
  _request(
    Command::SELECT, QString{ "SELECT %1" }.arg(quote(mailbox)), callback);
}

void
IMAP::close(const CommandCallback& callback)
{
  _request(Command::CLOSE, "CLOSE", callback);
}

void
IMAP::expunge(const CommandCallback& callback)
{
  _request(Command::EXPUNGE, "EXPUNGE", callback);
}

void
IMAP::uid_search(const QString& keys, const CommandCallback& callback)
{
  _request(Command::SEARCH, QString{ "UID SEARCH %1" }.arg(keys), callback);
}

void
IMAP::uid_fetch(const QList<std::size_t>& uids,
                request::Fetch::FieldFlags fields,
                const CommandCallback& callback)
{
  auto cmd_fields = QStringList{};
  for (auto it = FETCH_FIELD.cbegin(); it != FETCH_FIELD.cend(); ++it) {
    if (fields.testFlag(it.key())) {
      cmd_fields.push_back(it.value());
    }
  }

  _request(Command::FETCH,
           QString{ "UID FETCH %1 (%2)" }.arg(request::sequence_set(uids),
                                              cmd_fields.join(' ')),
           callback);
}

void
IMAP::uid_copy(const QList<std::size_t>& uids,
               const QString& mailbox,
               const CommandCallback& callback)
{
  _request(
    Command::COPY,
    QString{ "UID COPY %1 %2" }.arg(request::sequence_set(uids),
                                    quote(mailbox)),
    callback);
}

void
IMAP::uid_store(const QList<std::size_t>& uids,
                request::Store::Mode mode,
                const QStringList& flags,
                const CommandCallback& callback)
{
  _request(Command::STORE,
           QString{ "UID STORE %1 %2 (%3)" }.arg(request::sequence_set(uids),
                                                 STORE_MODE.value(mode),
                                                 flags.join(' ')),
           callback);
}

QVariant
IMAP::read()
{
  QMutexLocker guard{ &_read_lock };

  if (_queue.empty()) {
    qWarning() << "IMAP Client: Failed to read: No response in queue.";
    return {};
  }

  auto data = _queue.front();
  _queue.pop();

  return data;
}

QString
IMAP::quote(const QString& value)
{
  auto escaped = value;
  escaped.replace('\\', QString{ "\\\\" });
  escaped.replace('"', QString{ "\\\"" });

  return QString{ "\"%1\"" }.arg(escaped);
}

void
IMAP::_request(Command type,
               QAnyStringView cmd,
               const CommandCallback& callback)
{
  QMutexLocker request_guard{ &_request_lock };

  auto tag = _tags.generate();
  _add_handler(tag, callback, _default_error_handler);

  if (_status == Status::DISCONNECT) {
    _tag_error(tag, E_NOTCONNECTED, "Not connected");
    return;
  }

  QMutexLocker guard{ &_resp_lock };
  _resp.emplace_back(type, detail::IMAPResponse{ tag });
  guard.unlock();

  if (type == Command::LOGIN) {
    qDebug() << "IMAP Client: Send" << tag << "LOGIN ***";
  } else {
    qDebug() << "IMAP Client: Send" << tag << cmd.toString();
  }

  auto line = QString{ "%1 %2\r\n" }.arg(tag, cmd.toString()).toUtf8();
  if (_sock.write(line) < 0 || !_sock.flush()) {
    // nothing was sent, so no completion will ever arrive for this tag.
    guard.relock();
    _resp.pop_back();
    guard.unlock();

    _tag_error(tag, E_INTERNAL, _sock.errorString());
  }
}

void
IMAP::_tag_error(const QString& tag, ErrorType error, const QString& estr)
{
  qWarning() << "IMAP Client:" << tag << "failed with"
             << common::enum_name(error) << estr;

  _handle_error(tag, error, estr);
  _set_error(error, estr);
}

void
IMAP::_handle_success(const QString& tag, const QVariant& data)
{
  auto callbacks = _take_handler(tag);
  if (callbacks.first) {
    callbacks.first(data);
  }
}

void
IMAP::_handle_error(const QString& tag, ErrorType error, const QString& estr)
{
  auto callbacks = _take_handler(tag);
  if (callbacks.second) {
    callbacks.second(error, estr);
  }
}

QPair<IMAP::CommandCallback, IMAP::ErrorCallback>
IMAP::_take_handler(const QString& tag)
{
  // each tag completes exactly once, whichever way it goes.
  QMutexLocker guard{ &_cb_lock };
  return _resp_cb.take(tag);
}

void
IMAP::_add_handler(const QString& tag,
                   const CommandCallback& success,
                   const ErrorCallback& error)
{
  QMutexLocker guard{ &_cb_lock };
  _resp_cb.insert(tag, { success, error });
}

void
IMAP::_on_connected()
{
  // the greeting is read synchronously before readyRead is hooked up.
  auto resp = detail::IMAPResponse{ CONNECT_TAG };

  while (!resp.digest(_sock.readAll())) {
    if (resp.error()) {
      _tag_error(CONNECT_TAG, E_UNEXPECTED, "Malformed greeting");
      return;
    }

    if (!_sock.waitForReadyRead(TIMEOUT_MSECS)) {
      _tag_error(CONNECT_TAG, E_INTERNAL, _sock.errorString());
      return;
    }
  }

  if (resp.untagged().size() != 1) {
    _tag_error(CONNECT_TAG, E_UNEXPECTED, "Unexpected greeting");
    return;
  }

  if (resp.untagged()[0].first == Response::OK) {
    _status = Status::CONNECT;
  } else if (resp.untagged()[0].first == Response::PREAUTH) {
    _status = Status::AUTHENTICATE;
  } else {
    _tag_error(CONNECT_TAG, E_UNEXPECTED, resp.untagged()[0].second);
    return;
  }

  connect(&_sock,
          &QSslSocket::readyRead,
          this,
          &IMAP::_on_ready_read,
          Qt::UniqueConnection);

  qInfo() << "IMAP Client: Greeting received, tagging commands with"
          << _tags.label();

  _handle_success(CONNECT_TAG, {});
  emit connected();
}

void
IMAP::_on_disconnected()
{
  disconnect(
    &_sock, &QSslSocket::errorOccurred, this, &IMAP::_on_error_occurred);
  disconnect(&_sock, &QSslSocket::readyRead, this, &IMAP::_on_ready_read);
  _status = Status::DISCONNECT;

  qInfo() << "IMAP Client: Connection closed.";

  _handle_success(DISCONNECT_TAG, {});
  emit disconnected();
}

void
IMAP::_on_error_occurred(QAbstractSocket::SocketError error)
{
  QMutexLocker guard{ &_resp_lock };
  if (_resp.empty()) {
    guard.unlock();

    // server closes the connection after LOGOUT.
    if (error == QAbstractSocket::RemoteHostClosedError) {
      qDebug() << "IMAP Client: Remote host closed the connection.";
      return;
    }

    // connect still pending.
    if (_status == Status::DISCONNECT) {
      _tag_error(CONNECT_TAG, E_INTERNAL, _sock.errorString());
    } else {
      _set_error(E_INTERNAL, _sock.errorString());
    }
    return;
  }

  auto tag = _resp.front().second.tag();
  _resp.pop_front();
  guard.unlock();

  _tag_error(tag, E_INTERNAL, _sock.errorString());
}

void
IMAP::_on_ready_read()
{
  auto data = _sock.readAll();

  // responses complete in the order their commands were sent.
  QMutexLocker guard{ &_resp_lock };
  if (_resp.empty()) {
    qWarning() << "IMAP Client: Unhandled response:" << data;
    return;
  }

  auto& front = _resp.front();

  auto state = front.second.digest(data);
  auto error = front.second.error();

  if (!state && !error) {
    return;
  }

  // handlers may issue new commands, run them without holding the lock.
  auto resp = std::move(front);
  _resp.pop_front();
  guard.unlock();

  const auto& tag = resp.second.tag();

  if (error) {
    qWarning() << "IMAP Client: Failed to parse response for command"
               << common::enum_name(resp.first);
    _tag_error(tag, E_PARSE, "Invalid response");
    return;
  }

  auto handler = RESPONSE_HANDLER.value(resp.first);
  if (!handler) {
    _tag_error(tag, E_BADCOMMAND, "No handler for command");
    return;
  }

  handler(
    resp.second,

    // Parse error
    [this, &tag](ErrorType err, const QString& estr) {
      _tag_error(tag, err, estr);
    },

    // Parse success
    [this, &resp, &tag](const QVariant& data) {
      if (resp.first == Command::LOGIN) {
        _status = Status::AUTHENTICATE;
      }

      _handle_success(tag, data);

      _read_lock.lock();
      _queue.push(data);
      _read_lock.unlock();

      emit ready_read();

      if (resp.first == Command::LOGOUT) {
        _sock.disconnectFromHost();
      }
    });
}

}
