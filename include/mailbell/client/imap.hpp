/**
 * @file imap.hpp
 * @brief Mailbell IMAP4 client.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <qanystringview.h>
#include <qlist.h>
#include <qmap.h>
#include <qmutex.h>
#include <qobject.h>
#include <qpair.h>
#include <qsslsocket.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtmetamacros.h>
#include <queue>
#include <qvariant.h>

#include "mailbell/client/base.hpp"
#include "mailbell/client/request.hpp"
#include "mailbell/common.hpp"
#include "mailbell/tag.hpp"

namespace mailbell::client {

namespace detail {

class IMAPResponse;

}

/**
 * @brief IMAP4rev1 client with the Gmail extensions the notifier needs.
 *
 * Only the commands a poll or a delete issues are implemented. Responses are
 * matched to commands by tag and queued for `read`.
 */
class MAILBELL_PUBLIC IMAP : public Base
{
  Q_OBJECT

public:
  /** Session state as tracked from the tagged completions. */
  enum class Status : uint8_t
  {
    DISCONNECT,
    CONNECT,
    AUTHENTICATE,
  };

  /**
   * @brief Keyword of an untagged or tagged server line.
   *
   * Lines we do not interpret (LIST, LSUB, ...) are kept for logging only.
   */
  enum class Response : uint8_t
  {
    OK,
    NO,
    BAD,
    PREAUTH,
    BYE,
    CAPABILITY,
    LIST,
    LSUB,
    SEARCH,
    FLAGS,
    EXISTS,
    RECENT,
    EXPUNGE,
    FETCH,
    UNKNOWN,
  };

  Q_ENUM(Response)

  /** Commands issued by mail sources; all message commands are UID based. */
  enum class Command : uint8_t
  {
    LOGIN,
    LOGOUT,
    SELECT,
    CLOSE,
    EXPUNGE,
    SEARCH,
    FETCH,
    COPY,
    STORE,
    NOCMD, /**< Placeholder for the greeting. */
  };

  Q_ENUM(Command)

  using ResponseHandler = std::function<void(const detail::IMAPResponse&,
                                             const ErrorCallback&,
                                             const CommandCallback&)>;

  constexpr static uint16_t PORT_NO_SSL = 143;
  constexpr static uint16_t PORT_USE_SSL = 993;

  // Pseudo tags for events that have no command behind them.
  inline static const QString CONNECT_TAG = "CONNECT";
  inline static const QString DISCONNECT_TAG = "DISCONNECT";

  inline static const QMap<request::Fetch::Field, QString> FETCH_FIELD{
    { request::Fetch::UID, "UID" },
    { request::Fetch::FLAGS, "FLAGS" },
    { request::Fetch::THREAD, "X-GM-THRID" },
    { request::Fetch::ENVELOPE,
      "BODY.PEEK[HEADER.FIELDS (FROM SUBJECT DATE)]" },
  }; /**< Fetch items, headers are peeked so nothing gets marked read. */

  inline static const QMap<request::Store::Mode, QString> STORE_MODE{
    { request::Store::REPLACE, "FLAGS" },
    { request::Store::ADD, "+FLAGS" },
    { request::Store::REMOVE, "-FLAGS" },
  };

  /** Turns a completed response into the typed `response::*` value. */
  static const QMap<Command, ResponseHandler> RESPONSE_HANDLER;

private:
  QSslSocket _sock;
  std::queue<QVariant> _queue;
  Status _status{ Status::DISCONNECT };

  TagGenerator _tags;
  std::list<QPair<Command, detail::IMAPResponse>> _resp;
  QMap<QString, QPair<CommandCallback, ErrorCallback>> _resp_cb;

  QMutex _resp_lock;
  // Held across enqueue and write so a failed write can pop its own entry.
  QMutex _request_lock;
  QMutex _read_lock;
  QMutex _cb_lock;

public:
  explicit IMAP(QObject* parent = nullptr);

  ~IMAP() override;

  void connect_to_host(
    const QString& url,
    uint16_t port = 0,
    SslOption ssl = USE_SSL,
    const CommandCallback& callback = _default_command_handler) override;
  void disconnect_from_host(
    const CommandCallback& callback = _default_command_handler) override;
  bool is_connected() override
  {
    return _status == Status::CONNECT || _status == Status::AUTHENTICATE;
  }
  bool is_disconnected() override { return _status == Status::DISCONNECT; }
  void login(
    const QString& username,
    const QString& password,
    const CommandCallback& callback = _default_command_handler) override;
  void logout(
    const CommandCallback& callback = _default_command_handler) override;
  QVariant read() override;

  /** SELECT, read-write, so that STORE and EXPUNGE are allowed later. */
  void select(const QString& mailbox,
              const CommandCallback& callback = _default_command_handler);

  /** CLOSE; expunges `\Deleted` messages without untagged EXPUNGE lines. */
  void close(const CommandCallback& callback = _default_command_handler);

  void expunge(const CommandCallback& callback = _default_command_handler);

  /**
   * @brief UID SEARCH with raw keys.
   *
   * Build `keys` with `request::Search::keys`; the callback gets a
   * `response::Search` holding UIDs in server order.
   */
  void uid_search(const QString& keys,
                  const CommandCallback& callback = _default_command_handler);

  /**
   * @brief UID FETCH of the given items for a batch of UIDs.
   *
   * An empty `uids` list is an error (`E_BADCOMMAND`) rather than a no-op.
   */
  void uid_fetch(const QList<std::size_t>& uids,
                 request::Fetch::FieldFlags fields,
                 const CommandCallback& callback = _default_command_handler);

  /** UID COPY, used to move a thread into the trash mailbox. */
  void uid_copy(const QList<std::size_t>& uids,
                const QString& mailbox,
                const CommandCallback& callback = _default_command_handler);

  /** UID STORE, e.g. `+FLAGS (\Seen)` for mark-as-read. */
  void uid_store(const QList<std::size_t>& uids,
                 request::Store::Mode mode,
                 const QStringList& flags,
                 const CommandCallback& callback = _default_command_handler);

  /** Quoted-string form of `value`, escaping backslash and `"`. */
  static QString quote(const QString& value);

private:
  // Tags, writes and flushes `cmd`; errors are reported through the callbacks.
  void _request(Command type,
                QAnyStringView cmd,
                const CommandCallback& callback);

  void _tag_error(const QString& tag, ErrorType error, const QString& estr);
  void _handle_success(const QString& tag, const QVariant& data);
  void _handle_error(const QString& tag, ErrorType error, const QString& estr);
  QPair<CommandCallback, ErrorCallback> _take_handler(const QString& tag);

  void _add_handler(const QString& tag,
                    const CommandCallback& success,
                    const ErrorCallback& error);

private slots: // NOLINT
  void _on_connected();
  void _on_disconnected();
  void _on_error_occurred(QAbstractSocket::SocketError error);
  /** Feeds socket bytes to the oldest pending response. */
  void _on_ready_read();
};

}
