/**
 * @file imap.hpp
 * @brief IMAP4 mail source for Gmail accounts.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <qlist.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtypes.h>

#include "mailbell/client/base.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"
#include "mailbell/source/base.hpp"

namespace mailbell::client {

class IMAP;

}

namespace mailbell::source {

/**
 * @brief IMAP4 mail source.
 *
 * Every call opens its own connection in the calling thread and closes it
 * before returning.
 */
class MAILBELL_PUBLIC IMAP : public Base
{
public:
  /**
   * @brief Account settings.
   *
   */
  struct Account
  {
    QString host;
    uint16_t port{ 0 };
    QString username;
    QString password;
    QString inbox_url;
  };

  inline static const QString INBOX = "INBOX";
  inline static const QString TRASH = "[Gmail]/Trash";
  inline static const QString THREAD_LINK =
    "https://mail.google.com/mail/u/0/#inbox/%1"; /**< Link of a thread, %1
                                                     is the hex thread id. */

  constexpr static int SINCE_DAYS = 3;       /**< Search window. */
  constexpr static qsizetype MAX_FETCH = 200; /**< Newest uids fetched. */

private:
  Account _account;
  int _timeout;

public:
  /**
   * @brief Construct a new IMAP object.
   *
   * @param account Account settings.
   * @param timeout Timeout of each network step.
   */
  explicit IMAP(Account account,
                int timeout = client::Base::TIMEOUT_MSECS);

  void fetch_unread(
    const FetchCallback& callback,
    const ErrorCallback& error_callback = _default_error_handler) override;
  void remove(
    const QStringList& ids,
    const CommandCallback& callback = _default_command_handler,
    const ErrorCallback& error_callback = _default_error_handler) override;
  void test_connection(
    const CommandCallback& callback = _default_command_handler,
    const ErrorCallback& error_callback = _default_error_handler) override;

  [[nodiscard]] MAILBELL_INLINE auto& account() const { return _account; }

  /**
   * @brief Build a record from a FETCH item.
   *
   * @param item FETCH item with uid, thread id and header fields.
   * @param inbox_url Link used when the thread id is unknown.
   * @return model::EmailRecord Record.
   */
  static model::EmailRecord to_record(const client::response::FetchItem& item,
                                      const QString& inbox_url);

  /**
   * @brief Convert a decimal Gmail thread id to hex.
   *
   * @param thread_id Decimal X-GM-THRID.
   * @return QString Lowercase hex without prefix, empty when invalid.
   */
  static QString thread_hex(const QString& thread_id);

private:
  /**
   * @brief Connect and login.
   *
   * @param client Client.
   * @param error_callback Error callback.
   * @return true Logged in.
   * @return false Error callback has been called.
   */
  bool _open(client::IMAP& client, const ErrorCallback& error_callback) const;

  /**
   * @brief Logout, failures are only logged.
   *
   * @param client Client.
   */
  void _shutdown(client::IMAP& client) const;

  /**
   * @brief Report a client error.
   *
   * @param client Client.
   * @param what Step which failed.
   * @param type Source error type.
   * @param error_callback Error callback.
   */
  static void _fail(const client::IMAP& client,
                    const char* what,
                    ErrorType type,
                    const ErrorCallback& error_callback);
};

}
