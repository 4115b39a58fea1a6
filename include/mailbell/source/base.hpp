/**
 * @file base.hpp
 * @brief Base mail source.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <qobjectdefs.h>
#include <qstring.h>
#include <qstringlist.h>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"

namespace mailbell::source {

/**
 * @brief Mail source, the collaborator that reports unread messages and
 * deletes them on request.
 *
 * @note Calls block the calling thread until the callbacks have run, every
 * call must be reentrant so that polls and deletes may overlap.
 */
class MAILBELL_PUBLIC Base
{
  Q_GADGET

public:
  /**
   * @brief Source error types.
   *
   */
  enum ErrorType : uint8_t
  {
    E_NOERR,     /**< No error. */
    E_CONFIG,    /**< No credentials, the source is not usable. */
    E_TRANSPORT, /**< Connection, authentication or command failure. */
    E_MALFORMED, /**< Server answered with an unexpected status. */
  };

  Q_ENUM(ErrorType)

  using FetchCallback = std::function<void(const model::EmailList&)>;
  using CommandCallback = std::function<void()>;
  using ErrorCallback = std::function<void(ErrorType, const QString&)>;

  inline static const QString CONFIG_INCOMPLETE_MESSAGE =
    "Configuration incomplete. Please configure your mail account.";

  Base() = default;
  virtual ~Base() = default;

  Base(const Base&) = delete;
  Base& operator=(const Base&) = delete;

  /**
   * @brief Fetch unread messages.
   *
   * @param callback Success callback with records, newest first.
   * @param error_callback Error callback.
   */
  virtual void fetch_unread(
    const FetchCallback& callback,
    const ErrorCallback& error_callback = _default_error_handler) = 0;

  /**
   * @brief Move messages to trash.
   *
   * @param ids Message ids.
   * @param callback Success callback.
   * @param error_callback Error callback.
   */
  virtual void remove(
    const QStringList& ids,
    const CommandCallback& callback = _default_command_handler,
    const ErrorCallback& error_callback = _default_error_handler) = 0;

  /**
   * @brief Check that the account is reachable and the credentials work.
   *
   * @param callback Success callback.
   * @param error_callback Error callback.
   */
  virtual void test_connection(
    const CommandCallback& callback = _default_command_handler,
    const ErrorCallback& error_callback = _default_error_handler) = 0;

protected:
  static void _default_command_handler() {}

  static void _default_error_handler(ErrorType /*error*/,
                                     const QString& /*estr*/)
  {
  }
};

}
