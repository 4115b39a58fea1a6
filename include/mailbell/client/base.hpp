/**
 * @file base.hpp
 * @brief Blocking-capable mailbox client interface used by mail sources.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <qeventloop.h>
#include <qobject.h>
#include <qstring.h>
#include <qtimer.h>
#include <qvariant.h>
#include <utility>

#include "mailbell/common.hpp"

namespace mailbell::client {

/**
 * @brief Mailbox client owned by a single worker thread.
 *
 * Commands are asynchronous; the `wait_for_*` helpers spin a local event loop
 * so that a mail source can drive a whole session sequentially.
 */
class MAILBELL_PUBLIC Base : public QObject
{
  Q_OBJECT

public:
  /** Transport security of the mailbox connection. */
  enum SslOption : uint8_t
  {
    NO_SSL, /**< Plain TCP, only meant for local test servers. */
    USE_SSL /**< Implicit TLS (port 993). */
  };

  Q_ENUM(SslOption)

  /**
   * @brief Why the last command failed.
   *
   * Any value other than `E_NOERR` turns the current poll into a failed poll.
   */
  enum ErrorType : uint8_t
  {
    E_NOERR,
    E_DUPLICATE,    /**< Already connected or a command is still in flight. */
    E_INTERNAL,     /**< Socket or TLS failure, the session is gone. */
    E_UNEXPECTED,   /**< Server answered with something we cannot map. */
    E_NOTCONNECTED, /**< Command issued without a live session. */
    E_BADCOMMAND,   /**< Server rejected the syntax (BAD). */
    E_LOGIN,        /**< Credentials refused. */
    E_REFERENCE,    /**< Mailbox missing or not selectable. */
    E_PARSE,        /**< Response could not be decoded. */
    E_TIMEOUT,      /**< Server stayed silent past the deadline. */
  };

  Q_ENUM(ErrorType)

  using CommandCallback = std::function<void(const QVariant&)>;
  using ErrorCallback = std::function<void(ErrorType, const QString&)>;

  constexpr static int TIMEOUT_MSECS = 30000; /**< Per-command deadline. */

private:
  ErrorType _error{ E_NOERR };
  QString _estr;

public:
  explicit Base(QObject* parent = nullptr)
    : QObject{ parent }
  {
  }

  ~Base() override = default;

  /**
   * @brief Open the session to the mail host.
   *
   * `connected` fires once the server greeting has been read.
   *
   * @param url Host name, e.g. `imap.gmail.com`.
   * @param port 0 selects the protocol default.
   * @param ssl Transport security.
   * @param callback Invoked with the greeting.
   */
  virtual void connect_to_host(
    const QString& url,
    uint16_t port = 0,
    SslOption ssl = USE_SSL,
    const CommandCallback& callback = _default_command_handler) = 0;

  /** Drop the session without a protocol goodbye. */
  virtual void disconnect_from_host(
    const CommandCallback& callback = _default_command_handler) = 0;

  virtual bool is_connected() = 0;
  virtual bool is_disconnected() = 0;

  /**
   * @brief Authenticate the session.
   *
   * A refusal sets `E_LOGIN`; the password never shows up in the error text.
   */
  virtual void login(
    const QString& username,
    const QString& password,
    const CommandCallback& callback = _default_command_handler) = 0;

  /** Say goodbye politely; the server closes the socket afterwards. */
  virtual void logout(
    const CommandCallback& callback = _default_command_handler) = 0;

  /** Take the oldest completed response, invalid when none is queued. */
  virtual QVariant read() = 0;

  /**
   * @brief Block until the greeting arrives.
   *
   * @return false On timeout (`E_TIMEOUT` is set) or when the connection
   * failed.
   */
  bool wait_for_connected(int msecs = TIMEOUT_MSECS);

  bool wait_for_disconnected(int msecs = TIMEOUT_MSECS);

  /**
   * @brief Block until the pending command has completed.
   *
   * @note A stale error makes this return false immediately, so clear it with
   * `reset_error` before issuing the next command.
   */
  bool wait_for_ready_read(int msecs = TIMEOUT_MSECS);

  [[nodiscard]] MAILBELL_INLINE auto& error_string() const { return _estr; }
  [[nodiscard]] MAILBELL_INLINE auto error() const { return _error; }

  MAILBELL_INLINE void reset_error()
  {
    _error = E_NOERR;
    _estr.clear();
  }

protected:
  static void _default_command_handler(const QVariant& /*data*/) {}

  static void _default_error_handler(ErrorType /*error*/,
                                     const QString& /*estr*/)
  {
  }

  // Returns false only when the deadline passed; an error also ends the wait.
  template<typename Ef>
  bool _wait_for_event(int msecs, Ef&& func)
  {
    auto loop = QEventLoop{};
    auto timeout = false;

    connect(this, std::forward<Ef>(func), &loop, &QEventLoop::quit);
    connect(this, &Base::error_occurred, &loop, &QEventLoop::quit);

    if (msecs > 0) {
      auto* timer = new QTimer{ &loop };
      timer->setSingleShot(true);
      connect(timer, &QTimer::timeout, &loop, [&loop, &timeout]() {
        timeout = true;
        loop.quit();
      });

      timer->start(msecs);
    }

    loop.exec();

    return !timeout;
  }

  // Also wakes any pending wait_for_* loop.
  MAILBELL_INLINE void _set_error(ErrorType type, const QString& estr)
  {
    _error = type;
    _estr = estr;
    emit error_occurred();
  }

signals:
  void connected();
  void disconnected();
  /** A response was queued for `read`. */
  void ready_read();
  void error_occurred();
};

}
