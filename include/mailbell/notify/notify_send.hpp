/**
 * @file notify_send.hpp
 * @brief Desktop notifications through `notify-send`.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qobject.h>
#include <qprocess.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtmetamacros.h>

#include "mailbell/common.hpp"
#include "mailbell/notify/transport.hpp"

namespace mailbell::notify {

/**
 * @brief Notification transport running `notify-send`, one process per
 * notification.
 *
 * @note Action callbacks run on the thread of this object.
 */
class MAILBELL_PUBLIC NotifySend
  : public QObject
  , public Transport
{
  Q_OBJECT

public:
  inline static const QString PROGRAM = "notify-send";
  inline static const QString OPENER = "xdg-open";
  inline static const QString APP_NAME = "mailbell";
  inline static const QString ICON_MAIL = "mail-unread";
  inline static const QString ICON_WARNING = "dialog-warning";
  inline static const QString ACTION_OPEN = "open";
  inline static const QString ACTION_SNOOZE = "snooze";
  inline static const QString DEFAULT_URL = "https://mail.google.com";

  constexpr static int EXPIRE_MSECS = 10000; /**< Notification lifetime. */
  constexpr static int KILL_MSECS = 15000;   /**< Process lifetime. */

private:
  QString _program;
  QString _fallback_url;
  int _kill_msecs;

public:
  /**
   * @brief Construct a new NotifySend object.
   *
   * @param fallback_url Url opened when a request has no link.
   * @param parent Parent object.
   */
  explicit NotifySend(QString fallback_url = DEFAULT_URL,
                      QObject* parent = nullptr);

  void show(const Request& request) override;

  /**
   * @brief Override the program, mainly for tests.
   *
   * @param program Program path.
   */
  MAILBELL_INLINE void set_program(const QString& program)
  {
    _program = program;
  }

  MAILBELL_INLINE void set_kill_timeout(int msecs) { _kill_msecs = msecs; }

  /**
   * @brief Build `notify-send` arguments.
   *
   * @param request Notification.
   * @return QStringList Arguments.
   */
  static QStringList arguments(const Request& request);

  /**
   * @brief Run the action chosen by the user.
   *
   * @param action Action key printed by `notify-send`, may be empty.
   * @param request Notification.
   * @param fallback_url Url opened when the request has no link.
   * @return true An action ran.
   * @return false Action was empty or unknown.
   */
  static bool handle_action(const QString& action,
                            const Request& request,
                            const QString& fallback_url);

signals:
  /**
   * @brief Emitted when the user picked an action.
   *
   */
  void action_invoked(const QString& action);
};

}
