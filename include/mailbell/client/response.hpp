/**
 * @file response.hpp
 * @brief Mailbell IMAP4 response types.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstddef>
#include <qbytearray.h>
#include <qdebug.h>
#include <qlist.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qvariant.h>

#include "mailbell/common.hpp"

namespace mailbell::client::response {

/**
 * @brief LOGIN response.
 *
 */
struct Login
{};

/**
 * @brief LOGOUT response.
 *
 */
struct Logout
{};

/**
 * @brief SELECT response.
 *
 */
struct Select
{
  std::size_t exists{ 0 };
  std::size_t recent{ 0 };
  std::size_t unseen{ 0 };
  std::size_t uidvalidity{ 0 };
  QStringList flags;
  QStringList permanent_flags;
  QString permission;
};

/**
 * @brief SEARCH response, uids for UID SEARCH.
 *
 */
using Search = QList<std::size_t>;

/**
 * @brief FETCH response item of one message.
 *
 */
struct FetchItem
{
  std::size_t seq{ 0 };  /**< Message sequence number. */
  std::size_t uid{ 0 };  /**< Uid, 0 when not fetched. */
  QString thread_id;     /**< Decimal X-GM-THRID, empty when not fetched. */
  QStringList flags;     /**< Flags without leading backslash. */
  QByteArray header;     /**< Raw header fields. */
};

/**
 * @brief FETCH response.
 *
 */
using Fetch = QList<FetchItem>;

/**
 * @brief Response of commands that only report completion (CLOSE, EXPUNGE,
 * COPY, STORE).
 *
 */
struct Done
{
  QString message;
};

}

Q_DECLARE_METATYPE(mailbell::client::response::Login)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::client::response::Login& /*response*/)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << "Login";
  return dbg;
}

Q_DECLARE_METATYPE(mailbell::client::response::Logout)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::client::response::Logout& /*response*/)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << "Logout";
  return dbg;
}

Q_DECLARE_METATYPE(mailbell::client::response::Select)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::client::response::Select& response)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << QString{ "Select[exists: %1, recent: %2, unseen: %3, "
                            "uidvalidity: %4, permission: %5]" }
                     .arg(response.exists)
                     .arg(response.recent)
                     .arg(response.unseen)
                     .arg(response.uidvalidity)
                     .arg(response.permission);
  return dbg;
}

Q_DECLARE_METATYPE(mailbell::client::response::FetchItem)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::client::response::FetchItem& response)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << QString{ "FetchItem[seq: %1, uid: %2, thread: %3, "
                            "header: %4 bytes]" }
                     .arg(response.seq)
                     .arg(response.uid)
                     .arg(response.thread_id)
                     .arg(response.header.size());
  return dbg;
}

Q_DECLARE_METATYPE(mailbell::client::response::Done)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::client::response::Done& response)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << QString{ "Done[%1]" }.arg(response.message);
  return dbg;
}
