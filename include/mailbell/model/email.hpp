/**
 * @file email.hpp
 * @brief Mail records shared by the mail source and the engine.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qdebug.h>
#include <qlist.h>
#include <qmetatype.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtypes.h>

#include "mailbell/common.hpp"

namespace mailbell::model {

/**
 * @brief One unread message as reported by the mail source.
 *
 */
struct EmailRecord
{
  inline static const QString NO_SUBJECT =
    "(No subject)"; /**< Subject used when the header is absent. */

  QString id;                  /**< Stable id from the mail source. */
  QString thread_id;           /**< Server thread id, may be empty. */
  QString sender;              /**< Display name or address. */
  QString subject{ NO_SUBJECT }; /**< Decoded subject. */
  qint64 timestamp{ 0 };       /**< Epoch seconds, 0 when unknown. */
  QString link;                /**< Url that opens the message. */

  friend bool operator==(const EmailRecord& lhs, const EmailRecord& rhs)
  {
    return lhs.id == rhs.id && lhs.thread_id == rhs.thread_id &&
           lhs.sender == rhs.sender && lhs.subject == rhs.subject &&
           lhs.timestamp == rhs.timestamp && lhs.link == rhs.link;
  }

  friend bool operator!=(const EmailRecord& lhs, const EmailRecord& rhs)
  {
    return !(lhs == rhs);
  }
};

/**
 * @brief Display entry for all unread messages of one thread.
 *
 */
struct ThreadGroup
{
  EmailRecord representative; /**< Newest member of the thread. */
  qsizetype member_count{ 1 }; /**< Number of members, at least 1. */
  QStringList member_ids;     /**< Ids of all members, input order. */
};

using EmailList = QList<EmailRecord>;
using ThreadList = QList<ThreadGroup>;

}

Q_DECLARE_METATYPE(mailbell::model::EmailRecord)
Q_DECLARE_METATYPE(mailbell::model::ThreadGroup)

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::model::EmailRecord& record)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << QString{ "EmailRecord[id: %1, thread: %2, from: %3, "
                            "subject: %4, timestamp: %5]" }
                     .arg(record.id)
                     .arg(record.thread_id)
                     .arg(record.sender)
                     .arg(record.subject)
                     .arg(record.timestamp);
  return dbg;
}

MAILBELL_INLINE QDebug
operator<<(QDebug dbg, const mailbell::model::ThreadGroup& group)
{
  QDebugStateSaver saver{ dbg };
  dbg.noquote() << QString{ "ThreadGroup[count: %1, newest: %2 (%3)]" }
                     .arg(group.member_count)
                     .arg(group.representative.subject)
                     .arg(group.representative.id);
  return dbg;
}
