/**
 * @file request.hpp
 * @brief Mailbell IMAP4 request types.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <qdatetime.h>
#include <qflags.h>
#include <qlist.h>
#include <qobject.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qtmetamacros.h>

#include "mailbell/common.hpp"

namespace mailbell::client::request {

/**
 * @brief Search criteria, all descriptions are from RFC3501.
 *
 */
class MAILBELL_PUBLIC Search : public QObject
{
  Q_OBJECT

public:
  /**
   * @brief Flag criteria.
   *
   */
  enum Criteria : uint8_t
  {
    ALL,     /**< All messages in the mailbox. */
    FLAGGED, /**< Messages with the \Flagged flag set. */
    NEW, /**< Messages that have the \Recent flag set but not the \Seen flag. */
    RECENT, /**< Messages that have the \Recent flag set. */
    SEEN,   /**< Messages that have the \Seen flag set. */
    UNSEEN, /**< Messages that do not have the \Seen flag set. */
  };

  Q_ENUM(Criteria)

  /**
   * @brief Build search keys.
   *
   * @param criteria Flag criteria.
   * @param since Internal date lower bound, ignored when invalid.
   * @return QString Search keys, such as `UNSEEN SINCE 1-Feb-1994`.
   */
  static QString keys(Criteria criteria, const QDate& since = {});

  /**
   * @brief Format a date as an IMAP4 date, with English month names.
   *
   * @param date Date.
   * @return QString Date such as `1-Feb-1994`.
   */
  static QString date(const QDate& date);
};

/**
 * @brief Fetch items.
 *
 */
class MAILBELL_PUBLIC Fetch : public QObject
{
  Q_OBJECT

public:
  /**
   * @brief Fetch items.
   *
   */
  enum Field : uint8_t
  {
    UID = 0b0001,     /**< Unique identifier. */
    FLAGS = 0b0010,   /**< Flags. */
    THREAD = 0b0100,  /**< Gmail thread id (X-GM-THRID). */
    ENVELOPE = 0b1000, /**< From, subject and date header fields. */
  };

  Q_ENUM(Field)

  Q_DECLARE_FLAGS(FieldFlags, Field)
  Q_FLAG(FieldFlags)
};

/**
 * @brief Store modes.
 *
 */
class MAILBELL_PUBLIC Store : public QObject
{
  Q_OBJECT

public:
  /**
   * @brief How flags are applied.
   *
   */
  enum Mode : uint8_t
  {
    REPLACE, /**< FLAGS. */
    ADD,     /**< +FLAGS. */
    REMOVE,  /**< -FLAGS. */
  };

  Q_ENUM(Mode)

  inline static const QString DELETED = "\\Deleted"; /**< Deleted flag. */
  inline static const QString SEEN = "\\Seen";       /**< Seen flag. */
};

/**
 * @brief Build a sequence set such as `1,5,9`.
 *
 * @param ids Message ids.
 * @return QString Sequence set.
 */
MAILBELL_PUBLIC QString
sequence_set(const QList<std::size_t>& ids);

}

Q_DECLARE_OPERATORS_FOR_FLAGS(mailbell::client::request::Fetch::FieldFlags)
