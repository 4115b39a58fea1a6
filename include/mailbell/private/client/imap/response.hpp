/**
 * @file response.hpp
 * @brief IMAP4 response parser.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstddef>
#include <qbytearray.h>
#include <qlist.h>
#include <qmap.h>
#include <qpair.h>
#include <qregularexpression.h>
#include <qstring.h>
#include <qtypes.h>
#include <utility>

#include "mailbell/client/imap.hpp"
#include "mailbell/common.hpp"

namespace mailbell::client::detail {

/**
 * @brief IMAP4 response parser, digests socket data chunk by chunk until the
 * tagged completion line arrives.
 *
 */
class MAILBELL_PUBLIC IMAPResponse
{
public:
  inline static const QRegularExpression TAGGED_REG{
    R"REGEX(^(?P<tag>\S+) (?P<type>[A-Z]+)(?: (?P<data>.*))?$)REGEX"
  }; /**< Regex to parse tagged response. */

  inline static const QRegularExpression UNTAGGED_REG{
    R"REGEX(^\* (?P<type>[A-Z-]+)(?: (?P<data>.*))?$)REGEX"
  }; /**< Regex to parse untagged response. */

  inline static const QRegularExpression UNTAGGED_TRAILING_REG{
    R"REGEX(^\* (?P<data>\d+) (?P<type>[A-Z-]+)$)REGEX"
  }; /**< Regex to parse untagged trailing response. */

  inline static const QRegularExpression UNTAGGED_FETCH_REG{
    R"REGEX(^\* (?P<id>\d+) FETCH \((?P<data>.*)$)REGEX"
  }; /**< Regex to parse first FETCH response line. */

  /**
   * @brief Regex to parse FETCH item pairs.
   *
   * @note - UID 42 => (field UID) (number 42)
   *       - FLAGS (\Seen) => (field FLAGS) (list \Seen)
   *       - BODY[HEADER.FIELDS (FROM)] {12} => (field BODY[HEADER.FIELDS
   * (FROM)]) (size 12), only at the end of a line.
   */
  inline static const QRegularExpression FETCH_ITEM_REG{
    R"REGEX((?P<field>[A-Za-z0-9.\-]+(?:\[[^\]]*\])?(?:<\d+>)?) (?:(?P<number>\d+)|NIL|"(?P<quoted>(?:[^"\\]|\\.)*)"|\((?P<list>[^)]*)\)|\{(?P<size>\d+)\}$))REGEX"
  };

private:
  QString _tag;

  QByteArray _pending;
  bool _in_fetch{ false };

  std::size_t _id{ 0 };
  qint64 _bytes_to_read{ 0 };
  QString _field;

  bool _error{ false };

  QList<QPair<IMAP::Response, QString>> _tagged;
  QList<QPair<IMAP::Response, QString>> _untagged;
  QList<QPair<IMAP::Response, QString>> _untagged_trailing;
  QMap<std::size_t, QMap<QString, QByteArray>> _raw;

public:
  /**
   * @brief Construct a new IMAPResponse object.
   *
   * @param tag Request tag.
   */
  explicit IMAPResponse(QString tag)
    : _tag{ std::move(tag) }
  {
  }

  /**
   * @brief Digest input data.
   *
   * @return true Succesfully parsed data.
   * @return false Need more input or error occurred.
   */
  bool digest(const QByteArray& data);

  /**
   * @brief Get error flag.
   *
   * @return true Error occurred.
   * @return false No error.
   */
  [[nodiscard]] MAILBELL_INLINE auto error() const { return _error; }

  /**
   * @brief Get tagged response.
   *
   * @return const QList<QPair<IMAP::Response, QString>>& Tagged response with
   * code and data pair.
   */
  [[nodiscard]] MAILBELL_INLINE auto& tagged() const { return _tagged; }

  /**
   * @brief Get untagged response.
   *
   * @return const QList<QPair<IMAP::Response, QString>>& Untagged response
   * with code and data pair.
   */
  [[nodiscard]] MAILBELL_INLINE auto& untagged() const { return _untagged; }

  /**
   * @brief Get untagged trailing response (such as EXISTS or RECENT).
   *
   * @return const QList<QPair<IMAP::Response, QString>>& Untagged trailing
   * response with code and data pair.
   */
  [[nodiscard]] MAILBELL_INLINE auto& untagged_trailing() const
  {
    return _untagged_trailing;
  }

  /**
   * @brief Get raw FETCH response.
   *
   * @return const QMap<std::size_t, QMap<QString, QByteArray>>& Map of
   * message sequence number and a submap, which contains fetch field and data.
   */
  [[nodiscard]] MAILBELL_INLINE auto& raw() const { return _raw; }

  /**
   * @brief Get response tag.
   *
   * @return const QString& response tag.
   */
  [[nodiscard]] MAILBELL_INLINE auto& tag() const { return _tag; }

private:
  /**
   * @brief Handles tagged input line.
   *
   * @param line Line without CRLF.
   * @return true Successfully parsed tagged data.
   * @return false Error occurred.
   */
  bool _handle_tagged(const QString& line);

  /**
   * @brief Handles untagged input line.
   *
   * @param line Line without CRLF.
   * @return true Successfully parsed untagged data.
   * @return false Error occurred.
   */
  bool _handle_untagged(const QString& line);

  /**
   * @brief Handles FETCH items of the current message, opens a literal when
   * the line ends with `{n}`.
   *
   * @param data Item text.
   * @return true Successfully parsed items.
   * @return false Error occurred.
   */
  bool _handle_fetch_items(const QString& data);

  /**
   * @brief Move pending bytes into the open literal.
   *
   * @return true Literal complete.
   * @return false Need more input.
   */
  bool _read_literal();

  /**
   * @brief Take one line from pending bytes.
   *
   * @param line Line without CRLF.
   * @return true Got a complete line.
   * @return false Need more input.
   */
  bool _take_line(QString& line);
};

}
