/**
 * @file header.hpp
 * @brief Message header decoding.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qbytearray.h>
#include <qmap.h>
#include <qstring.h>
#include <qtypes.h>

#include "mailbell/common.hpp"

namespace mailbell::source::header {

inline const QString UNSUPPORTED_ENCODING =
  "[Unsupported encoding]"; /**< Placeholder for undecodable headers. */

/**
 * @brief Unfold raw header fields into a map.
 *
 * @param raw Raw header block, CRLF or LF separated.
 * @return QMap<QString, QByteArray> Lowercase field name to unfolded value,
 * the first occurrence of a field wins.
 */
MAILBELL_PUBLIC QMap<QString, QByteArray>
parse_fields(const QByteArray& raw);

/**
 * @brief Decode bytes in a named charset.
 *
 * Falls back to UTF-8 when the charset is unknown or the bytes are invalid in
 * it, then to Latin-1, which always succeeds.
 *
 * @note Qt only ships the UTF and Latin-1 codecs. Charsets such as
 * `windows-1251`, `ISO-8859-2` or `KOI8-R` need a Qt built with ICU
 * (`QStringConverter::availableCodecs()` lists them on Qt 6.7+). An
 * unavailable charset is logged and decoded through the fallbacks.
 *
 * @param bytes Encoded bytes.
 * @param charset Charset name, may be empty.
 * @return QString Decoded text.
 */
MAILBELL_PUBLIC QString
decode_charset(const QByteArray& bytes, const QByteArray& charset = {});

/**
 * @brief Decode a header value with RFC 2047 encoded words.
 *
 * @param value Raw header value.
 * @return QString Decoded value, `UNSUPPORTED_ENCODING` when an encoded word
 * is malformed.
 */
MAILBELL_PUBLIC QString
decode(const QByteArray& value);

/**
 * @brief Parse an RFC 2822 date.
 *
 * @param value Date header value.
 * @return qint64 Epoch seconds, 0 when unparseable.
 */
MAILBELL_PUBLIC qint64
parse_date(const QString& value);

/**
 * @brief Extract the display name of an address.
 *
 * @param from Decoded `From` value such as `Alice <alice@example.com>`.
 * @return QString Display name, or `from` itself when there is none.
 */
MAILBELL_PUBLIC QString
display_name(const QString& from);

}
