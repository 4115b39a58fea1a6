#include <optional>
#include <qbytearray.h>
#include <qdatetime.h>
#include <qdebug.h>
#include <qlogging.h>
#include <qmap.h>
#include <qregularexpression.h>
#include <qstring.h>
#include <qstringconverter.h>
#include <qtypes.h>

#include "mailbell/source/header.hpp"

namespace mailbell::source::header {

namespace {

const QRegularExpression ENCODED_WORD_REG{
  R"REGEX(=\?(?P<charset>[^?*]+)(?:\*[^?]*)?\?(?P<encoding>[BbQq])\?(?P<text>[^?]*)\?=)REGEX"
}; /**< Regex to match encoded words such as =?UTF-8?B?SGk=?= */

const QRegularExpression DATE_COMMENT_REG{
  R"REGEX(\s*\([^)]*\)\s*$)REGEX"
}; /**< Regex to match trailing comments such as (UTC) */

const QRegularExpression DATE_ZONE_REG{
  R"REGEX(\s+(?:GMT|UTC|UT|Z)$)REGEX",
  QRegularExpression::CaseInsensitiveOption
}; /**< Regex to match obsolete zone names equal to +0000 */

std::optional<QString>
_decode_strict(const QByteArray& bytes, const QByteArray& charset)
{
  auto decoder = QStringDecoder{ charset.constData() };
  if (!decoder.isValid()) {
    return std::nullopt;
  }

  QString text = decoder.decode(bytes);
  if (decoder.hasError()) {
    return std::nullopt;
  }

  return text;
}

int
_hex_value(char ch)
{
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  return -1;
}

QByteArray
_decode_q(const QByteArray& text)
{
  auto out = QByteArray{};
  out.reserve(text.size());

  for (qsizetype i = 0; i < text.size(); ++i) {
    auto ch = text.at(i);

    if (ch == '_') {
      out.append(' ');
      continue;
    }

    if (ch == '=' && i + 2 < text.size()) {
      auto high = _hex_value(text.at(i + 1));
      auto low = _hex_value(text.at(i + 2));
      if (high >= 0 && low >= 0) {
        out.append(static_cast<char>(high * 16 + low));
        i += 2;
        continue;
      }
    }

    out.append(ch);
  }

  return out;
}

}

QMap<QString, QByteArray>
parse_fields(const QByteArray& raw)
{
  auto fields = QMap<QString, QByteArray>{};
  auto name = QString{};
  auto value = QByteArray{};

  auto commit = [&fields, &name, &value]() {
    if (!name.isEmpty() && !fields.contains(name)) {
      fields.insert(name, value.trimmed());
    }
    name.clear();
    value.clear();
  };

  for (auto line : raw.split('\n')) {
    if (line.endsWith('\r')) {
      line.chop(1);
    }

    if (line.isEmpty()) {
      continue;
    }

    // folded continuation of the previous field.
    if (line.startsWith(' ') || line.startsWith('\t')) {
      if (!name.isEmpty()) {
        value.append(line);
      }
      continue;
    }

    commit();

    auto colon = line.indexOf(':');
    if (colon <= 0) {
      qDebug() << "Header: Skip malformed field line" << line;
      continue;
    }

    name = QString::fromLatin1(line.left(colon)).trimmed().toLower();
    value = line.mid(colon + 1);
  }

  commit();

  return fields;
}

QString
decode_charset(const QByteArray& bytes, const QByteArray& charset)
{
  if (!charset.isEmpty()) {
    if (!QStringDecoder{ charset.constData() }.isValid()) {
      qWarning() << "Header: Charset" << charset
                 << "is unavailable, decoding as UTF-8.";
    } else if (auto text = _decode_strict(bytes, charset); text) {
      return *text;
    }
  }

  if (auto text = _decode_strict(bytes, "UTF-8"); text) {
    return *text;
  }

  return QString::fromLatin1(bytes);
}

QString
decode(const QByteArray& value)
{
  auto result = QString{};
  qsizetype pos = 0;
  bool last_encoded = false;

  // Latin-1 keeps byte offsets and character offsets equal.
  auto subject = QString::fromLatin1(value);

  for (const auto& parsed : ENCODED_WORD_REG.globalMatch(subject)) {
    auto gap = value.mid(pos, parsed.capturedStart() - pos);

    // whitespace between adjacent encoded words is dropped.
    if (!(last_encoded && gap.trimmed().isEmpty())) {
      result.append(decode_charset(gap));
    }

    auto text = parsed.captured("text").toLatin1();
    auto bytes = QByteArray{};

    if (parsed.captured("encoding").toUpper() == "B") {
      auto decoded = QByteArray::fromBase64Encoding(
        text, QByteArray::AbortOnBase64DecodingErrors);
      if (!decoded) {
        qWarning() << "Header: Malformed base64 encoded word" << text;
        return UNSUPPORTED_ENCODING;
      }
      bytes = *decoded;
    } else {
      bytes = _decode_q(text);
    }

    result.append(
      decode_charset(bytes, parsed.captured("charset").toLatin1()));

    pos = parsed.capturedEnd();
    last_encoded = true;
  }

  result.append(decode_charset(value.mid(pos)));

  return result;
}

qint64
parse_date(const QString& value)
{
  auto normalized = value.trimmed();
  normalized.remove(DATE_COMMENT_REG);
  normalized.replace(DATE_ZONE_REG, " +0000");

  auto date = QDateTime::fromString(normalized, Qt::RFC2822Date);
  if (!date.isValid()) {
    if (!normalized.isEmpty()) {
      qDebug() << "Header: Unparseable date" << value;
    }
    return 0;
  }

  return date.toSecsSinceEpoch();
}

QString
display_name(const QString& from)
{
  auto angle = from.indexOf('<');
  if (angle < 0) {
    return from.trimmed();
  }

  auto name = from.left(angle).trimmed();
  if (name.size() >= 2 && name.startsWith('"') && name.endsWith('"')) {
    name = name.mid(1, name.size() - 2).trimmed();
  }

  return name.isEmpty() ? from.trimmed() : name;
}

}
