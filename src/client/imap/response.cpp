#include <cstddef>
#include <qbytearray.h>
#include <qdebug.h>
#include <qlogging.h>
#include <qregularexpression.h>
#include <qstring.h>

#include "mailbell/client/imap.hpp"
#include "mailbell/common.hpp"
#include "mailbell/private/client/imap/response.hpp"

#define _forward_false(expr)                                                   \
  {                                                                            \
    if (!(expr)) {                                                             \
      return false;                                                            \
    }                                                                          \
  }

#define _emit_error()                                                          \
  {                                                                            \
    _error = true;                                                             \
    return false;                                                              \
  }

namespace mailbell::client::detail {

namespace {

IMAP::Response
_response_type(const QString& type)
{
  return common::enum_value<IMAP::Response>(type.toLatin1().constData(),
                                            IMAP::Response::UNKNOWN);
}

}

bool
IMAPResponse::digest(const QByteArray& data)
{
  if (_error) {
    return false;
  }

  _pending.append(data);

  while (true) {
    if (_bytes_to_read > 0) {
      _forward_false(_read_literal());
    }

    auto line = QString{};
    _forward_false(_take_line(line));

    if (_in_fetch) {
      // continuation after a literal, such as ` UID 42)`.
      _forward_false(_handle_fetch_items(line));
      continue;
    }

    if (line.startsWith('*')) {
      _forward_false(_handle_untagged(line));

      // `connect` returns only an untagged response.
      if (_tag == IMAP::CONNECT_TAG) {
        return true;
      }
    } else if (line.startsWith(_tag + ' ')) {
      // all command should ends with a tagged response.
      return _handle_tagged(line);
    } else if (line.startsWith('+')) {
      qWarning() << "IMAP Client: Unexpected continuation request:" << line;
      _emit_error();
    } else {
      qWarning() << "IMAP Client: Unhandled response line:" << line;
      _emit_error();
    }
  }
}

bool
IMAPResponse::_handle_tagged(const QString& line)
{
  if (auto parsed = TAGGED_REG.match(line); parsed.hasMatch()) {
    _tagged.emplace_back(_response_type(parsed.captured("type")),
                         parsed.captured("data"));
    return true;
  }

  qWarning() << "IMAP Client: Unhandled response line:" << line;
  _emit_error();
}

bool
IMAPResponse::_handle_untagged(const QString& line)
{
  if (auto parsed = UNTAGGED_FETCH_REG.match(line); parsed.hasMatch()) {
    bool ok = false;
    _id = parsed.captured("id").toULongLong(&ok);
    if (!ok) {
      qWarning() << "IMAP Client: Failed to parse FETCH id: Not a number.";
      _emit_error();
    }

    _raw[_id];
    _in_fetch = true;
    return _handle_fetch_items(parsed.captured("data"));
  }

  if (auto parsed = UNTAGGED_TRAILING_REG.match(line); parsed.hasMatch()) {
    _untagged_trailing.emplace_back(_response_type(parsed.captured("type")),
                                    parsed.captured("data"));
    return true;
  }

  if (auto parsed = UNTAGGED_REG.match(line); parsed.hasMatch()) {
    _untagged.emplace_back(_response_type(parsed.captured("type")),
                           parsed.captured("data"));
    return true;
  }

  qWarning() << "IMAP Client: Unhandled response line:" << line;
  _emit_error();
}

bool
IMAPResponse::_handle_fetch_items(const QString& data)
{
  auto& items = _raw[_id];

  for (const auto& parsed : FETCH_ITEM_REG.globalMatch(data)) {
    auto field = parsed.captured("field").toUpper();

    if (parsed.hasCaptured("size")) {
      bool ok = false;
      auto bsize = parsed.captured("size").toLongLong(&ok);
      if (!ok) {
        qWarning() << "IMAP Client: Failed to parse FETCH size: Not a number.";
        _emit_error();
      }

      // multiline data: continue in `_read_literal`
      _field = field;
      _bytes_to_read = bsize;
      items[_field] = QByteArray{};
      return true;
    }

    if (parsed.hasCaptured("number")) {
      items[field] = parsed.captured("number").toLatin1();
    } else if (parsed.hasCaptured("quoted")) {
      items[field] = parsed.captured("quoted").toUtf8();
    } else if (parsed.hasCaptured("list")) {
      items[field] = parsed.captured("list").toUtf8();
    } else {
      // NIL
      items[field] = QByteArray{};
    }
  }

  // a line without literal is the last line of the message data.
  _in_fetch = false;
  return true;
}

bool
IMAPResponse::_read_literal()
{
  auto chunk = _pending.left(_bytes_to_read);
  _pending.remove(0, chunk.size());

  _bytes_to_read -= chunk.size();
  _raw[_id][_field].append(chunk);

  return _bytes_to_read <= 0;
}

bool
IMAPResponse::_take_line(QString& line)
{
  auto eol = _pending.indexOf("\r\n");
  if (eol < 0) {
    return false;
  }

  line = QString::fromUtf8(_pending.left(eol));
  _pending.remove(0, eol + 2);

  return true;
}

}
