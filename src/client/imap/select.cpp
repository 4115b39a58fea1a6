#include <cstddef>
#include <qdebug.h>
#include <qlogging.h>
#include <qregularexpression.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qvariant.h>
#include <utility>

#include "mailbell/client/imap.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/select.hpp"
#include "mailbell/private/client/imap/status.hpp"

namespace mailbell::client::detail {

namespace {

const QRegularExpression ATTRS_REG{
  R"REGEX(\((?P<attrs>[^)]*)\))REGEX"
}; /**< Regex to parse attrs such as (\XXX \XXX) into (<attrs>) */

const QRegularExpression SELECT_BRACKET_REG{
  R"REGEX(\[(?P<type>[A-Z-]+)(?: \(?(?P<data>[^)\]]+)\)?)?\])REGEX"
}; /**< Regex to parse bracket response such as [XXX XXX] XXX, [XXX] XXX or
      [XXX (\XXX \XXX)] XXX into [<type> <data>] XXX, [<type>] XXX or [<type>
      (<data>)] XXX */

QStringList
_parse_attrs(const QString& attrs_str)
{
  auto attrs = attrs_str.split(' ', Qt::SkipEmptyParts);

  for (auto& item : attrs) {
    if (item.startsWith('\\')) {
      item.remove(0, 1);
    }
  }

  return attrs;
}

bool
_parse_number(const QString& data, const char* what, std::size_t& out)
{
  bool ok = false;
  auto value = data.toULongLong(&ok);
  if (!ok) {
    qWarning("IMAP Client: Failed to parse SELECT %s response: Not a number.",
             what);
    return false;
  }

  out = value;
  return true;
}

}

void
imap_handle_select(const IMAPResponse& resp,
                   const IMAP::ErrorCallback& error_handler,
                   const IMAP::CommandCallback& success_handler)
{
  if (!imap_check_status(resp, IMAP::E_REFERENCE, error_handler)) {
    return;
  }

  auto select_resp = response::Select{};

  if (auto parsed = SELECT_BRACKET_REG.match(resp.tagged()[0].second);
      parsed.hasMatch()) {
    select_resp.permission = parsed.captured("type");
  } else {
    qWarning() << "IMAP Client: Failed to parse permission from SELECT "
                  "response: Unexpected format."
               << resp.tagged()[0].second;
  }

  for (const auto& [type, data] : resp.untagged_trailing()) {
    if (type == IMAP::Response::EXISTS) {
      _parse_number(data, "EXISTS", select_resp.exists);
    } else if (type == IMAP::Response::RECENT) {
      _parse_number(data, "RECENT", select_resp.recent);
    }
  }

  for (const auto& [type, data] : resp.untagged()) {
    if (auto parsed = ATTRS_REG.match(data);
        type == IMAP::Response::FLAGS && parsed.hasMatch()) {
      select_resp.flags = _parse_attrs(parsed.captured("attrs"));
      continue;
    }

    auto parsed = SELECT_BRACKET_REG.match(data);
    if (type != IMAP::Response::OK || !parsed.hasMatch() ||
        !parsed.hasCaptured("data")) {
      continue;
    }

    auto code = parsed.captured("type");
    if (code == "UNSEEN") {
      _parse_number(parsed.captured("data"), "UNSEEN", select_resp.unseen);
    } else if (code == "UIDVALIDITY") {
      _parse_number(
        parsed.captured("data"), "UIDVALIDITY", select_resp.uidvalidity);
    } else if (code == "PERMANENTFLAGS") {
      select_resp.permanent_flags = _parse_attrs(parsed.captured("data"));
    }
  }

  success_handler(QVariant::fromValue(std::move(select_resp)));
}

}
