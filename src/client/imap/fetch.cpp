#include <qdebug.h>
#include <qlogging.h>
#include <qstring.h>
#include <qstringlist.h>
#include <qvariant.h>
#include <utility>

#include "mailbell/client/imap.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/private/client/imap/fetch.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/status.hpp"

namespace mailbell::client::detail {

void
imap_handle_fetch(const IMAPResponse& resp,
                  const IMAP::ErrorCallback& error_handler,
                  const IMAP::CommandCallback& success_handler)
{
  if (!imap_check_status(resp, IMAP::E_REFERENCE, error_handler)) {
    return;
  }

  auto fetch_resp = response::Fetch{};
  const auto& raw = resp.raw();

  for (auto it = raw.cbegin(); it != raw.cend(); ++it) {
    auto item = response::FetchItem{};
    item.seq = it.key();

    const auto& fields = it.value();
    for (auto field = fields.cbegin(); field != fields.cend(); ++field) {
      const auto& name = field.key();

      if (name == "UID") {
        bool ok = false;
        item.uid = field.value().toULongLong(&ok);
        if (!ok) {
          qWarning() << "IMAP Client: Failed to parse FETCH UID: Not a "
                        "number."
                     << field.value();
        }
      } else if (name == "X-GM-THRID") {
        item.thread_id = QString::fromLatin1(field.value());
      } else if (name == "FLAGS") {
        auto flags =
          QString::fromUtf8(field.value()).split(' ', Qt::SkipEmptyParts);
        for (auto& flag : flags) {
          if (flag.startsWith('\\')) {
            flag.remove(0, 1);
          }
        }
        item.flags = std::move(flags);
      } else if (name.startsWith("BODY[") || name == "RFC822.HEADER") {
        item.header = field.value();
      }
    }

    fetch_resp.push_back(std::move(item));
  }

  success_handler(QVariant::fromValue(std::move(fetch_resp)));
}

}
