#include <cstddef>
#include <qdebug.h>
#include <qlogging.h>
#include <qstring.h>
#include <qvariant.h>
#include <utility>

#include "mailbell/client/imap.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/search.hpp"
#include "mailbell/private/client/imap/status.hpp"

namespace mailbell::client::detail {

void
imap_handle_search(const IMAPResponse& resp,
                   const IMAP::ErrorCallback& error_handler,
                   const IMAP::CommandCallback& success_handler)
{
  if (!imap_check_status(resp, IMAP::E_REFERENCE, error_handler)) {
    return;
  }

  auto search_resp = response::Search{};

  for (const auto& [type, data] : resp.untagged()) {
    if (type != IMAP::Response::SEARCH) {
      continue;
    }

    for (const auto& item : data.split(' ', Qt::SkipEmptyParts)) {
      bool ok = false;
      auto index = item.toULongLong(&ok);
      if (!ok) {
        qWarning() << "IMAP Client: Failed to parse SEARCH response: Not a "
                      "number."
                   << item;
        continue;
      }
      search_resp.push_back(index);
    }
  }

  success_handler(QVariant::fromValue(std::move(search_resp)));
}

}
