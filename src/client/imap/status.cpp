#include <qstring.h>
#include <qvariant.h>

#include "mailbell/client/imap.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/status.hpp"

namespace mailbell::client::detail {

bool
imap_check_status(const IMAPResponse& resp,
                  IMAP::ErrorType no_error,
                  const IMAP::ErrorCallback& error_handler)
{
  if (resp.tagged().size() != 1) {
    error_handler(IMAP::E_UNEXPECTED, "Unexpected tagged response");
    return false;
  }

  const auto& [type, data] = resp.tagged()[0];

  if (type == IMAP::Response::NO) {
    error_handler(no_error, data);
    return false;
  }

  if (type == IMAP::Response::BAD) {
    error_handler(IMAP::E_BADCOMMAND, data);
    return false;
  }

  if (type != IMAP::Response::OK) {
    error_handler(IMAP::E_UNEXPECTED, data);
    return false;
  }

  return true;
}

void
imap_handle_status(const IMAPResponse& resp,
                   const IMAP::ErrorCallback& error_handler,
                   const IMAP::CommandCallback& success_handler)
{
  if (!imap_check_status(resp, IMAP::E_REFERENCE, error_handler)) {
    return;
  }

  success_handler(
    QVariant::fromValue(response::Done{ resp.tagged()[0].second }));
}

}
