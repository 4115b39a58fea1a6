#include <qstring.h>
#include <qvariant.h>

#include "mailbell/client/imap.hpp"
#include "mailbell/client/response.hpp"
#include "mailbell/private/client/imap/login.hpp"
#include "mailbell/private/client/imap/response.hpp"
#include "mailbell/private/client/imap/status.hpp"

namespace mailbell::client::detail {

void
imap_handle_login(const IMAPResponse& resp,
                  const IMAP::ErrorCallback& error_handler,
                  const IMAP::CommandCallback& success_handler)
{
  if (!imap_check_status(resp, IMAP::E_LOGIN, error_handler)) {
    return;
  }

  success_handler(QVariant::fromValue(response::Login{}));
}

}
