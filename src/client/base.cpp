#include <qstring.h>

#include "mailbell/client/base.hpp"

namespace mailbell::client {

bool
Base::wait_for_connected(int msecs)
{
  if (is_connected()) {
    return true;
  }

  if (!_wait_for_event(msecs, &Base::connected)) {
    _set_error(E_TIMEOUT, "Timed out waiting for connection");
  }

  return is_connected();
}

bool
Base::wait_for_disconnected(int msecs)
{
  if (is_disconnected()) {
    return true;
  }

  if (!_wait_for_event(msecs, &Base::disconnected)) {
    _set_error(E_TIMEOUT, "Timed out waiting for disconnection");
  }

  return is_disconnected();
}

bool
Base::wait_for_ready_read(int msecs)
{
  if (_error != E_NOERR) {
    return false;
  }

  if (!_wait_for_event(msecs, &Base::ready_read)) {
    _set_error(E_TIMEOUT, "Timed out waiting for response");
  }

  return _error == E_NOERR;
}

}
