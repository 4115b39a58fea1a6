#include <algorithm>
#include <qtypes.h>

#include "mailbell/engine/snooze.hpp"

namespace mailbell::engine {

bool
Snooze::toggle(qint64 now)
{
  if (is_active(now)) {
    _until.reset();
    return false;
  }

  _until = now + DURATION_SECS;
  return true;
}

void
Snooze::snooze_from_external_trigger(qint64 now)
{
  if (is_active(now)) {
    return;
  }

  _until = now + DURATION_SECS;
}

bool
Snooze::is_active(qint64 now)
{
  if (!_until) {
    return false;
  }

  if (now >= *_until) {
    _until.reset();
    return false;
  }

  return true;
}

qint64
Snooze::remaining(qint64 now)
{
  if (!is_active(now)) {
    return 0;
  }

  return std::max<qint64>(0, *_until - now);
}

}
