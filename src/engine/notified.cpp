#include <qset.h>
#include <qstring.h>

#include "mailbell/engine/notified.hpp"
#include "mailbell/model/email.hpp"

namespace mailbell::engine {

NotifiedSet
prune(const NotifiedSet& notified, const model::EmailList& emails)
{
  auto server_ids = NotifiedSet{};
  for (const auto& email : emails) {
    server_ids.insert(email.id);
  }

  return server_ids.intersect(notified);
}

model::EmailList
filter_unnotified(const model::EmailList& emails, const NotifiedSet& notified)
{
  auto fresh = model::EmailList{};

  for (const auto& email : emails) {
    if (!notified.contains(email.id)) {
      fresh.push_back(email);
    }
  }

  return fresh;
}

NotifiedSet
mark_notified(const NotifiedSet& notified, const QStringList& ids)
{
  auto result = notified;
  for (const auto& id : ids) {
    result.insert(id);
  }

  return result;
}

}
