#include <algorithm>
#include <qhash.h>
#include <qset.h>
#include <qstring.h>
#include <qstringlist.h>

#include "mailbell/engine/reconcile.hpp"
#include "mailbell/model/email.hpp"

namespace mailbell::engine {

namespace {

const QString ORPHAN_PREFIX = "\x01orphan:";

}

model::EmailList
dedup(const model::EmailList& records)
{
  auto seen = QSet<QString>{};
  auto result = model::EmailList{};
  result.reserve(records.size());

  for (const auto& record : records) {
    if (record.id.isEmpty() || seen.contains(record.id)) {
      continue;
    }

    seen.insert(record.id);
    result.push_back(record);
  }

  std::stable_sort(result.begin(),
                   result.end(),
                   [](const model::EmailRecord& lhs,
                      const model::EmailRecord& rhs) {
                     return lhs.timestamp > rhs.timestamp;
                   });

  return result;
}

model::ThreadList
group_by_thread(const model::EmailList& emails)
{
  auto index = QHash<QString, qsizetype>{};
  auto groups = model::ThreadList{};

  for (const auto& email : emails) {
    // a record without thread never merges, not even with another orphan.
    auto key = email.thread_id.isEmpty() ? ORPHAN_PREFIX + email.id
                                         : email.thread_id;

    auto found = index.constFind(key);
    if (found == index.cend()) {
      index.insert(key, groups.size());
      groups.push_back({ email, 1, { email.id } });
      continue;
    }

    auto& group = groups[*found];
    ++group.member_count;
    group.member_ids.push_back(email.id);

    if (email.timestamp > group.representative.timestamp) {
      group.representative = email;
    }
  }

  std::stable_sort(
    groups.begin(),
    groups.end(),
    [](const model::ThreadGroup& lhs, const model::ThreadGroup& rhs) {
      return lhs.representative.timestamp > rhs.representative.timestamp;
    });

  return groups;
}

QStringList
find_thread_ids(const model::EmailList& emails, const QString& id)
{
  auto found = std::find_if(
    emails.cbegin(), emails.cend(), [&id](const model::EmailRecord& email) {
      return email.id == id;
    });

  if (found == emails.cend() || found->thread_id.isEmpty()) {
    return { id };
  }

  auto ids = QStringList{};
  for (const auto& email : emails) {
    if (email.thread_id == found->thread_id) {
      ids.push_back(email.id);
    }
  }

  return ids;
}

model::EmailList
remove_ids(const model::EmailList& emails, const QStringList& ids)
{
  auto drop = QSet<QString>{ ids.cbegin(), ids.cend() };

  auto result = model::EmailList{};
  result.reserve(emails.size());

  for (const auto& email : emails) {
    if (!drop.contains(email.id)) {
      result.push_back(email);
    }
  }

  return result;
}

}
