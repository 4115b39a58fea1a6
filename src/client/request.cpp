#include <array>
#include <qdatetime.h>
#include <qstring.h>
#include <qstringlist.h>

#include "mailbell/client/request.hpp"
#include "mailbell/common.hpp"

namespace mailbell::client::request {

namespace {

// IMAP dates are locale independent.
constexpr std::array<const char*, 12> MONTHS{
  "Jan", "Feb", "Mar", "Apr", "May", "Jun",
  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

}

QString
Search::keys(Criteria criteria, const QDate& since)
{
  auto keys = QString{ common::enum_name(criteria) };

  if (since.isValid()) {
    keys.append(QString{ " SINCE %1" }.arg(date(since)));
  }

  return keys;
}

QString
Search::date(const QDate& date)
{
  return QString{ "%1-%2-%3" }
    .arg(date.day(), 2, 10, QChar{ '0' })
    .arg(QString::fromLatin1(MONTHS.at(date.month() - 1)))
    .arg(date.year());
}

QString
sequence_set(const QList<std::size_t>& ids)
{
  auto parts = QStringList{};
  parts.reserve(ids.size());

  for (auto id : ids) {
    parts.push_back(QString::number(id));
  }

  return parts.join(',');
}

}
