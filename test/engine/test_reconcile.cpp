#include <qset.h>
#include <qstringlist.h>
#include <qtest.h>
#include <qtestcase.h>
#include <mailbell/engine/notified.hpp>
#include <mailbell/engine/reconcile.hpp>
#include <mailbell/model/email.hpp>

#include "test_reconcile.hpp"

using namespace mailbell;

namespace {

model::EmailRecord
make(const QString& id, const QString& thread, qint64 timestamp)
{
  auto record = model::EmailRecord{};
  record.id = id;
  record.thread_id = thread;
  record.sender = "Alice";
  record.subject = QString{ "Subject %1" }.arg(id);
  record.timestamp = timestamp;
  return record;
}

}

void
ReconcileTest::test_dedup_first_wins() // NOLINT
{
  auto first = make("1", "t1", 100);
  auto second = make("1", "t2", 300);
  second.subject = "Later copy";

  auto emails = engine::dedup({ first, make("2", "t1", 200), second });

  QCOMPARE(emails.size(), 2);
  QCOMPARE(emails[0].id, QString{ "2" });
  QCOMPARE(emails[1], first);
}

void
ReconcileTest::test_dedup_sorts_newest_first() // NOLINT
{
  auto emails = engine::dedup(
    { make("1", "", 100), make("2", "", 300), make("3", "", 0), make("4", "", 300) });

  QCOMPARE(emails.size(), 4);
  QCOMPARE(emails[0].id, QString{ "2" });
  QCOMPARE(emails[1].id, QString{ "4" });
  QCOMPARE(emails[2].id, QString{ "1" });
  QCOMPARE(emails[3].id, QString{ "3" });
}

void
ReconcileTest::test_dedup_drops_empty_id() // NOLINT
{
  auto emails = engine::dedup({ make("", "t1", 100), make("1", "t1", 50) });

  QCOMPARE(emails.size(), 1);
  QCOMPARE(emails[0].id, QString{ "1" });
  QVERIFY(engine::dedup({}).isEmpty());
}

void
ReconcileTest::test_dedup_idempotent() // NOLINT
{
  auto records = model::EmailList{ make("1", "A", 100), make("2", "", 300),
                                   make("1", "B", 500), make("3", "A", 100),
                                   make("", "A", 900),  make("4", "", 0) };

  auto once = engine::dedup(records);
  QCOMPARE(once.size(), 4);
  QCOMPARE(engine::dedup(once), once);
}

void
ReconcileTest::test_dedup_zero_timestamps_keep_order() // NOLINT
{
  auto emails = engine::dedup({ make("c", "", 0),
                                make("a", "", 0),
                                make("c", "", 0),
                                make("b", "", 0) });

  QCOMPARE(emails.size(), 3);
  QCOMPARE(emails[0].id, QString{ "c" });
  QCOMPARE(emails[1].id, QString{ "a" });
  QCOMPARE(emails[2].id, QString{ "b" });
}

void
ReconcileTest::test_group_by_thread() // NOLINT
{
  auto emails = engine::dedup({ make("1", "A", 100),
                                make("2", "A", 200),
                                make("3", "B", 150) });
  auto groups = engine::group_by_thread(emails);

  QCOMPARE(groups.size(), 2);

  QCOMPARE(groups[0].representative.id, QString{ "2" });
  QCOMPARE(groups[0].member_count, 2);
  QCOMPARE(groups[0].member_ids, (QStringList{ "2", "1" }));

  QCOMPARE(groups[1].representative.id, QString{ "3" });
  QCOMPARE(groups[1].member_count, 1);
}

void
ReconcileTest::test_group_orphans_never_merge() // NOLINT
{
  auto groups = engine::group_by_thread(
    engine::dedup({ make("1", "", 100), make("2", "", 200) }));

  QCOMPARE(groups.size(), 2);
  QCOMPARE(groups[0].member_count, 1);
  QCOMPARE(groups[1].member_count, 1);
}

void
ReconcileTest::test_group_empty() // NOLINT
{
  QVERIFY(engine::group_by_thread({}).isEmpty());
}

void
ReconcileTest::test_group_partitions_mixed_input() // NOLINT
{
  auto emails = engine::dedup({ make("1", "A", 100),
                                make("2", "", 200),
                                make("3", "B", 200),
                                make("1", "B", 900),
                                make("4", "A", 200),
                                make("5", "", 200),
                                make("6", "B", 50),
                                make("7", "", 0) });
  QCOMPARE(emails.size(), 7);

  auto groups = engine::group_by_thread(emails);
  QCOMPARE(groups.size(), 5);

  qsizetype total = 0;
  auto seen = QSet<QString>{};
  for (const auto& group : groups) {
    total += group.member_count;
    QCOMPARE(group.member_ids.size(), group.member_count);
    for (const auto& id : group.member_ids) {
      QVERIFY2(!seen.contains(id), qPrintable(id));
      seen.insert(id);
    }
  }

  QCOMPARE(total, emails.size());
  QCOMPARE(seen.size(), emails.size());
  for (const auto& email : emails) {
    QVERIFY(seen.contains(email.id));
  }

  // newest representative first, orphans stay alone.
  for (auto i = 1; i < groups.size(); ++i) {
    QVERIFY(groups[i - 1].representative.timestamp >=
            groups[i].representative.timestamp);
  }
  QCOMPARE(groups.back().representative.id, QString{ "7" });
  QCOMPARE(groups.back().member_count, 1);
}

void
ReconcileTest::test_group_representative_tie() // NOLINT
{
  auto groups = engine::group_by_thread({ make("x", "T", 100),
                                          make("y", "T", 200),
                                          make("z", "T", 200) });

  QCOMPARE(groups.size(), 1);
  QCOMPARE(groups[0].representative.id, QString{ "y" });
  QCOMPARE(groups[0].member_ids, (QStringList{ "x", "y", "z" }));
}

void
ReconcileTest::test_find_thread_ids() // NOLINT
{
  auto emails = model::EmailList{ make("1", "A", 300),
                                  make("2", "B", 200),
                                  make("3", "A", 100),
                                  make("4", "", 50) };

  QCOMPARE(engine::find_thread_ids(emails, "3"), (QStringList{ "1", "3" }));
  QCOMPARE(engine::find_thread_ids(emails, "2"), (QStringList{ "2" }));
  QCOMPARE(engine::find_thread_ids(emails, "4"), (QStringList{ "4" }));
  QCOMPARE(engine::find_thread_ids(emails, "9"), (QStringList{ "9" }));
}

void
ReconcileTest::test_remove_ids() // NOLINT
{
  auto emails = model::EmailList{ make("1", "A", 300),
                                  make("2", "B", 200),
                                  make("3", "A", 100) };

  auto left = engine::remove_ids(emails, { "1", "3", "9" });

  QCOMPARE(left.size(), 1);
  QCOMPARE(left[0].id, QString{ "2" });
}

void
ReconcileTest::test_notified_prune() // NOLINT
{
  auto notified = engine::NotifiedSet{ "1", "2", "3" };
  auto pruned =
    engine::prune(notified, { make("2", "", 0), make("4", "", 0) });

  QCOMPARE(pruned, (engine::NotifiedSet{ "2" }));
  QVERIFY(engine::prune(notified, {}).isEmpty());
}

void
ReconcileTest::test_notified_filter_and_mark() // NOLINT
{
  auto emails = model::EmailList{ make("1", "", 300),
                                  make("2", "", 200),
                                  make("3", "", 100) };

  auto fresh = engine::filter_unnotified(emails, { "2" });
  QCOMPARE(fresh.size(), 2);
  QCOMPARE(fresh[0].id, QString{ "1" });
  QCOMPARE(fresh[1].id, QString{ "3" });

  auto notified = engine::mark_notified({ "2" }, { "1", "3" });
  QCOMPARE(notified, (engine::NotifiedSet{ "1", "2", "3" }));
  QVERIFY(engine::filter_unnotified(emails, notified).isEmpty());
}

QTEST_GUILESS_MAIN(ReconcileTest)
