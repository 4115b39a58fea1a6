#include <qsignalspy.h>
#include <qstringlist.h>
#include <qtest.h>
#include <qtestcase.h>
#include <mailbell/common.hpp>
#include <mailbell/engine/badge.hpp>
#include <mailbell/engine/orchestrator.hpp>
#include <mailbell/engine/scheduler.hpp>
#include <mailbell/model/email.hpp>

#include "test_orchestrator.hpp"

namespace {

constexpr qint64 START_SECS = 1700000000;
constexpr int TEST_STAGGER_MSECS = 5;

model::EmailRecord
make(const QString& id, const QString& thread, qint64 timestamp)
{
  auto record = model::EmailRecord{};
  record.id = id;
  record.thread_id = thread;
  record.sender = QString{ "Sender %1" }.arg(id);
  record.subject = QString{ "Subject %1" }.arg(id);
  record.timestamp = timestamp;
  return record;
}

model::EmailList
make_batch(int count)
{
  auto emails = model::EmailList{};
  for (auto i = 0; i < count; ++i) {
    emails.push_back(make(QString::number(i + 1), {}, 1000 - i));
  }
  return emails;
}

// a result of a poll issued right now.
void
deliver(engine::Orchestrator* orchestrator, const model::EmailList& records)
{
  orchestrator->on_polled(records, common::steady_msecs());
}

}

void
OrchestratorTest::init()
{
  _now = START_SECS;
  _transport.shown.clear();

  _orchestrator = new engine::Orchestrator{ &_transport, this };
  _orchestrator->set_clock([this]() { return _now; });
  _orchestrator->set_scheduler(
    engine::Scheduler{ engine::Scheduler::MAX_INDIVIDUAL, TEST_STAGGER_MSECS });
}

void
OrchestratorTest::cleanup()
{
  delete _orchestrator;
  _orchestrator = nullptr;
}

void
OrchestratorTest::test_batch_notifies_once() // NOLINT
{
  auto grouped = QSignalSpy{ _orchestrator, &engine::Orchestrator::grouped_changed };
  auto badge = QSignalSpy{ _orchestrator, &engine::Orchestrator::badge_changed };

  deliver(_orchestrator, make_batch(7));

  QCOMPARE(_orchestrator->all_emails().size(), 7);
  QCOMPARE(_orchestrator->grouped().size(), 7);
  QCOMPARE(_orchestrator->notified().size(), 7);
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::UNREAD);
  QCOMPARE(grouped.count(), 1);
  QCOMPARE(badge.count(), 1);

  QTRY_COMPARE(_transport.shown.size(), 6);
  QCOMPARE(_transport.shown.back().body, QString{ "And 2 more new emails..." });

  // the same batch again is not announced twice.
  deliver(_orchestrator, make_batch(7));
  QTest::qWait(TEST_STAGGER_MSECS * 10);
  QCOMPARE(_transport.shown.size(), 6);
}

void
OrchestratorTest::test_notified_pruned_when_read_elsewhere() // NOLINT
{
  deliver(_orchestrator, make_batch(2));
  QTRY_COMPARE(_transport.shown.size(), 2);

  deliver(_orchestrator, make_batch(1));
  QCOMPARE(_orchestrator->notified(), (engine::NotifiedSet{ "1" }));

  // message 2 was read elsewhere, then marked unread again.
  deliver(_orchestrator, make_batch(2));
  QTRY_COMPARE(_transport.shown.size(), 3);
  QCOMPARE(_transport.shown.back().body, QString{ "Subject 2" });
}

void
OrchestratorTest::test_snooze_suppresses_and_replays() // NOLINT
{
  auto snoozed = QSignalSpy{ _orchestrator, &engine::Orchestrator::snooze_changed };

  _orchestrator->toggle_snooze();
  QCOMPARE(snoozed.count(), 1);
  QCOMPARE(snoozed.takeFirst().at(0).toBool(), true);
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::SNOOZED);

  deliver(_orchestrator, make_batch(3));
  QTest::qWait(TEST_STAGGER_MSECS * 10);
  QVERIFY(_transport.shown.isEmpty());
  QVERIFY(_orchestrator->notified().isEmpty());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::SNOOZED);
  QCOMPARE(_orchestrator->snooze_remaining(), qint64{ 3600 });

  _now += engine::Snooze::DURATION_SECS + 1;
  QVERIFY(!_orchestrator->is_snoozed());

  deliver(_orchestrator, make_batch(3));
  QTRY_COMPARE(_transport.shown.size(), 3);
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::UNREAD);
}

void
OrchestratorTest::test_snooze_from_notification() // NOLINT
{
  auto snoozed = QSignalSpy{ _orchestrator, &engine::Orchestrator::snooze_changed };

  deliver(_orchestrator, make_batch(1));
  QTRY_COMPARE(_transport.shown.size(), 1);
  QVERIFY(_transport.shown[0].on_snooze);

  _transport.shown[0].on_snooze();
  QVERIFY(_orchestrator->is_snoozed());
  QCOMPARE(snoozed.count(), 1);

  // a second press never extends nor cancels.
  _now += 100;
  _transport.shown[0].on_snooze();
  QCOMPARE(snoozed.count(), 1);
  QCOMPARE(_orchestrator->snooze_remaining(), qint64{ 3500 });
}

void
OrchestratorTest::test_remove_thread_is_synchronous() // NOLINT
{
  deliver(_orchestrator,
          { make("a", "t1", 300),
            make("b", "t1", 200),
            make("c", "t1", 100),
            make("d", "t2", 50) });
  QCOMPARE(_orchestrator->grouped().size(), 2);

  auto requested =
    QSignalSpy{ _orchestrator, &engine::Orchestrator::remove_requested };
  auto grouped = QSignalSpy{ _orchestrator, &engine::Orchestrator::grouped_changed };

  _orchestrator->remove_thread("b");

  QCOMPARE(_orchestrator->all_emails().size(), 1);
  QCOMPARE(_orchestrator->all_emails()[0].id, QString{ "d" });
  QCOMPARE(_orchestrator->grouped().size(), 1);
  QCOMPARE(grouped.count(), 1);

  QCOMPARE(requested.count(), 1);
  auto ids = requested.takeFirst().at(0).toStringList();
  ids.sort();
  QCOMPARE(ids, (QStringList{ "a", "b", "c" }));

  _orchestrator->remove({ "d" });
  QVERIFY(_orchestrator->all_emails().isEmpty());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::NONE);

  _orchestrator->remove({});
  QCOMPARE(requested.count(), 1);
}

void
OrchestratorTest::test_remove_failed_sets_error() // NOLINT
{
  deliver(_orchestrator, make_batch(1));
  QTRY_COMPARE(_transport.shown.size(), 1);

  _orchestrator->on_remove_failed("connection lost");

  QVERIFY(_orchestrator->is_error());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::ERROR);
  QCOMPARE(_transport.shown.size(), 2);
  QCOMPARE(_transport.shown.back().title, engine::Orchestrator::ERROR_TITLE);
  QVERIFY(_transport.shown.back().level == notify::Request::Level::WARNING);
  QVERIFY(_transport.shown.back().body.contains("connection lost"));

  // a successful poll clears the error.
  deliver(_orchestrator, make_batch(1));
  QVERIFY(!_orchestrator->is_error());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::UNREAD);
}

void
OrchestratorTest::test_mark_read_rechecks() // NOLINT
{
  _orchestrator->set_recheck_delay(20);
  deliver(_orchestrator, make_batch(2));

  auto checks = QSignalSpy{ _orchestrator, &engine::Orchestrator::check_requested };

  _orchestrator->mark_read("1");
  QCOMPARE(_orchestrator->all_emails().size(), 1);
  QCOMPARE(_orchestrator->all_emails()[0].id, QString{ "2" });
  QCOMPARE(checks.count(), 0);

  QTRY_COMPARE(checks.count(), 1);

  _orchestrator->check_now();
  QCOMPARE(checks.count(), 2);
}

void
OrchestratorTest::test_poll_failed_keeps_state() // NOLINT
{
  deliver(_orchestrator, make_batch(3));
  QTRY_COMPARE(_transport.shown.size(), 3);

  _orchestrator->on_poll_failed("Login failed");

  QVERIFY(_orchestrator->is_error());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::ERROR);
  QCOMPARE(_orchestrator->all_emails().size(), 3);
  QCOMPARE(_orchestrator->notified().size(), 3);
  QCOMPARE(_transport.shown.back().body, QString{ "Login failed" });

  // error outranks snooze.
  _orchestrator->toggle_snooze();
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::ERROR);
}

void
OrchestratorTest::test_stale_poll_keeps_removal() // NOLINT
{
  auto started = common::steady_msecs() - 1000;
  deliver(_orchestrator, { make("a", "t1", 300), make("b", "t2", 200) });

  _orchestrator->remove({ "a" });
  _orchestrator->mark_read("b");
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::NONE);
  QCOMPARE(_orchestrator->pending_removals().size(), 2);

  // fetched before the removal, still lists both.
  auto grouped = QSignalSpy{ _orchestrator, &engine::Orchestrator::grouped_changed };
  _orchestrator->on_polled({ make("a", "t1", 300), make("b", "t2", 200) },
                           started);

  QVERIFY(_orchestrator->all_emails().isEmpty());
  QVERIFY(_orchestrator->grouped().isEmpty());
  QCOMPARE(grouped.count(), 1);
  QVERIFY(grouped.at(0).at(0).value<model::ThreadList>().isEmpty());
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::NONE);
  QCOMPARE(_orchestrator->pending_removals().size(), 2);
}

void
OrchestratorTest::test_later_poll_clears_removal() // NOLINT
{
  deliver(_orchestrator, make_batch(2));
  QTRY_COMPARE(_transport.shown.size(), 2);

  _orchestrator->remove({ "1" });

  // the delete did not happen on the server, a later poll brings it back.
  _orchestrator->on_polled(make_batch(2), common::steady_msecs() + 1000);

  QVERIFY(_orchestrator->pending_removals().isEmpty());
  QCOMPARE(_orchestrator->all_emails().size(), 2);
  QCOMPARE(_orchestrator->badge(), engine::BadgeState::UNREAD);
}

QTEST_GUILESS_MAIN(OrchestratorTest)
