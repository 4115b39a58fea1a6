#pragma once

#include <qlist.h>
#include <qobject.h>
#include <qtest.h>
#include <mailbell/notify/transport.hpp>

using namespace mailbell;

class RecordingTransport : public notify::Transport
{
public:
  QList<notify::Request> shown;

  void show(const notify::Request& request) override
  {
    shown.push_back(request);
  }
};

class SchedulerTest : public QObject
{
  Q_OBJECT

private slots: // NOLINT
  void test_plan_staggers_individual();
  void test_plan_summary();
  void test_plan_single_summary();
  void test_plan_empty();
  void test_summary_body();
  void test_dispatch_order();
};
