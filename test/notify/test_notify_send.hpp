#pragma once

#include <qobject.h>
#include <qtest.h>

class NotifySendTest : public QObject
{
  Q_OBJECT

private slots: // NOLINT
  void test_arguments_mail();
  void test_arguments_summary();
  void test_arguments_warning();
  void test_handle_snooze();
  void test_handle_unknown();
  void test_missing_program();
};
