#pragma once

#include <qhash.h>
#include <qobject.h>
#include <qstring.h>
#include <qtemporarydir.h>
#include <qtest.h>
#include <mailbell/credentials.hpp>

class MemoryCredentialStore : public mailbell::CredentialStore
{
public:
  QHash<QString, QString> passwords;
  mutable int reads{ 0 };

protected:
  [[nodiscard]] QString _read(const QString& account) const override
  {
    ++reads;
    return passwords.value(account);
  }

  bool _write(const QString& account, const QString& password) override
  {
    passwords.insert(account, password);
    return true;
  }
};

class SettingsTest : public QObject
{
  Q_OBJECT

private:
  QTemporaryDir _dir;

private slots: // NOLINT
  void initTestCase();

  void test_missing_file_defaults();
  void test_corrupted_file_defaults();
  void test_save_and_load();
  void test_partial_and_mistyped_keys();
  void test_save_async();
  void test_out_of_range_values_clamped();
  void test_credentials();
  void test_credentials_require_account();
};
