#include <qdatetime.h>
#include <qglobal.h>
#include <qtest.h>
#include <qtestcase.h>
#include <mailbell/credentials.hpp>

#include "test_keychain.hpp"

using namespace mailbell;

namespace {

// keeps the user's real entries untouched.
const QString TEST_SERVICE = "mailbell-test";

}

void
KeychainTest::initTestCase()
{
  qunsetenv(CredentialStore::PASSWORD_ENV);
}

void
KeychainTest::test_round_trip() // NOLINT
{
  auto account =
    QString{ "test-%1@example.com" }.arg(QDateTime::currentMSecsSinceEpoch());
  auto credentials = KeychainCredentialStore{ TEST_SERVICE };

  QVERIFY(credentials.password(account).isEmpty());

  QVERIFY(credentials.store(account, "secret"));
  QCOMPARE(credentials.password(account), QString{ "secret" });
  QCOMPARE(KeychainCredentialStore{ TEST_SERVICE }.password(account),
           QString{ "secret" });

  QVERIFY(credentials.store(account, "changed"));
  QCOMPARE(credentials.password(account), QString{ "changed" });

  QVERIFY(KeychainCredentialStore{ "mailbell-other" }.password(account).isEmpty());
}

QTEST_GUILESS_MAIN(KeychainTest)
