#include <qbytearray.h>
#include <qregularexpression.h>
#include <qstring.h>
#include <qstringconverter.h>
#include <qtest.h>
#include <qtestcase.h>
#include <mailbell/client/response.hpp>
#include <mailbell/model/email.hpp>
#include <mailbell/source/header.hpp>
#include <mailbell/source/imap.hpp>

#include "test_header.hpp"

using namespace mailbell;
using namespace mailbell::source;

void
HeaderTest::test_parse_fields() // NOLINT
{
  auto fields = header::parse_fields("Subject: Quarterly\r\n"
                                     " report\r\n"
                                     "FROM: Alice <alice@example.com>\r\n"
                                     "subject: Second subject\r\n"
                                     "garbage line\r\n"
                                     "\r\n");

  QCOMPARE(fields.size(), 2);
  QCOMPARE(fields.value("subject"), QByteArray{ "Quarterly report" });
  QCOMPARE(fields.value("from"), QByteArray{ "Alice <alice@example.com>" });
}

void
HeaderTest::test_decode_data() // NOLINT
{
  QTest::addColumn<QByteArray>("raw");
  QTest::addColumn<QString>("expected");

  QTest::newRow("plain") << QByteArray{ "Hello world" } << "Hello world";
  QTest::newRow("base64") << QByteArray{ "=?UTF-8?B?SMOpbGxv?=" }
                          << QString::fromUtf8("H\xc3\xa9llo");
  QTest::newRow("quoted printable")
    << QByteArray{ "=?ISO-8859-1?Q?Caf=E9_au_lait?=" }
    << QString::fromUtf8("Caf\xc3\xa9 au lait");
  QTest::newRow("lower case encoding") << QByteArray{ "=?utf-8?q?a=3Db?=" }
                                       << "a=b";
  QTest::newRow("mixed") << QByteArray{ "Re: =?UTF-8?B?SMOpbGxv?= there" }
                         << QString::fromUtf8("Re: H\xc3\xa9llo there");
  QTest::newRow("adjacent words")
    << QByteArray{ "=?UTF-8?Q?Hel?= =?UTF-8?Q?lo?=" } << "Hello";
  QTest::newRow("unknown charset")
    << QByteArray{ "=?X-UNKNOWN?Q?plain?=" } << "plain";
  QTest::newRow("empty") << QByteArray{} << "";
}

void
HeaderTest::test_decode() // NOLINT
{
  QFETCH(QByteArray, raw);
  QFETCH(QString, expected);

  QCOMPARE(header::decode(raw), expected);
}

void
HeaderTest::test_decode_malformed_base64() // NOLINT
{
  QCOMPARE(header::decode("=?UTF-8?B?###?="), header::UNSUPPORTED_ENCODING);
}

void
HeaderTest::test_decode_charset_fallback() // NOLINT
{
  // invalid UTF-8 falls back to Latin-1.
  QCOMPARE(header::decode_charset("caf\xe9", "UTF-8"),
           QString::fromUtf8("caf\xc3\xa9"));
  QCOMPARE(header::decode_charset("caf\xe9"), QString::fromUtf8("caf\xc3\xa9"));

  // unknown charset falls back to UTF-8.
  QTest::ignoreMessage(QtWarningMsg,
                       QRegularExpression{ "X-UNKNOWN.*unavailable" });
  QCOMPARE(header::decode_charset("caf\xc3\xa9", "X-UNKNOWN"),
           QString::fromUtf8("caf\xc3\xa9"));
}

void
HeaderTest::test_decode_icu_charset() // NOLINT
{
  if (!QStringDecoder{ "KOI8-R" }.isValid()) {
    QSKIP("Qt built without ICU, KOI8-R is unavailable");
  }

  // a Cyrillic greeting in KOI8-R.
  QCOMPARE(header::decode("=?KOI8-R?B?8NLJ18XU?="),
           QString::fromUtf8("\xd0\x9f\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82"));
}

void
HeaderTest::test_parse_date_data() // NOLINT
{
  QTest::addColumn<QString>("value");
  QTest::addColumn<qint64>("expected");

  QTest::newRow("offset") << "Tue, 14 Nov 2023 22:13:20 +0000"
                          << qint64{ 1700000000 };
  QTest::newRow("positive offset") << "Wed, 15 Nov 2023 00:13:20 +0200"
                                   << qint64{ 1700000000 };
  QTest::newRow("comment") << "Tue, 14 Nov 2023 22:13:20 +0000 (UTC)"
                           << qint64{ 1700000000 };
  QTest::newRow("gmt") << "Tue, 14 Nov 2023 22:13:20 GMT"
                       << qint64{ 1700000000 };
  QTest::newRow("no weekday") << "14 Nov 2023 22:13:20 +0000"
                              << qint64{ 1700000000 };
  QTest::newRow("garbage") << "yesterday" << qint64{ 0 };
  QTest::newRow("empty") << "" << qint64{ 0 };
}

void
HeaderTest::test_parse_date() // NOLINT
{
  QFETCH(QString, value);
  QFETCH(qint64, expected);

  QCOMPARE(header::parse_date(value), expected);
}

void
HeaderTest::test_display_name_data() // NOLINT
{
  QTest::addColumn<QString>("from");
  QTest::addColumn<QString>("expected");

  QTest::newRow("name") << "Alice <alice@example.com>" << "Alice";
  QTest::newRow("quoted") << "\"Bob Smith\" <bob@example.com>" << "Bob Smith";
  QTest::newRow("address only") << "carol@example.com" << "carol@example.com";
  QTest::newRow("angle only") << "<dave@example.com>" << "<dave@example.com>";
  QTest::newRow("empty") << "" << "";
}

void
HeaderTest::test_display_name() // NOLINT
{
  QFETCH(QString, from);
  QFETCH(QString, expected);

  QCOMPARE(header::display_name(from), expected);
}

void
HeaderTest::test_thread_hex() // NOLINT
{
  QCOMPARE(IMAP::thread_hex("1781234567890123456"),
           QString::number(Q_UINT64_C(1781234567890123456), 16));
  QCOMPARE(IMAP::thread_hex("255"), QString{ "ff" });
  QVERIFY(IMAP::thread_hex("").isEmpty());
  QVERIFY(IMAP::thread_hex("0").isEmpty());
  QVERIFY(IMAP::thread_hex("abc").isEmpty());
}

void
HeaderTest::test_to_record() // NOLINT
{
  auto item = client::response::FetchItem{};
  item.uid = 4242;
  item.thread_id = "255";
  item.header = "From: =?UTF-8?Q?Jos=C3=A9?= <jose@example.com>\r\n"
                "Subject: =?UTF-8?B?SMOpbGxv?=\r\n"
                "Date: Tue, 14 Nov 2023 22:13:20 +0000\r\n";

  auto record = IMAP::to_record(item, "https://mail.google.com");

  QCOMPARE(record.id, QString{ "4242" });
  QCOMPARE(record.thread_id, QString{ "ff" });
  QCOMPARE(record.sender, QString::fromUtf8("Jos\xc3\xa9"));
  QCOMPARE(record.subject, QString::fromUtf8("H\xc3\xa9llo"));
  QCOMPARE(record.timestamp, qint64{ 1700000000 });
  QCOMPARE(record.link, QString{ "https://mail.google.com/mail/u/0/#inbox/ff" });
}

void
HeaderTest::test_to_record_without_header() // NOLINT
{
  auto item = client::response::FetchItem{};
  item.uid = 7;

  auto record = IMAP::to_record(item, "https://mail.google.com");

  QCOMPARE(record.id, QString{ "7" });
  QVERIFY(record.thread_id.isEmpty());
  QCOMPARE(record.subject, model::EmailRecord::NO_SUBJECT);
  QVERIFY(record.sender.isEmpty());
  QCOMPARE(record.timestamp, qint64{ 0 });
  QCOMPARE(record.link, QString{ "https://mail.google.com" });
}

QTEST_GUILESS_MAIN(HeaderTest)
