#include <qbytearray.h>
#include <qdatetime.h>
#include <qtest.h>
#include <qtestcase.h>
#include <qvariant.h>
#include <mailbell/client/base.hpp>
#include <mailbell/client/imap.hpp>
#include <mailbell/client/request.hpp>
#include <mailbell/client/response.hpp>
#include <mailbell/private/client/imap/fetch.hpp>
#include <mailbell/private/client/imap/login.hpp>
#include <mailbell/private/client/imap/response.hpp>
#include <mailbell/private/client/imap/search.hpp>
#include <mailbell/private/client/imap/select.hpp>
#include <mailbell/private/client/imap/status.hpp>
#include <mailbell/tag.hpp>

#include "test_imap_response.hpp"

using namespace mailbell;
using namespace mailbell::client;

namespace {

struct Outcome
{
  QVariant data;
  IMAP::ErrorType error{ IMAP::E_NOERR };
  QString estr;
};

template<typename Handler>
Outcome
run(Handler handler, const detail::IMAPResponse& resp)
{
  auto outcome = Outcome{};
  handler(
    resp,
    [&outcome](IMAP::ErrorType type, const QString& estr) {
      outcome.error = type;
      outcome.estr = estr;
    },
    [&outcome](const QVariant& data) { outcome.data = data; });
  return outcome;
}

}

void
IMAPResponseTest::test_greeting() // NOLINT
{
  auto resp = detail::IMAPResponse{ IMAP::CONNECT_TAG };

  QVERIFY(!resp.digest("* OK Gimap ready"));
  QVERIFY(resp.digest(" for requests\r\n"));
  QVERIFY(!resp.error());

  QCOMPARE(resp.untagged().size(), 1);
  QCOMPARE(resp.untagged()[0].first, IMAP::Response::OK);
  QCOMPARE(resp.untagged()[0].second, QString{ "Gimap ready for requests" });
}

void
IMAPResponseTest::test_tagged_status() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0001" };

  QVERIFY(!resp.digest("* CAPABILITY IMAP4rev1 UNSELECT\r\n"));
  QVERIFY(resp.digest("MB0001 OK alice@example.com authenticated (Success)\r\n"));

  QCOMPARE(resp.tagged().size(), 1);
  QCOMPARE(resp.tagged()[0].first, IMAP::Response::OK);
  QCOMPARE(resp.untagged()[0].first, IMAP::Response::CAPABILITY);
}

void
IMAPResponseTest::test_unknown_line() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0001" };

  QVERIFY(!resp.digest("MB0002 OK wrong tag\r\n"));
  QVERIFY(resp.error());

  // no more input is accepted after an error.
  QVERIFY(!resp.digest("MB0001 OK done\r\n"));

  auto unknown = detail::IMAPResponse{ "MB0001" };
  QVERIFY(!unknown.digest("* XLIST (\\HasNoChildren) \"/\" \"INBOX\"\r\n"));
  QCOMPARE(unknown.untagged()[0].first, IMAP::Response::UNKNOWN);
}

void
IMAPResponseTest::test_select() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0002" };
  QVERIFY(resp.digest(
    "* FLAGS (\\Answered \\Flagged \\Draft \\Deleted \\Seen)\r\n"
    "* OK [PERMANENTFLAGS (\\Answered \\Deleted \\Seen \\*)] Flags "
    "permitted.\r\n"
    "* OK [UIDVALIDITY 3] UIDs valid.\r\n"
    "* 42 EXISTS\r\n"
    "* 2 RECENT\r\n"
    "* OK [UNSEEN 17] First unseen.\r\n"
    "MB0002 OK [READ-WRITE] INBOX selected. (Success)\r\n"));

  auto outcome = run(detail::imap_handle_select, resp);
  QCOMPARE(outcome.error, IMAP::E_NOERR);
  QVERIFY(outcome.data.canConvert<response::Select>());

  auto select = outcome.data.value<response::Select>();
  QCOMPARE(select.exists, std::size_t{ 42 });
  QCOMPARE(select.recent, std::size_t{ 2 });
  QCOMPARE(select.unseen, std::size_t{ 17 });
  QCOMPARE(select.uidvalidity, std::size_t{ 3 });
  QCOMPARE(select.permission, QString{ "READ-WRITE" });
  QCOMPARE(select.flags,
           (QStringList{ "Answered", "Flagged", "Draft", "Deleted", "Seen" }));
  QCOMPARE(select.permanent_flags,
           (QStringList{ "Answered", "Deleted", "Seen", "*" }));
}

void
IMAPResponseTest::test_search() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0003" };
  QVERIFY(resp.digest("* SEARCH 101 205 309\r\nMB0003 OK SEARCH completed\r\n"));

  auto outcome = run(detail::imap_handle_search, resp);
  QCOMPARE(outcome.error, IMAP::E_NOERR);
  QCOMPARE(outcome.data.value<response::Search>(),
           (response::Search{ 101, 205, 309 }));
}

void
IMAPResponseTest::test_search_empty() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0003" };
  QVERIFY(resp.digest("* SEARCH\r\nMB0003 OK SEARCH completed\r\n"));

  auto outcome = run(detail::imap_handle_search, resp);
  QCOMPARE(outcome.error, IMAP::E_NOERR);
  QVERIFY(outcome.data.canConvert<response::Search>());
  QVERIFY(outcome.data.value<response::Search>().isEmpty());
}

void
IMAPResponseTest::test_fetch_chunked() // NOLINT
{
  auto header = QByteArray{ "From: Alice <alice@example.com>\r\n"
                            "Subject: Hello\r\n"
                            "\r\n" };

  auto data = QByteArray{};
  data.append("* 1 FETCH (X-GM-THRID 1781234567890123456 UID 101 FLAGS () "
              "BODY[HEADER.FIELDS (FROM SUBJECT DATE)] {");
  data.append(QByteArray::number(header.size()));
  data.append("}\r\n");
  data.append(header);
  data.append(")\r\n");
  data.append("* 2 FETCH (UID 205 X-GM-THRID 1781234567890123457 FLAGS "
              "(\\Flagged) BODY[HEADER.FIELDS (FROM SUBJECT DATE)] NIL)\r\n");
  data.append("* 7 FETCH (FLAGS (\\Seen))\r\n");
  data.append("MB0004 OK Success\r\n");

  // feed in small pieces, literals and lines split across reads.
  auto resp = detail::IMAPResponse{ "MB0004" };
  auto done = false;
  for (qsizetype pos = 0; pos < data.size(); pos += 7) {
    QVERIFY(!done);
    done = resp.digest(data.mid(pos, 7));
    QVERIFY(!resp.error());
  }
  QVERIFY(done);

  auto outcome = run(detail::imap_handle_fetch, resp);
  QCOMPARE(outcome.error, IMAP::E_NOERR);

  auto items = outcome.data.value<response::Fetch>();
  QCOMPARE(items.size(), 3);

  QCOMPARE(items[0].seq, std::size_t{ 1 });
  QCOMPARE(items[0].uid, std::size_t{ 101 });
  QCOMPARE(items[0].thread_id, QString{ "1781234567890123456" });
  QVERIFY(items[0].flags.isEmpty());
  QCOMPARE(items[0].header, header);

  QCOMPARE(items[1].uid, std::size_t{ 205 });
  QCOMPARE(items[1].flags, QStringList{ "Flagged" });
  QVERIFY(items[1].header.isEmpty());

  // unsolicited flag update without uid.
  QCOMPARE(items[2].seq, std::size_t{ 7 });
  QCOMPARE(items[2].uid, std::size_t{ 0 });
  QCOMPARE(items[2].flags, QStringList{ "Seen" });
}

void
IMAPResponseTest::test_fetch_nil_header() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0005" };
  QVERIFY(resp.digest("* 3 FETCH (UID 9 RFC822.HEADER {0}\r\n)\r\n"
                      "MB0005 OK Success\r\n"));

  auto items = run(detail::imap_handle_fetch, resp).data.value<response::Fetch>();
  QCOMPARE(items.size(), 1);
  QCOMPARE(items[0].uid, std::size_t{ 9 });
  QVERIFY(items[0].header.isEmpty());
}

void
IMAPResponseTest::test_login_rejected() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0001" };
  QVERIFY(resp.digest(
    "MB0001 NO [AUTHENTICATIONFAILED] Invalid credentials (Failure)\r\n"));

  auto outcome = run(detail::imap_handle_login, resp);
  QCOMPARE(outcome.error, IMAP::E_LOGIN);
  QVERIFY(outcome.estr.contains("Invalid credentials"));
  QVERIFY(!outcome.data.isValid());
}

void
IMAPResponseTest::test_bad_command() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0006" };
  QVERIFY(resp.digest("MB0006 BAD Could not parse command\r\n"));

  auto outcome = run(detail::imap_handle_search, resp);
  QCOMPARE(outcome.error, IMAP::E_BADCOMMAND);

  auto no = detail::IMAPResponse{ "MB0007" };
  QVERIFY(no.digest("MB0007 NO [NONEXISTENT] Unknown Mailbox\r\n"));
  QCOMPARE(run(detail::imap_handle_select, no).error, IMAP::E_REFERENCE);
}

void
IMAPResponseTest::test_status_done() // NOLINT
{
  auto resp = detail::IMAPResponse{ "MB0008" };
  QVERIFY(resp.digest("* 3 EXPUNGE\r\n* 3 EXPUNGE\r\nMB0008 OK Success\r\n"));

  auto outcome = run(detail::imap_handle_status, resp);
  QCOMPARE(outcome.error, IMAP::E_NOERR);
  QCOMPARE(outcome.data.value<response::Done>().message, QString{ "Success" });
  QCOMPARE(resp.untagged_trailing().size(), 2);
}

void
IMAPResponseTest::test_request_builders() // NOLINT
{
  QCOMPARE(request::Search::keys(request::Search::UNSEEN), QString{ "UNSEEN" });
  QCOMPARE(request::Search::keys(request::Search::UNSEEN, QDate{ 2026, 3, 7 }),
           QString{ "UNSEEN SINCE 07-Mar-2026" });
  QCOMPARE(request::Search::date(QDate{ 2026, 12, 25 }),
           QString{ "25-Dec-2026" });

  QCOMPARE(request::sequence_set({ 3, 15, 16 }), QString{ "3,15,16" });
  QCOMPARE(request::sequence_set({}), QString{});

  QCOMPARE(IMAP::quote("[Gmail]/Trash"), QString{ "\"[Gmail]/Trash\"" });
  QCOMPARE(IMAP::quote(R"(pa"ss\word)"), QString{ R"("pa\"ss\\word")" });
}

void
IMAPResponseTest::test_tag_generator() // NOLINT
{
  auto tags = TagGenerator{};
  QCOMPARE(tags.generate(), QString{ "MB0001" });
  QCOMPARE(tags.generate(), QString{ "MB0002" });
  QCOMPARE(tags.label(), QString{ "MB####" });

  for (uint32_t i = 3; i <= TagGenerator::MAX_TAG_INDEX; ++i) {
    tags.generate();
  }
  QCOMPARE(tags.generate(), QString{ "MB0001" });
}

void
IMAPResponseTest::test_not_connected() // NOLINT
{
  auto client = IMAP{};
  QVERIFY(client.is_disconnected());

  client.select("INBOX");
  QVERIFY(!client.wait_for_ready_read(100));
  QCOMPARE(client.error(), Base::E_NOTCONNECTED);

  client.reset_error();
  QCOMPARE(client.error(), Base::E_NOERR);
}

QTEST_GUILESS_MAIN(IMAPResponseTest)
