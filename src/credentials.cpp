#include <qdebug.h>
#include <qeventloop.h>
#include <qglobal.h>
#include <qlogging.h>
#include <qt6keychain/keychain.h>
#include <utility>

#include "mailbell/credentials.hpp"

namespace mailbell {

namespace {

void
_run(QKeychain::Job& job)
{
  auto loop = QEventLoop{};
  QObject::connect(&job, &QKeychain::Job::finished, &loop, &QEventLoop::quit);

  job.setAutoDelete(false);
  job.start();
  loop.exec();
}

}

QString
CredentialStore::password(const QString& account) const
{
  if (auto env = qEnvironmentVariable(PASSWORD_ENV); !env.isEmpty()) {
    return env;
  }

  if (account.isEmpty()) {
    return {};
  }

  return _read(account);
}

bool
CredentialStore::store(const QString& account, const QString& password)
{
  if (account.isEmpty()) {
    qWarning() << "Credentials: Refuse to store password without account.";
    return false;
  }

  return _write(account, password);
}

KeychainCredentialStore::KeychainCredentialStore(QString service)
  : _service{ std::move(service) }
{
}

QString
KeychainCredentialStore::_read(const QString& account) const
{
  auto job = QKeychain::ReadPasswordJob{ _service };
  job.setKey(account);
  _run(job);

  if (job.error() == QKeychain::EntryNotFound) {
    qInfo() << "Credentials: No password stored for" << account;
    return {};
  }

  if (job.error() != QKeychain::NoError) {
    qWarning() << "Credentials: Failed to read keyring:" << job.errorString();
    return {};
  }

  return job.textData();
}

bool
KeychainCredentialStore::_write(const QString& account,
                                const QString& password)
{
  auto job = QKeychain::WritePasswordJob{ _service };
  job.setKey(account);
  job.setTextData(password);
  _run(job);

  if (job.error() != QKeychain::NoError) {
    qWarning() << "Credentials: Failed to write keyring:" << job.errorString();
    return false;
  }

  qDebug() << "Credentials: Stored password for" << account;
  return true;
}

}
