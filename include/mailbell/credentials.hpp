/**
 * @file credentials.hpp
 * @brief Account password storage.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qstring.h>

#include "mailbell/common.hpp"

namespace mailbell {

/**
 * @brief Password store keyed by account.
 *
 * `MAILBELL_PASSWORD` in the environment overrides the stored password of
 * every account. Backends only see non-empty account names.
 */
class MAILBELL_PUBLIC CredentialStore
{
public:
  constexpr static const char* PASSWORD_ENV = "MAILBELL_PASSWORD";

  virtual ~CredentialStore() = default;

  /**
   * @brief Look up the password of an account.
   *
   * @param account Account name.
   * @return QString Password, empty when unknown.
   */
  [[nodiscard]] QString password(const QString& account) const;

  /**
   * @brief Store the password of an account.
   *
   * @param account Account name.
   * @param password Password.
   * @return true Stored.
   * @return false Failed, error logged.
   */
  bool store(const QString& account, const QString& password);

protected:
  [[nodiscard]] virtual QString _read(const QString& account) const = 0;
  virtual bool _write(const QString& account, const QString& password) = 0;
};

/**
 * @brief Credential store in the desktop keyring (Secret Service, KWallet,
 * macOS Keychain or the Windows credential store).
 *
 * Jobs are run synchronously in a local event loop.
 */
class MAILBELL_PUBLIC KeychainCredentialStore : public CredentialStore
{
public:
  inline static const QString SERVICE = "mailbell";

private:
  QString _service;

public:
  explicit KeychainCredentialStore(QString service = SERVICE);

protected:
  [[nodiscard]] QString _read(const QString& account) const override;
  bool _write(const QString& account, const QString& password) override;
};

}
