/**
 * @file settings.hpp
 * @brief Persistent settings.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qjsonobject.h>
#include <qmutex.h>
#include <qstring.h>
#include <qtypes.h>

#include "mailbell/common.hpp"

namespace mailbell {

/**
 * @brief Application settings, the password is not part of them.
 *
 */
struct Settings
{
  constexpr static int DEFAULT_CHECK_INTERVAL = 300; /**< Seconds. */
  constexpr static int DEFAULT_RECHECK_DELAY = 20000; /**< Milliseconds. */
  constexpr static int DEFAULT_POLL_TICK = 1000;      /**< Milliseconds. */

  // lower bounds applied to values read from disk.
  constexpr static int MIN_CHECK_INTERVAL = 60;
  constexpr static int MIN_RECHECK_DELAY = 1000;
  constexpr static int MIN_POLL_TICK = 100;

  inline static const QString DEFAULT_GMAIL_URL = "https://mail.google.com";
  inline static const QString DEFAULT_IMAP_HOST = "imap.gmail.com";

  int check_interval{ DEFAULT_CHECK_INTERVAL };
  QString gmail_url{ DEFAULT_GMAIL_URL };
  qint64 last_check_time{ 0 };
  QString username;
  QString imap_host{ DEFAULT_IMAP_HOST };
  int recheck_delay{ DEFAULT_RECHECK_DELAY };
  int poll_tick{ DEFAULT_POLL_TICK };

  friend bool operator==(const Settings& lhs, const Settings& rhs)
  {
    return lhs.check_interval == rhs.check_interval &&
           lhs.gmail_url == rhs.gmail_url &&
           lhs.last_check_time == rhs.last_check_time &&
           lhs.username == rhs.username && lhs.imap_host == rhs.imap_host &&
           lhs.recheck_delay == rhs.recheck_delay &&
           lhs.poll_tick == rhs.poll_tick;
  }

  friend bool operator!=(const Settings& lhs, const Settings& rhs)
  {
    return !(lhs == rhs);
  }
};

/**
 * @brief JSON file backed settings store.
 *
 * Every save overwrites the whole file. Concurrent saves are serialised.
 */
class MAILBELL_PUBLIC SettingsStore
{
public:
  inline static const QString APP_DIR = "mailbell";
  inline static const QString FILE_NAME = "settings.json";

private:
  QString _path;
  QMutex _lock;

public:
  /**
   * @brief Construct a new SettingsStore.
   *
   * @param path Settings file, `default_path()` when empty.
   */
  explicit SettingsStore(QString path = {});

  /**
   * @brief Get the configuration directory of the application.
   *
   * @return QString Absolute path.
   */
  static QString config_dir();

  /**
   * @brief Get the default settings file.
   *
   * @return QString Absolute path.
   */
  static QString default_path();

  /**
   * @brief Create the configuration directory, safe to call repeatedly.
   *
   * @return true Directory exists.
   * @return false Directory could not be created.
   */
  static bool init_config_dir();

  /**
   * @brief Load settings.
   *
   * Missing, unreadable or corrupt files give the defaults. Keys with an
   * unexpected type keep their default value.
   *
   * @return Settings Loaded settings.
   */
  Settings load() const;

  /**
   * @brief Save settings, replacing the file atomically.
   *
   * @param settings Settings to save.
   * @return true Saved.
   * @return false Failed, error logged.
   */
  bool save(const Settings& settings);

  /**
   * @brief Save a snapshot of settings on the global thread pool.
   *
   * @note The store must outlive the pool task.
   *
   * @param settings Settings to save.
   */
  void save_async(Settings settings);

  [[nodiscard]] MAILBELL_INLINE auto& path() const { return _path; }

  /**
   * @brief Serialize settings.
   *
   */
  static QJsonObject to_json(const Settings& settings);

  /**
   * @brief Deserialize settings over the defaults.
   *
   */
  static Settings from_json(const QJsonObject& json);
};

}
