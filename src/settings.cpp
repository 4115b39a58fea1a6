#include <qdebug.h>
#include <qdir.h>
#include <qfile.h>
#include <qfileinfo.h>
#include <qjsondocument.h>
#include <qjsonobject.h>
#include <qjsonvalue.h>
#include <qlogging.h>
#include <qmutex.h>
#include <qsavefile.h>
#include <qstandardpaths.h>
#include <qthreadpool.h>
#include <utility>

#include "mailbell/settings.hpp"

namespace mailbell {

namespace {

void
_read_int(const QJsonObject& json, const char* key, int& dst)
{
  auto value = json.value(key);
  if (value.isUndefined()) {
    return;
  }

  if (!value.isDouble()) {
    qWarning() << "Settings: Ignore" << key << ": Not a number.";
    return;
  }

  dst = value.toInt(dst);
}

void
_read_int_at_least(const QJsonObject& json,
                   const char* key,
                   int minimum,
                   int& dst)
{
  _read_int(json, key, dst);

  if (dst < minimum) {
    qWarning() << "Settings:" << key << "=" << dst << "is too small, using"
               << minimum << ".";
    dst = minimum;
  }
}

void
_read_int64(const QJsonObject& json, const char* key, qint64& dst)
{
  auto value = json.value(key);
  if (value.isUndefined()) {
    return;
  }

  if (!value.isDouble()) {
    qWarning() << "Settings: Ignore" << key << ": Not a number.";
    return;
  }

  dst = value.toInteger(dst);
}

void
_read_string(const QJsonObject& json, const char* key, QString& dst)
{
  auto value = json.value(key);
  if (value.isUndefined()) {
    return;
  }

  if (!value.isString()) {
    qWarning() << "Settings: Ignore" << key << ": Not a string.";
    return;
  }

  dst = value.toString();
}

}

SettingsStore::SettingsStore(QString path)
  : _path{ path.isEmpty() ? default_path() : std::move(path) }
{
}

QString
SettingsStore::config_dir()
{
  return QDir{ QStandardPaths::writableLocation(
                 QStandardPaths::GenericConfigLocation) }
    .filePath(APP_DIR);
}

QString
SettingsStore::default_path()
{
  return QDir{ config_dir() }.filePath(FILE_NAME);
}

bool
SettingsStore::init_config_dir()
{
  auto dir = config_dir();
  if (!QDir{}.mkpath(dir)) {
    qCritical() << "Settings: Failed to create configuration directory"
                << dir;
    return false;
  }

  return true;
}

Settings
SettingsStore::load() const
{
  auto file = QFile{ _path };

  if (!file.exists()) {
    qInfo() << "Settings: No settings at" << _path << ", using defaults.";
    return {};
  }

  if (!file.open(QIODevice::ReadOnly)) {
    qWarning() << "Settings: Failed to open" << _path << ":"
               << file.errorString() << ", using defaults.";
    return {};
  }

  auto error = QJsonParseError{};
  auto doc = QJsonDocument::fromJson(file.readAll(), &error);

  if (error.error != QJsonParseError::NoError || !doc.isObject()) {
    qWarning() << "Settings: File corrupted" << _path << ":"
               << error.errorString() << ", using defaults.";
    return {};
  }

  return from_json(doc.object());
}

bool
SettingsStore::save(const Settings& settings)
{
  QMutexLocker guard{ &_lock };

  if (!QDir{}.mkpath(QFileInfo{ _path }.absolutePath())) {
    qWarning() << "Settings: Failed to create directory for" << _path;
    return false;
  }

  auto file = QSaveFile{ _path };
  if (!file.open(QIODevice::WriteOnly)) {
    qWarning() << "Settings: Failed to open" << _path << ":"
               << file.errorString();
    return false;
  }

  file.write(QJsonDocument{ to_json(settings) }.toJson(QJsonDocument::Indented));

  if (!file.commit()) {
    qWarning() << "Settings: Failed to save" << _path << ":"
               << file.errorString();
    return false;
  }

  qDebug() << "Settings: Saved to" << _path;
  return true;
}

void
SettingsStore::save_async(Settings settings)
{
  QThreadPool::globalInstance()->start(
    [this, settings = std::move(settings)]() { save(settings); });
}

QJsonObject
SettingsStore::to_json(const Settings& settings)
{
  return {
    { "check_interval", settings.check_interval },
    { "gmail_url", settings.gmail_url },
    { "last_check_time", settings.last_check_time },
    { "username", settings.username },
    { "imap_host", settings.imap_host },
    { "recheck_delay", settings.recheck_delay },
    { "poll_tick", settings.poll_tick },
  };
}

Settings
SettingsStore::from_json(const QJsonObject& json)
{
  auto settings = Settings{};

  _read_int_at_least(json,
                     "check_interval",
                     Settings::MIN_CHECK_INTERVAL,
                     settings.check_interval);
  _read_string(json, "gmail_url", settings.gmail_url);
  _read_int64(json, "last_check_time", settings.last_check_time);
  _read_string(json, "username", settings.username);
  _read_string(json, "imap_host", settings.imap_host);
  _read_int_at_least(json,
                     "recheck_delay",
                     Settings::MIN_RECHECK_DELAY,
                     settings.recheck_delay);
  _read_int_at_least(
    json, "poll_tick", Settings::MIN_POLL_TICK, settings.poll_tick);

  return settings;
}

}
