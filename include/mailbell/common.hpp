/**
 * @file common.hpp
 * @brief Mailbell common utils.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qdeadlinetimer.h>
#include <qlogging.h>
#include <qmetaobject.h>
#include <qthread.h>

#if defined _WIN32 || defined __CYGWIN__
#ifdef BUILDING_MAILBELL
#define MAILBELL_PUBLIC __declspec(dllexport)
#else
#define MAILBELL_PUBLIC __declspec(dllimport)
#endif
#else
#ifdef BUILDING_MAILBELL
#define MAILBELL_PUBLIC __attribute__((visibility("default")))
#else
#define MAILBELL_PUBLIC
#endif
#endif

#if defined _WIN32 || defined __CYGWIN__
#define MAILBELL_INLINE inline __forceinline
#else
#define MAILBELL_INLINE inline __attribute__((always_inline))
#endif

/**
 * @brief Hard thread affinity check for objects that own canonical state.
 *
 * @note Must be used inside a QObject member function.
 */
#define MAILBELL_ASSERT_AFFINITY()                                             \
  Q_ASSERT_X(QThread::currentThread() == thread(),                             \
             Q_FUNC_INFO,                                                      \
             "called outside of the owning thread")

namespace mailbell::common {

/**
 * @brief Convert string to qt enum.
 *
 * @tparam Et Enum type.
 * @param name Enum name.
 * @param fallback Value returned when name is unknown.
 * @return Et Enum value.
 */
template<typename Et>
Et
enum_value(const char* name, Et fallback = static_cast<Et>(0))
{
  static auto enum_meta = QMetaEnum::fromType<Et>();

  bool ok = false;
  auto value = enum_meta.keyToValue(name, &ok);

  if (!ok) {
    qWarning("**MAILBELL INTERNAL**: Failed to convert %s to enum %s !",
             name,
             enum_meta.enumName());
    return fallback;
  }

  return static_cast<Et>(value);
}

/**
 * @brief Milliseconds on the monotonic clock.
 *
 * Unaffected by wall clock changes and comparable between threads.
 */
MAILBELL_INLINE qint64
steady_msecs()
{
  return QDeadlineTimer::current().deadline();
}

/**
 * @brief Convert qt enum to string.
 *
 * @tparam Et Enum type.
 * @param value Enum value.
 * @return const char* Enum name.
 */
template<typename Et>
MAILBELL_INLINE const char*
enum_name(Et value)
{
  static auto enum_meta = QMetaEnum::fromType<Et>();

  return enum_meta.valueToKey(static_cast<int>(value));
}

}
