/**
 * @file tag.hpp
 * @brief Utils to generate IMAP4 tags.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <cstdint>
#include <qstring.h>

#include "mailbell/common.hpp"

namespace mailbell {

/**
 * @brief Sequential IMAP4 tag generator, one per connection.
 *
 */
class MAILBELL_PUBLIC TagGenerator
{
public:
  constexpr static uint32_t MAX_TAG_INDEX = 9999; /**< Max index of tag. */
  constexpr static int TAG_WIDTH = 4;             /**< Digits in a tag. */
  constexpr static int TAG_BASE = 10;             /**< Tag base. */

  inline static const QString DEFAULT_PREFIX = "MB"; /**< Default prefix. */

private:
  QString _prefix;
  uint32_t _idx{ 1 };

public:
  /**
   * @brief Construct a new Tag Generator.
   *
   * @param prefix Tag prefix, upper case letters only.
   */
  explicit TagGenerator(QString prefix = DEFAULT_PREFIX);

  /**
   * @brief Generate next tag, wraps after `MAX_TAG_INDEX`.
   *
   * @return QString Next tag.
   */
  QString generate();

  /**
   * @brief Get label of the generator (for logging or debug).
   *
   * @return QString Tag Label.
   */
  [[nodiscard]] QString label() const;
};

}
