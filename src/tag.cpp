#include <qstring.h>
#include <utility>

#include "mailbell/tag.hpp"

namespace mailbell {

TagGenerator::TagGenerator(QString prefix)
  : _prefix{ std::move(prefix) }
{
}

QString
TagGenerator::generate()
{
  auto index = _idx;

  _idx = _idx >= MAX_TAG_INDEX ? 1 : _idx + 1;

  return QString{ "%1%2" }.arg(_prefix).arg(index, TAG_WIDTH, TAG_BASE, QChar{ '0' });
}

QString
TagGenerator::label() const
{
  return QString{ "%1%2" }.arg(_prefix).arg(QString{ TAG_WIDTH, QChar{ '#' } });
}

}
