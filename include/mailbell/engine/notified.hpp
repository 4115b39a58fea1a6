/**
 * @file notified.hpp
 * @brief Bookkeeping of ids that already produced a notification.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qset.h>
#include <qstring.h>
#include <qstringlist.h>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"

namespace mailbell::engine {

using NotifiedSet = QSet<QString>;

/**
 * @brief Forget ids that are no longer unread on the server.
 *
 * @param notified Current set.
 * @param emails Canonical list of the latest poll.
 * @return NotifiedSet Intersection of `notified` and the ids of `emails`.
 */
MAILBELL_PUBLIC NotifiedSet
prune(const NotifiedSet& notified, const model::EmailList& emails);

/**
 * @brief Select records that have not been notified yet.
 *
 * @param emails Canonical list.
 * @param notified Current set.
 * @return model::EmailList Unnotified records, order kept.
 */
MAILBELL_PUBLIC model::EmailList
filter_unnotified(const model::EmailList& emails, const NotifiedSet& notified);

/**
 * @brief Add ids to the set.
 *
 * @param notified Current set.
 * @param ids Ids to add.
 * @return NotifiedSet Union.
 */
MAILBELL_PUBLIC NotifiedSet
mark_notified(const NotifiedSet& notified, const QStringList& ids);

}
