/**
 * @file reconcile.hpp
 * @brief Deduplication and thread grouping of polled mail.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include <qstring.h>
#include <qstringlist.h>

#include "mailbell/common.hpp"
#include "mailbell/model/email.hpp"

namespace mailbell::engine {

/**
 * @brief Collapse duplicate ids and sort newest first.
 *
 * The first occurrence of an id wins, later copies are dropped without
 * comparing their payload. Records without an id are dropped. Sorting is
 * stable, so records with equal timestamps keep their relative order and
 * zero timestamps end up last.
 *
 * @param records Raw records in source order.
 * @return model::EmailList Canonical list.
 */
MAILBELL_PUBLIC model::EmailList
dedup(const model::EmailList& records);

/**
 * @brief Fold a canonical list into one entry per thread.
 *
 * Records with an empty thread id form their own group. Each group is
 * represented by its newest member (earliest in input on ties). Groups are
 * sorted newest first.
 *
 * @param emails Canonical list.
 * @return model::ThreadList Thread groups.
 */
MAILBELL_PUBLIC model::ThreadList
group_by_thread(const model::EmailList& emails);

/**
 * @brief Collect ids of all records sharing the thread of `id`.
 *
 * @param emails Canonical list.
 * @param id Id of any member.
 * @return QStringList Member ids, or just `id` when it has no thread.
 */
MAILBELL_PUBLIC QStringList
find_thread_ids(const model::EmailList& emails, const QString& id);

/**
 * @brief Drop records by id, keeping order.
 *
 * @param emails Canonical list.
 * @param ids Ids to drop.
 * @return model::EmailList Filtered list.
 */
MAILBELL_PUBLIC model::EmailList
remove_ids(const model::EmailList& emails, const QStringList& ids);

}
