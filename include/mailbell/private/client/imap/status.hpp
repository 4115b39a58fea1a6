/**
 * @file status.hpp
 * @brief IMAP4 completion status parser.
 * @version 0.1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026 Mailbell
 *
 */

#pragma once

#include "mailbell/client/imap.hpp"
#include "mailbell/common.hpp"
#include "mailbell/private/client/imap/response.hpp"

namespace mailbell::client::detail {

/**
 * @brief Check the tagged completion of a response.
 *
 * @param resp Response data.
 * @param no_error Error type reported for `NO`.
 * @param error_handler Emitted on error.
 * @return true Command completed with `OK`.
 * @return false Error handler has been emitted.
 */
MAILBELL_PUBLIC bool
imap_check_status(const IMAPResponse& resp,
                  IMAP::ErrorType no_error,
                  const IMAP::ErrorCallback& error_handler);

/**
 * @brief Handles IMAP4 responses which carry only a completion status (CLOSE,
 * EXPUNGE, UID COPY and UID STORE).
 *
 * @param resp Response data.
 * @param error_handler Emitted on error.
 * @param success_handler Emitted on success with `response::Done`.
 */
MAILBELL_PUBLIC void
imap_handle_status(const IMAPResponse& resp,
                   const IMAP::ErrorCallback& error_handler,
                   const IMAP::CommandCallback& success_handler);

}
