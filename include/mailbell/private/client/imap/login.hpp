/**
 * @file login.hpp
 * @brief IMAP4 LOGIN response parser.
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
 * @brief Handles IMAP4 LOGIN response.
 *
 * @param resp Response data.
 * @param error_handler Emitted on error.
 * @param success_handler Emitted on success with `response::Login`.
 */
MAILBELL_PUBLIC void
imap_handle_login(const IMAPResponse& resp,
                  const IMAP::ErrorCallback& error_handler,
                  const IMAP::CommandCallback& success_handler);

}
