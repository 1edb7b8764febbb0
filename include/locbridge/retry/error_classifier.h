/**
 * @file error_classifier.h
 * @brief Transient vs permanent failure classification
 */

#ifndef LOCBRIDGE_RETRY_ERROR_CLASSIFIER_H
#define LOCBRIDGE_RETRY_ERROR_CLASSIFIER_H

#include "locbridge/core/types.h"

#include <functional>

namespace locbridge::retry {

/**
 * @brief Decides whether a failed attempt may be repeated
 */
using retry_predicate = std::function<bool(const error&)>;

/**
 * @brief HTTP statuses worth retrying: 408, 425, 429, 500, 502, 503, 504
 */
[[nodiscard]] auto is_retryable_status(int status) -> bool;

/**
 * @brief Default classification, first match wins
 *
 * 1. connection_timeout (network layer)                  -> retryable
 * 2. operation_cancelled, deadline_exceeded               -> not retryable
 * 3. transfer_timeout (any other timeout)                 -> retryable
 * 4. unexpected_eof, connection_reset, broken_pipe,
 *    connection_aborted                                   -> retryable
 * 5. api_error with a retryable HTTP status               -> retryable
 * 6. everything else                                      -> not retryable
 *
 * Cancellation is checked before the generic timeout case so that a
 * caller-imposed limit is never mistaken for a transient fault.
 */
[[nodiscard]] auto is_retryable(const error& err) -> bool;

}  // namespace locbridge::retry

#endif  // LOCBRIDGE_RETRY_ERROR_CLASSIFIER_H
