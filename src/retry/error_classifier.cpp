/**
 * @file error_classifier.cpp
 * @brief Retry classification of locbridge errors
 */

#include "locbridge/retry/error_classifier.h"

#include "locbridge/core/api_error.h"

namespace locbridge::retry {

auto is_retryable_status(int status) -> bool {
    switch (status) {
        case 408:
        case 425:
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

auto is_retryable(const error& err) -> bool {
    if (!err) {
        return false;
    }

    if (err.code == error_code::connection_timeout) {
        return true;
    }

    if (err.is_cancellation()) {
        return false;
    }

    switch (err.code) {
        case error_code::transfer_timeout:
        case error_code::unexpected_eof:
        case error_code::connection_reset:
        case error_code::broken_pipe:
        case error_code::connection_aborted:
            return true;
        default:
            break;
    }

    if (err.code == error_code::api_error && err.api) {
        return is_retryable_status(err.api->status);
    }

    return false;
}

}  // namespace locbridge::retry
