/**
 * @file locbridge.h
 * @brief Main header for the locbridge library
 * @version 0.1.0
 *
 * Include this header to access the exchange client and its building blocks.
 *
 * @code
 * #include <locbridge/locbridge.h>
 *
 * using namespace locbridge;
 *
 * auto config = client_config::builder()
 *     .with_api_token(token)
 *     .with_project_id("123.abc")
 *     .build();
 *
 * auto client = exchange_client::builder()
 *     .with_config(config.value())
 *     .build();
 * @endcode
 */

#ifndef LOCBRIDGE_LOCBRIDGE_H
#define LOCBRIDGE_LOCBRIDGE_H

#include <string>

// Core types
#include "locbridge/core/api_error.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/core/logging.h"
#include "locbridge/core/types.h"

// Configuration
#include "locbridge/config/client_config.h"

// Client
#include "locbridge/client/exchange_client.h"

// Building blocks
#include "locbridge/archive/safe_extractor.h"
#include "locbridge/download/bundle_downloader.h"
#include "locbridge/download/url_guard.h"
#include "locbridge/process/process_poller.h"
#include "locbridge/retry/backoff.h"
#include "locbridge/retry/error_classifier.h"
#include "locbridge/transport/api_client.h"
#include "locbridge/upload/uploader.h"

namespace locbridge {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace locbridge

#endif  // LOCBRIDGE_LOCBRIDGE_H
