/**
 * @file bundle_downloader.h
 * @brief Export, fetch and unpack translation bundles
 */

#ifndef LOCBRIDGE_DOWNLOAD_BUNDLE_DOWNLOADER_H
#define LOCBRIDGE_DOWNLOAD_BUNDLE_DOWNLOADER_H

#include "locbridge/archive/safe_extractor.h"
#include "locbridge/process/process_poller.h"
#include "locbridge/transport/api_client.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace locbridge::download {

/**
 * @brief Downloader behavior beyond the request parameters
 */
struct download_options {
    archive::extraction_policy extraction;
};

/**
 * @brief Obtains a bundle URL from the API, then downloads and unpacks it
 *
 * Two flows share one pipeline:
 * - sync: POST files/download answers with "bundle_url"
 * - async: POST files/async-download answers with "process_id", which is
 *   polled until it finishes and yields details.download_url
 *
 * The bundle itself is fetched without the API token, under the backoff
 * engine, into a private temp directory. Each attempt writes to a fresh
 * temp file, checks the declared Content-Length, renames into place and
 * validates the ZIP; a short or invalid archive is retried.
 */
class bundle_downloader {
public:
    bundle_downloader(std::shared_ptr<const transport::api_client> api,
                      std::shared_ptr<const process_poller> poller,
                      download_options options = {});

    /**
     * @brief Sync export, download and unpack into @p destination
     * @return The bundle URL used
     */
    [[nodiscard]] auto download(const execution_scope& scope,
                                const std::filesystem::path& destination,
                                const nlohmann::json& params) const -> result<std::string>;

    /**
     * @brief Async export, download and unpack into @p destination
     * @return The download URL of the finished process
     */
    [[nodiscard]] auto download_async(const execution_scope& scope,
                                      const std::filesystem::path& destination,
                                      const nlohmann::json& params) const -> result<std::string>;

    [[nodiscard]] auto fetch_bundle(const execution_scope& scope,
                                    const nlohmann::json& params) const -> result<std::string>;

    [[nodiscard]] auto fetch_bundle_async(const execution_scope& scope,
                                          const nlohmann::json& params) const
        -> result<std::string>;

    /**
     * @brief Validate @p url, fetch the archive with retries and unpack it
     */
    [[nodiscard]] auto download_and_extract(const execution_scope& scope,
                                            std::string_view url,
                                            const std::filesystem::path& destination) const
        -> result<void>;

    [[nodiscard]] auto options() const -> const download_options& { return options_; }

private:
    [[nodiscard]] auto download_once(const execution_scope& scope,
                                     const std::string& url,
                                     const std::filesystem::path& archive_path) const
        -> result<void>;

    std::shared_ptr<const transport::api_client> api_;
    std::shared_ptr<const process_poller> poller_;
    download_options options_;
};

}  // namespace locbridge::download

#endif  // LOCBRIDGE_DOWNLOAD_BUNDLE_DOWNLOADER_H
