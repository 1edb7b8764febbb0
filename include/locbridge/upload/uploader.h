/**
 * @file uploader.h
 * @brief File upload operation
 */

#ifndef LOCBRIDGE_UPLOAD_UPLOADER_H
#define LOCBRIDGE_UPLOAD_UPLOADER_H

#include "upload_encoder.h"
#include "locbridge/process/process_poller.h"
#include "locbridge/transport/api_client.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace locbridge::upload {

/**
 * @brief Fields and local source for one upload
 *
 * `fields` must hold a non-empty string "filename". It may hold "data" as a
 * base64 string or as JSON binary; otherwise the file is read from
 * `source_path`, or from `filename` when `source_path` is blank.
 */
struct upload_spec {
    nlohmann::json fields = nlohmann::json::object();
    std::string source_path;
};

/**
 * @brief Uploads a file and optionally waits for the import process
 *
 * The request body is streamed: a fresh encoder pipe is opened for every
 * attempt, so retries re-read the file instead of keeping it in memory.
 */
class uploader {
public:
    uploader(std::shared_ptr<const transport::api_client> api,
             std::shared_ptr<const process_poller> poller,
             upload_encoder encoder);

    /**
     * @brief POST projects/{project}/files/upload
     * @param wait Poll the returned process until it finishes
     * @return Process id
     */
    [[nodiscard]] auto upload(const execution_scope& scope,
                              const upload_spec& spec,
                              bool wait) const -> result<std::string>;

private:
    [[nodiscard]] auto kickoff(const execution_scope& scope,
                               const nlohmann::json& fields,
                               const std::string& read_path) const -> result<std::string>;

    [[nodiscard]] auto wait_until_finished(const execution_scope& scope,
                                           const std::string& process_id) const
        -> result<std::string>;

    std::shared_ptr<const transport::api_client> api_;
    std::shared_ptr<const process_poller> poller_;
    upload_encoder encoder_;
};

}  // namespace locbridge::upload

#endif  // LOCBRIDGE_UPLOAD_UPLOADER_H
