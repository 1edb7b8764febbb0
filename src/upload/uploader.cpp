/**
 * @file uploader.cpp
 * @brief Upload operation implementation
 */

#include "locbridge/upload/uploader.h"

#include "locbridge/core/logging.h"

#include <filesystem>
#include <system_error>

namespace locbridge::upload {

namespace {

auto trim_copy(std::string_view s) -> std::string {
    const auto* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

auto ensure_regular_file(const std::filesystem::path& path) -> result<void> {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (!ec || ec == std::errc::no_such_file_or_directory) {
            return make_error(error_code::file_not_found,
                              "upload: file not found: \"" + path.string() + "\"");
        }
        return make_error(error_code::file_access_denied,
                          "upload: stat \"" + path.string() + "\": " + ec.message());
    }
    if (std::filesystem::is_directory(status)) {
        return make_error(error_code::not_a_regular_file,
                          "upload: \"" + path.string() + "\" is a directory, need a file");
    }
    if (!std::filesystem::is_regular_file(status)) {
        return make_error(error_code::not_a_regular_file,
                          "upload: \"" + path.string() + "\" is not a regular file");
    }
    return {};
}

}  // namespace

uploader::uploader(std::shared_ptr<const transport::api_client> api,
                   std::shared_ptr<const process_poller> poller,
                   upload_encoder encoder)
    : api_(std::move(api)), poller_(std::move(poller)), encoder_(std::move(encoder)) {}

auto uploader::upload(const execution_scope& scope, const upload_spec& spec, bool wait) const
    -> result<std::string> {
    if (auto live = scope.status(); !live) {
        return unexpected{live.error()};
    }
    if (!spec.fields.is_object()) {
        return make_error(error_code::invalid_upload_spec, "upload: fields must be a JSON object");
    }

    // Work on a copy; the caller's fields are never modified
    nlohmann::json fields = spec.fields;
    auto name_it = fields.find("filename");
    if (name_it == fields.end()) {
        return make_error(error_code::invalid_upload_spec, "upload: missing 'filename' param");
    }
    if (!name_it->is_string()) {
        return make_error(error_code::invalid_upload_spec,
                          "upload: 'filename' must be a non-empty string");
    }
    auto filename = trim_copy(name_it->get_ref<const std::string&>());
    if (filename.empty()) {
        return make_error(error_code::invalid_upload_spec,
                          "upload: 'filename' must be a non-empty string");
    }
    *name_it = filename;

    std::string read_path;
    if (!fields.contains("data")) {
        read_path = trim_copy(spec.source_path);
        if (read_path.empty()) {
            read_path = filename;
        }
        read_path = std::filesystem::path(read_path).lexically_normal().string();
        if (auto regular = ensure_regular_file(read_path); !regular) {
            return unexpected{regular.error()};
        }
    }

    auto process_id = kickoff(scope, fields, read_path);
    if (!process_id) {
        return process_id;
    }

    request_log_context ctx;
    ctx.operation = "upload";
    ctx.process_id = process_id.value();
    ctx.path = filename;
    LB_LOG_INFO_CTX(log_category::upload, "upload accepted", ctx);

    if (!wait) {
        return process_id;
    }
    return wait_until_finished(scope, process_id.value());
}

auto uploader::kickoff(const execution_scope& scope,
                       const nlohmann::json& fields,
                       const std::string& read_path) const -> result<std::string> {
    // Validate the data source before anything is sent
    auto source = resolve_data_source(fields, read_path);
    if (!source) {
        return unexpected{source.error()};
    }

    transport::body_factory factory = [this, &scope, &fields, &source]()
        -> result<std::unique_ptr<transport::body_reader>> {
        return encoder_.open(scope, fields, source.value());
    };

    auto response = api_->send_with_retry(scope, transport::http_method::post,
                                          api_->project_path("files/upload"), factory);
    if (!response) {
        return unexpected{response.error().wrap("upload: kickoff")};
    }

    auto process = parse_process_response(response.value());
    if (!process) {
        return unexpected{process.error().wrap("upload: kickoff")};
    }
    auto process_id = trim_copy(process.value().process_id);
    if (process_id.empty()) {
        return make_error(error_code::unexpected_response,
                          "upload: kickoff: empty process id in response");
    }
    return process_id;
}

auto uploader::wait_until_finished(const execution_scope& scope,
                                   const std::string& process_id) const -> result<std::string> {
    auto results = poller_->poll(scope, {process_id});
    if (!results) {
        return unexpected{results.error().wrap("upload: poll processes")};
    }
    if (results.value().empty()) {
        return make_error(error_code::process_incomplete,
                          "upload: no process results returned (process_id=" + process_id + ")");
    }

    const auto& process = results.value().front();
    if (process.is_finished()) {
        return process_id;
    }
    if (process.is_failed()) {
        std::string message = "upload: process " + process_id + " failed";
        if (!process.message.empty()) {
            message += ": " + process.message;
        }
        return make_error(error_code::process_failed, message);
    }
    return make_error(error_code::process_incomplete, "upload: process " + process_id +
                                                          " did not finish (status=" +
                                                          process.status + ")");
}

}  // namespace locbridge::upload
