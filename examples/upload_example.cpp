/**
 * @file upload_example.cpp
 * @brief Upload one translation file and wait for the import process
 *
 * This example demonstrates:
 * - Building a client_config from the environment and the command line
 * - Streaming a local file as the upload body
 * - Bounding the whole operation with an execution_scope timeout
 * - Reporting api_error details on failure
 */

#include <locbridge/client/exchange_client.h>
#include <locbridge/core/api_error.h>
#include <locbridge/core/logging.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace locbridge;

namespace {

void print_usage(const char* program) {
    std::cout << "Upload Example - locbridge" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <lang_iso>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -p, --project <id>      Project id (default: $LOCBRIDGE_PROJECT_ID)" << std::endl;
    std::cout << "  -n, --name <filename>   Filename stored remotely (default: local file name)"
              << std::endl;
    std::cout << "  -b, --base-url <url>    API base URL" << std::endl;
    std::cout << "  -r, --retries <n>       Retries per request (default: 3)" << std::endl;
    std::cout << "  --no-wait               Return once the import process is queued" << std::endl;
    std::cout << "  --timeout <seconds>     Overall timeout (default: 300)" << std::endl;
    std::cout << "  -v, --verbose           Debug logging" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "The API token is read from $LOCBRIDGE_API_TOKEN." << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " locales/en.json en" << std::endl;
    std::cout << "  " << program << " -p 123.abc -n app/en.json --no-wait en.json en" << std::endl;
}

auto env_or_empty(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

void print_failure(const error& err) {
    std::cerr << "Upload failed: " << err.message << std::endl;
    std::cerr << "  Code: " << to_string(err.code) << " (" << static_cast<int>(err.code) << ")"
              << std::endl;
    if (err.api) {
        std::cerr << "  " << err.api->describe() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string project_id = env_or_empty("LOCBRIDGE_PROJECT_ID");
    std::string base_url;
    std::string remote_name;
    std::string local_path;
    std::string lang_iso;
    int retries = 3;
    int timeout_seconds = 300;
    bool wait = true;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-p" || arg == "--project") {
            if (++i >= argc) {
                std::cerr << "Error: --project requires an argument" << std::endl;
                return 1;
            }
            project_id = argv[i];
        } else if (arg == "-n" || arg == "--name") {
            if (++i >= argc) {
                std::cerr << "Error: --name requires an argument" << std::endl;
                return 1;
            }
            remote_name = argv[i];
        } else if (arg == "-b" || arg == "--base-url") {
            if (++i >= argc) {
                std::cerr << "Error: --base-url requires an argument" << std::endl;
                return 1;
            }
            base_url = argv[i];
        } else if (arg == "-r" || arg == "--retries") {
            if (++i >= argc) {
                std::cerr << "Error: --retries requires an argument" << std::endl;
                return 1;
            }
            retries = std::atoi(argv[i]);
        } else if (arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout_seconds = std::atoi(argv[i]);
        } else if (arg == "--no-wait") {
            wait = false;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg[0] != '-') {
            if (local_path.empty()) {
                local_path = arg;
            } else if (lang_iso.empty()) {
                lang_iso = arg;
            }
        }
    }

    if (local_path.empty() || lang_iso.empty()) {
        std::cerr << "Error: Both local_file and lang_iso are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (remote_name.empty()) {
        remote_name = std::filesystem::path(local_path).filename().string();
    }
    if (timeout_seconds <= 0) {
        timeout_seconds = 300;
    }

    get_logger().initialize();
    get_logger().set_level(verbose ? log_level::debug : log_level::info);

    auto config_builder = client_config::builder();
    config_builder.with_api_token(env_or_empty("LOCBRIDGE_API_TOKEN"))
        .with_project_id(project_id)
        .with_max_retries(retries);
    if (!base_url.empty()) {
        config_builder.with_base_url(base_url);
    }
    auto config = config_builder.build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "       Translation Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  API: " << config.value().base_url << std::endl;
    std::cout << "  Project: " << config.value().project_id << std::endl;
    std::cout << "  Local file: " << local_path << std::endl;
    std::cout << "  Remote name: " << remote_name << " (" << lang_iso << ")" << std::endl;
    std::cout << std::endl;

    auto client = exchange_client::builder().with_config(config.value()).build();
    if (!client) {
        std::cerr << "Failed to create client: " << client.error().message << std::endl;
        return 1;
    }

    upload::upload_spec spec;
    spec.fields = {{"filename", remote_name}, {"lang_iso", lang_iso}};
    spec.source_path = local_path;

    auto scope = execution_scope::background().with_timeout(std::chrono::seconds(timeout_seconds));
    auto started = std::chrono::steady_clock::now();
    auto process_id = client.value().upload(scope, spec, wait);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!process_id) {
        print_failure(process_id.error());
        return 1;
    }

    std::cout << (wait ? "Import finished" : "Import queued") << ": process "
              << process_id.value() << " (" << elapsed.count() << " ms)" << std::endl;
    return 0;
}
