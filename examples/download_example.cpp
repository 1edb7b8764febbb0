/**
 * @file download_example.cpp
 * @brief Export a translation bundle and unpack it into a directory
 *
 * This example demonstrates:
 * - Sync (files/download) and async (files/async-download) exports
 * - Passing export parameters as JSON
 * - Tightening the extraction limits for untrusted bundles
 */

#include <locbridge/client/exchange_client.h>
#include <locbridge/core/api_error.h>
#include <locbridge/core/logging.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace locbridge;

namespace {

void print_usage(const char* program) {
    std::cout << "Download Example - locbridge" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <destination_dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -p, --project <id>      Project id (default: $LOCBRIDGE_PROJECT_ID)" << std::endl;
    std::cout << "  -f, --format <format>   Export format (default: json)" << std::endl;
    std::cout << "  --params <json>         Extra export parameters as a JSON object" << std::endl;
    std::cout << "  --async                 Use the async export and poll the process" << std::endl;
    std::cout << "  --max-files <n>         Maximum entries in the bundle (default: 20000)"
              << std::endl;
    std::cout << "  --timeout <seconds>     Overall timeout (default: 600)" << std::endl;
    std::cout << "  -v, --verbose           Debug logging" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "The API token is read from $LOCBRIDGE_API_TOKEN." << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " locales" << std::endl;
    std::cout << "  " << program << " --async -f yaml --params '{\"original_filenames\":true}' out"
              << std::endl;
}

auto env_or_empty(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

auto count_files(const std::filesystem::path& root) -> std::size_t {
    std::size_t count = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            ++count;
        }
    }
    return count;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string project_id = env_or_empty("LOCBRIDGE_PROJECT_ID");
    std::string format = "json";
    std::string extra_params;
    std::string destination;
    bool use_async = false;
    bool verbose = false;
    int max_files = 20000;
    int timeout_seconds = 600;

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
        } else if (arg == "-f" || arg == "--format") {
            if (++i >= argc) {
                std::cerr << "Error: --format requires an argument" << std::endl;
                return 1;
            }
            format = argv[i];
        } else if (arg == "--params") {
            if (++i >= argc) {
                std::cerr << "Error: --params requires an argument" << std::endl;
                return 1;
            }
            extra_params = argv[i];
        } else if (arg == "--max-files") {
            if (++i >= argc) {
                std::cerr << "Error: --max-files requires an argument" << std::endl;
                return 1;
            }
            max_files = std::atoi(argv[i]);
        } else if (arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout_seconds = std::atoi(argv[i]);
        } else if (arg == "--async") {
            use_async = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg[0] != '-') {
            destination = arg;
        }
    }

    if (destination.empty()) {
        std::cerr << "Error: destination_dir is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    nlohmann::json params = nlohmann::json::object();
    if (!extra_params.empty()) {
        params = nlohmann::json::parse(extra_params, nullptr, false);
        if (params.is_discarded() || !params.is_object()) {
            std::cerr << "Error: --params must be a JSON object" << std::endl;
            return 1;
        }
    }
    params["format"] = format;

    get_logger().initialize();
    get_logger().set_level(verbose ? log_level::debug : log_level::info);

    auto config = client_config::builder()
                      .with_api_token(env_or_empty("LOCBRIDGE_API_TOKEN"))
                      .with_project_id(project_id)
                      .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    archive::extraction_policy policy;
    if (max_files > 0) {
        policy.max_entries = static_cast<uint64_t>(max_files);
    }

    auto client = exchange_client::builder()
                      .with_config(config.value())
                      .with_extraction_policy(policy)
                      .build();
    if (!client) {
        std::cerr << "Failed to create client: " << client.error().message << std::endl;
        return 1;
    }

    std::cout << "Exporting " << format << " bundle of project " << config.value().project_id
              << (use_async ? " (async)" : "") << "..." << std::endl;

    auto scope = execution_scope::background().with_timeout(
        std::chrono::seconds(timeout_seconds > 0 ? timeout_seconds : 600));
    auto url = use_async ? client.value().download_async(scope, destination, params)
                         : client.value().download(scope, destination, params);
    if (!url) {
        std::cerr << "Download failed: " << url.error().message << std::endl;
        if (url.error().api) {
            std::cerr << "  " << url.error().api->describe() << std::endl;
        }
        return 1;
    }

    std::cout << "Bundle: " << url.value() << std::endl;
    std::cout << "Unpacked " << count_files(destination) << " files into " << destination
              << std::endl;
    return 0;
}
