/**
 * @file bench_upload_encoder.cpp
 * @brief Benchmarks for streaming upload body encoding
 */

#include <benchmark/benchmark.h>

#include <locbridge/adapters/thread_pool_adapter.h>
#include <locbridge/upload/upload_encoder.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace locbridge::benchmark {

namespace {

/**
 * @brief Temp file with deterministic random content, removed on destruction
 */
class temp_source_file {
public:
    temp_source_file(std::size_t size, uint32_t seed) {
        path_ = std::filesystem::temp_directory_path() /
                ("locbridge-bench-" + std::to_string(seed) + "-" + std::to_string(size) + ".bin");
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<char> data(size);
        for (auto& c : data) {
            c = static_cast<char>(dist(rng));
        }
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    ~temp_source_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    temp_source_file(const temp_source_file&) = delete;
    auto operator=(const temp_source_file&) -> temp_source_file& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

const nlohmann::json upload_fields{{"filename", "locales/en.json"},
                                   {"lang_iso", "en"},
                                   {"replace_modified", true}};

}  // namespace

/**
 * @brief Synchronous document encoding from a file
 */
static void BM_WriteDocument_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    temp_source_file source_file(file_size, 42);

    upload::upload_data_source source;
    source.kind = upload::data_source_kind::file;
    source.file_path = source_file.path();

    for (auto _ : state) {
        std::size_t produced = 0;
        auto written = upload::upload_encoder::write_document(
            upload_fields, source, [&produced](const char* data, std::size_t size) -> result<void> {
                ::benchmark::DoNotOptimize(data);
                produced += size;
                return {};
            });
        if (!written) {
            state.SkipWithError(written.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(produced);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Encoding through the pipe, drained the way a transport reads it
 */
static void BM_Open_PipeDrain(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto pipe_capacity = static_cast<std::size_t>(state.range(1));
    temp_source_file source_file(file_size, 7);

    upload::upload_data_source source;
    source.kind = upload::data_source_kind::file;
    source.file_path = source_file.path();

    auto pool = std::make_shared<adapters::standalone_thread_pool>(2);
    upload::upload_encoder encoder(pool, pipe_capacity);
    auto scope = execution_scope::background();
    std::vector<char> buffer(16 * 1024);

    for (auto _ : state) {
        auto body = encoder.open(scope, upload_fields, source);
        if (!body) {
            state.SkipWithError(body.error().message.c_str());
            return;
        }
        auto& reader = *body.value();
        for (;;) {
            auto got = reader.read(buffer.data(), buffer.size());
            if (!got) {
                state.SkipWithError(got.error().message.c_str());
                return;
            }
            if (got.value() == 0) {
                break;
            }
        }
        reader.close(std::nullopt);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_WriteDocument_File)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024)
    ->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Open_PipeDrain)
    ->Args({1024 * 1024, 64 * 1024})
    ->Args({1024 * 1024, 256 * 1024})
    ->Args({16 * 1024 * 1024, 256 * 1024})
    ->Unit(::benchmark::kMillisecond);

}  // namespace locbridge::benchmark
