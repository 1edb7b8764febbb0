/**
 * @file safe_extractor.cpp
 * @brief Safe ZIP extraction on top of the minizip-ng compatibility API
 */

#include "locbridge/archive/safe_extractor.h"

#include "locbridge/core/logging.h"

#include <minizip-ng/mz_compat.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace locbridge::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t copy_buffer_size = 64 * 1024;
constexpr unsigned long made_by_unix = 3;
constexpr unsigned long made_by_osx = 19;
constexpr unsigned long msdos_directory_attribute = 0x10;
constexpr mode_t directory_mode = 0755;
constexpr mode_t default_file_mode = 0644;

struct unzip_closer {
    void operator()(unzFile file) const {
        if (file) {
            unzClose(file);
        }
    }
};

using unzip_handle = std::unique_ptr<void, unzip_closer>;

/**
 * @brief The archive's current entry, closed on scope exit
 */
class open_entry {
public:
    explicit open_entry(unzFile zip) : zip_(zip) {}

    ~open_entry() {
        if (open_) {
            unzCloseCurrentFile(zip_);
        }
    }

    open_entry(const open_entry&) = delete;
    auto operator=(const open_entry&) -> open_entry& = delete;

    [[nodiscard]] auto open() -> int {
        int rc = unzOpenCurrentFile(zip_);
        open_ = rc == UNZ_OK;
        return rc;
    }

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> int {
        return unzReadCurrentFile(zip_, buffer, static_cast<unsigned>(size));
    }

    // Reports a CRC mismatch once the entry has been read to the end
    [[nodiscard]] auto close() -> int {
        open_ = false;
        return unzCloseCurrentFile(zip_);
    }

private:
    unzFile zip_;
    bool open_ = false;
};

/**
 * @brief Uniquely named file beside a target, unlinked unless committed
 */
class partial_file {
public:
    explicit partial_file(const fs::path& target) {
        auto pattern =
            (target.parent_path() / (target.filename().string() + ".partial-XXXXXX")).string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        fd_ = ::mkstemp(name.data());
        if (fd_ >= 0) {
            path_ = name.data();
        } else {
            open_errno_ = errno;
        }
    }

    ~partial_file() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        if (!committed_ && !path_.empty()) {
            ::unlink(path_.c_str());
        }
    }

    partial_file(const partial_file&) = delete;
    auto operator=(const partial_file&) -> partial_file& = delete;

    [[nodiscard]] auto is_open() const -> bool { return fd_ >= 0; }
    [[nodiscard]] auto open_errno() const -> int { return open_errno_; }

    [[nodiscard]] auto write(const char* data, std::size_t size) -> result<void> {
        while (size > 0) {
            auto n = ::write(fd_, data, size);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return make_error(error_code::file_write_error,
                                  "write " + path_ + ": " + std::strerror(errno));
            }
            data += n;
            size -= static_cast<std::size_t>(n);
        }
        return {};
    }

    void set_mode(mode_t mode) {
        if (::fchmod(fd_, mode) != 0) {
            LB_LOG_DEBUG(log_category::extract,
                         "chmod " + path_ + ": " + std::strerror(errno));
        }
    }

    [[nodiscard]] auto commit(const fs::path& target) -> result<void> {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return make_error(error_code::file_write_error,
                              "close " + path_ + ": " + std::strerror(errno));
        }
        if (::rename(path_.c_str(), target.c_str()) != 0) {
            return make_error(error_code::file_write_error, "rename " + path_ + " to " +
                                                                target.string() + ": " +
                                                                std::strerror(errno));
        }
        committed_ = true;
        return {};
    }

private:
    int fd_ = -1;
    int open_errno_ = 0;
    std::string path_;
    bool committed_ = false;
};

struct entry_info {
    std::string name;
    uint64_t uncompressed_size = 0;
    uint32_t mode = 0;
    bool directory = false;
    unsigned long dos_date = 0;
};

auto quoted(const std::string& s) -> std::string {
    std::string out = "\"";
    for (char c : s) {
        if (c == '\0') {
            out += "\\x00";
        } else {
            out += c;
        }
    }
    return out + "\"";
}

auto has_volume_prefix(std::string_view name) -> bool {
    return name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) &&
           name[1] == ':';
}

auto is_absolute_name(std::string_view name) -> bool {
    return (!name.empty() && (name.front() == '/' || name.front() == '\\')) ||
           has_volume_prefix(name);
}

auto is_within(const fs::path& root, const fs::path& candidate) -> bool {
    auto rel = candidate.lexically_normal().lexically_relative(root);
    if (rel.empty()) {
        return false;
    }
    return *rel.begin() != "..";
}

/**
 * @brief Normalized relative name, or an empty string for entries naming the root
 */
auto clean_entry_name(const std::string& raw) -> result<std::string> {
    if (raw.find('\0') != std::string::npos) {
        return make_error(error_code::path_escape,
                          "invalid file name (NUL) in zip: " + quoted(raw));
    }

    std::string name = raw;
    for (auto& c : name) {
        if (c == '\\') {
            c = '/';
        }
    }
    if (is_absolute_name(name)) {
        return make_error(error_code::path_escape, "unsafe absolute path in zip: " + quoted(raw));
    }

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find('/', start);
        if (end == std::string::npos) {
            end = name.size();
        }
        std::string segment = name.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == ".." && !segments.empty() && segments.back() != "..") {
            segments.pop_back();
            continue;
        }
        segments.push_back(std::move(segment));
    }

    std::string cleaned;
    for (const auto& segment : segments) {
        if (segment == "..") {
            return make_error(error_code::path_escape,
                              "unsafe path traversal in zip (.. segment): " + quoted(raw));
        }
        if (!cleaned.empty()) {
            cleaned += '/';
        }
        cleaned += segment;
    }
    return cleaned;
}

auto read_entry_info(unzFile zip) -> result<entry_info> {
    unz_file_info64 info{};
    if (unzGetCurrentFileInfo64(zip, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK) {
        return make_error(error_code::invalid_archive, "read zip entry header");
    }
    std::vector<char> name(static_cast<std::size_t>(info.size_filename) + 1, '\0');
    if (unzGetCurrentFileInfo64(zip, &info, name.data(), static_cast<unsigned long>(name.size()),
                                nullptr, 0, nullptr, 0) != UNZ_OK) {
        return make_error(error_code::invalid_archive, "read zip entry name");
    }

    entry_info entry;
    entry.name.assign(name.data(), static_cast<std::size_t>(info.size_filename));
    entry.uncompressed_size = info.uncompressed_size;
    entry.dos_date = info.dos_date;

    auto made_by = (info.version >> 8) & 0xFF;
    if (made_by == made_by_unix || made_by == made_by_osx) {
        entry.mode = static_cast<uint32_t>((info.external_fa >> 16) & 0xFFFF);
    }
    entry.directory = (!entry.name.empty() &&
                       (entry.name.back() == '/' || entry.name.back() == '\\')) ||
                      S_ISDIR(entry.mode) || (info.external_fa & msdos_directory_attribute) != 0;
    return entry;
}

auto dos_date_to_time(unsigned long dos_date) -> std::optional<std::time_t> {
    if (dos_date == 0) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = static_cast<int>((dos_date >> 25) & 0x7F) + 80;
    tm.tm_mon = static_cast<int>((dos_date >> 21) & 0x0F) - 1;
    tm.tm_mday = static_cast<int>((dos_date >> 16) & 0x1F);
    tm.tm_hour = static_cast<int>((dos_date >> 11) & 0x1F);
    tm.tm_min = static_cast<int>((dos_date >> 5) & 0x3F);
    tm.tm_sec = static_cast<int>(dos_date & 0x1F) * 2;
    tm.tm_isdst = -1;
    auto t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return t;
}

void apply_times(const fs::path& path, unsigned long dos_date) {
    auto when = dos_date_to_time(dos_date);
    if (!when) {
        return;
    }
    struct timespec times[2];
    times[0].tv_sec = *when;
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        LB_LOG_DEBUG(log_category::extract,
                     "set times on " + path.string() + ": " + std::strerror(errno));
    }
}

/**
 * @brief One extraction: the open archive, the resolved root and running totals
 */
class extraction_run {
public:
    extraction_run(unzFile zip, fs::path root, const extraction_policy& policy)
        : zip_(zip), root_(std::move(root)), policy_(policy) {}

    [[nodiscard]] auto extract_current() -> result<void> {
        auto info = read_entry_info(zip_);
        if (!info) {
            return unexpected{info.error()};
        }
        const auto& entry = info.value();

        auto cleaned = clean_entry_name(entry.name);
        if (!cleaned) {
            return unexpected{cleaned.error()};
        }
        if (cleaned.value().empty()) {
            return {};
        }

        if (policy_.max_entry_bytes > 0 && entry.uncompressed_size > policy_.max_entry_bytes) {
            return make_error(error_code::entry_too_large,
                              "zip entry too big by header: " + quoted(entry.name) + " (" +
                                  std::to_string(entry.uncompressed_size) + " bytes)");
        }

        auto target = (root_ / cleaned.value()).lexically_normal();
        if (target == root_ || !is_within(root_, target)) {
            return make_error(error_code::path_escape, "unsafe path escape: " + quoted(entry.name));
        }
        if (auto chain = check_symlink_chain(target, entry.name); !chain) {
            return chain;
        }

        if (entry.directory) {
            if (auto made = make_directories(target); !made) {
                return made;
            }
            if (policy_.preserve_times) {
                apply_times(target, entry.dos_date);
            }
            ++directories_;
            return {};
        }

        const auto type = entry.mode & S_IFMT;
        if (type == S_IFCHR || type == S_IFBLK || type == S_IFIFO || type == S_IFSOCK) {
            LB_LOG_DEBUG(log_category::extract, "skipping special entry " + quoted(entry.name));
            ++skipped_;
            return {};
        }
        if (type == S_IFLNK && !policy_.allow_symlinks) {
            LB_LOG_DEBUG(log_category::extract, "skipping symlink entry " + quoted(entry.name));
            ++skipped_;
            return {};
        }

        if (auto made = make_directories(target.parent_path()); !made) {
            return made;
        }

        if (type == S_IFLNK) {
            return extract_symlink(entry, target);
        }
        return extract_file(entry, target);
    }

    [[nodiscard]] auto files() const -> uint64_t { return files_; }
    [[nodiscard]] auto directories() const -> uint64_t { return directories_; }
    [[nodiscard]] auto symlinks() const -> uint64_t { return symlinks_; }
    [[nodiscard]] auto skipped() const -> uint64_t { return skipped_; }
    [[nodiscard]] auto total_written() const -> uint64_t { return total_written_; }

private:
    // Existing components of target must not be symlinks leading out of the root
    [[nodiscard]] auto check_symlink_chain(const fs::path& target, const std::string& name) const
        -> result<void> {
        fs::path current = root_;
        for (const auto& segment : target.lexically_relative(root_)) {
            if (segment.empty() || segment == ".") {
                continue;
            }
            current /= segment;

            std::error_code ec;
            auto status = fs::symlink_status(current, ec);
            if (ec) {
                return make_error(error_code::file_access_denied,
                                  "lstat " + current.string() + ": " + ec.message());
            }
            if (status.type() == fs::file_type::not_found) {
                return {};
            }
            if (status.type() != fs::file_type::symlink) {
                continue;
            }

            auto real = fs::canonical(current, ec);
            if (ec || !is_within(root_, real)) {
                return make_error(error_code::path_escape,
                                  "unsafe symlink in parents for: " + quoted(name));
            }
        }
        return {};
    }

    [[nodiscard]] auto make_directories(const fs::path& dir) const -> result<void> {
        fs::path current = root_;
        for (const auto& segment : dir.lexically_relative(root_)) {
            if (segment.empty() || segment == ".") {
                continue;
            }
            current /= segment;
            if (::mkdir(current.c_str(), directory_mode) == 0) {
                continue;
            }
            if (errno != EEXIST) {
                return make_error(error_code::file_write_error,
                                  "mkdir " + current.string() + ": " + std::strerror(errno));
            }
            std::error_code ec;
            if (!fs::is_directory(current, ec)) {
                return make_error(error_code::file_write_error,
                                  "mkdir " + current.string() + ": exists and is not a directory");
            }
        }
        return {};
    }

    [[nodiscard]] auto extract_symlink(const entry_info& entry, const fs::path& target)
        -> result<void> {
        open_entry reader(zip_);
        if (int rc = reader.open(); rc != UNZ_OK) {
            return make_error(error_code::invalid_archive,
                              "open zip entry " + quoted(entry.name) + ": error " +
                                  std::to_string(rc));
        }

        std::string link_target;
        std::vector<char> buffer(4096);
        for (;;) {
            int got = reader.read(buffer.data(), buffer.size());
            if (got < 0) {
                return make_error(error_code::invalid_archive,
                                  "read symlink target: " + quoted(entry.name) + ": error " +
                                      std::to_string(got));
            }
            if (got == 0) {
                break;
            }
            link_target.append(buffer.data(), static_cast<std::size_t>(got));
            if (link_target.size() > max_symlink_target_bytes) {
                return make_error(error_code::symlink_rejected,
                                  "symlink target too long: " + quoted(entry.name));
            }
        }
        if (int rc = reader.close(); rc != UNZ_OK) {
            return make_error(error_code::invalid_archive,
                              "close zip entry " + quoted(entry.name) + ": error " +
                                  std::to_string(rc));
        }

        const auto* ws = " \t\r\n\v\f";
        auto first = link_target.find_first_not_of(ws);
        if (first == std::string::npos) {
            return make_error(error_code::symlink_rejected,
                              "empty symlink target: " + quoted(entry.name));
        }
        link_target = link_target.substr(first, link_target.find_last_not_of(ws) - first + 1);
        if (is_absolute_name(link_target)) {
            return make_error(error_code::symlink_rejected, "absolute symlink target not allowed: " +
                                                                quoted(entry.name) + " -> " +
                                                                quoted(link_target));
        }

        // Judge the link through the parents as they resolve on disk now
        std::error_code ec;
        auto parent = target.parent_path();
        auto parent_real = fs::canonical(parent, ec);
        if (ec) {
            if (ec != std::errc::no_such_file_or_directory) {
                return make_error(error_code::file_access_denied,
                                  "symlink parent resolve error: " + ec.message());
            }
            parent_real = parent;
        }

        auto link_abs = parent_real / target.filename();
        if (!is_within(root_, link_abs)) {
            return make_error(error_code::symlink_rejected,
                              "symlink destination escapes extraction root: " +
                                  quoted(link_abs.string()));
        }
        if (!is_within(root_, parent_real / link_target)) {
            return make_error(error_code::symlink_rejected,
                              "symlink target escapes extraction root: " + quoted(entry.name) +
                                  " -> " + quoted(link_target));
        }

        // Whatever cannot be removed here makes create_symlink fail below
        fs::remove(target, ec);
        fs::create_symlink(link_target, target, ec);
        if (ec) {
            return make_error(error_code::file_write_error,
                              "create symlink " + target.string() + ": " + ec.message());
        }
        ++symlinks_;
        return {};
    }

    [[nodiscard]] auto extract_file(const entry_info& entry, const fs::path& target)
        -> result<void> {
        open_entry reader(zip_);
        if (int rc = reader.open(); rc != UNZ_OK) {
            return make_error(error_code::invalid_archive,
                              "open zip entry " + quoted(entry.name) + ": error " +
                                  std::to_string(rc));
        }

        partial_file out(target);
        if (!out.is_open()) {
            return make_error(error_code::file_write_error,
                              "create temp file for " + target.string() + ": " +
                                  std::strerror(out.open_errno()));
        }
        auto perm = static_cast<mode_t>(entry.mode & 0777);
        out.set_mode(perm != 0 ? perm : default_file_mode);

        std::vector<char> buffer(copy_buffer_size);
        uint64_t written = 0;
        for (;;) {
            int got = reader.read(buffer.data(), buffer.size());
            if (got < 0) {
                return make_error(error_code::invalid_archive,
                                  "read zip entry " + quoted(entry.name) + ": error " +
                                      std::to_string(got));
            }
            if (got == 0) {
                break;
            }
            written += static_cast<uint64_t>(got);
            if (policy_.max_entry_bytes > 0 && written > policy_.max_entry_bytes) {
                return make_error(error_code::entry_too_large,
                                  "zip entry exceeds max size: " + quoted(entry.name));
            }
            if (policy_.max_total_bytes > 0 &&
                total_written_ + written > policy_.max_total_bytes) {
                return make_error(error_code::archive_too_large,
                                  "zip too large uncompressed (actual): " +
                                      std::to_string(total_written_ + written) + " > " +
                                      std::to_string(policy_.max_total_bytes));
            }
            if (auto w = out.write(buffer.data(), static_cast<std::size_t>(got)); !w) {
                return w;
            }
        }
        if (int rc = reader.close(); rc != UNZ_OK) {
            return make_error(error_code::invalid_archive,
                              "close zip entry " + quoted(entry.name) + ": error " +
                                  std::to_string(rc));
        }

        if (auto committed = out.commit(target); !committed) {
            return committed;
        }
        total_written_ += written;
        ++files_;

        if (policy_.preserve_times) {
            apply_times(target, entry.dos_date);
        }
        return {};
    }

    unzFile zip_;
    fs::path root_;
    const extraction_policy& policy_;
    uint64_t total_written_ = 0;
    uint64_t files_ = 0;
    uint64_t directories_ = 0;
    uint64_t symlinks_ = 0;
    uint64_t skipped_ = 0;
};

}  // namespace

auto validate_archive(const fs::path& archive) -> result<void> {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return make_error(error_code::file_not_found,
                          "zip validate open: " + archive.string() + ": no such file");
    }

    unzip_handle zip(unzOpen64(archive.c_str()));
    if (!zip) {
        return make_error(error_code::unexpected_eof, "zip validate: unexpected EOF");
    }
    unz_global_info64 global{};
    if (unzGetGlobalInfo64(zip.get(), &global) != UNZ_OK) {
        return make_error(error_code::unexpected_eof, "zip validate: unexpected EOF");
    }
    return {};
}

auto safe_extractor::extract(const fs::path& archive,
                             const fs::path& destination,
                             const extraction_policy& policy) const -> result<void> {
    const auto started = std::chrono::steady_clock::now();

    unzip_handle zip(unzOpen64(archive.c_str()));
    if (!zip) {
        return make_error(error_code::invalid_archive, "open zip " + archive.string());
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return make_error(error_code::file_write_error,
                          "create " + destination.string() + ": " + ec.message());
    }
    auto root = fs::canonical(fs::absolute(destination, ec), ec);
    if (ec) {
        return make_error(error_code::invalid_file_path,
                          "resolve " + destination.string() + ": " + ec.message());
    }

    unz_global_info64 global{};
    if (unzGetGlobalInfo64(zip.get(), &global) != UNZ_OK) {
        return make_error(error_code::invalid_archive, "read zip central directory");
    }
    if (policy.max_entries > 0 && global.number_entry > policy.max_entries) {
        return make_error(error_code::too_many_entries,
                          "zip too many files: " + std::to_string(global.number_entry));
    }

    extraction_run run(zip.get(), root, policy);
    int rc = unzGoToFirstFile(zip.get());
    while (rc == UNZ_OK) {
        if (auto extracted = run.extract_current(); !extracted) {
            request_log_context ctx;
            ctx.operation = "extract";
            ctx.path = root.string();
            ctx.error_message = extracted.error().message;
            LB_LOG_WARN_CTX(log_category::extract, "extraction stopped", ctx);
            return extracted;
        }
        rc = unzGoToNextFile(zip.get());
    }
    if (rc != UNZ_END_OF_LIST_OF_FILE) {
        return make_error(error_code::invalid_archive,
                          "walk zip entries: error " + std::to_string(rc));
    }

    request_log_context ctx;
    ctx.operation = "extract";
    ctx.path = root.string();
    ctx.bytes = run.total_written();
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started)
            .count());
    LB_LOG_INFO_CTX(log_category::extract,
                    "extracted " + std::to_string(run.files()) + " files, " +
                        std::to_string(run.directories()) + " directories, " +
                        std::to_string(run.symlinks()) + " symlinks (" +
                        std::to_string(run.skipped()) + " skipped)",
                    ctx);
    return {};
}

}  // namespace locbridge::archive
