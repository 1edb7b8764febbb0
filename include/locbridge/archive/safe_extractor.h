/**
 * @file safe_extractor.h
 * @brief Policy-bound extraction of untrusted ZIP archives
 */

#ifndef LOCBRIDGE_ARCHIVE_SAFE_EXTRACTOR_H
#define LOCBRIDGE_ARCHIVE_SAFE_EXTRACTOR_H

#include "locbridge/core/types.h"

#include <cstdint>
#include <filesystem>

namespace locbridge::archive {

/**
 * @brief Limits applied while unpacking one archive
 *
 * A zero limit disables that check.
 */
struct extraction_policy {
    uint64_t max_entries = 20000;
    uint64_t max_total_bytes = 2ULL << 30;  // 2 GiB
    uint64_t max_entry_bytes = 512ULL << 20;  // 512 MiB
    bool allow_symlinks = false;
    bool preserve_times = false;
};

/**
 * @brief Largest symlink target accepted from an archive
 */
inline constexpr std::size_t max_symlink_target_bytes = 1 << 20;

/**
 * @brief Check that @p archive opens as a ZIP file
 *
 * A missing central directory or a truncated file is reported as
 * unexpected_eof so the downloader retries it like a short read.
 */
[[nodiscard]] auto validate_archive(const std::filesystem::path& archive) -> result<void>;

/**
 * @brief Unpacks ZIP archives without letting entries leave the destination
 *
 * Entry names are normalized ('\\' becomes '/'). Names holding NUL, absolute
 * names, drive prefixes and names still containing ".." after lexical
 * cleaning are rejected, as is any target not inside the symlink-resolved
 * destination root. Existing path components are checked for symlinks that
 * lead out of the root.
 *
 * Device, FIFO and socket entries are skipped. Symlinks are skipped unless
 * the policy allows them, and then must be relative and resolve inside the
 * root. Regular files are written to "<name>.partial-XXXXXX" beside the
 * target and renamed into place once complete, so a failed extraction never
 * leaves a partial file under the final name.
 *
 * @code
 * archive::safe_extractor extractor;
 * if (auto r = extractor.extract("bundle.zip", "locales", {}); !r) {
 *     std::cerr << r.error().message << "\n";
 * }
 * @endcode
 */
class safe_extractor {
public:
    [[nodiscard]] auto extract(const std::filesystem::path& archive,
                               const std::filesystem::path& destination,
                               const extraction_policy& policy) const -> result<void>;
};

}  // namespace locbridge::archive

#endif  // LOCBRIDGE_ARCHIVE_SAFE_EXTRACTOR_H
