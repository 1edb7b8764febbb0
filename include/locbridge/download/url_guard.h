/**
 * @file url_guard.h
 * @brief Validation of server-supplied bundle URLs
 */

#ifndef LOCBRIDGE_DOWNLOAD_URL_GUARD_H
#define LOCBRIDGE_DOWNLOAD_URL_GUARD_H

#include "locbridge/core/types.h"

#include <string>
#include <string_view>

namespace locbridge::download {

/**
 * @brief Accept only public https URLs
 *
 * Rejected with url_rejected: schemes other than https, empty hosts,
 * userinfo, fragments, localhost and *.localhost / *.local / *.internal
 * names, and IP literals that are loopback, unspecified, multicast,
 * link-local or private (IPv4-mapped IPv6 forms included).
 *
 * @return The URL as normalized by the parser
 */
[[nodiscard]] auto validate_bundle_url(std::string_view url) -> result<std::string>;

/**
 * @brief Resolve a redirect Location against the URL that returned it
 *
 * Relative locations are resolved against @p base. The target passes
 * through validate_bundle_url() before it is returned.
 */
[[nodiscard]] auto resolve_redirect_url(std::string_view base, std::string_view location)
    -> result<std::string>;

/**
 * @brief True when @p host is an IP literal in a blocked range
 *
 * Hostnames that are not IP literals return false. IPv6 literals may be
 * given with or without brackets.
 */
[[nodiscard]] auto is_blocked_ip_literal(std::string_view host) -> bool;

}  // namespace locbridge::download

#endif  // LOCBRIDGE_DOWNLOAD_URL_GUARD_H
