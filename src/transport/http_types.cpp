/**
 * @file http_types.cpp
 * @brief HTTP helper types
 */

#include "locbridge/transport/http_types.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace locbridge::transport {

auto find_header(const header_list& headers, std::string_view name)
    -> std::optional<std::string> {
    auto equals = [name](const std::string& candidate) {
        return candidate.size() == name.size() &&
               std::equal(candidate.begin(), candidate.end(), name.begin(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };
    for (const auto& [key, value] : headers) {
        if (equals(key)) {
            return value;
        }
    }
    return std::nullopt;
}

auto string_body_reader::read(char* buffer, std::size_t size) -> result<std::size_t> {
    auto n = std::min(size, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

}  // namespace locbridge::transport
