/**
 * @file http_transport.cpp
 * @brief Header and URL parsing shared by transports
 */

#include <kcenon/bulk_download/transport/http_transport.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kcenon::bulk_download {

namespace {

auto parse_u64(std::string_view text) -> std::optional<uint64_t> {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto parse_content_range(std::string_view value)
    -> std::optional<std::pair<uint64_t, std::optional<uint64_t>>> {
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);

    constexpr std::string_view unit = "bytes";
    if (value.size() < unit.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < unit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != unit[i]) {
            return std::nullopt;
        }
    }
    value.remove_prefix(unit.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto start = parse_u64(value.substr(0, dash));
    auto end = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    auto total_text = value.substr(slash + 1);
    while (!total_text.empty() && total_text.front() == ' ') total_text.remove_prefix(1);
    while (!total_text.empty() && total_text.back() == ' ') total_text.remove_suffix(1);

    std::optional<uint64_t> total;
    if (total_text != "*") {
        total = parse_u64(total_text);
        if (!total) {
            return std::nullopt;
        }
    }
    return std::make_pair(*start, total);
}

auto url_host(std::string_view url) -> std::string {
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
    }
    auto end = url.find_first_of("/?#");
    auto authority = url.substr(0, end);

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string host(authority);
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

}  // namespace kcenon::bulk_download
