/**
 * @file timeout_policy.cpp
 * @brief Implementation of adaptive timeout selection
 */

#include <kcenon/bulk_download/core/timeout_policy.h>

#include <algorithm>
#include <cctype>

namespace kcenon::bulk_download {

auto extension_of(std::string_view name) -> std::string {
    auto cut = name.find_first_of("?#");
    auto base = name.substr(0, cut);

    auto last_sep = base.find_last_of("/\\");
    if (last_sep != std::string_view::npos) {
        base = base.substr(last_sep + 1);
    }

    auto dot = base.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }

    std::string ext(base.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

auto timeout_policy::categorize(std::string_view name) const -> file_category {
    auto ext = extension_of(name);
    if (long_extensions.count(ext) > 0) {
        return file_category::long_transfer;
    }
    if (medium_extensions.count(ext) > 0) {
        return file_category::medium_transfer;
    }
    return file_category::short_transfer;
}

auto timeout_policy::envelope_for(file_category category) const -> const timeout_envelope& {
    switch (category) {
        case file_category::long_transfer:
            return long_envelope;
        case file_category::medium_transfer:
            return medium_envelope;
        case file_category::short_transfer:
        default:
            return short_envelope;
    }
}

auto timeout_policy::select(std::string_view filename, std::string_view url) const
    -> const timeout_envelope& {
    if (extension_of(filename).empty() && !url.empty()) {
        return envelope_for(categorize(url));
    }
    return envelope_for(categorize(filename));
}

}  // namespace kcenon::bulk_download
