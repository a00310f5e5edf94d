#include "Slugify.hpp"

#include <cctype>

namespace GB {

auto slugify(std::string_view text) -> std::string {
    std::string slug;
    slug.reserve(text.size());
    bool pendingDash = false;
    for (unsigned char ch : text) {
        // Bytes >= 0x80 belong to UTF-8 sequences and are kept verbatim.
        if (std::isalnum(ch) || ch == '_' || ch >= 0x80) {
            if (pendingDash && !slug.empty())
                slug.push_back('-');
            pendingDash = false;
            slug.push_back(ch < 0x80 ? static_cast<char>(std::tolower(ch)) : static_cast<char>(ch));
        } else {
            pendingDash = true;
        }
    }
    return slug;
}

auto strip(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto split_strip(std::string_view text, std::string_view delimiter) -> std::vector<std::string> {
    std::vector<std::string> items;
    if (delimiter.empty()) {
        auto item = strip(text);
        if (!item.empty())
            items.emplace_back(item);
        return items;
    }
    while (true) {
        auto const pos  = text.find(delimiter);
        auto       item = strip(text.substr(0, pos));
        if (!item.empty())
            items.emplace_back(item);
        if (pos == std::string_view::npos)
            break;
        text.remove_prefix(pos + delimiter.size());
    }
    return items;
}

} // namespace GB
