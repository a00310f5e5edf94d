#include "Pagination.hpp"

namespace GB {

auto paginatedSlug(std::string_view slug, std::size_t pageNum, std::string_view urlSuffix) -> std::string {
    if (pageNum <= 1)
        return std::string(slug);
    auto const number = std::to_string(pageNum);

    static constexpr std::string_view index = "index.html";
    std::string_view                  base  = slug;
    if (base.ends_with("/" + std::string(index)) || base == index)
        base.remove_suffix(index.size());
    if (base.empty() || base.ends_with('/'))
        return std::string(base) + std::string(urlSuffix) + "/" + number + "/index.html";

    auto const lastSlash = base.rfind('/');
    auto const lastDot   = base.rfind('.');
    bool const hasExt    = lastDot != std::string_view::npos && (lastSlash == std::string_view::npos || lastDot > lastSlash + 1);
    if (hasExt) {
        return std::string(base.substr(0, lastDot)) + std::string(urlSuffix) + number + std::string(base.substr(lastDot));
    }
    return std::string(base) + "/" + std::string(urlSuffix) + "/" + number + "/index.html";
}

auto pageCount(std::size_t total, std::size_t perPage) -> std::size_t {
    if (perPage == 0 || total == 0)
        return 1;
    return (total + perPage - 1) / perPage;
}

} // namespace GB
