#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace GB {

/**
 * Slug of page `pageNum` (1-based) for a group slug. Page 1 keeps the slug.
 *   "tags/a/"           -> "tags/a/page/2/index.html"
 *   "tags/a/index.html" -> "tags/a/page/2/index.html"
 *   "tags/a.html"       -> "tags/apage2.html"
 *   "tags/a"            -> "tags/a/page/2/index.html"
 */
auto paginatedSlug(std::string_view slug, std::size_t pageNum, std::string_view urlSuffix) -> std::string;

// Number of pages for `total` items; never less than one.
auto pageCount(std::size_t total, std::size_t perPage) -> std::size_t;

} // namespace GB
