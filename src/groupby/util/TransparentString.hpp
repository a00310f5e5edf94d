#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace GB {

// Heterogeneous lookup hash so maps keyed by std::string accept std::string_view.
struct TransparentStringHash {
    using is_transparent = void;

    auto operator()(std::string_view value) const noexcept -> std::size_t {
        return phmap::Hash<std::string_view>{}(value);
    }
    auto operator()(std::string const& value) const noexcept -> std::size_t {
        return phmap::Hash<std::string_view>{}(std::string_view{value});
    }
    auto operator()(char const* value) const noexcept -> std::size_t {
        return phmap::Hash<std::string_view>{}(std::string_view{value});
    }
};

} // namespace GB
