#include "Value.hpp"

#include <charconv>
#include <type_traits>

namespace GB {

auto FlowBlock::get(std::string_view name) const -> Value const* {
    for (auto const& [key, value] : this->fields) {
        if (key == name)
            return &value;
    }
    return nullptr;
}

auto isNull(Value const& value) -> bool {
    return std::holds_alternative<std::monostate>(value);
}

auto isEmpty(Value const& value) -> bool {
    return std::visit(
            [](auto const& v) -> bool {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return true;
                } else if constexpr (std::is_same_v<T, bool>) {
                    return !v;
                } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                    return v == 0;
                } else if constexpr (std::is_same_v<T, std::shared_ptr<Flow>>) {
                    return !v || v->blocks.empty();
                } else {
                    return v.empty();
                }
            },
            value);
}

auto isScalar(Value const& value) -> bool {
    return !std::holds_alternative<std::vector<std::string>>(value) && !std::holds_alternative<std::shared_ptr<Flow>>(value);
}

namespace {

auto doubleToString(double d) -> std::string {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d);
    if (ec != std::errc{})
        return std::to_string(d);
    return std::string(buffer, end);
}

auto typeRank(Value const& value) -> int {
    switch (value.index()) {
    case 0:
        return 0;
    case 1:
        return 1;
    case 2:
    case 3:
        return 2;
    case 4:
        return 3;
    case 5:
        return 4;
    default:
        return 5;
    }
}

auto asNumber(Value const& value) -> double {
    if (auto const* i = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*i);
    return std::get<double>(value);
}

template <typename T>
auto threeWay(T const& a, T const& b) -> int {
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

} // namespace

auto toString(Value const& value) -> std::string {
    return std::visit(
            [](auto const& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return {};
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    return doubleToString(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    std::string joined;
                    for (std::size_t i = 0; i < v.size(); ++i) {
                        if (i > 0)
                            joined += ", ";
                        joined += v[i];
                    }
                    return joined;
                } else {
                    return "<flow:" + std::to_string(v ? v->blocks.size() : 0) + ">";
                }
            },
            value);
}

auto compareValues(Value const& a, Value const& b) -> int {
    auto const rankA = typeRank(a);
    auto const rankB = typeRank(b);
    if (rankA != rankB)
        return threeWay(rankA, rankB);
    switch (rankA) {
    case 0:
        return 0;
    case 1:
        return threeWay(std::get<bool>(a), std::get<bool>(b));
    case 2:
        return threeWay(asNumber(a), asNumber(b));
    case 3:
        return threeWay(std::get<std::string>(a), std::get<std::string>(b));
    case 4:
        return threeWay(std::get<std::vector<std::string>>(a), std::get<std::vector<std::string>>(b));
    default: {
        auto const& fa = std::get<std::shared_ptr<Flow>>(a);
        auto const& fb = std::get<std::shared_ptr<Flow>>(b);
        return threeWay(fa ? fa->blocks.size() : 0, fb ? fb->blocks.size() : 0);
    }
    }
}

auto valueTypeName(Value const& value) -> std::string_view {
    switch (value.index()) {
    case 0:
        return "null";
    case 1:
        return "bool";
    case 2:
        return "integer";
    case 3:
        return "float";
    case 4:
        return "string";
    case 5:
        return "strings";
    default:
        return "flow";
    }
}

} // namespace GB
