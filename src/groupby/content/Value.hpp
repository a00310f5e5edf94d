#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace GB {

struct Flow;

/**
 * A record field value as handed out by the host content model.
 *
 * Alternatives:
 * - std::monostate: null / absent
 * - bool, std::int64_t, double, std::string: scalars
 * - std::vector<std::string>: a "strings" field (one entry per line)
 * - std::shared_ptr<Flow>: a sequence of nested flow blocks
 */
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::string>, std::shared_ptr<Flow>>;

struct FlowBlock {
    std::string                                 type;
    std::vector<std::pair<std::string, Value>>  fields;

    auto get(std::string_view name) const -> Value const*;
};

struct Flow {
    std::vector<FlowBlock> blocks;
};

[[nodiscard]] auto isNull(Value const& value) -> bool;

// Null, empty string, empty list, empty flow, false, 0 and 0.0.
[[nodiscard]] auto isEmpty(Value const& value) -> bool;

// Scalars only; lists and flows have no canonical string form.
[[nodiscard]] auto isScalar(Value const& value) -> bool;

// String form of a scalar: "" for null, "true"/"false", decimal numbers.
// Lists are joined with ", "; a flow renders as "<flow:N>".
[[nodiscard]] auto toString(Value const& value) -> std::string;

// Ordering used by order_by: null < bool < numbers < strings < lists < flows.
// Numbers compare by numeric value across int and double.
[[nodiscard]] auto compareValues(Value const& a, Value const& b) -> int;

[[nodiscard]] auto valueTypeName(Value const& value) -> std::string_view;

} // namespace GB
