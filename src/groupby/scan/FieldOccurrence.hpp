#pragma once
#include "content/Record.hpp"
#include "content/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace GB {

// Location of a watched value: a record field, or one field of one flow block.
struct FieldKeyPath {
    std::string                fieldKey;
    std::optional<std::size_t> flowIndex;
    std::optional<std::string> flowKey;

    bool operator==(FieldKeyPath const&) const = default;
};

struct FieldOccurrence {
    std::shared_ptr<Record> record;
    FieldKeyPath            key;
    Value                   field;
};

} // namespace GB
