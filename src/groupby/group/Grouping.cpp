#include "Grouping.hpp"

#include "util/Slugify.hpp"

namespace GB {

auto FunctionGrouping::produceKeys(FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> {
    if (!this->produce_)
        return std::vector<KeyYield>{};
    return this->produce_(occurrence);
}

auto FunctionGrouping::onResolved(FieldOccurrence& occurrence, KeyYield const& yielded, GroupHandle& group) -> Expected<void> {
    if (!this->resolved_)
        return {};
    return this->resolved_(occurrence, yielded, group);
}

namespace {

class SplitGrouping final : public GroupingCallback {
public:
    explicit SplitGrouping(std::optional<std::string> split)
        : split_(std::move(split)) {}

    auto produceKeys(FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> override {
        std::vector<KeyYield> keys;
        auto const&           value = occurrence.field;
        if (auto const* text = std::get_if<std::string>(&value); text && !text->empty()) {
            if (this->split_ && !this->split_->empty()) {
                for (auto& item : split_strip(*text, *this->split_))
                    keys.emplace_back(std::move(item));
            } else {
                keys.emplace_back(*text);
            }
            return keys;
        }
        if (std::holds_alternative<bool>(value) || std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value)) {
            keys.emplace_back(value);
            return keys;
        }
        if (auto const* list = std::get_if<std::vector<std::string>>(&value); list && !list->empty()) {
            for (auto const& item : *list)
                keys.emplace_back(item);
            return keys;
        }
        if (isEmpty(value)) {
            keys.emplace_back(Value{});
            return keys;
        }
        return std::unexpected(Error{Error::Code::InvalidYield,
                                     "cannot derive keys from a " + std::string(valueTypeName(value)) + " in field '" + occurrence.key.fieldKey + "'"});
    }

private:
    std::optional<std::string> split_;
};

} // namespace

auto makeSplitGrouping(std::optional<std::string> split) -> std::shared_ptr<GroupingCallback> {
    return std::make_shared<SplitGrouping>(std::move(split));
}

} // namespace GB
