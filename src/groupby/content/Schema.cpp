#include "Schema.hpp"

#include <algorithm>
#include <cctype>

namespace GB {

auto boolFromString(std::string_view value) -> std::optional<bool> {
    std::string lowered{value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "yes" || lowered == "1" || lowered == "on")
        return true;
    if (lowered == "false" || lowered == "no" || lowered == "0" || lowered == "off")
        return false;
    return std::nullopt;
}

auto FieldDef::hasAttribute(std::string_view attribute) const -> bool {
    auto it = this->options.find(std::string(attribute));
    if (it == this->options.end())
        return false;
    return boolFromString(it->second).value_or(false);
}

auto Schema::addModel(Model model) -> void {
    auto id = model.id;
    this->models_.insert_or_assign(std::move(id), std::move(model));
}

auto Schema::addFlowBlock(FlowBlockModel block) -> void {
    auto id = block.id;
    this->flowBlocks_.insert_or_assign(std::move(id), std::move(block));
}

auto Schema::model(std::string_view id) const -> Model const* {
    auto it = this->models_.find(id);
    return it == this->models_.end() ? nullptr : &it->second;
}

} // namespace GB
