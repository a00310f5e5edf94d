#include "Record.hpp"

#include "path/UrlUtils.hpp"

namespace GB {

Record::Record(std::string path, std::string modelId, Fields fields)
    : path_(normalize_path(path)), modelId_(std::move(modelId)), fields_(std::move(fields)) {}

auto Record::field(std::string_view name) const -> Value {
    std::lock_guard<std::mutex> lock(this->fieldsMutex_);
    for (auto const& [key, value] : this->fields_) {
        if (key == name)
            return value;
    }
    return {};
}

auto Record::hasField(std::string_view name) const -> bool {
    std::lock_guard<std::mutex> lock(this->fieldsMutex_);
    for (auto const& entry : this->fields_) {
        if (entry.first == name)
            return true;
    }
    return false;
}

auto Record::fieldNames() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->fieldsMutex_);
    std::vector<std::string>    names;
    names.reserve(this->fields_.size());
    for (auto const& entry : this->fields_)
        names.push_back(entry.first);
    return names;
}

auto Record::setField(std::string_view name, Value value) -> void {
    std::lock_guard<std::mutex> lock(this->fieldsMutex_);
    for (auto& entry : this->fields_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    this->fields_.emplace_back(std::string(name), std::move(value));
}

auto Record::sourceFilenames() const -> std::vector<std::string> {
    return {this->path_};
}

} // namespace GB
