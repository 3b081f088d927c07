#include "Value.hpp"

#include <algorithm>

namespace SS {

Mapping::Mapping() : entries_(std::make_unique<Entries>()) {}

Mapping::Mapping(Mapping const& other)
    : entries_(std::make_unique<Entries>(other.entries())) {}

Mapping::Mapping(Mapping&& other) noexcept = default;

auto Mapping::operator=(Mapping const& other) -> Mapping& {
    if (this != &other)
        this->entries_ = std::make_unique<Entries>(other.entries());
    return *this;
}

auto Mapping::operator=(Mapping&& other) noexcept -> Mapping& = default;

Mapping::~Mapping() = default;

auto Mapping::set(std::string key, Value value) -> void {
    if (!this->entries_)
        this->entries_ = std::make_unique<Entries>();
    this->entries_->insert_or_assign(std::move(key), std::move(value));
}

auto Mapping::find(std::string const& key) const -> Value const* {
    if (!this->entries_)
        return nullptr;
    auto it = this->entries_->find(key);
    return it == this->entries_->end() ? nullptr : &it->second;
}

auto Mapping::size() const -> std::size_t {
    return this->entries_ ? this->entries_->size() : 0;
}

auto Mapping::empty() const -> bool {
    return this->size() == 0;
}

auto Mapping::sortedKeys() const -> std::vector<std::string> {
    std::vector<std::string> keys;
    keys.reserve(this->size());
    for (auto const& [key, value] : this->entries())
        keys.push_back(key);
    std::sort(keys.begin(), keys.end());
    return keys;
}

auto Mapping::sortedValues() const -> Sequence {
    Sequence sorted;
    sorted.reserve(this->size());
    for (auto const& key : this->sortedKeys())
        sorted.push_back(this->entries_->at(key));
    return sorted;
}

auto Mapping::entries() const -> Entries const& {
    static Entries const empty{};
    return this->entries_ ? *this->entries_ : empty;
}

auto operator==(Mapping const& lhs, Mapping const& rhs) -> bool {
    return lhs.entries() == rhs.entries();
}

auto Value::isNumeric() const noexcept -> bool {
    switch (this->kind()) {
    case Kind::Integer:
    case Kind::Unsigned:
    case Kind::Float:
        return true;
    case Kind::Boolean:
    case Kind::Text:
    case Kind::Sequence:
    case Kind::Mapping:
        return false;
    }
    return false;
}

auto Value::isScalar() const noexcept -> bool {
    return this->kind() != Kind::Sequence && this->kind() != Kind::Mapping;
}

auto operator==(Value const& lhs, Value const& rhs) -> bool {
    return lhs.storage_ == rhs.storage_;
}

auto kindName(Value::Kind kind) -> std::string_view {
    switch (kind) {
    case Value::Kind::Integer:
        return "integer";
    case Value::Kind::Unsigned:
        return "unsigned";
    case Value::Kind::Float:
        return "float";
    case Value::Kind::Boolean:
        return "boolean";
    case Value::Kind::Text:
        return "text";
    case Value::Kind::Sequence:
        return "sequence";
    case Value::Kind::Mapping:
        return "mapping";
    }
    return "unknown";
}

} // namespace SS
