#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace SS {

class Value;

using Sequence = std::vector<Value>;

/**
 * String keyed table of values stored under a single scratch key.
 *
 * Entries are kept unordered; callers that need a stable order use sortedKeys() or
 * sortedValues(), which order by byte-wise ascending key. Copies are deep.
 * A moved-from Mapping behaves as an empty one.
 */
class Mapping {
public:
    using Entries = std::unordered_map<std::string, Value>;

    Mapping();
    Mapping(Mapping const& other);
    Mapping(Mapping&& other) noexcept;
    auto operator=(Mapping const& other) -> Mapping&;
    auto operator=(Mapping&& other) noexcept -> Mapping&;
    ~Mapping();

    // Insert or overwrite the entry for key.
    auto set(std::string key, Value value) -> void;
    // Returns nullptr when key has no entry.
    [[nodiscard]] auto find(std::string const& key) const -> Value const*;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto sortedKeys() const -> std::vector<std::string>;
    [[nodiscard]] auto sortedValues() const -> Sequence;
    [[nodiscard]] auto entries() const -> Entries const&;

    friend auto operator==(Mapping const& lhs, Mapping const& rhs) -> bool;

private:
    std::unique_ptr<Entries> entries_;
};

/**
 * Dynamically typed scratch value.
 *
 * The alternatives are ordered to match Kind so kind() is the variant index.
 */
class Value {
public:
    enum class Kind {
        Integer = 0,
        Unsigned,
        Float,
        Boolean,
        Text,
        Sequence,
        Mapping
    };

    using Storage = std::variant<std::int64_t, std::uint64_t, double, bool, std::string, SS::Sequence, SS::Mapping>;

    Value() = delete;

    template <std::signed_integral T>
    Value(T v) : storage_(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(v)) {}

    template <std::unsigned_integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : storage_(std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(v)) {}

    Value(double v) : storage_(std::in_place_type<double>, v) {}
    Value(float v) : storage_(std::in_place_type<double>, static_cast<double>(v)) {}
    Value(bool v) : storage_(std::in_place_type<bool>, v) {}
    Value(std::string v) : storage_(std::in_place_type<std::string>, std::move(v)) {}
    Value(std::string_view v) : storage_(std::in_place_type<std::string>, v) {}
    Value(char const* v) : storage_(std::in_place_type<std::string>, v) {}
    Value(SS::Sequence v) : storage_(std::in_place_type<SS::Sequence>, std::move(v)) {}
    Value(SS::Mapping v) : storage_(std::in_place_type<SS::Mapping>, std::move(v)) {}

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(this->storage_.index()); }
    [[nodiscard]] auto storage() const noexcept -> Storage const& { return this->storage_; }

    [[nodiscard]] auto isNumeric() const noexcept -> bool;
    [[nodiscard]] auto isScalar() const noexcept -> bool;
    [[nodiscard]] auto isSequence() const noexcept -> bool { return this->kind() == Kind::Sequence; }
    [[nodiscard]] auto isMapping() const noexcept -> bool { return this->kind() == Kind::Mapping; }

    // Typed views; nullptr when the value holds another alternative.
    [[nodiscard]] auto asInteger() const noexcept -> std::int64_t const* { return std::get_if<std::int64_t>(&this->storage_); }
    [[nodiscard]] auto asUnsigned() const noexcept -> std::uint64_t const* { return std::get_if<std::uint64_t>(&this->storage_); }
    [[nodiscard]] auto asFloat() const noexcept -> double const* { return std::get_if<double>(&this->storage_); }
    [[nodiscard]] auto asBoolean() const noexcept -> bool const* { return std::get_if<bool>(&this->storage_); }
    [[nodiscard]] auto asText() const noexcept -> std::string const* { return std::get_if<std::string>(&this->storage_); }
    [[nodiscard]] auto asSequence() const noexcept -> SS::Sequence const* { return std::get_if<SS::Sequence>(&this->storage_); }
    [[nodiscard]] auto asSequence() noexcept -> SS::Sequence* { return std::get_if<SS::Sequence>(&this->storage_); }
    [[nodiscard]] auto asMapping() const noexcept -> SS::Mapping const* { return std::get_if<SS::Mapping>(&this->storage_); }
    [[nodiscard]] auto asMapping() noexcept -> SS::Mapping* { return std::get_if<SS::Mapping>(&this->storage_); }

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool;

private:
    Storage storage_;
};

[[nodiscard]] auto kindName(Value::Kind kind) -> std::string_view;

} // namespace SS
