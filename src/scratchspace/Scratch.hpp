#pragma once
#include "core/Error.hpp"
#include "type/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace SS {

/**
 * Scratch is a writable, thread-safe context for one rendering pass.
 *
 * Every public member acquires the internal reader/writer lock for its full duration, so
 * each call is atomic with respect to all others. Reads take a shared lock, writes an
 * exclusive one. The order in which concurrent writers to one key are applied is
 * unspecified.
 *
 * A key used with setInMap holds a Mapping; mixing map writes with scalar or sequence
 * accumulation on the same key is rejected with Error::Code::TypeMismatch.
 */
class Scratch {
public:
    Scratch() = default;
    ~Scratch() = default;

    Scratch(Scratch const&)            = delete;
    Scratch& operator=(Scratch const&) = delete;
    Scratch(Scratch&&)                 = delete;
    Scratch& operator=(Scratch&&)      = delete;

    /**
     * @brief Accumulates addend into the value stored under key.
     *
     * Absent keys take addend verbatim. Sequences are extended (a sequence addend is
     * flattened one level). Scalars are combined with Operator::Add.
     * @return std::nullopt on success; ArithmeticError or TypeMismatch otherwise, in which case
     *         the stored value is left untouched.
     */
    auto add(std::string const& key, Value addend) -> std::optional<Error>;

    /**
     * @brief Stores value under key, replacing whatever was there.
     */
    auto set(std::string const& key, Value value) -> void;

    /**
     * @brief Returns a copy of the value stored under key, or std::nullopt if there is none.
     */
    [[nodiscard]] auto get(std::string const& key) const -> std::optional<Value>;

    /**
     * @brief Sets mapKey inside the mapping stored under key, creating the mapping on first use.
     * @return TypeMismatch if key already holds something other than a mapping.
     */
    auto setInMap(std::string const& key, std::string mapKey, Value value) -> std::optional<Error>;

    /**
     * @brief Values of the mapping under key, ordered by ascending map key.
     * @return std::nullopt for an absent key; TypeMismatch if key does not hold a mapping.
     */
    [[nodiscard]] auto getSortedMapValues(std::string const& key) const -> Expected<std::optional<Sequence>>;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto contains(std::string const& key) const -> bool;

private:
    static auto accumulate(Value& existing, Value addend) -> std::optional<Error>;

    mutable std::shared_mutex              mutex;
    std::unordered_map<std::string, Value> values;
};

// Fresh, empty scratch for hosts that share one context between render tasks.
[[nodiscard]] auto makeScratch() -> std::shared_ptr<Scratch>;

} // namespace SS
