#include "Scratch.hpp"
#include "core/Arithmetic.hpp"
#include "log/TaggedLogger.hpp"

#include <iterator>
#include <mutex>
#include <string>

namespace SS {

auto Scratch::add(std::string const& key, Value addend) -> std::optional<Error> {
    ss_log("Scratch::add", "Function Called");
    std::unique_lock lock(this->mutex);

    auto it = this->values.find(key);
    if (it == this->values.end()) {
        ss_log("add: new key " + key + " (" + std::string{kindName(addend.kind())} + ")", "Scratch");
        this->values.emplace(key, std::move(addend));
        return std::nullopt;
    }

    if (auto error = accumulate(it->second, std::move(addend))) {
        ss_log("add: rejected for key " + key + ": " + describeError(*error), "Scratch");
        return error;
    }
    return std::nullopt;
}

auto Scratch::accumulate(Value& existing, Value addend) -> std::optional<Error> {
    if (auto* sequence = existing.asSequence()) {
        if (auto* tail = addend.asSequence()) {
            sequence->insert(sequence->end(), std::make_move_iterator(tail->begin()), std::make_move_iterator(tail->end()));
        } else {
            sequence->push_back(std::move(addend));
        }
        return std::nullopt;
    }

    if (existing.isMapping() || addend.isMapping()) {
        return Error{Error::Code::TypeMismatch,
                     std::string{"can't accumulate "} + std::string{kindName(addend.kind())} + " into "
                             + std::string{kindName(existing.kind())} + "; use setInMap for mappings"};
    }

    auto combined = doArithmetic(existing, addend, Operator::Add);
    if (!combined)
        return combined.error();
    existing = std::move(*combined);
    return std::nullopt;
}

auto Scratch::set(std::string const& key, Value value) -> void {
    ss_log("Scratch::set", "Function Called");
    std::unique_lock lock(this->mutex);
    this->values.insert_or_assign(key, std::move(value));
}

auto Scratch::get(std::string const& key) const -> std::optional<Value> {
    std::shared_lock lock(this->mutex);
    auto it = this->values.find(key);
    if (it == this->values.end())
        return std::nullopt;
    return it->second;
}

auto Scratch::setInMap(std::string const& key, std::string mapKey, Value value) -> std::optional<Error> {
    ss_log("Scratch::setInMap", "Function Called");
    std::unique_lock lock(this->mutex);

    auto it = this->values.find(key);
    if (it == this->values.end())
        it = this->values.emplace(key, Mapping{}).first;

    auto* mapping = it->second.asMapping();
    if (!mapping) {
        ss_log("setInMap: key " + key + " holds " + std::string{kindName(it->second.kind())}, "Scratch");
        return Error{Error::Code::TypeMismatch,
                     "key '" + key + "' holds a " + std::string{kindName(it->second.kind())} + ", not a mapping"};
    }
    mapping->set(std::move(mapKey), std::move(value));
    return std::nullopt;
}

auto Scratch::getSortedMapValues(std::string const& key) const -> Expected<std::optional<Sequence>> {
    std::shared_lock lock(this->mutex);
    auto it = this->values.find(key);
    if (it == this->values.end())
        return std::optional<Sequence>{};

    auto const* mapping = it->second.asMapping();
    if (!mapping) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "key '" + key + "' holds a " + std::string{kindName(it->second.kind())} + ", not a mapping"});
    }
    return std::optional<Sequence>{mapping->sortedValues()};
}

auto Scratch::size() const -> std::size_t {
    std::shared_lock lock(this->mutex);
    return this->values.size();
}

auto Scratch::contains(std::string const& key) const -> bool {
    std::shared_lock lock(this->mutex);
    return this->values.contains(key);
}

auto makeScratch() -> std::shared_ptr<Scratch> {
    return std::make_shared<Scratch>();
}

} // namespace SS
