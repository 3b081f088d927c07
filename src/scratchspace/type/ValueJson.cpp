#include "ValueJson.hpp"

#include <cstdint>
#include <limits>
#include <variant>

namespace SS {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

auto toJson(Value const& value) -> nlohmann::json {
    return std::visit(
            Overloaded{
                    [](std::int64_t v) -> nlohmann::json { return v; },
                    [](std::uint64_t v) -> nlohmann::json { return v; },
                    [](double v) -> nlohmann::json { return v; },
                    [](bool v) -> nlohmann::json { return v; },
                    [](std::string const& v) -> nlohmann::json { return v; },
                    [](Sequence const& v) -> nlohmann::json {
                        auto array = nlohmann::json::array();
                        for (auto const& element : v)
                            array.push_back(toJson(element));
                        return array;
                    },
                    [](Mapping const& v) -> nlohmann::json {
                        auto object = nlohmann::json::object();
                        for (auto const& key : v.sortedKeys())
                            object[key] = toJson(*v.find(key));
                        return object;
                    }},
            value.storage());
}

auto fromJson(nlohmann::json const& json) -> Expected<Value> {
    switch (json.type()) {
    case nlohmann::json::value_t::boolean:
        return Value{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
        return Value{json.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned: {
        auto const v = json.get<std::uint64_t>();
        if (v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return Value{static_cast<std::int64_t>(v)};
        return Value{v};
    }
    case nlohmann::json::value_t::number_float:
        return Value{json.get<double>()};
    case nlohmann::json::value_t::string:
        return Value{json.get<std::string>()};
    case nlohmann::json::value_t::array: {
        Sequence sequence;
        sequence.reserve(json.size());
        for (auto const& element : json) {
            auto converted = fromJson(element);
            if (!converted)
                return std::unexpected(converted.error());
            sequence.push_back(std::move(*converted));
        }
        return Value{std::move(sequence)};
    }
    case nlohmann::json::value_t::object: {
        Mapping mapping;
        for (auto const& [key, element] : json.items()) {
            auto converted = fromJson(element);
            if (!converted)
                return std::unexpected(converted.error());
            mapping.set(key, std::move(*converted));
        }
        return Value{std::move(mapping)};
    }
    case nlohmann::json::value_t::null:
        return std::unexpected(Error{Error::Code::MalformedInput, "null has no scratch value representation"});
    case nlohmann::json::value_t::binary:
    case nlohmann::json::value_t::discarded:
        break;
    }
    return std::unexpected(Error{Error::Code::InvalidType, std::string{"unsupported json type "} + json.type_name()});
}

auto describeValue(Value const& value) -> std::string {
    return toJson(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace SS
