#include "Arithmetic.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace SS {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto incompatible(Value const& lhs, Value const& rhs, Operator op) -> std::unexpected<Error> {
    std::string message = "can't apply operator '";
    message.push_back(operatorSymbol(op));
    message += "' to ";
    message += kindName(lhs.kind());
    message += " and ";
    message += kindName(rhs.kind());
    ss_log(message, "Arithmetic");
    return std::unexpected(Error{Error::Code::ArithmeticError, std::move(message)});
}

auto divisionByZero() -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::ArithmeticError, "integer division by zero"});
}

// Signed results are computed in unsigned arithmetic so overflow wraps instead of being UB.
auto combineIntegers(std::int64_t a, std::int64_t b, Operator op) -> Expected<Value> {
    auto const ua = static_cast<std::uint64_t>(a);
    auto const ub = static_cast<std::uint64_t>(b);
    switch (op) {
    case Operator::Add:
        return Value{static_cast<std::int64_t>(ua + ub)};
    case Operator::Subtract:
        return Value{static_cast<std::int64_t>(ua - ub)};
    case Operator::Multiply:
        return Value{static_cast<std::int64_t>(ua * ub)};
    case Operator::Divide:
        if (b == 0)
            return divisionByZero();
        if (b == -1)
            return Value{static_cast<std::int64_t>(std::uint64_t{0} - ua)};
        return Value{a / b};
    }
    return std::unexpected(Error{Error::Code::NotSupported, "unknown operator"});
}

auto combineUnsigned(std::uint64_t a, std::uint64_t b, Operator op) -> Expected<Value> {
    switch (op) {
    case Operator::Add:
        return Value{a + b};
    case Operator::Subtract:
        return Value{a - b};
    case Operator::Multiply:
        return Value{a * b};
    case Operator::Divide:
        if (b == 0)
            return divisionByZero();
        return Value{a / b};
    }
    return std::unexpected(Error{Error::Code::NotSupported, "unknown operator"});
}

auto combineFloats(double a, double b, Operator op) -> Expected<Value> {
    switch (op) {
    case Operator::Add:
        return Value{a + b};
    case Operator::Subtract:
        return Value{a - b};
    case Operator::Multiply:
        return Value{a * b};
    case Operator::Divide:
        return Value{a / b};
    }
    return std::unexpected(Error{Error::Code::NotSupported, "unknown operator"});
}

auto combineMixed(std::int64_t a, std::uint64_t b, Operator op) -> Expected<Value> {
    if (a >= 0)
        return combineUnsigned(static_cast<std::uint64_t>(a), b, op);
    return combineFloats(static_cast<double>(a), static_cast<double>(b), op);
}

auto combineMixed(std::uint64_t a, std::int64_t b, Operator op) -> Expected<Value> {
    if (b >= 0)
        return combineUnsigned(a, static_cast<std::uint64_t>(b), op);
    return combineFloats(static_cast<double>(a), static_cast<double>(b), op);
}

auto combineText(std::string const& a, std::string const& b, Value const& lhs, Value const& rhs, Operator op) -> Expected<Value> {
    if (op != Operator::Add)
        return incompatible(lhs, rhs, op);
    std::string joined;
    joined.reserve(a.size() + b.size());
    joined.append(a);
    joined.append(b);
    return Value{std::move(joined)};
}

} // namespace

auto operatorSymbol(Operator op) -> char {
    switch (op) {
    case Operator::Add:
        return '+';
    case Operator::Subtract:
        return '-';
    case Operator::Multiply:
        return '*';
    case Operator::Divide:
        return '/';
    }
    return '?';
}

auto doArithmetic(Value const& lhs, Value const& rhs, Operator op) -> Expected<Value> {
    return std::visit(
            Overloaded{
                    [&](std::int64_t a, std::int64_t b) -> Expected<Value> { return combineIntegers(a, b, op); },
                    [&](std::int64_t a, std::uint64_t b) -> Expected<Value> { return combineMixed(a, b, op); },
                    [&](std::int64_t a, double b) -> Expected<Value> { return combineFloats(static_cast<double>(a), b, op); },
                    [&](std::uint64_t a, std::int64_t b) -> Expected<Value> { return combineMixed(a, b, op); },
                    [&](std::uint64_t a, std::uint64_t b) -> Expected<Value> { return combineUnsigned(a, b, op); },
                    [&](std::uint64_t a, double b) -> Expected<Value> { return combineFloats(static_cast<double>(a), b, op); },
                    [&](double a, std::int64_t b) -> Expected<Value> { return combineFloats(a, static_cast<double>(b), op); },
                    [&](double a, std::uint64_t b) -> Expected<Value> { return combineFloats(a, static_cast<double>(b), op); },
                    [&](double a, double b) -> Expected<Value> { return combineFloats(a, b, op); },
                    [&](std::string const& a, std::string const& b) -> Expected<Value> { return combineText(a, b, lhs, rhs, op); },
                    [&](auto const&, auto const&) -> Expected<Value> { return incompatible(lhs, rhs, op); }},
            lhs.storage(),
            rhs.storage());
}

} // namespace SS
