#pragma once
#include "core/Error.hpp"
#include "type/Value.hpp"

namespace SS {

enum class Operator {
    Add = 0,
    Subtract,
    Multiply,
    Divide
};

[[nodiscard]] auto operatorSymbol(Operator op) -> char;

/**
 * Combines two scalar values.
 *
 * Numeric promotion:
 * - integer op integer   -> integer (wrapping)
 * - unsigned op unsigned -> unsigned (wrapping)
 * - integer op unsigned  -> unsigned when the integer operand is >= 0, float otherwise
 * - any float operand    -> float
 * Text supports only Operator::Add (concatenation). Every other pairing, and integral
 * division by zero, yields Error::Code::ArithmeticError.
 */
[[nodiscard]] auto doArithmetic(Value const& lhs, Value const& rhs, Operator op) -> Expected<Value>;

} // namespace SS
