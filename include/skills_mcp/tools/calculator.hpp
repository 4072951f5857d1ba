#pragma once

#include <skills_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace skills_mcp {

// ---------------------------------------------------------------------------
// Number — integer or floating value produced by the calculator.
//
// Integer operands stay integral through + - * // % and non-negative **;
// true division and any float operand produce a float.
// ---------------------------------------------------------------------------
class Number {
public:
    static Number Int(int64_t value) { return Number(value); }
    static Number Float(double value) { return Number(value); }

    [[nodiscard]] bool IsInt() const noexcept { return value_.index() == 0; }
    [[nodiscard]] int64_t AsInt() const { return std::get<0>(value_); }
    [[nodiscard]] double AsDouble() const noexcept;

    // Integers print plainly, floats in shortest round-trip form with a
    // trailing ".0" when integral ("3.0", "0.1", "1e+20").
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Number& other) const { return value_ == other.value_; }
    bool operator!=(const Number& other) const { return value_ != other.value_; }

private:
    explicit Number(int64_t value) : value_(value) {}
    explicit Number(double value) : value_(value) {}

    std::variant<int64_t, double> value_;
};

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,       // "/"  always float
    FloorDivide,  // "//" rounds toward negative infinity
    Modulo,       // "%"  result takes the sign of the divisor
    Power,        // "**"
};

// Apply one arithmetic operator with the integer/float rules above.
Result<Number, Error> Apply(BinaryOp op, const Number& lhs, const Number& rhs);

// Shortest decimal text that parses back to the same double.
std::string FormatDouble(double value);

// Evaluate an arithmetic expression made of digits, whitespace and
// + - * / . ( ) %. Supports binary + - * / // % **, unary + -, parentheses.
// Errors carry ErrorCategory::InvalidArgument for disallowed characters and
// ErrorCategory::Evaluation for syntax errors, division by zero and overflow.
Result<Number, Error> EvaluateExpression(std::string_view expression);

} // namespace skills_mcp
