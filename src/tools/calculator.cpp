#include <skills_mcp/tools/calculator.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace skills_mcp {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

Result<Number, Error> EvalError(const std::string& message) {
    return Result<Number, Error>::Err(
        Error{"Calculate", message, ErrorCategory::Evaluation});
}

// Open parentheses, unary signs and '**' operands each recurse once.
constexpr int kMaxNesting = 200;

Result<Number, Error> IntOverflow() {
    return EvalError("integer overflow");
}

bool AddOverflows(int64_t a, int64_t b) {
    return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b);
}

bool SubOverflows(int64_t a, int64_t b) {
    return (b < 0 && a > kMax + b) || (b > 0 && a < kMin + b);
}

bool MulOverflows(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return false;
    if (a > 0) {
        return b > 0 ? a > kMax / b : b < kMin / a;
    }
    return b > 0 ? a < kMin / b : b < kMax / a;
}

Result<Number, Error> IntPower(int64_t base, int64_t exponent) {
    int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            if (MulOverflows(result, base)) return IntOverflow();
            result *= base;
        }
        exponent >>= 1;
        if (exponent > 0) {
            if (MulOverflows(base, base)) return IntOverflow();
            base *= base;
        }
    }
    return Result<Number, Error>::Ok(Number::Int(result));
}

Result<Number, Error> CheckedFloat(double value) {
    if (std::isinf(value)) {
        return EvalError("numerical result out of range");
    }
    return Result<Number, Error>::Ok(Number::Float(value));
}

Result<Number, Error> Negate(const Number& value) {
    if (value.IsInt()) {
        if (value.AsInt() == kMin) return IntOverflow();
        return Result<Number, Error>::Ok(Number::Int(-value.AsInt()));
    }
    return Result<Number, Error>::Ok(Number::Float(-value.AsDouble()));
}

Result<Number, Error> ApplyInt(BinaryOp op, int64_t a, int64_t b) {
    switch (op) {
        case BinaryOp::Add:
            if (AddOverflows(a, b)) return IntOverflow();
            return Result<Number, Error>::Ok(Number::Int(a + b));
        case BinaryOp::Subtract:
            if (SubOverflows(a, b)) return IntOverflow();
            return Result<Number, Error>::Ok(Number::Int(a - b));
        case BinaryOp::Multiply:
            if (MulOverflows(a, b)) return IntOverflow();
            return Result<Number, Error>::Ok(Number::Int(a * b));
        case BinaryOp::Divide:
            if (b == 0) return EvalError("division by zero");
            return CheckedFloat(static_cast<double>(a) / static_cast<double>(b));
        case BinaryOp::FloorDivide: {
            if (b == 0) return EvalError("integer division or modulo by zero");
            if (a == kMin && b == -1) return IntOverflow();
            int64_t q = a / b;
            if (a % b != 0 && ((a < 0) != (b < 0))) --q;
            return Result<Number, Error>::Ok(Number::Int(q));
        }
        case BinaryOp::Modulo: {
            if (b == 0) return EvalError("integer division or modulo by zero");
            if (b == -1) return Result<Number, Error>::Ok(Number::Int(0));
            int64_t r = a % b;
            if (r != 0 && ((r < 0) != (b < 0))) r += b;
            return Result<Number, Error>::Ok(Number::Int(r));
        }
        case BinaryOp::Power:
            if (b < 0) {
                if (a == 0) {
                    return EvalError("0.0 cannot be raised to a negative power");
                }
                return CheckedFloat(std::pow(static_cast<double>(a),
                                             static_cast<double>(b)));
            }
            return IntPower(a, b);
    }
    return EvalError("unsupported operator");
}

Result<Number, Error> ApplyFloat(BinaryOp op, double a, double b) {
    switch (op) {
        case BinaryOp::Add:      return CheckedFloat(a + b);
        case BinaryOp::Subtract: return CheckedFloat(a - b);
        case BinaryOp::Multiply: return CheckedFloat(a * b);
        case BinaryOp::Divide:
            if (b == 0.0) return EvalError("float division by zero");
            return CheckedFloat(a / b);
        case BinaryOp::FloorDivide:
            if (b == 0.0) return EvalError("float floor division by zero");
            return CheckedFloat(std::floor(a / b));
        case BinaryOp::Modulo: {
            if (b == 0.0) return EvalError("float modulo");
            double r = std::fmod(a, b);
            if (r != 0.0 && ((r < 0.0) != (b < 0.0))) r += b;
            return CheckedFloat(r);
        }
        case BinaryOp::Power:
            if (a == 0.0 && b < 0.0) {
                return EvalError("0.0 cannot be raised to a negative power");
            }
            if (a < 0.0 && std::floor(b) != b) {
                return EvalError("negative number cannot be raised to a fractional power");
            }
            return CheckedFloat(std::pow(a, b));
    }
    return EvalError("unsupported operator");
}

// ---------------------------------------------------------------------------
// Parser — recursive descent, '**' binds tighter than unary minus on its left:
//
//   expr   := term (('+' | '-') term)*
//   term   := unary (('*' | '/' | '//' | '%') unary)*
//   unary  := ('+' | '-') unary | power
//   power  := atom ('**' unary)?
//   atom   := NUMBER | '(' expr ')'
// ---------------------------------------------------------------------------
class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Result<Number, Error> Parse() {
        auto value = ParseExpr();
        if (value.IsErr()) return value;
        SkipSpace();
        if (pos_ != text_.size()) {
            return SyntaxError();
        }
        return value;
    }

private:
    Result<Number, Error> ParseExpr() {
        auto lhs = ParseTerm();
        if (lhs.IsErr()) return lhs;
        auto acc = std::move(lhs).Value();
        while (true) {
            BinaryOp op = BinaryOp::Add;
            if (Accept("+")) {
                op = BinaryOp::Add;
            } else if (Accept("-")) {
                op = BinaryOp::Subtract;
            } else {
                break;
            }
            auto rhs = ParseTerm();
            if (rhs.IsErr()) return rhs;
            auto combined = Apply(op, acc, rhs.Value());
            if (combined.IsErr()) return combined;
            acc = std::move(combined).Value();
        }
        return Result<Number, Error>::Ok(acc);
    }

    Result<Number, Error> ParseTerm() {
        auto lhs = ParseUnary();
        if (lhs.IsErr()) return lhs;
        auto acc = std::move(lhs).Value();
        while (true) {
            BinaryOp op = BinaryOp::Add;
            if (Peek("**")) {
                break;
            } else if (Accept("//")) {
                op = BinaryOp::FloorDivide;
            } else if (Accept("*")) {
                op = BinaryOp::Multiply;
            } else if (Accept("/")) {
                op = BinaryOp::Divide;
            } else if (Accept("%")) {
                op = BinaryOp::Modulo;
            } else {
                break;
            }
            auto rhs = ParseUnary();
            if (rhs.IsErr()) return rhs;
            auto combined = Apply(op, acc, rhs.Value());
            if (combined.IsErr()) return combined;
            acc = std::move(combined).Value();
        }
        return Result<Number, Error>::Ok(acc);
    }

    Result<Number, Error> ParseUnary() {
        if (Accept("-")) {
            NestingGuard guard(depth_);
            if (guard.Exceeded()) return TooDeep();
            auto operand = ParseUnary();
            if (operand.IsErr()) return operand;
            return Negate(operand.Value());
        }
        if (Accept("+")) {
            NestingGuard guard(depth_);
            if (guard.Exceeded()) return TooDeep();
            return ParseUnary();
        }
        return ParsePower();
    }

    Result<Number, Error> ParsePower() {
        auto base = ParseAtom();
        if (base.IsErr()) return base;
        if (!Accept("**")) return base;
        NestingGuard guard(depth_);
        if (guard.Exceeded()) return TooDeep();
        auto exponent = ParseUnary();
        if (exponent.IsErr()) return exponent;
        return Apply(BinaryOp::Power, base.Value(), exponent.Value());
    }

    Result<Number, Error> ParseAtom() {
        if (Accept("(")) {
            NestingGuard guard(depth_);
            if (guard.Exceeded()) {
                return EvalError("too many nested parentheses");
            }
            auto inner = ParseExpr();
            if (inner.IsErr()) return inner;
            if (!Accept(")")) return SyntaxError();
            return inner;
        }
        SkipSpace();
        return ParseNumber();
    }

    Result<Number, Error> ParseNumber() {
        const auto start = pos_;
        bool seen_digit = false;
        bool seen_dot = false;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                seen_digit = true;
            } else if (c == '.' && !seen_dot) {
                seen_dot = true;
            } else {
                break;
            }
            ++pos_;
        }
        if (!seen_digit) {
            pos_ = start;
            return SyntaxError();
        }

        const std::string literal(text_.substr(start, pos_ - start));
        if (!seen_dot) {
            errno = 0;
            char* end = nullptr;
            const long long value = std::strtoll(literal.c_str(), &end, 10);
            if (errno == ERANGE) return IntOverflow();
            return Result<Number, Error>::Ok(Number::Int(value));
        }
        return CheckedFloat(std::strtod(literal.c_str(), nullptr));
    }

    void SkipSpace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Peek(std::string_view token) {
        SkipSpace();
        return text_.substr(pos_, token.size()) == token;
    }

    bool Accept(std::string_view token) {
        if (!Peek(token)) return false;
        pos_ += token.size();
        return true;
    }

    static Result<Number, Error> TooDeep() {
        return EvalError("expression nested too deeply");
    }

    Result<Number, Error> SyntaxError() const {
        if (pos_ >= text_.size()) {
            return EvalError("unexpected end of expression");
        }
        return EvalError("invalid syntax at position " + std::to_string(pos_ + 1));
    }

    class NestingGuard {
    public:
        explicit NestingGuard(int& depth) : depth_(depth) { ++depth_; }
        ~NestingGuard() { --depth_; }
        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        [[nodiscard]] bool Exceeded() const { return depth_ > kMaxNesting; }

    private:
        int& depth_;
    };

    std::string_view text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

bool IsAllowedChar(char c) {
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        std::isspace(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '+': case '-': case '*': case '/':
        case '.': case '(': case ')': case '%':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Number
// ---------------------------------------------------------------------------
double Number::AsDouble() const noexcept {
    if (IsInt()) return static_cast<double>(std::get<0>(value_));
    return std::get<1>(value_);
}

std::string Number::ToString() const {
    if (IsInt()) return std::to_string(std::get<0>(value_));

    const double v = std::get<1>(value_);
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v < 0 ? "-inf" : "inf";

    auto text = FormatDouble(v);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string FormatDouble(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    char buf[64];
    int digits = 17;
    for (int p = 1; p <= 17; ++p) {
        std::snprintf(buf, sizeof(buf), "%.*e", p - 1, value);
        if (std::strtod(buf, nullptr) == value) {
            digits = p;
            break;
        }
    }
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
    const char* e = std::strchr(buf, 'e');
    const int exponent = e != nullptr ? std::atoi(e + 1) : 0;

    // Fixed notation for 1e-4 <= |value| < 1e16, scientific outside.
    if (exponent >= -4 && exponent < 16) {
        const int decimals = std::max(0, digits - 1 - exponent);
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    }
    return buf;
}

Result<Number, Error> Apply(BinaryOp op, const Number& lhs, const Number& rhs) {
    if (lhs.IsInt() && rhs.IsInt()) {
        return ApplyInt(op, lhs.AsInt(), rhs.AsInt());
    }
    return ApplyFloat(op, lhs.AsDouble(), rhs.AsDouble());
}

Result<Number, Error> EvaluateExpression(std::string_view expression) {
    if (expression.empty()) {
        return Result<Number, Error>::Err(
            Error{"Calculate", "empty expression", ErrorCategory::InvalidArgument});
    }
    for (char c : expression) {
        if (!IsAllowedChar(c)) {
            return Result<Number, Error>::Err(
                Error{"Calculate",
                      "character '" + std::string(1, c) + "' is not allowed",
                      ErrorCategory::InvalidArgument});
        }
    }
    return Parser(expression).Parse();
}

} // namespace skills_mcp
