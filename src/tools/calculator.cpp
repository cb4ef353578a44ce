#include "calculator.hpp"
#include "tool_util.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace agentstream {

namespace {

// Recursive-descent evaluator. Precedence, lowest first:
//   expr  := term (('+' | '-') term)*
//   term  := unary (('*' | '/' | '%') unary)*
//   unary := ('-' | '+') unary | power
//   power := primary ('^' unary)?        (right associative)
class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    double parse() {
        double value = expr();
        skip_space();
        if (pos_ != text_.size()) {
            throw std::invalid_argument("Unexpected character '" +
                                        std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    double expr() {
        double value = term();
        for (;;) {
            if (accept('+')) value += term();
            else if (accept('-')) value -= term();
            else return value;
        }
    }

    double term() {
        double value = unary();
        for (;;) {
            if (accept('*')) {
                value *= unary();
            } else if (accept('/')) {
                double rhs = unary();
                if (rhs == 0.0) throw std::domain_error("Division by zero");
                value /= rhs;
            } else if (accept('%')) {
                double rhs = unary();
                if (rhs == 0.0) throw std::domain_error("Division by zero");
                value = std::fmod(value, rhs);
            } else {
                return value;
            }
        }
    }

    double unary() {
        if (accept('-')) return -unary();
        if (accept('+')) return unary();
        return power();
    }

    double power() {
        double base = primary();
        if (accept('^')) return std::pow(base, unary());
        return base;
    }

    double primary() {
        if (accept('(')) {
            double value = expr();
            if (!accept(')')) throw std::invalid_argument("Missing closing parenthesis");
            return value;
        }
        return number();
    }

    double number() {
        skip_space();
        size_t start = pos_;
        bool seen_dot = false;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                pos_++;
            } else if (c == '.' && !seen_dot) {
                seen_dot = true;
                pos_++;
            } else {
                break;
            }
        }
        if (start == pos_ || (pos_ - start == 1 && seen_dot)) {
            if (pos_ >= text_.size()) throw std::invalid_argument("Unexpected end of expression");
            throw std::invalid_argument("Expected a number at '" +
                                        std::string(1, text_[start]) + "'");
        }
        return std::stod(text_.substr(start, pos_ - start));
    }

    bool accept(char c) {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

double evaluate_expression(const std::string& expression) {
    ExpressionParser parser(expression);
    double value = parser.parse();
    if (!std::isfinite(value)) throw std::domain_error("Result is not a finite number");
    return value;
}

std::string format_number(double value) {
    if (std::fabs(value) < 1e15 && value == std::floor(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.12g", value);
    return buf;
}

ToolResult CalculatorTool::execute(const std::string& args_json) {
    std::string expression;
    if (auto err = string_arg(args_json, "expression", expression)) return *err;

    try {
        double value = evaluate_expression(expression);
        return ToolResult{true, format_number(value)};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Error: ") + e.what()};
    }
}

std::string CalculatorTool::description() const {
    return "Perform basic arithmetic calculations";
}

std::string CalculatorTool::parameters_json() const {
    return R"({"type":"object","properties":{"expression":{"type":"string","description":"Arithmetic expression, e.g. (2 + 3) * 4"}},"required":["expression"]})";
}

} // namespace agentstream
