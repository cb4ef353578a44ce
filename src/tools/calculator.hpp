#pragma once
#include "../tool.hpp"
#include <string>

namespace agentstream {

// Evaluates arithmetic: + - * / % ^, parentheses, unary minus, decimals.
class CalculatorTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "calculator"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

// Evaluate an arithmetic expression. Throws std::invalid_argument on
// malformed input and std::domain_error on division by zero.
double evaluate_expression(const std::string& expression);

// Integral values print without a fraction ("4"), others with up to 12
// significant digits ("0.333333333333").
std::string format_number(double value);

} // namespace agentstream
