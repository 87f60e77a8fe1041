#ifndef MCPTOOLS_OPERANDS_HPP
#define MCPTOOLS_OPERANDS_HPP

// Operand validation for the calculator tools.
// Runs before any handler: handlers may assume finite doubles.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace operands {

using json = nlohmann::json;

struct OperandValidation {
    bool valid = false;
    double number_a = 0.0;
    double number_b = 0.0;
    std::string error;
};

// Coerce both raw values to doubles. Accepts JSON numbers and numeric strings.
// A null value means the argument was not supplied.
OperandValidation validate_operands(const json &raw_a, const json &raw_b);

// tools/call validator for the two-operand tools: only "a" and "b" are allowed.
// On success the normalized arguments are {"a": double, "b": double}.
mcp_tools::ValidationResult validate_calculator_arguments(const json &arguments);

} // namespace operands

#endif // MCPTOOLS_OPERANDS_HPP
