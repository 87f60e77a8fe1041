#ifndef MCPTOOLS_ARITHMETIC_HPP
#define MCPTOOLS_ARITHMETIC_HPP

// The four calculator operations. Failures are values, never exceptions.

#include <string>

namespace arithmetic {

enum class Operation {
    Sum,
    Difference,
    Product,
    Quotient,
};

struct OperationResult {
    bool success = false;
    double value = 0.0;
    std::string error;
};

// Tool name used for the operation ("suma", "resta", ...).
const char *operation_name(Operation operation);

// Symbol used in the human-readable description ("+", "-", "×", "÷").
const char *operation_symbol(Operation operation);

// Apply the operation to finite operands. Fails on division by zero and on a
// non-finite result (overflow).
OperationResult apply(Operation operation, double a, double b);

} // namespace arithmetic

#endif // MCPTOOLS_ARITHMETIC_HPP
