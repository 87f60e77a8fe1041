#include "calculator/arithmetic.hpp"

#include <cmath>

namespace arithmetic {

const char *operation_name(Operation operation) {
    switch (operation) {
    case Operation::Sum:
        return "suma";
    case Operation::Difference:
        return "resta";
    case Operation::Product:
        return "multiplicacion";
    case Operation::Quotient:
        return "division";
    }
    return "desconocida";
}

const char *operation_symbol(Operation operation) {
    switch (operation) {
    case Operation::Sum:
        return "+";
    case Operation::Difference:
        return "-";
    case Operation::Product:
        return "×";
    case Operation::Quotient:
        return "÷";
    }
    return "?";
}

OperationResult apply(Operation operation, double a, double b) {
    OperationResult result;

    switch (operation) {
    case Operation::Sum:
        result.value = a + b;
        break;
    case Operation::Difference:
        result.value = a - b;
        break;
    case Operation::Product:
        result.value = a * b;
        break;
    case Operation::Quotient:
        if (b == 0.0) {
            result.error = "No se puede dividir por cero";
            return result;
        }
        result.value = a / b;
        break;
    }

    if (!std::isfinite(result.value)) {
        result.error = "El resultado excede el rango numérico representable";
        return result;
    }

    result.success = true;
    return result;
}

} // namespace arithmetic
