#include "calculator/operands.hpp"
#include "utils/text.hpp"

#include <cmath>

namespace operands {

// Convert one raw operand. Returns false with error filled on failure.
static bool coerce_operand(const char *operand_name, const json &raw_value, double &number,
                           std::string &error) {
    if (raw_value.is_null()) {
        error = std::string("Operandos inválidos: falta el argumento requerido '") + operand_name + "'";
        return false;
    }
    if (raw_value.is_number()) {
        number = raw_value.get<double>();
        return true;
    }
    if (raw_value.is_string()) {
        const std::string &raw_text = raw_value.get_ref<const std::string &>();
        if (text::parse_double(raw_text, number)) {
            return true;
        }
        error = std::string("Operandos inválidos: no se puede convertir '") + raw_text +
                "' a número en '" + operand_name + "'";
        return false;
    }
    error = std::string("Operandos inválidos: '") + operand_name + "' debe ser un número, se recibió " +
            raw_value.type_name();
    return false;
}

OperandValidation validate_operands(const json &raw_a, const json &raw_b) {
    OperandValidation validation;

    if (!coerce_operand("a", raw_a, validation.number_a, validation.error) ||
        !coerce_operand("b", raw_b, validation.number_b, validation.error)) {
        return validation;
    }

    if (std::isnan(validation.number_a) || std::isnan(validation.number_b)) {
        validation.error = "Los operandos no pueden ser NaN";
        return validation;
    }
    if (std::isinf(validation.number_a) || std::isinf(validation.number_b)) {
        validation.error = "Los operandos no pueden ser infinito";
        return validation;
    }

    validation.valid = true;
    return validation;
}

mcp_tools::ValidationResult validate_calculator_arguments(const json &arguments) {
    mcp_tools::ValidationResult result;

    for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
        if (iterator.key() != "a" && iterator.key() != "b") {
            result.error = "Argumento no permitido: '" + iterator.key() + "'";
            return result;
        }
    }

    json raw_a = arguments.contains("a") ? arguments["a"] : json();
    json raw_b = arguments.contains("b") ? arguments["b"] : json();

    OperandValidation validation = validate_operands(raw_a, raw_b);
    if (!validation.valid) {
        result.error = validation.error;
        return result;
    }

    result.valid = true;
    result.arguments = {{"a", validation.number_a}, {"b", validation.number_b}};
    return result;
}

} // namespace operands
