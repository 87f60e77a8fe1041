#include "calculator/calculator_tool.hpp"
#include "calculator/operands.hpp"
#include "utils/debug_log.hpp"

namespace calculator_tool {

// Numbers are rendered the way the JSON payload renders them (e.g. "25.0").
static std::string format_number(double value) {
    return json(value).dump();
}

json build_operand_schema(const std::string &a_description, const std::string &b_description) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"a", {{"type", "number"}, {"description", a_description}}},
        {"b", {{"type", "number"}, {"description", b_description}}}
    };
    input_schema["required"] = json::array({"a", "b"});
    input_schema["additionalProperties"] = false;
    return input_schema;
}

mcp_tools::ToolResult run_operation(arithmetic::Operation operation, const json &validated_arguments) {
    double a = validated_arguments.at("a").get<double>();
    double b = validated_arguments.at("b").get<double>();
    std::string operation_name = arithmetic::operation_name(operation);

    debug_log::log(operation_name + " invoked a=" + format_number(a) + " b=" + format_number(b));
    arithmetic::OperationResult outcome = arithmetic::apply(operation, a, b);

    json payload;
    payload["operacion"] = operation_name;

    if (!outcome.success) {
        payload["error"] = outcome.error;
        payload["error_type"] = "calculation_error";
        return mcp_tools::failure_result(payload);
    }

    payload["operandos"] = json::array({a, b});
    payload["resultado"] = outcome.value;
    payload["descripcion"] = format_number(a) + " " + arithmetic::operation_symbol(operation) + " " +
                             format_number(b) + " = " + format_number(outcome.value);
    return mcp_tools::success_result(payload);
}

void register_operation(mcp_tools::ToolRegistry &registry, arithmetic::Operation operation,
                        const std::string &description, const std::string &a_description,
                        const std::string &b_description) {
    registry.register_tool({
        arithmetic::operation_name(operation),
        description,
        build_operand_schema(a_description, b_description),
        operands::validate_calculator_arguments,
        [operation](const json &validated_arguments) {
            return run_operation(operation, validated_arguments);
        }
    });
}

} // namespace calculator_tool
