#include "expression_rule.hpp"

#include <fmt/format.h>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

enum class OperandType { kUnknown, kString, kNumber, kBool };

// Signals are typed only at evaluation time.
OperandType StaticType(const rules::Expression& expr) {
    switch (expr.expr_case()) {
        case rules::Expression::kField:
            return expr.field().field() == rules::FieldReference::AMOUNT ? OperandType::kNumber
                                                                         : OperandType::kString;
        case rules::Expression::kLiteral:
            switch (expr.literal().value_case()) {
                case rules::LiteralValue::kStringValue:
                    return OperandType::kString;
                case rules::LiteralValue::kNumberValue:
                    return OperandType::kNumber;
                case rules::LiteralValue::kBoolValue:
                    return OperandType::kBool;
                default:
                    return OperandType::kUnknown;
            }
        default:
            return OperandType::kUnknown;
    }
}

bool IsOrdering(rules::ComparisonOperation::Operator op) {
    return op == rules::ComparisonOperation::GREATER_THAN ||
           op == rules::ComparisonOperation::GREATER_THAN_OR_EQUAL ||
           op == rules::ComparisonOperation::LESS_THAN ||
           op == rules::ComparisonOperation::LESS_THAN_OR_EQUAL;
}

void ValidateOperandType(OperandType type, rules::ComparisonOperation::Operator op) {
    const auto& op_name = rules::ComparisonOperation::Operator_Name(op);
    switch (type) {
        case OperandType::kString:
            if (IsOrdering(op)) {
                throw RuleConfigError(fmt::format("{} cannot compare strings", op_name));
            }
            return;
        case OperandType::kNumber:
            if (op == rules::ComparisonOperation::LIKE) {
                throw RuleConfigError("LIKE requires string operands");
            }
            return;
        case OperandType::kBool:
            if (op != rules::ComparisonOperation::EQUAL &&
                op != rules::ComparisonOperation::NOT_EQUAL) {
                throw RuleConfigError(fmt::format("{} cannot compare booleans", op_name));
            }
            return;
        case OperandType::kUnknown:
            return;
    }
}

void ValidateComparisonTypes(const rules::ComparisonOperation& comp) {
    const auto left = StaticType(comp.left());
    const auto right = StaticType(comp.right());
    if (left != OperandType::kUnknown && right != OperandType::kUnknown && left != right) {
        throw RuleConfigError("comparison operands have different types");
    }
    ValidateOperandType(left, comp.operator_());
    ValidateOperandType(right, comp.operator_());
}

}  // namespace

ExpressionRule::ExpressionRule(const rules::RuleConfig& rule_config)
    : rule_config_(rule_config) {
    if (!rule_config_.has_expression()) {
        throw RuleConfigError(
            fmt::format("Rule {} has no expression", rule_config_.name()));
    }
    try {
        ValidateBoolean(rule_config_.expression());
    } catch (const RuleConfigError& e) {
        throw RuleConfigError(fmt::format("Rule {}: {}", rule_config_.name(), e.what()));
    }
}

void ExpressionRule::ValidateBoolean(const rules::Expression& expr) {
    switch (expr.expr_case()) {
        case rules::Expression::kComparison: {
            const auto& comp = expr.comparison();
            if (comp.operator_() == rules::ComparisonOperation::OPERATOR_UNSPECIFIED) {
                throw RuleConfigError("comparison without operator");
            }
            ValidateValue(comp.left());
            ValidateValue(comp.right());
            ValidateComparisonTypes(comp);
            return;
        }
        case rules::Expression::kLogical: {
            const auto& logical = expr.logical();
            if (logical.operator_() == rules::LogicalOperation::OPERATOR_UNSPECIFIED) {
                throw RuleConfigError("logical operation without operator");
            }
            if (logical.operator_() == rules::LogicalOperation::NOT && logical.operands_size() != 1) {
                throw RuleConfigError("NOT operator requires exactly one operand");
            }
            if (logical.operands_size() == 0) {
                throw RuleConfigError("logical operation without operands");
            }
            for (const auto& operand : logical.operands()) {
                ValidateBoolean(operand);
            }
            return;
        }
        case rules::Expression::kSignal:
            if (expr.signal().key().empty()) {
                throw RuleConfigError("empty signal key");
            }
            return;
        case rules::Expression::kLiteral:
            if (expr.literal().value_case() == rules::LiteralValue::kBoolValue) {
                return;
            }
            throw RuleConfigError("Expression is not boolean");
        default:
            throw RuleConfigError("Expression is not boolean");
    }
}

void ExpressionRule::ValidateValue(const rules::Expression& expr) {
    switch (expr.expr_case()) {
        case rules::Expression::kField:
            if (expr.field().field() == rules::FieldReference::FIELD_UNSPECIFIED) {
                throw RuleConfigError("unspecified field reference");
            }
            return;
        case rules::Expression::kSignal:
            if (expr.signal().key().empty()) {
                throw RuleConfigError("empty signal key");
            }
            return;
        case rules::Expression::kLiteral:
            if (expr.literal().value_case() == rules::LiteralValue::VALUE_NOT_SET) {
                throw RuleConfigError("empty literal");
            }
            return;
        default:
            throw RuleConfigError("Cannot evaluate expression to value");
    }
}

bool ExpressionRule::IsTriggered(const transaction::Transaction& transaction,
                                 const Context& context) const {
    return EvaluateExpression(transaction, context, rule_config_.expression());
}

rule_utils::ExpressionValue ExpressionRule::EvaluateExpressionValue(
    const transaction::Transaction& transaction,
    const Context& context,
    const rules::Expression& expr) const {
    switch (expr.expr_case()) {
        case rules::Expression::kField:
            return rule_utils::FieldExtractor::GetFieldValue(transaction, expr.field().field());
        case rules::Expression::kSignal:
            return rule_utils::SignalExtractor::GetSignalValue(context, expr.signal().key());
        case rules::Expression::kLiteral:
            return rule_utils::LiteralExtractor::GetLiteralValue(expr.literal());
        default:
            throw RuleConfigError("Cannot evaluate expression to value");
    }
}

bool ExpressionRule::EvaluateExpression(
    const transaction::Transaction& transaction,
    const Context& context,
    const rules::Expression& expr) const {
    switch (expr.expr_case()) {
        case rules::Expression::kComparison:
            return EvaluateComparison(transaction, context, expr.comparison());
        case rules::Expression::kLogical:
            return EvaluateLogical(transaction, context, expr.logical());
        case rules::Expression::kSignal: {
            // A bare signal is a flag: absent is false, anything but a bool is malformed.
            const auto flag = context.GetBool(expr.signal().key());
            return flag.value_or(false);
        }
        case rules::Expression::kLiteral:
            return expr.literal().bool_value();
        default:
            throw RuleConfigError("Expression is not boolean");
    }
}

bool ExpressionRule::EvaluateComparison(
    const transaction::Transaction& transaction,
    const Context& context,
    const rules::ComparisonOperation& comp) const {
    auto left = EvaluateExpressionValue(transaction, context, comp.left());
    auto right = EvaluateExpressionValue(transaction, context, comp.right());
    return rule_utils::ComparisonEvaluator::Evaluate(left, right, comp.operator_());
}

bool ExpressionRule::EvaluateLogical(
    const transaction::Transaction& transaction,
    const Context& context,
    const rules::LogicalOperation& logical) const {
    switch (logical.operator_()) {
        case rules::LogicalOperation::AND:
            for (const auto& operand : logical.operands()) {
                if (!EvaluateExpression(transaction, context, operand)) {
                    return false;
                }
            }
            return true;
        case rules::LogicalOperation::OR:
            for (const auto& operand : logical.operands()) {
                if (EvaluateExpression(transaction, context, operand)) {
                    return true;
                }
            }
            return false;
        case rules::LogicalOperation::NOT:
            return !EvaluateExpression(transaction, context, logical.operands(0));
        default:
            throw RuleConfigError("Unknown logical operator");
    }
}

}  // namespace transaction_monitor
