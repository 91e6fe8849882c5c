#pragma once

#include <rules/rule_config.pb.h>
#include <transaction/transaction.pb.h>

#include "rule_interface/IRule.hpp"
#include "rule_utils/expression_evaluator.hpp"

namespace transaction_monitor {

// Rule defined by a comparison/logical expression tree over transaction
// fields, context signals and literals.
class ExpressionRule : public IRule {
public:
    // Throws RuleConfigError when the tree is not a boolean expression.
    explicit ExpressionRule(const rules::RuleConfig& rule_config);

    bool IsTriggered(const transaction::Transaction& transaction,
                     const Context& context) const override;

    const rules::RuleConfig& GetConfig() const override { return rule_config_; }

private:
    using ExpressionValue = rule_utils::ExpressionValue;

    static void ValidateBoolean(const rules::Expression& expr);
    static void ValidateValue(const rules::Expression& expr);

    ExpressionValue EvaluateExpressionValue(
        const transaction::Transaction& transaction,
        const Context& context,
        const rules::Expression& expr) const;

    bool EvaluateExpression(
        const transaction::Transaction& transaction,
        const Context& context,
        const rules::Expression& expr) const;

    bool EvaluateComparison(
        const transaction::Transaction& transaction,
        const Context& context,
        const rules::ComparisonOperation& comp) const;

    bool EvaluateLogical(
        const transaction::Transaction& transaction,
        const Context& context,
        const rules::LogicalOperation& logical) const;

    const rules::RuleConfig rule_config_;
};

}  // namespace transaction_monitor
