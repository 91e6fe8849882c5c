#pragma once

#include <rules/rule_config.pb.h>
#include <transaction/transaction.pb.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "context/context.hpp"
#include "errors/errors.hpp"

namespace transaction_monitor::rule_utils {

// std::monostate stands for an absent or null operand.
using ExpressionValue = std::variant<std::monostate, std::string, double, bool>;

class FieldExtractor {
public:
    static ExpressionValue GetFieldValue(
        const transaction::Transaction& transaction,
        rules::FieldReference::FieldType field) {
        switch (field) {
            case rules::FieldReference::TRANSACTION_ID:
                return transaction.transaction_id();
            case rules::FieldReference::ACCOUNT_ID:
                return transaction.account_id();
            case rules::FieldReference::COUNTERPARTY_ID:
                if (transaction.counterparty_id().empty()) {
                    return std::monostate{};
                }
                return transaction.counterparty_id();
            case rules::FieldReference::AMOUNT:
                return transaction.amount();
            case rules::FieldReference::DIRECTION:
                return transaction::Transaction::Direction_Name(transaction.direction());
            case rules::FieldReference::TRANSACTION_TYPE:
                return transaction.transaction_type();
            case rules::FieldReference::TIMESTAMP:
                return transaction.timestamp();
            case rules::FieldReference::DESCRIPTION:
                return transaction.description();
            default:
                throw RuleConfigError("Unknown field type");
        }
    }
};

class SignalExtractor {
public:
    static ExpressionValue GetSignalValue(const Context& context, const std::string& key) {
        auto value = context.Find(key);
        if (!value || value->IsNull()) {
            return std::monostate{};
        }
        if (value->IsBool()) {
            return value->As<bool>();
        }
        if (value->IsString()) {
            return value->As<std::string>();
        }
        if (value->IsDouble() || value->IsInt64() || value->IsUInt64()) {
            return value->As<double>();
        }
        throw MalformedContextError("Signal " + key + " is not a scalar and cannot be compared");
    }
};

class LiteralExtractor {
public:
    static ExpressionValue GetLiteralValue(const rules::LiteralValue& literal) {
        switch (literal.value_case()) {
            case rules::LiteralValue::kStringValue:
                return literal.string_value();
            case rules::LiteralValue::kNumberValue:
                return literal.number_value();
            case rules::LiteralValue::kBoolValue:
                return literal.bool_value();
            default:
                throw RuleConfigError("Unknown literal type");
        }
    }
};

class ComparisonEvaluator {
public:
    static bool Evaluate(
        const ExpressionValue& left,
        const ExpressionValue& right,
        rules::ComparisonOperation::Operator op) {
        return std::visit([op](auto&& l, auto&& r) -> bool {
            using L = std::decay_t<decltype(l)>;
            using R = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<L, std::monostate> || std::is_same_v<R, std::monostate>) {
                return false;
            }
            else if constexpr (std::is_same_v<L, double> && std::is_same_v<R, double>) {
                return CompareNumeric(l, r, op);
            }
            else if constexpr (std::is_same_v<L, std::string> && std::is_same_v<R, std::string>) {
                return CompareString(l, r, op);
            }
            else if constexpr (std::is_same_v<L, bool> && std::is_same_v<R, bool>) {
                return CompareBoolean(l, r, op);
            }
            else {
                throw MalformedContextError("Type mismatch in comparison");
            }
        }, left, right);
    }

private:
    static bool CompareNumeric(double left, double right, rules::ComparisonOperation::Operator op) {
        switch (op) {
            case rules::ComparisonOperation::EQUAL:
                return left == right;
            case rules::ComparisonOperation::NOT_EQUAL:
                return left != right;
            case rules::ComparisonOperation::GREATER_THAN:
                return left > right;
            case rules::ComparisonOperation::GREATER_THAN_OR_EQUAL:
                return left >= right;
            case rules::ComparisonOperation::LESS_THAN:
                return left < right;
            case rules::ComparisonOperation::LESS_THAN_OR_EQUAL:
                return left <= right;
            default:
                throw RuleConfigError("Invalid operator for numeric comparison");
        }
    }

    static bool CompareString(
        const std::string& left,
        const std::string& right,
        rules::ComparisonOperation::Operator op) {
        switch (op) {
            case rules::ComparisonOperation::EQUAL:
                return left == right;
            case rules::ComparisonOperation::NOT_EQUAL:
                return left != right;
            case rules::ComparisonOperation::LIKE:
                return left.find(right) != std::string::npos;
            default:
                throw RuleConfigError("Invalid operator for string comparison");
        }
    }

    static bool CompareBoolean(bool left, bool right, rules::ComparisonOperation::Operator op) {
        switch (op) {
            case rules::ComparisonOperation::EQUAL:
                return left == right;
            case rules::ComparisonOperation::NOT_EQUAL:
                return left != right;
            default:
                throw RuleConfigError("Invalid operator for boolean comparison");
        }
    }
};

}  // namespace transaction_monitor::rule_utils
