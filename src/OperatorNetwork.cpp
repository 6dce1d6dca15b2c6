#include "OperatorNetwork.hpp"
#include "QuantityErrors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Quantica {

std::string toString(Operator op) {
    return op == Operator::MULTIPLY ? "*" : "/";
}

std::string toString(DivisionPolicy policy) {
    return policy == DivisionPolicy::THROW ? "throw" : "ieee754";
}

DivisionPolicy parseDivisionPolicy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "throw") return DivisionPolicy::THROW;
    if (lower == "ieee754" || lower == "ieee") return DivisionPolicy::IEEE754;
    throw std::invalid_argument("Unknown division policy: " + name +
                                " (expected throw or ieee754)");
}

OperatorNetwork::OperatorNetwork(DivisionPolicy policy) : policy_(policy) {}

const OperatorRule& OperatorNetwork::rule(QuantityType left, QuantityType right,
                                          Operator op) const {
    const std::size_t index = findRule(left, right, op);
    if (index == kNoRule) {
        throw DimensionMismatch("No rule for " + toString(left) + " " + toString(op) +
                                " " + toString(right));
    }
    return kOperatorRules[index];
}

QuantityType OperatorNetwork::resultType(QuantityType left, QuantityType right,
                                         Operator op) const {
    return rule(left, right, op).result;
}

Quantity OperatorNetwork::multiply(const Quantity& left, const Quantity& right) const {
    const OperatorRule& r = rule(left.type(), right.type(), Operator::MULTIPLY);
    return Quantity::fromBase(left.baseValue() * right.baseValue(), r.result);
}

Quantity OperatorNetwork::divide(const Quantity& left, const Quantity& right) const {
    const OperatorRule& r = rule(left.type(), right.type(), Operator::DIVIDE);

    const double divisor = right.baseValue();
    if (divisor == 0.0 && policy_ == DivisionPolicy::THROW) {
        throw DivisionByZero("Division of " + toString(left.type()) + " by zero " +
                             toString(right.type()));
    }
    return Quantity::fromBase(left.baseValue() / divisor, r.result);
}

} // namespace Quantica
