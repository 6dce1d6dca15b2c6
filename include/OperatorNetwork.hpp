#ifndef QUANTICA_OPERATOR_NETWORK_HPP
#define QUANTICA_OPERATOR_NETWORK_HPP

#include "Quantity.hpp"
#include "QuantityType.hpp"
#include <array>
#include <cstddef>
#include <string>

namespace Quantica {

enum class Operator {
    MULTIPLY,
    DIVIDE
};

/**
 * @brief left op right = result, applied to base values
 */
struct OperatorRule {
    QuantityType left;
    QuantityType right;
    Operator op;
    QuantityType result;
};

/**
 * @brief How a divide rule treats a zero divisor
 */
enum class DivisionPolicy {
    THROW,      // Raise DivisionByZero
    IEEE754     // Return IEEE infinity or NaN
};

// =============================================================================
// Rule table
// =============================================================================

inline constexpr std::array<OperatorRule, 26> kOperatorRules = {{
    // Geometry
    {QuantityType::LENGTH, QuantityType::LENGTH, Operator::MULTIPLY, QuantityType::AREA},
    {QuantityType::AREA, QuantityType::LENGTH, Operator::MULTIPLY, QuantityType::VOLUME},
    {QuantityType::LENGTH, QuantityType::AREA, Operator::MULTIPLY, QuantityType::VOLUME},
    {QuantityType::AREA, QuantityType::LENGTH, Operator::DIVIDE, QuantityType::LENGTH},
    {QuantityType::VOLUME, QuantityType::AREA, Operator::DIVIDE, QuantityType::LENGTH},
    {QuantityType::VOLUME, QuantityType::LENGTH, Operator::DIVIDE, QuantityType::AREA},

    // Kinematics
    {QuantityType::SPEED, QuantityType::DURATION, Operator::MULTIPLY, QuantityType::LENGTH},
    {QuantityType::DURATION, QuantityType::SPEED, Operator::MULTIPLY, QuantityType::LENGTH},
    {QuantityType::LENGTH, QuantityType::DURATION, Operator::DIVIDE, QuantityType::SPEED},
    {QuantityType::LENGTH, QuantityType::SPEED, Operator::DIVIDE, QuantityType::DURATION},
    {QuantityType::ACCELERATION, QuantityType::DURATION, Operator::MULTIPLY, QuantityType::SPEED},
    {QuantityType::DURATION, QuantityType::ACCELERATION, Operator::MULTIPLY, QuantityType::SPEED},
    {QuantityType::SPEED, QuantityType::DURATION, Operator::DIVIDE, QuantityType::ACCELERATION},
    {QuantityType::SPEED, QuantityType::ACCELERATION, Operator::DIVIDE, QuantityType::DURATION},

    // Dynamics
    {QuantityType::MASS, QuantityType::ACCELERATION, Operator::MULTIPLY, QuantityType::FORCE},
    {QuantityType::ACCELERATION, QuantityType::MASS, Operator::MULTIPLY, QuantityType::FORCE},
    {QuantityType::FORCE, QuantityType::MASS, Operator::DIVIDE, QuantityType::ACCELERATION},
    {QuantityType::FORCE, QuantityType::ACCELERATION, Operator::DIVIDE, QuantityType::MASS},
    {QuantityType::FORCE, QuantityType::LENGTH, Operator::MULTIPLY, QuantityType::TORQUE},
    {QuantityType::LENGTH, QuantityType::FORCE, Operator::MULTIPLY, QuantityType::TORQUE},
    {QuantityType::TORQUE, QuantityType::FORCE, Operator::DIVIDE, QuantityType::LENGTH},
    {QuantityType::TORQUE, QuantityType::LENGTH, Operator::DIVIDE, QuantityType::FORCE},

    // Fluids
    {QuantityType::LENGTH, QuantityType::SPEED, Operator::MULTIPLY, QuantityType::KINEMATIC_VISCOSITY},
    {QuantityType::SPEED, QuantityType::LENGTH, Operator::MULTIPLY, QuantityType::KINEMATIC_VISCOSITY},
    {QuantityType::KINEMATIC_VISCOSITY, QuantityType::LENGTH, Operator::DIVIDE, QuantityType::SPEED},
    {QuantityType::KINEMATIC_VISCOSITY, QuantityType::SPEED, Operator::DIVIDE, QuantityType::LENGTH}
}};

constexpr std::size_t kNoRule = kOperatorRules.size();

/**
 * @brief Index of the rule for (left, right, op), kNoRule if none
 */
constexpr std::size_t findRule(QuantityType left, QuantityType right, Operator op) {
    for (std::size_t i = 0; i < kOperatorRules.size(); ++i) {
        const OperatorRule& rule = kOperatorRules[i];
        if (rule.left == left && rule.right == right && rule.op == op) {
            return i;
        }
    }
    return kNoRule;
}

constexpr bool hasRule(QuantityType left, QuantityType right, Operator op,
                       QuantityType result) {
    const std::size_t index = findRule(left, right, op);
    return index != kNoRule && kOperatorRules[index].result == result;
}

/**
 * @brief Every A x B = C has C / A = B, C / B = A and B x A = C, and every
 * C / A = B has a product A x B = C
 */
constexpr bool rulesAreClosed() {
    for (std::size_t i = 0; i < kOperatorRules.size(); ++i) {
        const OperatorRule& rule = kOperatorRules[i];
        if (rule.op == Operator::MULTIPLY) {
            if (!hasRule(rule.result, rule.left, Operator::DIVIDE, rule.right)) return false;
            if (!hasRule(rule.result, rule.right, Operator::DIVIDE, rule.left)) return false;
            if (!hasRule(rule.right, rule.left, Operator::MULTIPLY, rule.result)) return false;
        } else {
            if (!hasRule(rule.right, rule.result, Operator::MULTIPLY, rule.left)) return false;
        }
    }
    return true;
}

// At most one rule per (left, right, op)
constexpr bool rulesAreUnambiguous() {
    for (std::size_t i = 0; i < kOperatorRules.size(); ++i) {
        const OperatorRule& rule = kOperatorRules[i];
        if (findRule(rule.left, rule.right, rule.op) != i) return false;
    }
    return true;
}

static_assert(rulesAreClosed(), "Operator rules must be closed under division");
static_assert(rulesAreUnambiguous(), "Operator rules must not contradict each other");

std::string toString(Operator op);

// =============================================================================
// Operator network
// =============================================================================

/**
 * @brief Cross-type multiplication and division of quantities
 *
 * Both operands are converted to base values, one multiplication or
 * division is applied, and the result is returned in the base unit of the
 * result type. Stateless apart from the division policy, so one instance
 * can be shared freely.
 */
class OperatorNetwork {
public:
    explicit OperatorNetwork(DivisionPolicy policy = DivisionPolicy::THROW);

    /**
     * @throws DimensionMismatch if no rule multiplies these types
     */
    Quantity multiply(const Quantity& left, const Quantity& right) const;

    /**
     * @throws DimensionMismatch if no rule divides these types
     * @throws DivisionByZero if the divisor is zero under DivisionPolicy::THROW
     */
    Quantity divide(const Quantity& left, const Quantity& right) const;

    bool canApply(QuantityType left, QuantityType right, Operator op) const {
        return findRule(left, right, op) != kNoRule;
    }

    /**
     * @throws DimensionMismatch if no rule applies
     */
    QuantityType resultType(QuantityType left, QuantityType right, Operator op) const;

    DivisionPolicy divisionPolicy() const { return policy_; }

    static const std::array<OperatorRule, 26>& rules() { return kOperatorRules; }

    static bool isClosed() { return rulesAreClosed(); }

private:
    const OperatorRule& rule(QuantityType left, QuantityType right, Operator op) const;

    DivisionPolicy policy_;
};

DivisionPolicy parseDivisionPolicy(const std::string& name);
std::string toString(DivisionPolicy policy);

} // namespace Quantica

#endif // QUANTICA_OPERATOR_NETWORK_HPP
