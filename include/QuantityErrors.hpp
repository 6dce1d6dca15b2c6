#ifndef QUANTICA_QUANTITY_ERRORS_HPP
#define QUANTICA_QUANTITY_ERRORS_HPP

#include "QuantityType.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief One pattern tried while parsing
 *
 * candidate is the unit name (single-unit path) or the grammar name
 * (composite path). pattern is empty when no pattern could be built, in
 * which case note says why.
 */
struct ParseAttempt {
    std::string candidate;
    std::string pattern;
    std::string note;
};

/**
 * @brief Diagnostics for a failed parse
 *
 * Returned through the try* entry points and carried by FormatException.
 */
struct ParseFailure {
    std::string text;
    QuantityType quantity_type = QuantityType::LENGTH;
    std::string culture;
    std::vector<ParseAttempt> attempts;

    // Multi-line human readable report
    std::string describe() const;
};

// =============================================================================
// Exception hierarchy
// =============================================================================

/**
 * @brief Root of all errors raised by the engine
 */
class QuantityError : public std::runtime_error {
public:
    explicit QuantityError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief No abbreviation exists for a unit in the requested culture,
 * nor in the fallback culture
 */
class AbbreviationNotFound : public QuantityError {
public:
    AbbreviationNotFound(QuantityType type, const std::string& unit,
                         const std::string& culture);

    QuantityType quantityType() const { return quantity_type_; }
    const std::string& unit() const { return unit_; }
    const std::string& culture() const { return culture_; }

private:
    QuantityType quantity_type_;
    std::string unit_;
    std::string culture_;
};

/**
 * @brief A parse pattern was requested for a unit with nothing to match
 */
class NoAbbreviationsForUnit : public QuantityError {
public:
    NoAbbreviationsForUnit(QuantityType type, const std::string& unit,
                           const std::string& culture);

    QuantityType quantityType() const { return quantity_type_; }
    const std::string& unit() const { return unit_; }
    const std::string& culture() const { return culture_; }

private:
    QuantityType quantity_type_;
    std::string unit_;
    std::string culture_;
};

/**
 * @brief Raised by the non-try parse entry points
 */
class FormatException : public QuantityError {
public:
    FormatException(const std::string& message, const ParseFailure& failure);

    const std::string& text() const { return failure_.text; }
    QuantityType quantityType() const { return failure_.quantity_type; }
    const ParseFailure& failure() const { return failure_; }

private:
    ParseFailure failure_;
};

/**
 * @brief Division rule applied to a zero divisor under DivisionPolicy::THROW
 */
class DivisionByZero : public QuantityError {
public:
    explicit DivisionByZero(const std::string& message)
        : QuantityError(message) {}
};

/**
 * @brief Operands whose quantity types do not combine
 */
class DimensionMismatch : public QuantityError {
public:
    explicit DimensionMismatch(const std::string& message)
        : QuantityError(message) {}
};

class UnknownUnit : public QuantityError {
public:
    explicit UnknownUnit(const std::string& message)
        : QuantityError(message) {}
};

class UnknownQuantityType : public QuantityError {
public:
    explicit UnknownQuantityType(const std::string& message)
        : QuantityError(message) {}
};

class UnknownCulture : public QuantityError {
public:
    explicit UnknownCulture(const std::string& culture)
        : QuantityError("Unknown culture: " + culture) {}
};

} // namespace Quantica

#endif // QUANTICA_QUANTITY_ERRORS_HPP
