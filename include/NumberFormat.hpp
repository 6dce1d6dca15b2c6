#ifndef QUANTICA_NUMBER_FORMAT_HPP
#define QUANTICA_NUMBER_FORMAT_HPP

#include <limits>
#include <map>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief Number formatting rules of one culture
 *
 * Passed explicitly to every parse and format call. When the group
 * separator equals the decimal separator grouping is disabled, so the two
 * can never be confused.
 */
class NumberFormat {
public:
    NumberFormat(const std::string& culture,
                 const std::string& decimal_separator,
                 const std::string& group_separator,
                 const std::string& negative_sign = "-");

    const std::string& culture() const { return culture_; }
    const std::string& decimalSeparator() const { return decimal_separator_; }
    const std::string& groupSeparator() const { return group_separator_; }
    const std::string& negativeSign() const { return negative_sign_; }
    bool hasGrouping() const { return !group_separator_.empty(); }

    /**
     * @brief Parse a number written in this culture
     *
     * Accepts group separators, the culture's decimal separator, a leading
     * '+', '-' or the culture's negative sign and an exponent. The whole
     * string must be consumed.
     * @param text Number text, no surrounding whitespace
     * @param[out] value Parsed value
     * @return true if parsing successful
     */
    bool tryParse(const std::string& text, double& value) const;

    /**
     * @brief Format a number in this culture, without group separators
     */
    std::string format(double value,
                       int precision = std::numeric_limits<double>::max_digits10) const;

private:
    std::string culture_;
    std::string decimal_separator_;
    std::string group_separator_;
    std::string negative_sign_;
};

/**
 * @brief Immutable table of the cultures the engine knows
 */
class CultureTable {
public:
    static const CultureTable& instance();

    /**
     * @brief Number format of a culture
     * @throws UnknownCulture if the identifier is not in the table
     */
    const NumberFormat& get(const std::string& culture) const;

    bool has(const std::string& culture) const;

    std::vector<std::string> names() const;

private:
    CultureTable();
    void addCulture(const NumberFormat& format);

    std::map<std::string, NumberFormat> cultures_;
};

} // namespace Quantica

#endif // QUANTICA_NUMBER_FORMAT_HPP
