#include "NumberFormat.hpp"
#include "QuantityErrors.hpp"
#include <iomanip>
#include <locale>
#include <sstream>

namespace Quantica {

namespace {

void replaceAll(std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
}

} // namespace

// =============================================================================
// NumberFormat Implementation
// =============================================================================

NumberFormat::NumberFormat(const std::string& culture,
                           const std::string& decimal_separator,
                           const std::string& group_separator,
                           const std::string& negative_sign)
    : culture_(culture),
      decimal_separator_(decimal_separator),
      group_separator_(group_separator == decimal_separator ? "" : group_separator),
      negative_sign_(negative_sign.empty() ? "-" : negative_sign) {}

bool NumberFormat::tryParse(const std::string& text, double& value) const {
    if (text.empty()) return false;

    std::string normalized = text;

    // Culture-specific sign first, since it may be multi-byte
    if (negative_sign_ != "-" &&
        normalized.compare(0, negative_sign_.length(), negative_sign_) == 0) {
        normalized.replace(0, negative_sign_.length(), "-");
    }

    if (hasGrouping()) {
        replaceAll(normalized, group_separator_, "");
    }
    if (decimal_separator_ != ".") {
        if (normalized.find('.') != std::string::npos) return false;
        replaceAll(normalized, decimal_separator_, ".");
    }

    std::istringstream ss(normalized);
    ss.imbue(std::locale::classic());
    double parsed = 0.0;
    ss >> parsed;
    if (ss.fail()) return false;

    // Trailing characters mean the text was not a number
    ss.peek();
    if (!ss.eof()) return false;

    value = parsed;
    return true;
}

std::string NumberFormat::format(double value, int precision) const {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(precision) << value;
    std::string text = ss.str();

    if (decimal_separator_ != ".") {
        replaceAll(text, ".", decimal_separator_);
    }
    if (negative_sign_ != "-" && !text.empty() && text[0] == '-') {
        text.replace(0, 1, negative_sign_);
    }
    return text;
}

// =============================================================================
// CultureTable Implementation
// =============================================================================

const CultureTable& CultureTable::instance() {
    static const CultureTable table;
    return table;
}

CultureTable::CultureTable() {
    // U+00A0 no-break space groups digits in Norwegian and Russian
    const std::string nbsp = "\xC2\xA0";

    addCulture(NumberFormat("en-US", ".", ","));
    addCulture(NumberFormat("de-DE", ",", "."));
    addCulture(NumberFormat("nb-NO", ",", nbsp, "\xE2\x88\x92"));  // U+2212 minus sign
    addCulture(NumberFormat("ru-RU", ",", nbsp));
}

void CultureTable::addCulture(const NumberFormat& format) {
    cultures_.emplace(format.culture(), format);
}

const NumberFormat& CultureTable::get(const std::string& culture) const {
    auto it = cultures_.find(culture);
    if (it == cultures_.end()) {
        throw UnknownCulture(culture);
    }
    return it->second;
}

bool CultureTable::has(const std::string& culture) const {
    return cultures_.find(culture) != cultures_.end();
}

std::vector<std::string> CultureTable::names() const {
    std::vector<std::string> result;
    for (const auto& pair : cultures_) {
        result.push_back(pair.first);
    }
    return result;
}

} // namespace Quantica
