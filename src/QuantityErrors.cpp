#include "QuantityErrors.hpp"
#include <sstream>

namespace Quantica {

// =============================================================================
// ParseFailure
// =============================================================================

std::string ParseFailure::describe() const {
    std::ostringstream ss;
    ss << "Unable to parse '" << text << "' as " << toString(quantity_type)
       << " (culture " << culture << ")";
    if (attempts.empty()) {
        ss << ": no pattern was tried";
        return ss.str();
    }
    ss << ", tried " << attempts.size() << " pattern(s):";
    for (const auto& attempt : attempts) {
        ss << "\n  " << attempt.candidate << ": ";
        if (attempt.pattern.empty()) {
            ss << "<none>";
        } else {
            ss << attempt.pattern;
        }
        if (!attempt.note.empty()) {
            ss << " (" << attempt.note << ")";
        }
    }
    return ss.str();
}

// =============================================================================
// Exceptions
// =============================================================================

AbbreviationNotFound::AbbreviationNotFound(QuantityType type, const std::string& unit,
                                           const std::string& culture)
    : QuantityError("No abbreviation for " + toString(type) + "." + unit +
                    " in culture " + culture),
      quantity_type_(type), unit_(unit), culture_(culture) {}

NoAbbreviationsForUnit::NoAbbreviationsForUnit(QuantityType type, const std::string& unit,
                                               const std::string& culture)
    : QuantityError("Unit " + toString(type) + "." + unit +
                    " has no abbreviations to match in culture " + culture),
      quantity_type_(type), unit_(unit), culture_(culture) {}

FormatException::FormatException(const std::string& message, const ParseFailure& failure)
    : QuantityError(message), failure_(failure) {}

} // namespace Quantica
