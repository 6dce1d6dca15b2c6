#ifndef QUANTICA_COMPOSITE_GRAMMAR_HPP
#define QUANTICA_COMPOSITE_GRAMMAR_HPP

#include "UnitTable.hpp"
#include <map>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief One component of a composite format
 *
 * separator is a regex matched between this part and the next one; it is
 * ignored on the last part.
 */
struct CompositePart {
    std::string unit;       // Unit name, e.g. "Foot"
    std::string separator;  // e.g. "\\s?"
};

/**
 * @brief Multi-part textual format such as "2 ft 4 in"
 *
 * The composite pattern is the concatenation of the parts' non-anchored
 * unit patterns joined by their separators and anchored as a whole. Each
 * part is parsed on its own and the parts are summed, so a sign written in
 * front of the first part only applies to that part: "-2 ft 4 in" is
 * -(2 ft) + 4 in.
 */
struct CompositeGrammar {
    std::string name;
    std::vector<CompositePart> parts;
};

// 2 ft 4 in, 2' 4", 2′4″
CompositeGrammar feetInchesGrammar();

// 11 st 6 lb
CompositeGrammar stonePoundsGrammar();

/**
 * @brief Composite grammars registered per quantity type
 *
 * Grammars are tried in registration order. Registration is part of engine
 * set-up; the registry is read-only once parsing starts.
 */
class CompositeRegistry {
public:
    /**
     * @brief Register a grammar for a quantity type
     * @throws std::invalid_argument if the grammar has fewer than two parts
     *         or reuses a name already registered for the type
     * @throws UnknownUnit if a part names a unit the type does not have
     */
    void add(QuantityType type, const CompositeGrammar& grammar,
             const UnitTable& table = UnitTable::instance());

    const std::vector<CompositeGrammar>& grammarsFor(QuantityType type) const;

    bool has(QuantityType type) const;

    size_t size() const;

    /**
     * @brief Registry holding the grammars shipped with the engine
     * (Length feet-inches)
     */
    static CompositeRegistry withBuiltins();

private:
    std::map<QuantityType, std::vector<CompositeGrammar>> grammars_;
};

} // namespace Quantica

#endif // QUANTICA_COMPOSITE_GRAMMAR_HPP
