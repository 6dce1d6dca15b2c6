#include "CompositeGrammar.hpp"
#include <stdexcept>

namespace Quantica {

CompositeGrammar feetInchesGrammar() {
    CompositeGrammar grammar;
    grammar.name = "FeetInches";
    grammar.parts = {{"Foot", "\\s?"}, {"Inch", ""}};
    return grammar;
}

CompositeGrammar stonePoundsGrammar() {
    CompositeGrammar grammar;
    grammar.name = "StonePounds";
    grammar.parts = {{"Stone", "\\s?"}, {"Pound", ""}};
    return grammar;
}

void CompositeRegistry::add(QuantityType type, const CompositeGrammar& grammar,
                            const UnitTable& table) {
    if (grammar.parts.size() < 2) {
        throw std::invalid_argument("Composite grammar " + grammar.name +
                                    " needs at least two parts");
    }

    for (const auto& part : grammar.parts) {
        // Throws UnknownUnit for a misspelled part
        table.getUnit(type, part.unit);
    }

    auto& registered = grammars_[type];
    for (const auto& existing : registered) {
        if (existing.name == grammar.name) {
            throw std::invalid_argument("Composite grammar " + grammar.name +
                                        " already registered for " + toString(type));
        }
    }
    registered.push_back(grammar);
}

const std::vector<CompositeGrammar>& CompositeRegistry::grammarsFor(QuantityType type) const {
    static const std::vector<CompositeGrammar> kNone;
    auto it = grammars_.find(type);
    if (it == grammars_.end()) {
        return kNone;
    }
    return it->second;
}

bool CompositeRegistry::has(QuantityType type) const {
    return !grammarsFor(type).empty();
}

size_t CompositeRegistry::size() const {
    size_t count = 0;
    for (const auto& pair : grammars_) {
        count += pair.second.size();
    }
    return count;
}

CompositeRegistry CompositeRegistry::withBuiltins() {
    CompositeRegistry registry;
    registry.add(QuantityType::LENGTH, feetInchesGrammar());
    return registry;
}

} // namespace Quantica
