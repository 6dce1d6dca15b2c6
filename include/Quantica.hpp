#ifndef QUANTICA_HPP
#define QUANTICA_HPP

// Umbrella header: the unit table, parsing, arithmetic and configuration

#include "QuantityType.hpp"
#include "QuantityErrors.hpp"
#include "UnitTable.hpp"
#include "NumberFormat.hpp"
#include "AbbreviationResolver.hpp"
#include "PatternBuilder.hpp"
#include "PatternCache.hpp"
#include "CompositeGrammar.hpp"
#include "Quantity.hpp"
#include "QuantityFormatter.hpp"
#include "QuantityParser.hpp"
#include "OperatorNetwork.hpp"
#include "QuantityEngine.hpp"
#include "ConfigReader.hpp"

namespace Quantica {

// Version information
constexpr int QUANTICA_VERSION_MAJOR = 1;
constexpr int QUANTICA_VERSION_MINOR = 0;
constexpr int QUANTICA_VERSION_PATCH = 0;

} // namespace Quantica

#endif // QUANTICA_HPP
