#ifndef QUANTICA_PATTERN_CACHE_HPP
#define QUANTICA_PATTERN_CACHE_HPP

#include "UnitTable.hpp"
#include <boost/regex.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Quantica {

/**
 * @brief A compiled pattern and what it denotes
 *
 * unit is set for single-unit patterns and null for composite grammars,
 * where grammar names the grammar instead.
 */
struct ParsePattern {
    std::string key;
    std::string source;
    boost::regex regex;
    QuantityType quantity_type = QuantityType::LENGTH;
    const UnitInfo* unit = nullptr;
    std::string grammar;
};

/**
 * @brief Cache of compiled parse patterns, owned by one parser
 *
 * Keyed by (quantity type, unit or grammar, culture, anchoring). Entries
 * are immutable once inserted. A miss compiles the pattern outside the lock
 * and inserts it if absent; when two threads race on the same key both
 * compile and the first insert wins, which is harmless since the results
 * are identical.
 */
class PatternCache {
public:
    using Factory = std::function<std::shared_ptr<const ParsePattern>()>;

    static std::string makeKey(QuantityType type, const std::string& name,
                               const std::string& culture, bool anchored);

    /**
     * @brief Fetch a pattern, compiling it on a miss
     *
     * Exceptions thrown by the factory propagate and nothing is cached.
     */
    std::shared_ptr<const ParsePattern> getOrCreate(const std::string& key,
                                                    const Factory& factory);

    std::shared_ptr<const ParsePattern> find(const std::string& key) const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const ParsePattern>> patterns_;
};

} // namespace Quantica

#endif // QUANTICA_PATTERN_CACHE_HPP
