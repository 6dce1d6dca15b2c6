#include "PatternCache.hpp"

namespace Quantica {

std::string PatternCache::makeKey(QuantityType type, const std::string& name,
                                  const std::string& culture, bool anchored) {
    return toString(type) + "|" + name + "|" + culture + (anchored ? "|^$" : "|~");
}

std::shared_ptr<const ParsePattern> PatternCache::getOrCreate(const std::string& key,
                                                              const Factory& factory) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = patterns_.find(key);
        if (it != patterns_.end()) {
            return it->second;
        }
    }

    // Regex compilation is the expensive part; keep it out of the lock
    std::shared_ptr<const ParsePattern> created = factory();

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = patterns_.emplace(key, created);
    return result.first->second;
}

std::shared_ptr<const ParsePattern> PatternCache::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = patterns_.find(key);
    if (it != patterns_.end()) {
        return it->second;
    }
    return nullptr;
}

size_t PatternCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return patterns_.size();
}

void PatternCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_.clear();
}

} // namespace Quantica
