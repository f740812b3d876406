#include <pagescope/analysis/result_cache.h>

namespace pagescope::analysis {

// ============================================================================
// InMemoryResultCache
// ============================================================================

std::optional<AnalysisRecord> InMemoryResultCache::get(const std::string& url) {
    std::lock_guard lock(mu_);
    auto it = entries_.find(url);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void InMemoryResultCache::set(const std::string& url, const AnalysisRecord& record) {
    std::lock_guard lock(mu_);
    entries_.insert_or_assign(url, record);
}

void InMemoryResultCache::remove(const std::string& url) {
    std::lock_guard lock(mu_);
    entries_.erase(url);
}

void InMemoryResultCache::clear() {
    std::lock_guard lock(mu_);
    entries_.clear();
}

size_t InMemoryResultCache::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

// ============================================================================
// BoundedResultCache
// ============================================================================

BoundedResultCache::BoundedResultCache(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::optional<AnalysisRecord> BoundedResultCache::get(const std::string& url) {
    std::lock_guard lock(mu_);
    auto it = entries_.find(url);
    if (it == entries_.end()) return std::nullopt;

    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    return it->second.record;
}

void BoundedResultCache::set(const std::string& url, const AnalysisRecord& record) {
    std::lock_guard lock(mu_);

    auto it = entries_.find(url);
    if (it != entries_.end()) {
        it->second.record = record;
        lru_.splice(lru_.begin(), lru_, it->second.lru_it);
        return;
    }

    lru_.push_front(url);
    entries_.emplace(url, Entry{record, lru_.begin()});
    evict_if_needed();
}

void BoundedResultCache::remove(const std::string& url) {
    std::lock_guard lock(mu_);
    auto it = entries_.find(url);
    if (it != entries_.end()) {
        lru_.erase(it->second.lru_it);
        entries_.erase(it);
    }
}

void BoundedResultCache::clear() {
    std::lock_guard lock(mu_);
    entries_.clear();
    lru_.clear();
}

size_t BoundedResultCache::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

void BoundedResultCache::evict_if_needed() {
    // Called with mu_ held
    while (entries_.size() > capacity_ && !lru_.empty()) {
        entries_.erase(lru_.back());
        lru_.pop_back();
    }
}

} // namespace pagescope::analysis
