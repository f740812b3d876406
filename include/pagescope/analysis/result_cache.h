#pragma once
#include <pagescope/analysis/record.h>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pagescope::analysis {

// Process-wide store of finished records, keyed by the exact request URL
// (no normalization). Implementations must be safe to call from any thread.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    virtual std::optional<AnalysisRecord> get(const std::string& url) = 0;
    virtual void set(const std::string& url, const AnalysisRecord& record) = 0;
    virtual void remove(const std::string& url) = 0;
    virtual void clear() = 0;
    virtual size_t size() const = 0;
};

// Unbounded map under one mutex. Entries never expire.
class InMemoryResultCache : public ResultCache {
public:
    std::optional<AnalysisRecord> get(const std::string& url) override;
    void set(const std::string& url, const AnalysisRecord& record) override;
    void remove(const std::string& url) override;
    void clear() override;
    size_t size() const override;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, AnalysisRecord> entries_;
};

// Stores nothing; every lookup misses.
class NullResultCache : public ResultCache {
public:
    std::optional<AnalysisRecord> get(const std::string&) override { return std::nullopt; }
    void set(const std::string&, const AnalysisRecord&) override {}
    void remove(const std::string&) override {}
    void clear() override {}
    size_t size() const override { return 0; }
};

// Fixed number of entries; the least recently used one is evicted first.
class BoundedResultCache : public ResultCache {
public:
    static constexpr size_t kDefaultCapacity = 256;

    explicit BoundedResultCache(size_t capacity = kDefaultCapacity);

    std::optional<AnalysisRecord> get(const std::string& url) override;
    void set(const std::string& url, const AnalysisRecord& record) override;
    void remove(const std::string& url) override;
    void clear() override;
    size_t size() const override;

    size_t capacity() const { return capacity_; }

private:
    void evict_if_needed();

    mutable std::mutex mu_;
    size_t capacity_;

    // front = most recently used, back = least recently used
    using LruList = std::list<std::string>;
    LruList lru_;

    struct Entry {
        AnalysisRecord record;
        LruList::iterator lru_it;
    };
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace pagescope::analysis
