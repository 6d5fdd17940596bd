#include "engine/trend_cache.hpp"

#include <mutex>

namespace testline {

// ------------------------------------------------------------
// InMemoryTrendCache
// ------------------------------------------------------------

std::optional<std::vector<AggregateSnapshot>> InMemoryTrendCache::lookup(const TrendCacheKey &key) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.points;
}

void InMemoryTrendCache::store(const TrendCacheKey &key,
                               const std::set<std::string> &testCaseIds,
                               bool unrestricted,
                               const std::vector<AggregateSnapshot> &points)
{
    std::unique_lock lock(m_mutex);
    // A series keyed to an earlier day can never be looked up again.
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.dayIndex < key.dayIndex) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }

    Entry &entry = m_entries[key];
    entry.testCaseIds = testCaseIds;
    entry.unrestricted = unrestricted;
    entry.points = points;
}

void InMemoryTrendCache::invalidateTestCase(const std::string &testCaseId)
{
    std::unique_lock lock(m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.unrestricted || it->second.testCaseIds.count(testCaseId) > 0) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

void InMemoryTrendCache::clear()
{
    std::unique_lock lock(m_mutex);
    m_entries.clear();
}

std::size_t InMemoryTrendCache::size() const
{
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

// ------------------------------------------------------------
// NullTrendCache
// ------------------------------------------------------------

std::optional<std::vector<AggregateSnapshot>> NullTrendCache::lookup(const TrendCacheKey &) const
{
    return std::nullopt;
}

void NullTrendCache::store(const TrendCacheKey &,
                           const std::set<std::string> &,
                           bool,
                           const std::vector<AggregateSnapshot> &)
{
}

void NullTrendCache::invalidateTestCase(const std::string &)
{
}

void NullTrendCache::clear()
{
}

std::size_t NullTrendCache::size() const
{
    return 0;
}

} // namespace testline
