#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

#include "common/models.hpp"

namespace testline {

struct TrendCacheKey {
    std::string scopeSignature;
    int windowDays = 0;
    // Reference day index of "now"; every cutoff in the series derives from it.
    std::int64_t dayIndex = 0;

    bool operator<(const TrendCacheKey &other) const
    {
        return std::tie(scopeSignature, windowDays, dayIndex)
            < std::tie(other.scopeSignature, other.windowDays, other.dayIndex);
    }
};

// Injectable trend cache. Entries remember which test cases their scope
// covered so a new event for one test case only drops the entries it can
// change.
class TrendCache
{
public:
    virtual ~TrendCache() = default;

    virtual std::optional<std::vector<AggregateSnapshot>> lookup(const TrendCacheKey &key) const = 0;

    // unrestricted: the scope covers every test case, including ones added later.
    // Storing a key drops every entry keyed to an earlier day.
    virtual void store(const TrendCacheKey &key,
                       const std::set<std::string> &testCaseIds,
                       bool unrestricted,
                       const std::vector<AggregateSnapshot> &points) = 0;

    virtual void invalidateTestCase(const std::string &testCaseId) = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;
};

class InMemoryTrendCache : public TrendCache
{
public:
    std::optional<std::vector<AggregateSnapshot>> lookup(const TrendCacheKey &key) const override;
    void store(const TrendCacheKey &key,
               const std::set<std::string> &testCaseIds,
               bool unrestricted,
               const std::vector<AggregateSnapshot> &points) override;
    void invalidateTestCase(const std::string &testCaseId) override;
    void clear() override;
    std::size_t size() const override;

private:
    struct Entry {
        std::set<std::string> testCaseIds;
        bool unrestricted = false;
        std::vector<AggregateSnapshot> points;
    };

    mutable std::shared_mutex m_mutex;
    std::map<TrendCacheKey, Entry> m_entries;
};

// Never stores anything; every lookup misses.
class NullTrendCache : public TrendCache
{
public:
    std::optional<std::vector<AggregateSnapshot>> lookup(const TrendCacheKey &key) const override;
    void store(const TrendCacheKey &key,
               const std::set<std::string> &testCaseIds,
               bool unrestricted,
               const std::vector<AggregateSnapshot> &points) override;
    void invalidateTestCase(const std::string &testCaseId) override;
    void clear() override;
    std::size_t size() const override;
};

} // namespace testline
