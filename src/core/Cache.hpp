#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>


namespace blockreader
{
namespace CacheStrategy
{
template<typename Index>
class CacheStrategy
{
public:
    virtual
    ~CacheStrategy() = default;

    virtual void
    touch( const Index& index ) = 0;

    /**
     * @return The next eviction no matter whether the cache is currently full. Only returns nothing if the cache
     *         is empty, i.e., there is nothing to evict.
     */
    [[nodiscard]] virtual std::optional<Index>
    nextEviction() const = 0;

    /**
     * @param indexToEvict If an index is given, that index will be removed if it exists instead of using
     *                     the cache strategy.
     */
    virtual std::optional<Index>
    evict( std::optional<Index> indexToEvict = {} ) = 0;
};


template<typename Index>
class LeastRecentlyUsed :
    public CacheStrategy<Index>
{
public:
    using Nonce = uint64_t;

public:
    LeastRecentlyUsed() = default;

    void
    touch( const Index& index ) override
    {
        ++m_usageNonce;
        auto [match, wasInserted] = m_lastUsage.try_emplace( index, m_usageNonce );
        if ( !wasInserted ) {
            m_sortedIndexes.erase( match->second );
            match->second = m_usageNonce;
        }
        m_sortedIndexes.emplace( m_usageNonce, index );
    }

    [[nodiscard]] std::optional<Index>
    nextEviction() const override
    {
        return m_sortedIndexes.empty() ? std::nullopt : std::make_optional( m_sortedIndexes.begin()->second );
    }

    std::optional<Index>
    evict( std::optional<Index> indexToEvict = {} ) override
    {
        auto evictedIndex = indexToEvict ? std::move( indexToEvict ) : nextEviction();
        if ( evictedIndex ) {
            const auto existingEntry = m_lastUsage.find( *evictedIndex );
            if ( existingEntry != m_lastUsage.end() ) {
                m_sortedIndexes.erase( existingEntry->second );
                m_lastUsage.erase( existingEntry );
            }
        }
        return evictedIndex;
    }

    /**
     * @return All known indexes ordered from least recently to most recently used.
     */
    [[nodiscard]] std::vector<Index>
    usageOrder() const
    {
        std::vector<Index> result;
        result.reserve( m_sortedIndexes.size() );
        for ( const auto& [nonce, index] : m_sortedIndexes ) {
            result.emplace_back( index );
        }
        return result;
    }

private:
    std::unordered_map<Index, Nonce> m_lastUsage;

    /**
     * Keep a map of values sorted by nonce, i.e., by timestamp. A multimap is not necessary because nonces
     * are unique. m_sortedIndexes.begin holds the least recent index.
     */
    std::map<Nonce, Index> m_sortedIndexes;

    Nonce m_usageNonce{ 0 };
};
}  // namespace CacheStrategy


/**
 * A cache whose capacity is not given in entries but in a weight, e.g., bytes, summed over all entries.
 * The weight of a value is queried once on insertion and remembered. By default, each entry weighs 1,
 * which results in a cache limited by the entry count.
 *
 * Each value that leaves the cache, be it because of an eviction to make room, an explicit @ref evict,
 * @ref clear, or because it has been replaced by @ref insert, is handed to the eviction callback.
 * The callback is called synchronously and must not access the cache.
 *
 * Calls to members are not thread-safe!
 */
template<
    typename Key,
    typename Value,
    typename CacheStrategy = CacheStrategy::LeastRecentlyUsed<Key>
>
class Cache
{
public:
    using GetWeight = std::function<size_t( const Value& )>;
    using OnEviction = std::function<void( const Key&, Value&& )>;

    struct Statistics
    {
        size_t hits{ 0 };
        size_t misses{ 0 };
        size_t insertions{ 0 };
        size_t evictions{ 0 };
        size_t rejections{ 0 };
        /** Entries that got evicted without being accessed even once. */
        size_t unusedEntries{ 0 };
        size_t capacity{ 0 };
        size_t weight{ 0 };
        size_t maxWeight{ 0 };
        size_t entries{ 0 };
    };

private:
    struct Entry
    {
        Value value;
        size_t weight{ 1 };
        size_t accesses{ 0 };
    };

public:
    explicit
    Cache( size_t     capacity,
           GetWeight  getWeight = {},
           OnEviction onEviction = {} ) :
        m_capacity( capacity ),
        m_getWeight( std::move( getWeight ) ),
        m_onEviction( std::move( onEviction ) )
    {}

    ~Cache()
    {
        clear();
    }

    Cache( const Cache& ) = delete;

    Cache&
    operator=( const Cache& ) = delete;

    [[nodiscard]] std::optional<Value>
    get( const Key& key )
    {
        if ( const auto match = m_cache.find( key ); match != m_cache.end() ) {
            ++m_statistics.hits;
            ++match->second.accesses;
            m_cacheStrategy.touch( key );
            return match->second.value;
        }

        ++m_statistics.misses;
        return std::nullopt;
    }

    /**
     * Inserts or replaces the value for @p key and then evicts entries in the order given by the cache strategy
     * until the summed weight fits into the capacity. The inserted value itself is never evicted to make room
     * for itself. A value weighing more than the whole capacity is not inserted at all and directly handed to
     * the eviction callback.
     * @return false if the value was rejected because it is heavier than the capacity.
     */
    bool
    insert( const Key& key,
            Value      value )
    {
        const auto weight = m_getWeight ? m_getWeight( value ) : size_t( 1 );
        if ( weight > m_capacity ) {
            ++m_statistics.rejections;
            if ( m_cache.find( key ) != m_cache.end() ) {
                evict( key );
            }
            if ( m_onEviction ) {
                m_onEviction( key, std::move( value ) );
            }
            return false;
        }

        ++m_statistics.insertions;

        if ( const auto existingEntry = m_cache.find( key ); existingEntry != m_cache.end() ) {
            auto replaced = std::move( existingEntry->second.value );
            m_weight -= existingEntry->second.weight;
            existingEntry->second.value = std::move( value );
            existingEntry->second.weight = weight;
            m_weight += weight;
            if ( m_onEviction ) {
                m_onEviction( key, std::move( replaced ) );
            }
        } else {
            m_cache.emplace( key, Entry{ std::move( value ), weight, 0 } );
            m_weight += weight;
        }
        m_cacheStrategy.touch( key );

        /* Shrink while protecting the newly inserted entry, which is the most recently used one. */
        while ( m_weight > m_capacity ) {
            const auto toEvict = m_cacheStrategy.nextEviction();
            if ( !toEvict || ( *toEvict == key ) ) {
                throw std::logic_error( "The cache strategy does not offer an eviction even though the cache "
                                        "exceeds its capacity!" );
            }
            evictEntry( *toEvict );
        }

        m_statistics.maxWeight = std::max( m_statistics.maxWeight, m_weight );
        return true;
    }

    /* Advanced Control and Usage */

    /**
     * Same as @ref get but neither counts as an access nor changes the eviction order.
     */
    [[nodiscard]] std::optional<Value>
    peek( const Key& key ) const
    {
        if ( const auto match = m_cache.find( key ); match != m_cache.end() ) {
            return match->second.value;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool
    test( const Key& key ) const
    {
        return m_cache.find( key ) != m_cache.end();
    }

    /**
     * @return true if an entry for @p key existed and has been evicted.
     */
    bool
    evict( const Key& key )
    {
        if ( !test( key ) ) {
            return false;
        }
        evictEntry( key );
        return true;
    }

    void
    clear()
    {
        while ( !m_cache.empty() ) {
            const auto toEvict = m_cacheStrategy.nextEviction();
            evictEntry( toEvict ? *toEvict : m_cache.begin()->first );
        }
    }

    /* Analytics */

    [[nodiscard]] Statistics
    statistics() const
    {
        auto result = m_statistics;
        result.capacity = m_capacity;
        result.weight = m_weight;
        result.entries = m_cache.size();
        return result;
    }

    [[nodiscard]] size_t
    capacity() const noexcept
    {
        return m_capacity;
    }

    /**
     * @return The summed weight of all entries.
     */
    [[nodiscard]] size_t
    weight() const noexcept
    {
        return m_weight;
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_cache.size();
    }

    [[nodiscard]] const CacheStrategy&
    cacheStrategy() const noexcept
    {
        return m_cacheStrategy;
    }

private:
    void
    evictEntry( const Key& key )
    {
        /* Copy the key because it might be a reference into the map entry we are about to erase. */
        const auto keyToEvict = key;
        m_cacheStrategy.evict( keyToEvict );

        const auto match = m_cache.find( keyToEvict );
        if ( match == m_cache.end() ) {
            return;
        }

        auto entry = std::move( match->second );
        m_cache.erase( match );
        m_weight -= entry.weight;

        ++m_statistics.evictions;
        if ( entry.accesses == 0 ) {
            ++m_statistics.unusedEntries;
        }

        if ( m_onEviction ) {
            m_onEviction( keyToEvict, std::move( entry.value ) );
        }
    }

private:
    CacheStrategy m_cacheStrategy;
    const size_t m_capacity;
    const GetWeight m_getWeight;
    const OnEviction m_onEviction;

    std::unordered_map<Key, Entry> m_cache;
    size_t m_weight{ 0 };

    /* Analytics */
    Statistics m_statistics;
};
}  // namespace blockreader
