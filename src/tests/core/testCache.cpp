#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <core/Cache.hpp>
#include <core/TestHelpers.hpp>


using namespace blockreader;


void
testCacheReinsertion()
{
    Cache<size_t, double> cache( /* capacity */ 2 );

    cache.insert( 2, 4.0 );
    cache.insert( 1, 1.0 );
    /* Replacing an existing key's value should not trigger evictions. */
    cache.insert( 1, 2.0 );

    REQUIRE_EQUAL( cache.size(), 2U );
    REQUIRE_EQUAL( cache.statistics().evictions, 0U );
    /** Unused entries are those that got evicted without them being accessed first. */
    REQUIRE_EQUAL( cache.statistics().unusedEntries, 0U );
    REQUIRE( cache.get( 1 ) == std::make_optional( 2.0 ) );
}


void
testLeastRecentlyUsedEviction()
{
    std::vector<size_t> evicted;
    Cache<size_t, int> cache( /* capacity */ 3, {}, [&evicted] ( const size_t& key, int&& ) {
        evicted.emplace_back( key );
    } );

    cache.insert( 1, 1 );
    cache.insert( 2, 2 );
    cache.insert( 3, 3 );

    /* Touch 1 so that 2 becomes the least recently used entry. */
    REQUIRE( cache.get( 1 ).has_value() );
    cache.insert( 4, 4 );

    REQUIRE_EQUAL( evicted.size(), 1U );
    REQUIRE_EQUAL( evicted.front(), 2U );
    REQUIRE( !cache.test( 2 ) );
    REQUIRE( cache.test( 1 ) );
    REQUIRE( cache.test( 3 ) );
    REQUIRE( cache.test( 4 ) );

    const auto order = cache.cacheStrategy().usageOrder();
    REQUIRE_EQUAL( order, ( std::vector<size_t>{ 3, 1, 4 } ) );

    const auto statistics = cache.statistics();
    REQUIRE_EQUAL( statistics.hits, 1U );
    REQUIRE_EQUAL( statistics.evictions, 1U );
    REQUIRE_EQUAL( statistics.unusedEntries, 1U );
}


void
testWeightedCapacity()
{
    std::vector<std::string> evicted;
    Cache<std::string, std::string> cache(
        /* capacity */ 10,
        [] ( const std::string& value ) { return value.size(); },
        [&evicted] ( const std::string& key, std::string&& ) { evicted.emplace_back( key ); } );

    cache.insert( "a", "1234" );
    cache.insert( "b", "1234" );
    REQUIRE_EQUAL( cache.weight(), 8U );
    REQUIRE( evicted.empty() );

    /* Needs 6 bytes, which only fit after evicting the least recently used entry. */
    cache.insert( "c", "123456" );
    REQUIRE_EQUAL( evicted, ( std::vector<std::string>{ "a" } ) );
    REQUIRE_EQUAL( cache.weight(), 10U );

    /* Heavier than the whole capacity: never inserted, directly handed to the eviction callback. */
    evicted.clear();
    REQUIRE( !cache.insert( "d", "12345678901" ) );
    REQUIRE( !cache.test( "d" ) );
    REQUIRE_EQUAL( evicted, ( std::vector<std::string>{ "d" } ) );
    REQUIRE_EQUAL( cache.statistics().rejections, 1U );
    REQUIRE_EQUAL( cache.weight(), 10U );

    /* Replacing a value hands the old value to the callback and updates the weight. */
    evicted.clear();
    cache.insert( "c", "12" );
    REQUIRE_EQUAL( evicted, ( std::vector<std::string>{ "c" } ) );
    REQUIRE_EQUAL( cache.weight(), 6U );
    REQUIRE_EQUAL( cache.statistics().maxWeight, 10U );
}


void
testExplicitEvictionAndClear()
{
    size_t evictionCount{ 0 };
    Cache<int, int> cache( /* capacity */ 10, {}, [&evictionCount] ( const int&, int&& ) { ++evictionCount; } );

    cache.insert( 1, 10 );
    cache.insert( 2, 20 );
    cache.insert( 3, 30 );

    REQUIRE( cache.evict( 2 ) );
    REQUIRE( !cache.evict( 2 ) );
    REQUIRE( !cache.evict( 42 ) );
    REQUIRE_EQUAL( evictionCount, 1U );

    /* Peeking neither counts as a hit nor changes the eviction order. */
    REQUIRE( cache.peek( 1 ) == std::make_optional( 10 ) );
    REQUIRE_EQUAL( cache.statistics().hits, 0U );
    REQUIRE( cache.cacheStrategy().nextEviction() == std::make_optional( 1 ) );

    cache.clear();
    REQUIRE_EQUAL( evictionCount, 3U );
    REQUIRE_EQUAL( cache.size(), 0U );
    REQUIRE_EQUAL( cache.weight(), 0U );
    REQUIRE( !cache.get( 1 ).has_value() );
    REQUIRE_EQUAL( cache.statistics().misses, 1U );
}


void
testEvictionOnDestruction()
{
    size_t evictionCount{ 0 };
    {
        Cache<int, int> cache( /* capacity */ 10, {}, [&evictionCount] ( const int&, int&& ) { ++evictionCount; } );
        cache.insert( 1, 10 );
        cache.insert( 2, 20 );
    }
    REQUIRE_EQUAL( evictionCount, 2U );
}


int
main()
{
    testCacheReinsertion();
    testLeastRecentlyUsedEviction();
    testWeightedCapacity();
    testExplicitEvictionAndClear();
    testEvictionOnDestruction();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
