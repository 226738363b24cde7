#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <blockreader/BlockAdapter.hpp>
#include <blockreader/BlockCache.hpp>
#include <blockreader/RangeResolver.hpp>
#include <core/common.hpp>
#include <core/TestHelpers.hpp>


using namespace blockreader;


namespace
{
/**
 * Serves slices of an in-memory buffer and counts the fetches.
 */
class CountingAdapter :
    public BlockAdapter
{
public:
    explicit
    CountingAdapter( std::vector<char>         data,
                     std::chrono::milliseconds delay = std::chrono::milliseconds( 0 ) ) :
        m_data( std::move( data ) ),
        m_delay( delay )
    {}

    [[nodiscard]] std::string
    cacheKey( size_t blockNumber ) const override
    {
        return "counting:" + std::to_string( blockNumber );
    }

    [[nodiscard]] std::vector<char>
    fetchBlock( size_t blockFirst,
                size_t blockLast ) override
    {
        ++m_fetchCount;
        if ( m_delay.count() > 0 ) {
            std::this_thread::sleep_for( m_delay );
        }

        const auto begin = std::min( blockFirst, m_data.size() );
        const auto end = std::min( blockLast + 1, m_data.size() );
        return std::vector<char>( m_data.begin() + static_cast<std::ptrdiff_t>( begin ),
                                  m_data.begin() + static_cast<std::ptrdiff_t>( end ) );
    }

    [[nodiscard]] size_t
    fetchCount() const noexcept
    {
        return m_fetchCount;
    }

private:
    const std::vector<char> m_data;
    const std::chrono::milliseconds m_delay;
    std::atomic<size_t> m_fetchCount{ 0 };
};


/**
 * Throws on each fetch if @p nBytesToReturn is 0. Else, returns that many bytes regardless of the extent.
 */
class BrokenAdapter :
    public BlockAdapter
{
public:
    explicit
    BrokenAdapter( size_t nBytesToReturn ) :
        m_nBytesToReturn( nBytesToReturn )
    {}

    [[nodiscard]] std::string
    cacheKey( size_t blockNumber ) const override
    {
        return "broken:" + std::to_string( blockNumber );
    }

    [[nodiscard]] std::vector<char>
    fetchBlock( size_t,
                size_t ) override
    {
        if ( m_nBytesToReturn == 0 ) {
            throw std::runtime_error( "Origin is unreachable!" );
        }
        return std::vector<char>( m_nBytesToReturn, 'x' );
    }

private:
    const size_t m_nBytesToReturn;
};


/**
 * @return The inclusive range [first, last] of createOffsetBytes.
 */
[[nodiscard]] std::vector<char>
offsetBytes( size_t first,
             size_t last )
{
    std::vector<char> result;
    for ( auto i = first; i <= last; ++i ) {
        result.push_back( static_cast<char>( static_cast<uint8_t>( i ) ) );
    }
    return result;
}


[[nodiscard]] std::shared_ptr<BlockCache>
createCache( const std::filesystem::path& folder )
{
    BlockCache::Configuration configuration;
    configuration.temporaryDirectory = folder;
    configuration.capacity = 1000;
    return std::make_shared<BlockCache>( configuration );
}
}  // namespace


void
testMissThenHit( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 30 ) );

    std::vector<size_t> populated;
    RangeResolver resolver( cache, adapter, 10, [&populated] ( size_t blockNumber ) {
        populated.push_back( blockNumber );
    } );
    REQUIRE_EQUAL( resolver.blockSize(), 10U );

    /* Range [5, 15) spans the end of block 0 and the start of block 1. */
    REQUIRE_EQUAL( resolver.resolveBlock( 5, 15, 0 ), offsetBytes( 5, 9 ) );
    REQUIRE_EQUAL( resolver.resolveBlock( 5, 15, 1 ), offsetBytes( 10, 14 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );
    REQUIRE_EQUAL( populated, ( std::vector<size_t>{ 0, 1 } ) );
    REQUIRE( cache->test( adapter.cacheKey( 0 ) ) );
    REQUIRE( cache->test( adapter.cacheKey( 1 ) ) );
    REQUIRE( !cache->test( adapter.cacheKey( 2 ) ) );

    /* The whole block is cached even though only a part of it was requested. */
    const auto entry = cache->get( adapter.cacheKey( 0 ) );
    REQUIRE( entry.has_value() );
    REQUIRE_EQUAL( entry->length, 10U );
    REQUIRE_EQUAL( std::filesystem::file_size( entry->filePath ), 10U );

    /* Hits return the same bytes as misses without fetching again. */
    REQUIRE_EQUAL( resolver.resolveBlock( 5, 15, 0 ), offsetBytes( 5, 9 ) );
    REQUIRE_EQUAL( resolver.resolveBlock( 5, 15, 1 ), offsetBytes( 10, 14 ) );
    REQUIRE_EQUAL( resolver.resolveBlock( 0, 30, 0 ), offsetBytes( 0, 9 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );
    REQUIRE_EQUAL( populated.size(), 2U );

    const auto statistics = resolver.statistics();
    REQUIRE_EQUAL( statistics.misses, 2U );
    REQUIRE_EQUAL( statistics.hits, 3U );
    REQUIRE_EQUAL( statistics.fetchedBytes, 20U );
    REQUIRE_EQUAL( statistics.readBytes, 20U );

    REQUIRE_THROWS( resolver.resolveBlock( 5, 15, 2 ) );
}


void
testVanishedBackingFile( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 30 ) );
    RangeResolver resolver( cache, adapter, 10 );

    REQUIRE_EQUAL( resolver.resolveBlock( 20, 30, 2 ), offsetBytes( 20, 29 ) );
    const auto entry = cache->get( adapter.cacheKey( 2 ) );
    REQUIRE( entry.has_value() );
    std::filesystem::remove( entry->filePath );

    /* A vanished backing file is a miss. The block gets fetched and cached anew. */
    REQUIRE_EQUAL( resolver.resolveBlock( 22, 25, 2 ), offsetBytes( 22, 24 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );
    REQUIRE_EQUAL( resolver.statistics().staleEntries, 1U );
    REQUIRE_EQUAL( resolver.statistics().misses, 2U );

    const auto newEntry = cache->get( adapter.cacheKey( 2 ) );
    REQUIRE( newEntry.has_value() );
    REQUIRE( newEntry->filePath != entry->filePath );
    REQUIRE( std::filesystem::exists( newEntry->filePath ) );

    REQUIRE_EQUAL( resolver.resolveBlock( 22, 25, 2 ), offsetBytes( 22, 24 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );
}


void
testShortFinalBlock( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 25 ) );
    RangeResolver resolver( cache, adapter, 10 );

    /* The source ends inside block 2. Only the available bytes are returned on miss and on hit. */
    REQUIRE_EQUAL( resolver.resolveBlock( 15, 30, 2 ), offsetBytes( 20, 24 ) );
    REQUIRE_EQUAL( cache->get( adapter.cacheKey( 2 ) )->length, 5U );
    REQUIRE_EQUAL( resolver.resolveBlock( 15, 30, 2 ), offsetBytes( 20, 24 ) );
    REQUIRE_EQUAL( resolver.resolveBlock( 23, 28, 2 ), offsetBytes( 23, 24 ) );
    REQUIRE( resolver.resolveBlock( 27, 30, 2 ).empty() );

    /* Blocks completely behind the end of the source are empty and known to be so without fetching. */
    REQUIRE_EQUAL( resolver.knownSourceSize(), 25U );
    REQUIRE( resolver.resolveBlock( 30, 40, 3 ).empty() );
    REQUIRE( resolver.resolveBlock( 30, 40, 3 ).empty() );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );
    REQUIRE_EQUAL( resolver.statistics().skippedBlocks, 2U );
    REQUIRE( !cache->test( adapter.cacheKey( 3 ) ) );
}


void
testBlockBehindEndOfSource( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 30 ) );
    size_t populatedCount{ 0 };
    RangeResolver resolver( cache, adapter, 10, [&populatedCount] ( size_t ) { ++populatedCount; } );
    REQUIRE_EQUAL( resolver.knownSourceSize(), std::numeric_limits<size_t>::max() );

    /* The source size is a multiple of the block size, so only an empty fetch reveals its end. */
    REQUIRE( resolver.resolveBlock( 30, 40, 3 ).empty() );
    REQUIRE_EQUAL( adapter.fetchCount(), 1U );
    REQUIRE_EQUAL( resolver.knownSourceSize(), 30U );

    /* Empty blocks are neither cached nor persisted. */
    REQUIRE( !cache->test( adapter.cacheKey( 3 ) ) );
    REQUIRE_EQUAL( populatedCount, 0U );
    REQUIRE_EQUAL( cache->statistics().cache.entries, 0U );
    REQUIRE_EQUAL( cache->statistics().backingFilesCreated, 0U );

    REQUIRE( resolver.resolveBlock( 30, 40, 3 ).empty() );
    REQUIRE( resolver.resolveBlock( 95, 1000, 9 ).empty() );
    REQUIRE_EQUAL( adapter.fetchCount(), 1U );

    /* Blocks before the end are still served. */
    REQUIRE_EQUAL( resolver.resolveBlock( 25, 35, 2 ), offsetBytes( 25, 29 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 2U );

    const auto statistics = resolver.statistics();
    REQUIRE_EQUAL( statistics.misses, 2U );
    REQUIRE_EQUAL( statistics.skippedBlocks, 2U );
}


void
testHitsDoNotWaitForKeyLock( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 30 ) );
    RangeResolver resolver( cache, adapter, 10 );
    REQUIRE_EQUAL( resolver.resolveBlock( 0, 10, 0 ), offsetBytes( 0, 9 ) );

    std::vector<char> result;
    std::atomic<bool> finished{ false };
    std::thread hitThread;
    {
        /* Emulates a long-running population of the same key by another request. */
        const auto keyLock = cache->lockKey( adapter.cacheKey( 0 ) );
        hitThread = std::thread( [&] () {
            result = resolver.resolveBlock( 0, 10, 0 );
            finished = true;
        } );

        for ( size_t i = 0; ( i < 5000 ) && !finished; ++i ) {
            std::this_thread::sleep_for( std::chrono::milliseconds( 1 ) );
        }
        REQUIRE( finished );
    }
    hitThread.join();

    REQUIRE_EQUAL( result, offsetBytes( 0, 9 ) );
    REQUIRE_EQUAL( adapter.fetchCount(), 1U );
    REQUIRE_EQUAL( resolver.statistics().hits, 1U );
}


void
testConcurrentMisses( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );
    CountingAdapter adapter( createOffsetBytes( 30 ), std::chrono::milliseconds( 50 ) );
    RangeResolver resolver( cache, adapter, 10 );

    constexpr size_t THREAD_COUNT = 8;
    std::vector<std::vector<char> > results( THREAD_COUNT );
    std::vector<std::thread> threads;
    for ( size_t i = 0; i < THREAD_COUNT; ++i ) {
        threads.emplace_back( [&resolver, &results, i] () { results[i] = resolver.resolveBlock( 0, 10, 0 ); } );
    }
    for ( auto& thread : threads ) {
        thread.join();
    }

    /* Concurrent requests for the same missing block fetch it only once. */
    REQUIRE_EQUAL( adapter.fetchCount(), 1U );
    for ( const auto& result : results ) {
        REQUIRE_EQUAL( result, offsetBytes( 0, 9 ) );
    }
    REQUIRE_EQUAL( resolver.statistics().misses, 1U );
    REQUIRE_EQUAL( resolver.statistics().hits, THREAD_COUNT - 1 );
}


void
testFailingAdapter( const std::filesystem::path& folder )
{
    const auto cache = createCache( folder );

    {
        BrokenAdapter adapter( 0 );
        size_t populatedCount{ 0 };
        RangeResolver resolver( cache, adapter, 10, [&populatedCount] ( size_t ) { ++populatedCount; } );
        REQUIRE_THROWS( resolver.resolveBlock( 0, 10, 0 ) );
        REQUIRE( !cache->test( adapter.cacheKey( 0 ) ) );
        REQUIRE_EQUAL( populatedCount, 0U );
    }

    {
        /* Adapters must not return more than one block. */
        BrokenAdapter adapter( 11 );
        RangeResolver resolver( cache, adapter, 10 );
        REQUIRE_THROWS( resolver.resolveBlock( 0, 10, 0 ) );
        REQUIRE( !cache->test( adapter.cacheKey( 0 ) ) );
    }

    REQUIRE_EQUAL( cache->statistics().cache.entries, 0U );

    CountingAdapter adapter( createOffsetBytes( 10 ) );
    REQUIRE_THROWS( RangeResolver( nullptr, adapter, 10 ) );
    REQUIRE_THROWS( RangeResolver( cache, adapter, 0 ) );
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "blockreader.testRangeResolver" );

    try
    {
        testMissThenHit( tmpFolder );
        testVanishedBackingFile( tmpFolder );
        testShortFinalBlock( tmpFolder );
        testBlockBehindEndOfSource( tmpFolder );
        testHitsDoNotWaitForKeyLock( tmpFolder );
        testConcurrentMisses( tmpFolder );
        testFailingAdapter( tmpFolder );
    }
    catch ( const std::exception& exception )
    {
        std::cerr << "Caught exception: " << exception.what() << "\n";
        return 1;
    }

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
