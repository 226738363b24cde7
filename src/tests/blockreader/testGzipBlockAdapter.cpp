#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <blockreader/blockreader.hpp>
#include <core/common.hpp>
#include <core/filereader/Memory.hpp>
#include <core/filereader/Standard.hpp>
#include <core/TestHelpers.hpp>
#include <core/zlib.hpp>


using namespace blockreader;


namespace
{
/**
 * Text-like data, which compresses well but still has enough variation to catch misplaced slices.
 */
[[nodiscard]] std::vector<char>
createTestData( size_t size )
{
    std::vector<char> result( size );
    uint32_t state = 12345;
    for ( size_t i = 0; i < size; ++i ) {
        state = state * 1103515245U + 12345U;
        result[i] = static_cast<char>( 'a' + ( ( state >> 16U ) % 8U ) );
    }
    return result;
}


[[nodiscard]] std::vector<char>
subrange( const std::vector<char>& data,
          size_t                   start,
          size_t                   end )
{
    start = std::min( start, data.size() );
    end = std::min( end, data.size() );
    if ( start >= end ) {
        return {};
    }
    return std::vector<char>( data.begin() + static_cast<std::ptrdiff_t>( start ),
                              data.begin() + static_cast<std::ptrdiff_t>( end ) );
}


[[nodiscard]] std::vector<char>
decompressAll( const std::vector<char>& compressed )
{
    ZlibInflater inflater( std::make_unique<MemoryFileReader>( compressed ) );
    std::vector<char> result;
    std::vector<char> buffer( 4096 );
    while ( true ) {
        const auto nBytesRead = inflater.read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        result.insert( result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>( nBytesRead ) );
    }
    return result;
}
}  // namespace


void
testZlibInflater()
{
    const auto data = createTestData( 100'000 );
    const auto compressed = compressWithZlib( data );
    REQUIRE( compressed.size() < data.size() );
    REQUIRE_EQUAL( decompressAll( compressed ), data );

    /* Concatenated gzip members decompress to the concatenated contents. */
    const auto otherData = createTestData( 5'000 );
    auto concatenated = compressed;
    const auto otherCompressed = compressWithZlib( otherData );
    concatenated.insert( concatenated.end(), otherCompressed.begin(), otherCompressed.end() );

    auto expected = data;
    expected.insert( expected.end(), otherData.begin(), otherData.end() );
    REQUIRE_EQUAL( decompressAll( concatenated ), expected );

    /* Skipping discards exactly the requested number of bytes. */
    {
        ZlibInflater inflater( std::make_unique<MemoryFileReader>( concatenated ) );
        REQUIRE_EQUAL( inflater.skip( 100'010 ), 100'010U );
        REQUIRE_EQUAL( inflater.tell(), 100'010U );
        std::vector<char> buffer( 10 );
        REQUIRE_EQUAL( inflater.read( buffer.data(), buffer.size() ), 10U );
        REQUIRE_EQUAL( buffer, subrange( expected, 100'010, 100'020 ) );
        REQUIRE_EQUAL( inflater.skip( 1'000'000 ), expected.size() - 100'020 );
        REQUIRE( inflater.eos() );
    }

    /* Zlib container instead of gzip. */
    {
        ZlibInflater inflater( std::make_unique<MemoryFileReader>( compressWithZlib( data, ContainerFormat::ZLIB ) ),
                               ContainerFormat::ZLIB );
        std::vector<char> result( data.size() + 1 );
        REQUIRE_EQUAL( inflater.read( result.data(), result.size() ), data.size() );
        result.resize( data.size() );
        REQUIRE_EQUAL( result, data );
    }

    /* Decompressed sizes that are an exact multiple of the output buffer must not be mistaken as truncated. */
    const auto exactData = createTestData( 4096 * 3 );
    REQUIRE_EQUAL( decompressAll( compressWithZlib( exactData ) ), exactData );

    /* Empty input is an empty stream. */
    REQUIRE( decompressAll( {} ).empty() );
}


void
testTruncatedInput()
{
    const auto data = createTestData( 100'000 );
    auto compressed = compressWithZlib( data );
    compressed.resize( compressed.size() / 2 );
    REQUIRE_THROWS( decompressAll( compressed ) );

    /* Garbage is no gzip stream. */
    const std::vector<char> garbage( 100, 'x' );
    REQUIRE_THROWS( decompressAll( garbage ) );
}


void
testFetchBlock()
{
    const auto data = createTestData( 25'000 );
    GzipBlockAdapter adapter( std::make_unique<MemoryFileReader>( compressWithZlib( data ) ), "memory", 10'000 );

    REQUIRE_EQUAL( adapter.cacheKey( 2 ), std::string( "gzip:memory:10000:2" ) );
    REQUIRE_EQUAL( adapter.fetchBlock( 0, 9'999 ), subrange( data, 0, 10'000 ) );
    REQUIRE_EQUAL( adapter.fetchBlock( 10'000, 19'999 ), subrange( data, 10'000, 20'000 ) );
    REQUIRE_EQUAL( adapter.fetchBlock( 20'000, 29'999 ), subrange( data, 20'000, 25'000 ) );
    REQUIRE( adapter.fetchBlock( 30'000, 39'999 ).empty() );
    REQUIRE_EQUAL( adapter.fetchCount(), 4U );
    REQUIRE_THROWS( adapter.fetchBlock( 10, 9 ) );

    adapter.close();
    REQUIRE_THROWS( adapter.fetchBlock( 0, 9'999 ) );
}


void
testGzipThroughBlockReader( const std::filesystem::path& folder )
{
    const auto data = createTestData( 1'000'000 );
    auto compressed = compressWithZlib( subrange( data, 0, 400'000 ) );
    const auto secondMember = compressWithZlib( subrange( data, 400'000, data.size() ) );
    compressed.insert( compressed.end(), secondMember.begin(), secondMember.end() );

    const auto gzipFilePath = folder / "data.gz";
    writeFile( gzipFilePath, compressed );

    BlockCache::Configuration cacheConfiguration;
    cacheConfiguration.temporaryDirectory = folder;
    cacheConfiguration.capacity = 10'000'000;
    const auto cache = std::make_shared<BlockCache>( cacheConfiguration );

    BlockReader::Configuration readerConfiguration;
    readerConfiguration.blockSize = 64_Ki;
    readerConfiguration.parallelization = 4;
    readerConfiguration.maxConcurrency = 4;

    auto adapter = std::make_unique<GzipBlockAdapter>( std::make_unique<StandardFileReader>( gzipFilePath ),
                                                       gzipFilePath.string(), readerConfiguration.blockSize );
    const auto* const adapterView = adapter.get();
    BlockReader reader( cache, std::move( adapter ), readerConfiguration );

    /* Ranges crossing block and gzip member boundaries. */
    const std::vector<std::pair<size_t, size_t> > ranges = {
        { 0, 100 }, { 65'000, 67'000 }, { 399'990, 400'010 }, { 123'456, 654'321 }, { 999'000, 1'100'000 },
    };
    for ( const auto& [start, end] : ranges ) {
        REQUIRE_EQUAL( readAll( *reader.readStreamForRange( start, end ) ), subrange( data, start, end ) );
    }

    /* Repeated requests are served from the cache. */
    const auto fetchCount = adapterView->fetchCount();
    for ( const auto& [start, end] : ranges ) {
        REQUIRE_EQUAL( reader.resolveRange( start, end ), subrange( data, start, end ) );
    }
    REQUIRE_EQUAL( adapterView->fetchCount(), fetchCount );
    REQUIRE( reader.statistics().resolver.hits > 0 );

    reader.close();
    REQUIRE_EQUAL( cache->statistics().cache.entries, 0U );
}


void
testTruncatedGzipThroughBlockReader( const std::filesystem::path& folder )
{
    const auto data = createTestData( 100'000 );
    auto compressed = compressWithZlib( data );
    compressed.resize( compressed.size() / 2 );

    BlockCache::Configuration cacheConfiguration;
    cacheConfiguration.temporaryDirectory = folder;
    const auto cache = std::make_shared<BlockCache>( cacheConfiguration );

    BlockReader::Configuration readerConfiguration;
    readerConfiguration.blockSize = 10'000;
    BlockReader reader( cache,
                        std::make_unique<GzipBlockAdapter>( std::make_unique<MemoryFileReader>( compressed ),
                                                            "truncated", readerConfiguration.blockSize ),
                        readerConfiguration );

    /* The last block cannot be decompressed completely. */
    const auto stream = reader.readStreamForRange( 90'000, 100'000 );
    stream->wait();
    REQUIRE( stream->error() != nullptr );
    REQUIRE_THROWS( reader.resolveRange( 0, 100'000 ) );
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "blockreader.testGzipBlockAdapter" );

    try
    {
        testZlibInflater();
        testTruncatedInput();
        testFetchBlock();
        testGzipThroughBlockReader( tmpFolder );
        testTruncatedGzipThroughBlockReader( tmpFolder );
    }
    catch ( const std::exception& exception )
    {
        std::cerr << "Caught exception: " << exception.what() << "\n";
        return 1;
    }

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
