#include <array>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include <unistd.h>

#include <cxxopts.hpp>

#include <blockreader/blockreader.hpp>
#include <core/common.hpp>
#include <core/FileUtils.hpp>
#include <core/filereader/Standard.hpp>

#include "CLIHelper.hpp"


using namespace blockreader;


struct Arguments
{
    std::string inputFilePath;
    std::string outputFilePath;
    std::vector<std::pair<size_t, size_t> > ranges;
    bool decompress{ false };
    size_t repetitions{ 1 };
    bool verbose{ false };
    BlockCache::Configuration cacheConfiguration;
    BlockReader::Configuration readerConfiguration;
};


void
printBlockcatHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Ranges are half-open, i.e., 0:10 prints the first 10 bytes. If no range is given, the whole contents\n"
    << "are printed. Gzip files are detected automatically and their decompressed contents are served.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "Print the bytes [1000, 2000) of a file:\n"
    << "  blockcat -r 1000:2000 file\n"
    << "\n"
    << "Print two ranges of the decompressed contents and repeat the requests to show cache hits:\n"
    << "  blockcat -v --repeat 2 -r 0:100 -r 5000000:5000100 file.gz\n"
    << std::endl;
}


[[nodiscard]] bool
hasGzipMagicBytes( const std::string& filePath )
{
    StandardFileReader file( filePath );
    std::array<char, 2> magicBytes{};
    return ( file.read( magicBytes.data(), magicBytes.size() ) == magicBytes.size() )
           && ( static_cast<unsigned char>( magicBytes[0] ) == 0x1FU )
           && ( static_cast<unsigned char>( magicBytes[1] ) == 0x8BU );
}


[[nodiscard]] std::unique_ptr<BlockAdapter>
createAdapter( const Arguments& args )
{
    const auto identifier = std::filesystem::absolute( args.inputFilePath ).string();
    auto file = std::make_unique<StandardFileReader>( args.inputFilePath );
    if ( args.decompress ) {
        return std::make_unique<GzipBlockAdapter>( std::move( file ), identifier,
                                                   args.readerConfiguration.blockSize );
    }
    return std::make_unique<FileBlockAdapter>( std::move( file ), identifier, args.readerConfiguration.blockSize );
}


void
writeToOutput( int                      outputFileDescriptor,
               const std::vector<char>& data )
{
    if ( const auto errorCode = writeAllToFd( outputFileDescriptor, data.data(), data.size() ); errorCode != 0 ) {
        throw std::runtime_error( std::string( "Failed to write to the output: " ) + std::strerror( errorCode ) );
    }
}


/**
 * Issues all range requests at once and writes the results in the requested order.
 * @return The number of written bytes.
 */
size_t
printRanges( BlockReader&                                   reader,
             const std::vector<std::pair<size_t, size_t> >& ranges,
             int                                            outputFileDescriptor )
{
    std::vector<std::unique_ptr<RangeStream> > streams;
    streams.reserve( ranges.size() );
    for ( const auto& [start, end] : ranges ) {
        streams.emplace_back( reader.readStreamForRange( start, end ) );
    }

    size_t nBytesWritten{ 0 };
    for ( auto& stream : streams ) {
        stream->wait();
        if ( const auto error = stream->error(); error ) {
            std::rethrow_exception( error );
        }

        std::vector<char> data( stream->size().value_or( 0 ) );
        data.resize( stream->read( data.data(), data.size() ) );
        writeToOutput( outputFileDescriptor, data );
        nBytesWritten += data.size();
    }
    return nBytesWritten;
}


/**
 * Reads the whole contents in chunks of multiple blocks until a chunk comes back short.
 */
size_t
printAll( BlockReader& reader,
          int          outputFileDescriptor )
{
    const auto chunkSize = reader.blockSize() * reader.configuration().maxConcurrency;
    size_t nBytesWritten{ 0 };
    for ( size_t offset = 0; ; offset += chunkSize ) {
        const auto data = reader.resolveRange( offset, offset + chunkSize );
        writeToOutput( outputFileDescriptor, data );
        nBytesWritten += data.size();
        if ( data.size() < chunkSize ) {
            break;
        }
    }
    return nBytesWritten;
}


int
blockcatCLI( int                  argc,
             char const * const * argv )
{
    /* Cleaned, checked, and typed arguments. */
    Arguments args;

    cxxopts::Options options( "blockcat",
                              "Prints byte ranges of a file or of the decompressed contents of a gzip file "
                              "through a disk-backed block cache." );
    options.add_options( "Input Options" )
        ( "i,input"      , "Input file.", cxxopts::value<std::string>() )
        ( "r,range"      , "Half-open byte range START:END to print. May be specified multiple times.",
          cxxopts::value<std::vector<std::string> >() )
        ( "raw"          , "Print the raw bytes even if the input is a gzip file." )
        ( "o,output"     , "Output file. If none is given, writes to standard output.",
          cxxopts::value<std::string>() );

    options.add_options( "Cache Options" )
        ( "b,block-size" , "The size of the cached blocks in bytes.",
          cxxopts::value<size_t>()->default_value( "1000000" ) )
        ( "C,cache-size" , "The maximum summed size of all cached blocks in bytes.",
          cxxopts::value<size_t>()->default_value( "500000000" ) )
        ( "temporary-directory", "Folder in which the backing files are created. "
                                 "Defaults to the system's temporary folder.",
          cxxopts::value<std::string>() )
        ( "P,parallelization", "The number of threads fetching blocks. If 0 is given, then the parallelism will "
                               "be determined automatically.",
          cxxopts::value<unsigned int>()->default_value( "8" ) )
        ( "max-concurrency", "The maximum number of blocks fetched concurrently per range.",
          cxxopts::value<unsigned int>()->default_value( "8" ) )
        ( "repeat"       , "Number of times all ranges are printed. Repetitions are served from the cache.",
          cxxopts::value<unsigned int>()->default_value( "1" ) );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "q,quiet"  , "Suppress noncritical error messages." )
        ( "v,verbose", "Print debug output and profiling statistics." )
        ( "V,version", "Display software version." );

    options.parse_positional( { "input" } );

    const auto parsedArgs = options.parse( argc, argv );

    /* Check against simple commands like help and version. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printBlockcatHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "blockcat, CLI to the disk-backed block cache library blockreader version 0.1.0.\n";
        return 0;
    }

    args.verbose = parsedArgs["verbose"].as<bool>();

    if ( parsedArgs.count( "input" ) != 1 ) {
        std::cerr << "Exactly one input file must be specified!\n";
        return 1;
    }

    args.inputFilePath = parsedArgs["input"].as<std::string>();
    if ( !fileExists( args.inputFilePath ) ) {
        std::cerr << "Input file could not be found! Specified path: " << args.inputFilePath << "\n";
        return 1;
    }

    args.outputFilePath = getFilePath( parsedArgs, "output" );
    args.decompress = ( parsedArgs.count( "raw" ) == 0 ) && hasGzipMagicBytes( args.inputFilePath );
    args.repetitions = parsedArgs["repeat"].as<unsigned int>();

    if ( parsedArgs.count( "range" ) > 0 ) {
        for ( const auto& range : parsedArgs["range"].as<std::vector<std::string> >() ) {
            args.ranges.emplace_back( parseRange( range ) );
        }
    }

    const auto getParallelism = [] ( const auto p ) { return p > 0 ? p : availableCores(); };

    args.cacheConfiguration.capacity = parsedArgs["cache-size"].as<size_t>();
    args.cacheConfiguration.verbose = args.verbose;
    if ( parsedArgs.count( "temporary-directory" ) > 0 ) {
        args.cacheConfiguration.temporaryDirectory = parsedArgs["temporary-directory"].as<std::string>();
    }

    args.readerConfiguration.blockSize = parsedArgs["block-size"].as<size_t>();
    args.readerConfiguration.parallelization = getParallelism( parsedArgs["parallelization"].as<unsigned int>() );
    args.readerConfiguration.maxConcurrency = parsedArgs["max-concurrency"].as<unsigned int>();
    args.readerConfiguration.verbose = args.verbose;

    if ( args.verbose ) {
        std::cerr << "Input file          : " << args.inputFilePath << "\n"
                  << "Serving             : " << ( args.decompress ? "decompressed gzip contents" : "raw bytes" ) << "\n"
                  << "Block size          : " << formatBytes( args.readerConfiguration.blockSize ) << "\n"
                  << "Cache capacity      : " << formatBytes( args.cacheConfiguration.capacity ) << "\n"
                  << "Parallelization     : " << args.readerConfiguration.parallelization << "\n";
    }

    unique_file_ptr outputFile;
    auto outputFileDescriptor = STDOUT_FILENO;
    if ( !args.outputFilePath.empty() ) {
        outputFile = throwingOpen( args.outputFilePath, "wb" );
        outputFileDescriptor = ::fileno( outputFile.get() );
    }

    const auto cache = std::make_shared<BlockCache>( args.cacheConfiguration );
    BlockReader reader( cache, createAdapter( args ), args.readerConfiguration );

    const auto t0 = now();
    size_t nBytesWritten{ 0 };
    for ( size_t i = 0; i < args.repetitions; ++i ) {
        nBytesWritten += args.ranges.empty()
                         ? printAll( reader, outputFileDescriptor )
                         : printRanges( reader, args.ranges, outputFileDescriptor );
    }
    const auto t1 = now();

    if ( args.verbose ) {
        std::cerr << "Wrote " << formatBytes( nBytesWritten ) << " in " << duration( t0, t1 ) << " s\n"
                  << "Reader statistics:" << reader.statistics().print() << "\n"
                  << "Cache statistics:" << cache->statistics().print() << "\n";
    }

    reader.close();
    return 0;
}


int
main( int argc, char** argv )
{
    try
    {
        return blockcatCLI( argc, argv );
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
