#pragma once

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <cxxopts.hpp>


[[nodiscard]] inline std::string
getFilePath( cxxopts::ParseResult const& parsedArgs,
             std::string          const& argument )
{
    if ( parsedArgs.count( argument ) > 1 ) {
        if ( parsedArgs.count( "quiet" ) == 0 ) {
            std::cerr << "[Warning] Multiple output files specified. Will only use the last one: "
                      << parsedArgs[argument].as<std::string>() << "!\n";
        }
    }
    if ( parsedArgs.count( argument ) > 0 ) {
        auto path = parsedArgs[argument].as<std::string>();
        if ( path != "-" ) {
            return path;
        }
    }
    return {};
}


/**
 * Parses "START:END" into the half-open range [START, END).
 */
[[nodiscard]] inline std::pair<size_t, size_t>
parseRange( const std::string& range )
{
    const auto separator = range.find( ':' );
    if ( ( separator == std::string::npos ) || ( separator == 0 ) || ( separator + 1 >= range.size() ) ) {
        throw std::invalid_argument( "Ranges must be given as START:END but got: " + range );
    }

    size_t nParsed{ 0 };
    const auto start = std::stoull( range.substr( 0, separator ), &nParsed );
    if ( nParsed != separator ) {
        throw std::invalid_argument( "Invalid range start in: " + range );
    }

    const auto endString = range.substr( separator + 1 );
    const auto end = std::stoull( endString, &nParsed );
    if ( nParsed != endString.size() ) {
        throw std::invalid_argument( "Invalid range end in: " + range );
    }

    if ( end < start ) {
        throw std::invalid_argument( "The range end must not be smaller than its start: " + range );
    }

    return { static_cast<size_t>( start ), static_cast<size_t>( end ) };
}
