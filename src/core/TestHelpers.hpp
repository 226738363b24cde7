#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common.hpp"
#include "FileUtils.hpp"
#include "filereader/FileReader.hpp"


namespace blockreader
{
inline int gnTests = 0;  // NOLINT
inline int gnTestErrors = 0;  // NOLINT


template<typename A,
         typename B>
void
requireEqual( const A&  a,
              const B&  b,
              const int line )
{
    ++gnTests;
    if ( a != b ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << a << " != " << b << "\n";
    }
}


inline void
require( bool               condition,
         std::string const& conditionString,
         int                line )
{
    ++gnTests;
    if ( !condition ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << conditionString << "\n";
    }
}


#define REQUIRE_EQUAL( a, b ) requireEqual( a, b, __LINE__ )  // NOLINT
#define REQUIRE( condition ) require( condition, #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS( condition ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const std::exception& ) { \
        return true; \
    } \
    return false; \
} (), #condition, __LINE__ )  // NOLINT


class TemporaryDirectory
{
public:
    explicit
    TemporaryDirectory( std::filesystem::path path ) :
        m_path( std::move( path ) )
    {}

    TemporaryDirectory( TemporaryDirectory&& other ) noexcept :
        m_path( std::exchange( other.m_path, {} ) )
    {}

    TemporaryDirectory( const TemporaryDirectory& ) = delete;

    TemporaryDirectory&
    operator=( TemporaryDirectory&& ) = delete;

    TemporaryDirectory&
    operator=( const TemporaryDirectory& ) = delete;

    ~TemporaryDirectory()
    {
        if ( !m_path.empty() ) {
            std::error_code error;
            std::filesystem::remove_all( m_path, error );
        }
    }

    [[nodiscard]] operator std::filesystem::path() const
    {
        return m_path;
    }

    [[nodiscard]] const std::filesystem::path&
    path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};


[[nodiscard]] inline TemporaryDirectory
createTemporaryDirectory( const std::string& title = "blockreaderTest" )
{
    return TemporaryDirectory( createTemporaryFolder( std::filesystem::temp_directory_path(), title + "." ) );
}


/**
 * @return A buffer in which each byte equals its offset truncated to 8 bits, which makes it easy to
 *         check that a slice was taken from the correct position.
 */
[[nodiscard]] inline std::vector<char>
createOffsetBytes( size_t size )
{
    std::vector<char> result( size );
    for ( size_t i = 0; i < size; ++i ) {
        result[i] = static_cast<char>( static_cast<uint8_t>( i ) );
    }
    return result;
}


[[nodiscard]] inline std::vector<char>
readAll( FileReader& file )
{
    std::vector<char> result;
    std::vector<char> buffer( 4096 );
    while ( true ) {
        const auto nBytesRead = file.read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        result.insert( result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>( nBytesRead ) );
    }
    return result;
}


inline void
writeFile( const std::filesystem::path& filePath,
           const std::vector<char>&     contents )
{
    const auto file = throwingOpen( filePath.string(), "wb" );
    if ( !contents.empty()
         && ( std::fwrite( contents.data(), 1, contents.size(), file.get() ) != contents.size() ) ) {
        throw std::runtime_error( "Failed to write test file: " + filePath.string() );
    }
}
}  // namespace blockreader
