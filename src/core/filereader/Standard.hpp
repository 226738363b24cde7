#pragma once

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <sys/stat.h>

#include <core/FileUtils.hpp>

#include "FileReader.hpp"


namespace blockreader
{
/**
 * FileReader over a regular file opened by path. Only regular, i.e., seekable files are supported because
 * block adapters need random access.
 */
class StandardFileReader :
    public FileReader
{
public:
    explicit
    StandardFileReader( std::string filePath ) :
        m_file( throwingOpen( filePath, "rb" ) ),
        m_fileDescriptor( ::fileno( fp() ) ),
        m_filePath( std::move( filePath ) ),
        m_fileSizeBytes( determineFileSize( m_fileDescriptor ) )
    {}

    explicit
    StandardFileReader( const std::filesystem::path& filePath ) :
        StandardFileReader( filePath.string() )
    {}

    /* Add this to avoid ambiguity for const char*, which would otherwise be the case with only
     * std::string and std::filesystem::path constructors. */
    explicit
    StandardFileReader( const char* filePath ) :
        StandardFileReader( std::string( filePath ) )
    {}

    ~StandardFileReader() override
    {
        StandardFileReader::close();
    }

    /**
     * The clone has its own file position, which makes it possible to read from multiple threads.
     */
    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        auto result = std::make_unique<StandardFileReader>( m_filePath );
        result->seek( static_cast<long long int>( m_currentPosition ) );
        return result;
    }

    void
    close() override
    {
        m_file.reset();
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_file;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_currentPosition >= m_fileSizeBytes;
    }

    [[nodiscard]] bool
    fail() const override
    {
        return std::ferror( fp() ) != 0;
    }

    [[nodiscard]] int
    fileno() const override
    {
        if ( m_file ) {
            return m_fileDescriptor;
        }
        throw std::invalid_argument( "Trying to get fileno of an invalid file!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        if ( !m_file ) {
            throw std::invalid_argument( "Cannot read from a closed file!" );
        }

        if ( nMaxBytesToRead == 0 ) {
            return 0;
        }

        size_t nBytesRead = 0;
        if ( buffer == nullptr ) {
            nBytesRead = std::min( nMaxBytesToRead, m_fileSizeBytes - std::min( m_fileSizeBytes, m_currentPosition ) );
            fileSeek( m_file.get(), static_cast<long long int>( nBytesRead ), SEEK_CUR );
        } else {
            nBytesRead = std::fread( buffer, /* element size */ 1, nMaxBytesToRead, m_file.get() );
            if ( ( nBytesRead < nMaxBytesToRead ) && ( std::ferror( m_file.get() ) != 0 ) ) {
                throw std::runtime_error( "Failed to read from file '" + m_filePath + "'!" );
            }
        }

        m_currentPosition += nBytesRead;
        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( !m_file ) {
            throw std::invalid_argument( "Cannot seek in a closed file!" );
        }

        const auto newPosition = effectiveOffset( offset, origin );
        fileSeek( m_file.get(), static_cast<long long int>( newPosition ), SEEK_SET );
        m_currentPosition = newPosition;
        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_fileSizeBytes;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

    void
    clearerr() override
    {
        std::clearerr( fp() );
    }

    [[nodiscard]] const std::string&
    filePath() const noexcept
    {
        return m_filePath;
    }

private:
    [[nodiscard]] static size_t
    determineFileSize( int fileNumber )
    {
        struct stat fileStats{};
        if ( ::fstat( fileNumber, &fileStats ) != 0 ) {
            throw std::runtime_error( "Failed to query the file size!" );
        }
        if ( !S_ISREG( fileStats.st_mode ) ) {
            throw std::invalid_argument( "Only regular files are supported because random access is required!" );
        }
        return static_cast<size_t>( fileStats.st_size );
    }

    [[nodiscard]] FILE*
    fp() const
    {
        if ( m_file ) {
            return m_file.get();
        }
        throw std::invalid_argument( "Operation not allowed on an invalid file!" );
    }

protected:
    unique_file_ptr m_file;
    const int m_fileDescriptor;
    const std::string m_filePath;
    const size_t m_fileSizeBytes;

    size_t m_currentPosition{ 0 };
};
}  // namespace blockreader
