#pragma once

#include <istream>
#include <stdexcept>
#include <streambuf>
#include <utility>
#include <vector>

#include "FileReader.hpp"


namespace blockreader
{
[[nodiscard]] inline int
toOrigin( std::ios_base::seekdir anchor )
{
    switch ( anchor )
    {
    case std::ios_base::beg: return SEEK_SET;
    case std::ios_base::cur: return SEEK_CUR;
    case std::ios_base::end: return SEEK_END;
    default: break;
    }
    return SEEK_SET;
}


/**
 * Implements the std::streambuf interface by forwarding calls to the appropriate FileReader methods.
 * Because the FileReader is read-only, the put area as well as the overflow method is not supported.
 * Exceptions thrown by the FileReader, e.g., the failure of a range request, are propagated
 * to the std::istream, which sets badbit and rethrows them if exceptions( badbit ) is enabled.
 */
class FileReaderStreamBuffer :
    public std::streambuf
{
public:
    static constexpr size_t BUFFER_SIZE = 8ULL * 1024ULL;

    explicit
    FileReaderStreamBuffer( UniqueFileReader file ) :
        m_file( std::move( file ) )
    {
        if ( !m_file ) {
            throw std::invalid_argument( "May only be opened with a valid FileReader!" );
        }

        /* Already point to the buffer but signal that it does not yet contain data. */
        clearGetArea();
    }

protected:
    std::streamsize
    showmanyc() override
    {
        if ( m_file->closed() ) {
            return -1;
        }
        return ( ( gptr() != nullptr ) && ( gptr() < egptr() ) ) ? std::streamsize( egptr() - gptr() ) : 0;
    }

    int_type
    underflow() override
    {
        if ( m_file->closed() ) {
            return traits_type::eof();
        }

        if ( ( gptr() != nullptr ) && ( gptr() < egptr() ) ) {
            return traits_type::to_int_type( *gptr() );
        }

        const auto nBytesRead = m_file->read( m_buffer.data(), m_buffer.size() );
        if ( nBytesRead == 0 ) {
            clearGetArea();
            return traits_type::eof();
        }

        setg( /* begin */ m_buffer.data(), /* current */ m_buffer.data(), /* end */ m_buffer.data() + nBytesRead );
        return traits_type::to_int_type( *gptr() );
    }

    int_type
    overflow( int_type = traits_type::eof() ) override
    {
        throw std::runtime_error( "Writing is not supported!" );
    }

    pos_type
    seekoff( off_type                offset,
             std::ios_base::seekdir  anchor,
             std::ios_base::openmode mode = std::ios_base::in | std::ios_base::out ) override
    {
        if ( ( mode & std::ios_base::out ) != 0 ) {
            throw std::runtime_error( "Writing is not supported!" );
        }

        /* The FileReader is positioned at the end of the buffer while this stream buffer is positioned somewhere
         * inside of it. Therefore, relative seeks have to be translated to absolute ones. */
        if ( anchor == std::ios_base::cur ) {
            const auto bufferSize = static_cast<long long int>( egptr() - eback() );
            if ( bufferSize == 0 ) {
                return seekpos( static_cast<long long int>( m_file->tell() ) + offset, mode );
            }

            const auto bufferPosition = static_cast<long long int>( gptr() - eback() );
            const auto newPosition = bufferPosition + offset;
            if ( ( newPosition >= 0 ) && ( newPosition <= bufferSize ) ) {
                setg( /* begin */ eback(), /* current */ eback() + newPosition, /* end */ egptr() );
                return static_cast<pos_type>( static_cast<long long int>( m_file->tell() )
                                              - ( bufferSize - newPosition ) );
            }

            return seekpos( static_cast<long long int>( m_file->tell() ) - ( egptr() - gptr() ) + offset, mode );
        }

        clearGetArea();
        return static_cast<pos_type>( m_file->seek( offset, toOrigin( anchor ) ) );
    }

    pos_type
    seekpos( pos_type                offset,
             std::ios_base::openmode mode = std::ios_base::in | std::ios_base::out ) override
    {
        if ( ( mode & std::ios_base::out ) != 0 ) {
            throw std::runtime_error( "Writing is not supported!" );
        }

        clearGetArea();
        return static_cast<pos_type>( m_file->seek( offset, SEEK_SET ) );
    }

private:
    void
    clearGetArea()
    {
        setg( /* begin */ m_buffer.data(), /* current */ m_buffer.data(), /* end */ m_buffer.data() );
    }

protected:
    const UniqueFileReader m_file;
    std::vector<char_type> m_buffer = std::vector<char_type>( BUFFER_SIZE );
};


class FileReaderStream :
    public FileReaderStreamBuffer,
    public std::istream
{
public:
    explicit
    FileReaderStream( UniqueFileReader file ) :
        FileReaderStreamBuffer( std::move( file ) ),
        std::istream( static_cast<std::streambuf*>( this ) )
    {}

    [[nodiscard]] bool
    is_open() const
    {
        return !m_file->closed();
    }

    void
    close() const
    {
        m_file->close();
    }

    [[nodiscard]] FileReader&
    fileReader() const
    {
        return *m_file;
    }
};
}  // namespace blockreader
