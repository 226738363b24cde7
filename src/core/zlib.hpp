#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

#include "common.hpp"
#include "filereader/FileReader.hpp"


namespace blockreader
{
enum class ContainerFormat : int
{
    DEFLATE,
    ZLIB,
    GZIP,
};


[[nodiscard]] constexpr int
windowBits( ContainerFormat containerFormat ) noexcept
{
    /* > Add 16 to windowBits to write a simple gzip header and trailer around the
     * > compressed data instead of a zlib wrapper.
     * > windowBits can also be -8..-15 for raw deflate. In this case, -windowBits determines the window size. */
    switch ( containerFormat )
    {
    case ContainerFormat::DEFLATE:
        return -MAX_WBITS;
    case ContainerFormat::ZLIB:
        return MAX_WBITS;
    case ContainerFormat::GZIP:
        return 16 + MAX_WBITS;
    }
    return MAX_WBITS;
}


[[nodiscard]] inline std::vector<char>
compressWithZlib( const std::vector<char>& toCompress,
                  ContainerFormat          containerFormat = ContainerFormat::GZIP )
{
    if ( toCompress.size() > std::numeric_limits<uInt>::max() ) {
        throw std::invalid_argument( "Data to compress is too large for a single zlib call!" );
    }

    std::vector<char> output;
    output.reserve( toCompress.size() / 2 + 64 );

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = static_cast<uInt>( toCompress.size() );
    stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( toCompress.data() ) );
    stream.avail_out = 0;
    stream.next_out = nullptr;

    if ( deflateInit2( &stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits( containerFormat ),
                       /* memLevel */ 8, Z_DEFAULT_STRATEGY ) != Z_OK ) {
        throw std::runtime_error( "Failed to initialize zlib for compression!" );
    }

    auto status = Z_OK;
    constexpr auto CHUNK_SIZE = 1_Mi;
    while ( status == Z_OK ) {
        output.resize( output.size() + CHUNK_SIZE );
        stream.next_out = reinterpret_cast<Bytef*>( output.data() + output.size() - CHUNK_SIZE );
        stream.avail_out = CHUNK_SIZE;
        status = ::deflate( &stream, Z_FINISH );
    }

    deflateEnd( &stream );

    if ( status != Z_STREAM_END ) {
        throw std::runtime_error( "Compression with zlib failed with code " + std::to_string( status ) + "!" );
    }

    output.resize( stream.total_out );
    output.shrink_to_fit();
    return output;
}


/**
 * Small streaming wrapper around zlib's inflate, which reads the compressed data from a FileReader.
 * Concatenated gzip members, e.g., as written by pigz or `cat a.gz b.gz`, are decompressed as one stream.
 */
class ZlibInflater
{
public:
    static constexpr size_t INPUT_BUFFER_SIZE = 128_Ki;

public:
    explicit
    ZlibInflater( UniqueFileReader file,
                  ContainerFormat  containerFormat = ContainerFormat::GZIP ) :
        m_file( std::move( file ) ),
        m_containerFormat( containerFormat )
    {
        if ( !m_file ) {
            throw std::invalid_argument( "ZlibInflater requires a valid file!" );
        }

        m_stream.zalloc = Z_NULL;     /* used to allocate the internal state */
        m_stream.zfree = Z_NULL;      /* used to free the internal state */
        m_stream.opaque = Z_NULL;     /* private data object passed to zalloc and zfree */
        m_stream.avail_in = 0;        /* number of bytes available at next_in */
        m_stream.next_in = Z_NULL;    /* next input byte */

        if ( inflateInit2( &m_stream, windowBits( m_containerFormat ) ) != Z_OK ) {
            throw std::runtime_error( "Failed to initialize zlib for decompression!" );
        }
    }

    ~ZlibInflater()
    {
        inflateEnd( &m_stream );
    }

    ZlibInflater( const ZlibInflater& ) = delete;

    ZlibInflater&
    operator=( const ZlibInflater& ) = delete;

    /**
     * @return The number of decompressed bytes written to @p output. Only smaller than @p size at the end
     *         of the stream.
     */
    [[nodiscard]] size_t
    read( char*  output,
          size_t size )
    {
        size_t nBytesDecoded = 0;
        while ( ( nBytesDecoded < size ) && !m_finished ) {
            /* At the end of the input, inflate may still hold decompressed data that did not fit last time. */
            const auto endOfInput = ( m_stream.avail_in == 0 ) && !refillBuffer();
            if ( endOfInput && !m_inStream ) {
                m_finished = true;
                break;
            }

            const auto nBytesToDecode = std::min( size - nBytesDecoded,
                                                  static_cast<size_t>( std::numeric_limits<uInt>::max() ) );
            m_stream.next_out = reinterpret_cast<Bytef*>( output + nBytesDecoded );
            m_stream.avail_out = static_cast<uInt>( nBytesToDecode );
            m_inStream = true;

            const auto errorCode = ::inflate( &m_stream, Z_NO_FLUSH );
            const auto nBytesDecodedPerCall = nBytesToDecode - m_stream.avail_out;
            nBytesDecoded += nBytesDecodedPerCall;

            if ( errorCode == Z_STREAM_END ) {
                m_inStream = false;
                /* Continue with the next gzip member if there is any data left. */
                if ( ( m_stream.avail_in == 0 ) && !refillBuffer() ) {
                    m_finished = true;
                    break;
                }
                if ( inflateReset( &m_stream ) != Z_OK ) {
                    throw std::runtime_error( "Failed to reset zlib for the next stream!" );
                }
                continue;
            }

            if ( endOfInput && ( nBytesDecodedPerCall == 0 ) ) {
                throw std::runtime_error( "Unexpected end of the compressed stream!" );
            }

            if ( ( errorCode != Z_OK ) && ( errorCode != Z_BUF_ERROR ) ) {
                std::stringstream message;
                message << "[ZlibInflater::read] Decompression failed with error code " << errorCode;
                if ( m_stream.msg != nullptr ) {
                    message << ": " << m_stream.msg;
                }
                message << " after " << formatBytes( m_stream.total_out ) << " of the current stream!";
                throw std::runtime_error( std::move( message ).str() );
            }
        }

        m_totalOut += nBytesDecoded;
        return nBytesDecoded;
    }

    /**
     * Decompresses and discards @p count bytes.
     * @return The number of discarded bytes, which is only smaller than @p count at the end of the stream.
     */
    size_t
    skip( size_t count )
    {
        std::vector<char> buffer( std::min<size_t>( count, 128_Ki ) );
        size_t nBytesSkipped = 0;
        while ( nBytesSkipped < count ) {
            const auto nBytesRead = read( buffer.data(), std::min( buffer.size(), count - nBytesSkipped ) );
            if ( nBytesRead == 0 ) {
                break;
            }
            nBytesSkipped += nBytesRead;
        }
        return nBytesSkipped;
    }

    [[nodiscard]] bool
    eos() const noexcept
    {
        return m_finished;
    }

    [[nodiscard]] size_t
    tell() const noexcept
    {
        return m_totalOut;
    }

private:
    [[nodiscard]] bool
    refillBuffer()
    {
        const auto nBytesRead = m_file->read( m_buffer.data(), m_buffer.size() );
        m_stream.next_in = reinterpret_cast<Bytef*>( m_buffer.data() );
        m_stream.avail_in = static_cast<uInt>( nBytesRead );
        return nBytesRead > 0;
    }

private:
    const UniqueFileReader m_file;
    const ContainerFormat m_containerFormat;
    z_stream m_stream{};
    std::vector<char> m_buffer = std::vector<char>( INPUT_BUFFER_SIZE );

    bool m_inStream{ false };
    bool m_finished{ false };
    size_t m_totalOut{ 0 };
};
}  // namespace blockreader
