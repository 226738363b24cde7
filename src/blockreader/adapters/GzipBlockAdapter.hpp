#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/filereader/FileReader.hpp>
#include <core/zlib.hpp>

#include "../BlockAdapter.hpp"
#include "../BlockMath.hpp"


namespace blockreader
{
/**
 * Serves blocks of the decompressed contents of a gzip file. Gzip has no random access, so each fetch
 * decompresses from the start of the file and discards everything before the block. This makes it a
 * slow origin, which benefits greatly from the block cache. Fetches of different blocks can run
 * concurrently because each works on its own clone of the file.
 */
class GzipBlockAdapter :
    public BlockAdapter
{
public:
    GzipBlockAdapter( UniqueFileReader file,
                      std::string      identifier,
                      size_t           blockSize ) :
        m_file( std::move( file ) ),
        m_identifier( std::move( identifier ) ),
        m_blockSize( blockSize )
    {
        if ( !m_file ) {
            throw std::invalid_argument( "GzipBlockAdapter requires a valid file!" );
        }
        checkBlockSize( m_blockSize );
    }

    [[nodiscard]] std::string
    cacheKey( size_t blockNumber ) const override
    {
        return "gzip:" + m_identifier + ":" + std::to_string( m_blockSize ) + ":" + std::to_string( blockNumber );
    }

    [[nodiscard]] std::vector<char>
    fetchBlock( size_t blockFirst,
                size_t blockLast ) override
    {
        if ( blockLast < blockFirst ) {
            throw std::invalid_argument( "The block extent must not be empty!" );
        }

        UniqueFileReader file;
        {
            const std::lock_guard lock( m_mutex );
            if ( m_file->closed() ) {
                throw std::logic_error( "Cannot fetch from a closed file!" );
            }
            file = m_file->clone();
        }
        file->seek( 0 );

        ZlibInflater inflater( std::move( file ) );
        if ( inflater.skip( blockFirst ) < blockFirst ) {
            ++m_fetchCount;
            return {};
        }

        std::vector<char> result( blockLast - blockFirst + 1 );
        size_t nBytesRead = 0;
        while ( nBytesRead < result.size() ) {
            const auto nBytesReadPerCall = inflater.read( result.data() + nBytesRead, result.size() - nBytesRead );
            if ( nBytesReadPerCall == 0 ) {
                break;
            }
            nBytesRead += nBytesReadPerCall;
        }
        result.resize( nBytesRead );

        ++m_fetchCount;
        return result;
    }

    void
    close() override
    {
        const std::lock_guard lock( m_mutex );
        m_file->close();
    }

    [[nodiscard]] size_t
    fetchCount() const noexcept
    {
        return m_fetchCount;
    }

private:
    const UniqueFileReader m_file;
    const std::string m_identifier;
    const size_t m_blockSize;

    std::mutex m_mutex;
    std::atomic<size_t> m_fetchCount{ 0 };
};
}  // namespace blockreader
