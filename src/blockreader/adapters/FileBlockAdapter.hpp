#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/filereader/FileReader.hpp>

#include "../BlockAdapter.hpp"
#include "../BlockMath.hpp"


namespace blockreader
{
/**
 * Serves blocks of any FileReader. Reads are serialized because the reader has a single file position.
 */
class FileBlockAdapter :
    public BlockAdapter
{
public:
    /**
     * @param identifier Names the source in the cache keys. Must be unique among all sources in the process,
     *                   e.g., the absolute file path.
     */
    FileBlockAdapter( UniqueFileReader file,
                      std::string      identifier,
                      size_t           blockSize ) :
        m_file( std::move( file ) ),
        m_identifier( std::move( identifier ) ),
        m_blockSize( blockSize )
    {
        if ( !m_file ) {
            throw std::invalid_argument( "FileBlockAdapter requires a valid file!" );
        }
        checkBlockSize( m_blockSize );
    }

    [[nodiscard]] std::string
    cacheKey( size_t blockNumber ) const override
    {
        return m_identifier + ":" + std::to_string( m_blockSize ) + ":" + std::to_string( blockNumber );
    }

    [[nodiscard]] std::vector<char>
    fetchBlock( size_t blockFirst,
                size_t blockLast ) override
    {
        if ( blockLast < blockFirst ) {
            throw std::invalid_argument( "The block extent must not be empty!" );
        }

        std::vector<char> result( blockLast - blockFirst + 1 );
        size_t nBytesRead = 0;
        {
            const std::lock_guard lock( m_mutex );
            if ( m_file->closed() ) {
                throw std::logic_error( "Cannot fetch from a closed file!" );
            }

            m_file->seek( static_cast<long long int>( blockFirst ) );
            while ( nBytesRead < result.size() ) {
                const auto nBytesReadPerCall = m_file->read( result.data() + nBytesRead, result.size() - nBytesRead );
                if ( nBytesReadPerCall == 0 ) {
                    break;
                }
                nBytesRead += nBytesReadPerCall;
            }
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
