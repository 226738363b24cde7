#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/FileUtils.hpp>

#include "BlockAdapter.hpp"
#include "BlockCache.hpp"
#include "BlockMath.hpp"


namespace blockreader
{
/**
 * Resolves the contribution of a single block to a range request. Cached blocks are read from their backing
 * file. Missing blocks are fetched from the adapter, persisted, and inserted into the cache.
 */
class RangeResolver
{
public:
    /** Called with the block number after this resolver inserted a block into the cache. */
    using OnPopulated = std::function<void( size_t )>;

    struct Statistics
    {
    public:
        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Block Resolutions"
                << "\n        Cache Hits                    : " << hits
                << "\n        Cache Misses                  : " << misses
                << "\n        Stale Entries                 : " << staleEntries
                << "\n        Skipped Behind End Of Source  : " << skippedBlocks
                << "\n        Fetched From Adapter          : " << formatBytes( fetchedBytes )
                << "\n        Read From Backing Files       : " << formatBytes( readBytes );
            return std::move( out ).str();
        }

    public:
        size_t hits{ 0 };
        size_t misses{ 0 };
        /** Entries that were found in the cache but whose backing file was missing. */
        size_t staleEntries{ 0 };
        /** Blocks starting at or behind the known end of the source. They are neither fetched nor cached. */
        size_t skippedBlocks{ 0 };
        size_t fetchedBytes{ 0 };
        size_t readBytes{ 0 };
    };

public:
    RangeResolver( std::shared_ptr<BlockCache> cache,
                   BlockAdapter&               adapter,
                   size_t                      blockSize,
                   OnPopulated                 onPopulated = {},
                   bool                        verbose = false ) :
        m_cache( std::move( cache ) ),
        m_adapter( adapter ),
        m_blockSize( blockSize ),
        m_onPopulated( std::move( onPopulated ) ),
        m_verbose( verbose )
    {
        if ( !m_cache ) {
            throw std::invalid_argument( "RangeResolver requires a valid cache!" );
        }
        checkBlockSize( m_blockSize );
    }

    /**
     * @param start, end The whole requested range [start, end), which must intersect with @p blockNumber.
     * @return The bytes of the intersection. Fewer than requested if the source ends inside this block.
     */
    [[nodiscard]] std::vector<char>
    resolveBlock( size_t start,
                  size_t end,
                  size_t blockNumber )
    {
        const auto slice = sliceInBlock( start, end, blockNumber, m_blockSize );
        const auto extent = blockExtent( blockNumber, m_blockSize );
        if ( extent.first >= knownSourceSize() ) {
            ++m_skippedBlocks;
            return {};
        }

        const auto key = m_adapter.cacheKey( blockNumber );
        bool foundStaleEntry{ false };
        if ( auto result = readCached( key, slice, blockNumber, foundStaleEntry ); result ) {
            return std::move( *result );
        }

        /* Only misses are serialized per key so that concurrent misses fetch only once. */
        const auto keyLock = m_cache->lockKey( key );

        if ( auto result = readCached( key, slice, blockNumber, foundStaleEntry ); result ) {
            return std::move( *result );
        }
        if ( extent.first >= knownSourceSize() ) {
            ++m_skippedBlocks;
            return {};
        }

        ++m_misses;
        return fetchAndCache( key, slice, extent, blockNumber );
    }

    /**
     * @return The size of the source as far as it has been observed by a block shorter than the block size.
     *         The maximum value of size_t as long as no such block has been seen.
     */
    [[nodiscard]] size_t
    knownSourceSize() const noexcept
    {
        return m_knownSourceSize;
    }

    [[nodiscard]] size_t
    blockSize() const noexcept
    {
        return m_blockSize;
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        Statistics result;
        result.hits = m_hits;
        result.misses = m_misses;
        result.staleEntries = m_staleEntries;
        result.skippedBlocks = m_skippedBlocks;
        result.fetchedBytes = m_fetchedBytes;
        result.readBytes = m_readBytes;
        return result;
    }

private:
    /**
     * @return The slice clamped to the bytes actually stored for the block.
     */
    [[nodiscard]] static BlockSlice
    clampSlice( BlockSlice slice,
                size_t     availableBytes )
    {
        slice.position = std::min( slice.position, availableBytes );
        slice.length = std::min( slice.length, availableBytes - slice.position );
        return slice;
    }

    /**
     * @return The requested slice or nothing if the backing file does not exist anymore.
     */
    [[nodiscard]] static std::optional<std::vector<char> >
    readFromBackingFile( const CacheEntry& entry,
                         BlockSlice        slice )
    {
        const auto file = openForReadingIfExists( entry.filePath );
        if ( !file ) {
            return std::nullopt;
        }

        slice = clampSlice( slice, entry.length );
        std::vector<char> result( slice.length );
        const auto nBytesRead = preadAll( *file, result.data(), result.size(), slice.position );
        if ( nBytesRead != result.size() ) {
            std::stringstream message;
            message << "Backing file " << entry.filePath << " is shorter than expected. Read only " << nBytesRead
                    << " B instead of " << result.size() << " B at offset " << slice.position << ".";
            throw std::runtime_error( std::move( message ).str() );
        }
        return result;
    }

    /**
     * @return The requested slice if the block is cached and its backing file still exists.
     */
    [[nodiscard]] std::optional<std::vector<char> >
    readCached( const std::string& key,
                const BlockSlice&  slice,
                size_t             blockNumber,
                bool&              foundStaleEntry )
    {
        const auto entry = m_cache->get( key );
        if ( !entry ) {
            return std::nullopt;
        }

        if ( auto result = readFromBackingFile( *entry, slice ); result ) {
            ++m_hits;
            m_readBytes += result->size();
            if ( entry->length < m_blockSize ) {
                updateKnownSourceSize( blockNumber * m_blockSize + entry->length );
            }
            return result;
        }

        if ( !foundStaleEntry ) {
            foundStaleEntry = true;
            ++m_staleEntries;
            if ( m_verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[RangeResolver] Backing file" << entry->filePath
                               << "of block" << blockNumber << "vanished. Fetching it again." ).str();
            }
        }
        return std::nullopt;
    }

    void
    updateKnownSourceSize( size_t sourceSize ) noexcept
    {
        auto previous = m_knownSourceSize.load();
        while ( ( sourceSize < previous ) && !m_knownSourceSize.compare_exchange_weak( previous, sourceSize ) ) {}
    }

    [[nodiscard]] std::vector<char>
    fetchAndCache( const std::string& key,
                   const BlockSlice&  slice,
                   const BlockExtent& extent,
                   size_t             blockNumber )
    {
        const auto data = m_adapter.fetchBlock( extent.first, extent.last );
        if ( data.size() > m_blockSize ) {
            std::stringstream message;
            message << "The adapter returned " << data.size() << " B for block " << blockNumber
                    << ", which is more than the block size of " << m_blockSize << " B!";
            throw std::logic_error( std::move( message ).str() );
        }
        m_fetchedBytes += data.size();

        if ( data.size() < m_blockSize ) {
            updateKnownSourceSize( extent.first + data.size() );
        }

        /* Empty blocks would weigh nothing in the cache and therefore never be evicted. */
        if ( data.empty() ) {
            if ( m_verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[RangeResolver] Block" << blockNumber
                               << "is behind the end of the source" ).str();
            }
            return {};
        }

        auto backingFile = m_cache->createBackingFile( key );
        if ( const auto error = writeAllToFd( *backingFile.file, data.data(), data.size() ); error != 0 ) {
            backingFile.file.close();
            std::error_code removeError;
            std::filesystem::remove( backingFile.path, removeError );

            std::stringstream message;
            message << "Failed to write block " << blockNumber << " to " << backingFile.path << ": "
                    << std::strerror( error );
            throw std::runtime_error( std::move( message ).str() );
        }
        backingFile.file.close();

        m_cache->insert( key, CacheEntry{ key, backingFile.path, data.size() } );
        if ( m_onPopulated ) {
            m_onPopulated( blockNumber );
        }

        if ( m_verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[RangeResolver] Fetched block" << blockNumber << "with"
                           << formatBytes( data.size() ) << "into" << backingFile.path ).str();
        }

        const auto clamped = clampSlice( slice, data.size() );
        const auto begin = data.begin() + static_cast<std::ptrdiff_t>( clamped.position );
        return std::vector<char>( begin, begin + static_cast<std::ptrdiff_t>( clamped.length ) );
    }

private:
    const std::shared_ptr<BlockCache> m_cache;
    BlockAdapter& m_adapter;
    const size_t m_blockSize;
    const OnPopulated m_onPopulated;
    const bool m_verbose;

    std::atomic<size_t> m_knownSourceSize{ std::numeric_limits<size_t>::max() };

    /* Analytics */
    std::atomic<size_t> m_hits{ 0 };
    std::atomic<size_t> m_misses{ 0 };
    std::atomic<size_t> m_staleEntries{ 0 };
    std::atomic<size_t> m_skippedBlocks{ 0 };
    std::atomic<size_t> m_fetchedBytes{ 0 };
    std::atomic<size_t> m_readBytes{ 0 };
};
}  // namespace blockreader
