#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/ThreadPool.hpp>

#include "BlockAdapter.hpp"
#include "BlockCache.hpp"
#include "BlockMath.hpp"
#include "RangeAssembler.hpp"
#include "RangeResolver.hpp"
#include "RangeStream.hpp"


namespace blockreader
{
/**
 * Serves arbitrary byte ranges of one source, which is accessed through a BlockAdapter, via the shared BlockCache.
 * The reader remembers which blocks it inserted into the cache and removes exactly those on @ref close.
 * All members are thread-safe.
 */
class BlockReader
{
public:
    struct Configuration
    {
        size_t blockSize{ 1'000'000 };
        /** Maximum number of block resolutions in flight per range request. */
        size_t maxConcurrency{ 8 };
        /** Number of threads resolving blocks. Shared by all requests to this reader. */
        size_t parallelization{ 8 };
        /** Number of threads assembling ranges for streams returned by @ref readStreamForRange. */
        size_t requestParallelism{ 2 };
        bool verbose{ false };
    };

    struct Statistics
    {
    public:
        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Requests"
                << "\n        Total                         : " << requests
                << "\n        Failed                        : " << failedRequests
                << "\n        Requested Bytes               : " << formatBytes( requestedBytes )
                << "\n        Owned Blocks                  : " << ownedBlocks
                << resolver.print();
            return std::move( out ).str();
        }

    public:
        size_t requests{ 0 };
        size_t failedRequests{ 0 };
        size_t requestedBytes{ 0 };
        size_t ownedBlocks{ 0 };
        RangeResolver::Statistics resolver;
    };

public:
    BlockReader( std::shared_ptr<BlockCache>   cache,
                 std::unique_ptr<BlockAdapter> adapter ) :
        BlockReader( std::move( cache ), std::move( adapter ), Configuration{} )
    {}

    BlockReader( std::shared_ptr<BlockCache>   cache,
                 std::unique_ptr<BlockAdapter> adapter,
                 Configuration                 configuration ) :
        m_configuration( configuration ),
        m_cache( std::move( cache ) ),
        m_adapter( checkAdapter( std::move( adapter ) ) ),
        m_resolver( m_cache, *m_adapter, m_configuration.blockSize,
                    [this] ( size_t blockNumber ) { recordOwnedBlock( blockNumber ); },
                    m_configuration.verbose ),
        m_assembler( m_resolver, m_configuration.parallelization, m_configuration.maxConcurrency ),
        m_requestPool( m_configuration.requestParallelism )
    {
        if ( m_configuration.requestParallelism == 0 ) {
            throw std::invalid_argument( "At least one thread is required for serving range streams!" );
        }
    }

    ~BlockReader()
    {
        close();
    }

    BlockReader( const BlockReader& ) = delete;

    BlockReader&
    operator=( const BlockReader& ) = delete;

    /**
     * Returns immediately. The range is assembled asynchronously and the returned stream becomes readable
     * when it has finished. Failures are delivered through the stream.
     */
    [[nodiscard]] std::unique_ptr<RangeStream>
    readStreamForRange( size_t start,
                        size_t end )
    {
        const std::lock_guard lock( m_mutex );
        if ( m_closed ) {
            throw std::logic_error( "Cannot read from a closed BlockReader!" );
        }

        /* Requests accepted before close are still served. Only later requests are rejected. */
        auto result = m_requestPool.submit( [this, start, end] () {
            const ActiveRequest activeRequest( *this, /* allowClosed */ true );
            return resolveRangeUnchecked( start, end );
        } ).share();

        m_pendingStreams.erase(
            std::remove_if( m_pendingStreams.begin(), m_pendingStreams.end(), [] ( const auto& pending ) {
                return pending.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready;
            } ), m_pendingStreams.end() );
        m_pendingStreams.emplace_back( result );

        return std::make_unique<RangeStream>( start, end, std::move( result ) );
    }

    /**
     * Synchronously assembles [start, end).
     * @throws The first failure of any block of the range. Partial results are never returned.
     */
    [[nodiscard]] std::vector<char>
    resolveRange( size_t start,
                  size_t end )
    {
        const ActiveRequest activeRequest( *this );
        return resolveRangeUnchecked( start, end );
    }

    /**
     * Waits for all running requests, closes the adapter, and removes all blocks this reader has inserted
     * into the cache. Can be called multiple times and never throws. Requests after closing are rejected.
     */
    void
    close()
    {
        std::vector<RangeStream::Result> pendingStreams;
        {
            const std::lock_guard lock( m_mutex );
            if ( m_closed ) {
                return;
            }
            m_closed = true;
            pendingStreams.swap( m_pendingStreams );
        }

        for ( const auto& pending : pendingStreams ) {
            pending.wait();
        }

        {
            std::unique_lock lock( m_mutex );
            m_requestsChanged.wait( lock, [this] () { return m_activeRequests == 0; } );
        }

        m_requestPool.stop();
        m_assembler.stop();

        try {
            m_adapter->close();
        } catch ( const std::exception& exception ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to close the block adapter:"
                           << exception.what() ).str();
        }

        std::vector<size_t> ownedBlocks;
        {
            const std::lock_guard lock( m_ownedBlocksMutex );
            ownedBlocks.swap( m_ownedBlocks );
            m_ownedBlockSet.clear();
        }

        for ( const auto blockNumber : ownedBlocks ) {
            try {
                m_cache->evict( m_adapter->cacheKey( blockNumber ) );
            } catch ( const std::exception& exception ) {
                std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to purge block" << blockNumber << ":"
                               << exception.what() ).str();
            }
        }

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[BlockReader::close] Purged" << ownedBlocks.size() << "blocks"
                           << statistics().print() ).str();
        }
    }

    [[nodiscard]] bool
    closed() const
    {
        const std::lock_guard lock( m_mutex );
        return m_closed;
    }

    /**
     * @return The block numbers this reader has inserted into the cache in insertion order.
     */
    [[nodiscard]] std::vector<size_t>
    ownedBlocks() const
    {
        const std::lock_guard lock( m_ownedBlocksMutex );
        return m_ownedBlocks;
    }

    [[nodiscard]] size_t
    blockSize() const noexcept
    {
        return m_configuration.blockSize;
    }

    [[nodiscard]] const Configuration&
    configuration() const noexcept
    {
        return m_configuration;
    }

    [[nodiscard]] const std::shared_ptr<BlockCache>&
    cache() const noexcept
    {
        return m_cache;
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        Statistics result;
        result.requests = m_requests;
        result.failedRequests = m_failedRequests;
        result.requestedBytes = m_requestedBytes;
        result.ownedBlocks = ownedBlocks().size();
        result.resolver = m_resolver.statistics();
        return result;
    }

private:
    [[nodiscard]] std::vector<char>
    resolveRangeUnchecked( size_t start,
                           size_t end )
    {
        ++m_requests;
        if ( end > start ) {
            m_requestedBytes += end - start;
        }

        try {
            auto result = m_assembler.resolveRange( start, end );
            if ( m_configuration.verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[BlockReader::resolveRange] Resolved [" << start << "," << end
                               << ") to" << formatBytes( result.size() ) ).str();
            }
            return result;
        } catch ( const std::exception& exception ) {
            ++m_failedRequests;
            std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to read range [" << start << "," << end << "):"
                           << exception.what() ).str();
            throw;
        }
    }

    /**
     * Registers a running request so that @ref close can wait for it. Throws if the reader is closed
     * unless the request has been accepted before closing.
     */
    class ActiveRequest
    {
    public:
        explicit
        ActiveRequest( BlockReader& reader,
                       bool         allowClosed = false ) :
            m_reader( reader )
        {
            const std::lock_guard lock( m_reader.m_mutex );
            if ( m_reader.m_closed && !allowClosed ) {
                throw std::logic_error( "Cannot read from a closed BlockReader!" );
            }
            ++m_reader.m_activeRequests;
        }

        ~ActiveRequest()
        {
            {
                const std::lock_guard lock( m_reader.m_mutex );
                --m_reader.m_activeRequests;
            }
            m_reader.m_requestsChanged.notify_all();
        }

        ActiveRequest( const ActiveRequest& ) = delete;

        ActiveRequest&
        operator=( const ActiveRequest& ) = delete;

    private:
        BlockReader& m_reader;
    };

private:
    [[nodiscard]] static std::unique_ptr<BlockAdapter>
    checkAdapter( std::unique_ptr<BlockAdapter> adapter )
    {
        if ( !adapter ) {
            throw std::invalid_argument( "BlockReader requires a valid adapter!" );
        }
        return adapter;
    }

    void
    recordOwnedBlock( size_t blockNumber )
    {
        const std::lock_guard lock( m_ownedBlocksMutex );
        if ( m_ownedBlockSet.insert( blockNumber ).second ) {
            m_ownedBlocks.emplace_back( blockNumber );
        }
    }

private:
    const Configuration m_configuration;
    const std::shared_ptr<BlockCache> m_cache;
    const std::unique_ptr<BlockAdapter> m_adapter;

    mutable std::mutex m_ownedBlocksMutex;
    std::vector<size_t> m_ownedBlocks;
    std::unordered_set<size_t> m_ownedBlockSet;

    /** Guards m_closed, m_activeRequests, and m_pendingStreams. */
    mutable std::mutex m_mutex;
    std::condition_variable m_requestsChanged;
    bool m_closed{ false };
    size_t m_activeRequests{ 0 };
    std::vector<RangeStream::Result> m_pendingStreams;

    /* Analytics */
    std::atomic<size_t> m_requests{ 0 };
    std::atomic<size_t> m_failedRequests{ 0 };
    std::atomic<size_t> m_requestedBytes{ 0 };

    RangeResolver m_resolver;
    RangeAssembler m_assembler;

    /** Comes last so that it is stopped first on destruction while all other members still exist. */
    ThreadPool m_requestPool;
};
}  // namespace blockreader
