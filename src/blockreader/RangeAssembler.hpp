#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/ThreadPool.hpp>

#include "BlockMath.hpp"
#include "RangeResolver.hpp"


namespace blockreader
{
/**
 * Resolves all blocks touched by a range on a thread pool and concatenates the slices in ascending block order.
 * Per call of @ref resolveRange, at most maxConcurrency block resolutions are submitted at any time.
 * Further blocks are submitted as soon as any of the running ones has finished. No further blocks are
 * submitted after one of them has revealed the end of the source.
 */
class RangeAssembler
{
public:
    RangeAssembler( RangeResolver& resolver,
                    size_t         parallelization,
                    size_t         maxConcurrency ) :
        m_resolver( resolver ),
        m_maxConcurrency( maxConcurrency ),
        m_threadPool( parallelization )
    {
        if ( parallelization == 0 ) {
            throw std::invalid_argument( "At least one thread is required for resolving blocks!" );
        }
        if ( m_maxConcurrency == 0 ) {
            throw std::invalid_argument( "The maximum concurrency must be larger than 0!" );
        }
    }

    /**
     * @return The bytes of [start, end). Shorter than end - start only if the range exceeds the source.
     * @throws The first failure of any block resolution after all submitted resolutions have finished.
     */
    [[nodiscard]] std::vector<char>
    resolveRange( size_t start,
                  size_t end )
    {
        if ( start >= end ) {
            return {};
        }

        const auto blockSize = m_resolver.blockSize();
        const auto blocks = blockRange( start, end, blockSize );

        /* These are shared with the tasks, which is why all submitted tasks have to finish before returning. */
        std::mutex mutex;
        std::condition_variable changed;
        size_t inFlight{ 0 };
        bool failed{ false };

        std::vector<std::future<std::vector<char> > > slices;

        const auto waitForSubmitted = [&slices] () {
            for ( auto& slice : slices ) {
                slice.wait();
            }
        };

        for ( auto blockNumber = blocks.first; blockNumber <= blocks.last; ++blockNumber ) {
            {
                std::unique_lock lock( mutex );
                changed.wait( lock, [&] () { return ( inFlight < m_maxConcurrency ) || failed; } );
                /* Blocks behind the end of the source contribute nothing. */
                if ( failed || ( blockExtent( blockNumber, blockSize ).first >= m_resolver.knownSourceSize() ) ) {
                    break;
                }
                ++inFlight;
            }

            try {
                slices.emplace_back( m_threadPool.submit( [&, blockNumber] () {
                    const Finally notifyDone( [&] () {
                        {
                            const std::lock_guard lock( mutex );
                            --inFlight;
                        }
                        changed.notify_all();
                    } );

                    try {
                        return m_resolver.resolveBlock( start, end, blockNumber );
                    } catch ( const std::exception& ) {
                        const std::lock_guard lock( mutex );
                        failed = true;
                        throw;
                    }
                } ) );
            } catch ( const std::exception& ) {
                waitForSubmitted();
                throw;
            }
        }

        waitForSubmitted();

        /* Ranges may extend far behind the end of the source. Reserve only what has actually been resolved. */
        std::vector<std::vector<char> > parts;
        parts.reserve( slices.size() );
        size_t totalSize{ 0 };
        for ( auto& slice : slices ) {
            parts.emplace_back( slice.get() );
            totalSize += parts.back().size();
        }

        std::vector<char> result;
        result.reserve( totalSize );
        for ( const auto& part : parts ) {
            result.insert( result.end(), part.begin(), part.end() );
        }
        return result;
    }

    /**
     * Drops queued resolutions and joins the worker threads. Running resolutions finish normally.
     */
    void
    stop()
    {
        m_threadPool.stop();
    }

    [[nodiscard]] size_t
    maxConcurrency() const noexcept
    {
        return m_maxConcurrency;
    }

private:
    RangeResolver& m_resolver;
    const size_t m_maxConcurrency;
    ThreadPool m_threadPool;
};
}  // namespace blockreader
