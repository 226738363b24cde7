#pragma once

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/filereader/FileReader.hpp>
#include <core/filereader/StreamAdapter.hpp>


namespace blockreader
{
/**
 * Handle for one range request, which is returned before the data is available. The assembled bytes become
 * readable all at once when the request finishes. If the request failed, reading, seeking, and querying the
 * size rethrow the failure. Destroying the handle does not cancel the request.
 */
class RangeStream :
    public FileReader
{
public:
    using Result = std::shared_future<std::vector<char> >;

public:
    RangeStream( size_t start,
                 size_t end,
                 Result result ) :
        m_start( start ),
        m_end( end ),
        m_result( std::move( result ) )
    {
        if ( !m_result.valid() ) {
            throw std::invalid_argument( "RangeStream requires a valid result!" );
        }
    }

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        auto result = std::make_unique<RangeStream>( m_start, m_end, m_result );
        result->m_currentPosition = m_currentPosition;
        return result;
    }

    void
    close() override
    {
        m_closed = true;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        if ( !ready() ) {
            return false;
        }
        if ( error() ) {
            return true;
        }
        return m_currentPosition >= m_result.get().size();
    }

    [[nodiscard]] bool
    fail() const override
    {
        return ready() && ( error() != nullptr );
    }

    [[nodiscard]] int
    fileno() const override
    {
        throw std::invalid_argument( "A range stream has no file descriptor!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    /**
     * Blocks until the request has finished.
     */
    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        if ( m_closed ) {
            throw std::invalid_argument( "Cannot read from a closed stream!" );
        }

        const auto& data = m_result.get();
        const auto nBytesRead = std::min( nMaxBytesToRead, data.size() - std::min( data.size(), m_currentPosition ) );
        if ( ( nBytesRead > 0 ) && ( buffer != nullptr ) ) {
            std::memcpy( buffer, data.data() + m_currentPosition, nBytesRead );
        }
        m_currentPosition += nBytesRead;
        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( m_closed ) {
            throw std::invalid_argument( "Cannot seek in a closed stream!" );
        }
        m_currentPosition = effectiveOffset( offset, origin );
        return m_currentPosition;
    }

    /**
     * Blocks until the request has finished.
     */
    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_result.get().size();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

    void
    clearerr() override
    {}

    void
    wait() const
    {
        m_result.wait();
    }

    [[nodiscard]] bool
    ready() const
    {
        return m_result.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready;
    }

    /**
     * @return The failure of the finished request or nullptr if it succeeded or has not finished yet.
     */
    [[nodiscard]] std::exception_ptr
    error() const
    {
        if ( !ready() ) {
            return nullptr;
        }

        try {
            m_result.get();
        } catch ( ... ) {
            return std::current_exception();
        }
        return nullptr;
    }

    /**
     * @return The requested range, which might be longer than the available data at the end of the source.
     */
    [[nodiscard]] std::pair<size_t, size_t>
    range() const noexcept
    {
        return { m_start, m_end };
    }

private:
    const size_t m_start;
    const size_t m_end;
    const Result m_result;
    bool m_closed{ false };
    size_t m_currentPosition{ 0 };
};


/**
 * Wraps a range stream into a std::istream. Failures of the request are rethrown by the stream's read calls.
 */
[[nodiscard]] inline std::unique_ptr<FileReaderStream>
openRangeStream( std::unique_ptr<RangeStream> stream )
{
    auto result = std::make_unique<FileReaderStream>( std::move( stream ) );
    result->exceptions( std::ios_base::badbit );
    return result;
}
}  // namespace blockreader
