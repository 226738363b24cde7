#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "FileReader.hpp"


namespace blockreader
{
/**
 * Serves a buffer that is shared between all clones, which is what the test adapters use as origin.
 */
class MemoryFileReader :
    public FileReader
{
public:
    using Buffer = std::vector<char>;

public:
    explicit
    MemoryFileReader( Buffer data ) :
        m_data( std::make_shared<const Buffer>( std::move( data ) ) )
    {}

    explicit
    MemoryFileReader( std::shared_ptr<const Buffer> data ) :
        m_data( std::move( data ) )
    {
        if ( !m_data ) {
            throw std::invalid_argument( "MemoryFileReader requires a valid buffer!" );
        }
    }

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        auto result = std::make_unique<MemoryFileReader>( m_data );
        result->m_currentPosition = m_currentPosition;
        return result;
    }

    void
    close() override
    {
        m_closed = true;
        m_currentPosition = 0;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_currentPosition >= m_data->size();
    }

    [[nodiscard]] bool
    fail() const override
    {
        return false;
    }

    [[nodiscard]] int
    fileno() const override
    {
        throw std::invalid_argument( "Trying to get fileno of an in-memory file!" );
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
        if ( m_closed ) {
            throw std::invalid_argument( "Cannot read from a closed file!" );
        }

        const auto nBytesRead = std::min( nMaxBytesToRead, m_data->size() - m_currentPosition );
        if ( nBytesRead == 0 ) {
            return 0;
        }

        if ( buffer != nullptr ) {
            std::memcpy( buffer, m_data->data() + m_currentPosition, nBytesRead );
        }

        m_currentPosition += nBytesRead;

        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        m_currentPosition = effectiveOffset( offset, origin );
        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_data->size();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

    void
    clearerr() override
    {}

protected:
    const std::shared_ptr<const Buffer> m_data;
    bool m_closed{ false };
    size_t m_currentPosition{ 0 };
};
}  // namespace blockreader
