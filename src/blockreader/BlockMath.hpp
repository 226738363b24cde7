#pragma once

#include <cstddef>
#include <stdexcept>


namespace blockreader
{
/**
 * Inclusive byte extent [first, last] of one block in the source's address space.
 */
struct BlockExtent
{
    size_t first{ 0 };
    size_t last{ 0 };

    [[nodiscard]] bool
    operator==( const BlockExtent& other ) const noexcept
    {
        return ( first == other.first ) && ( last == other.last );
    }
};


/**
 * Offset inside a block and the number of bytes to extract from there.
 */
struct BlockSlice
{
    size_t position{ 0 };
    size_t length{ 0 };

    [[nodiscard]] bool
    operator==( const BlockSlice& other ) const noexcept
    {
        return ( position == other.position ) && ( length == other.length );
    }
};


/**
 * Inclusive range of block numbers [first, last] touched by a byte range.
 */
struct BlockRange
{
    size_t first{ 0 };
    size_t last{ 0 };

    [[nodiscard]] size_t
    size() const noexcept
    {
        return last - first + 1;
    }
};


inline void
checkBlockSize( size_t blockSize )
{
    if ( blockSize == 0 ) {
        throw std::invalid_argument( "The block size must be larger than 0!" );
    }
}


[[nodiscard]] inline BlockExtent
blockExtent( size_t blockNumber,
             size_t blockSize )
{
    checkBlockSize( blockSize );
    const auto first = blockNumber * blockSize;
    return { first, first + blockSize - 1 };
}


/**
 * Computes which part of block @p blockNumber contributes to the range [start, end).
 * The block is assumed to be full-sized. Callers clamp the result to the bytes actually available.
 */
[[nodiscard]] inline BlockSlice
sliceInBlock( size_t start,
              size_t end,
              size_t blockNumber,
              size_t blockSize )
{
    const auto extent = blockExtent( blockNumber, blockSize );
    if ( ( start >= end ) || ( end <= extent.first ) || ( start > extent.last ) ) {
        throw std::invalid_argument( "The block does not intersect with the requested range!" );
    }

    BlockSlice slice;
    slice.position = start <= extent.first ? 0 : start % blockSize;
    slice.length = end > extent.last ? blockSize - slice.position : ( end % blockSize ) - slice.position;
    return slice;
}


/**
 * @return The blocks touched by the non-empty range [start, end).
 */
[[nodiscard]] inline BlockRange
blockRange( size_t start,
            size_t end,
            size_t blockSize )
{
    checkBlockSize( blockSize );
    if ( start >= end ) {
        throw std::invalid_argument( "Cannot compute the blocks of an empty range!" );
    }
    return { start / blockSize, ( end - 1 ) / blockSize };
}
}  // namespace blockreader
