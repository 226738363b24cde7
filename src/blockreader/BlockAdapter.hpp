#pragma once

#include <cstddef>
#include <string>
#include <vector>


namespace blockreader
{
/**
 * Capability supplied by each concrete origin. It knows how to name a block uniquely and how to get
 * the bytes of a block from the slow source. Everything else, i.e., caching, assembly of ranges,
 * and concurrency, is handled by BlockReader.
 */
class BlockAdapter
{
public:
    virtual
    ~BlockAdapter() = default;

    /**
     * @return A key that is deterministic and unique per source and block number over the whole process.
     */
    [[nodiscard]] virtual std::string
    cacheKey( size_t blockNumber ) const = 0;

    /**
     * Returns the bytes of the inclusive extent [blockFirst, blockLast]. May return fewer bytes
     * if the source ends inside the block. Failures are reported by throwing.
     * Must be callable concurrently for different blocks.
     */
    [[nodiscard]] virtual std::vector<char>
    fetchBlock( size_t blockFirst,
                size_t blockLast ) = 0;

    /**
     * Closes the underlying source handle. May throw.
     */
    virtual void
    close()
    {}
};
}  // namespace blockreader
