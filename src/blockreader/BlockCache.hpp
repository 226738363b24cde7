#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <unistd.h>

#include <core/Cache.hpp>
#include <core/common.hpp>
#include <core/FileUtils.hpp>
#include <core/Sha256.hpp>
#include <core/ThreadPool.hpp>


namespace blockreader
{
/**
 * Metadata of one cached block. The bytes themselves live in the backing file.
 */
struct CacheEntry
{
    std::string key;
    std::filesystem::path filePath;
    /** Byte size of the fetched block. Used for the capacity accounting and to bound reads. */
    size_t length{ 0 };
};


struct DisposalFailure
{
    std::filesystem::path filePath;
    std::string message;
};


/**
 * Disk-backed, least-recently-used cache of blocks shared by all readers. It only tracks metadata in memory.
 * Each entry leaving the cache, be it by eviction, replacement, explicit removal, or destruction, gets its
 * backing file deleted asynchronously on the disposal thread pool. Failures of these deletions never
 * propagate. They are logged and collected in @ref disposalFailures.
 *
 * All members are thread-safe.
 */
class BlockCache
{
public:
    using Cache = blockreader::Cache<std::string, CacheEntry>;

    struct Configuration
    {
        /** Maximum summed length of all cached blocks in bytes. */
        size_t capacity{ 500'000'000 };
        /** Parent for the private folder holding the backing files. Empty means the system's temporary folder. */
        std::filesystem::path temporaryDirectory{};
        size_t disposalParallelism{ 1 };
        bool verbose{ false };
    };

    struct Statistics
    {
    public:
        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Cache"
                << "\n        Hits                          : " << cache.hits
                << "\n        Misses                        : " << cache.misses
                << "\n        Insertions                    : " << cache.insertions
                << "\n        Evictions                     : " << cache.evictions
                << "\n        Rejections                    : " << cache.rejections
                << "\n        Unused Entries                : " << cache.unusedEntries
                << "\n        Entries                       : " << cache.entries
                << "\n        Size                          : " << formatBytes( cache.weight )
                << "\n        Maximum Fill Size             : " << formatBytes( cache.maxWeight )
                << "\n        Capacity                      : " << formatBytes( cache.capacity )
                << "\n    Backing Files"
                << "\n        Created                       : " << backingFilesCreated
                << "\n        Disposed                      : " << disposals
                << "\n        Failed Disposals              : " << disposalFailures;
            return std::move( out ).str();
        }

    public:
        Cache::Statistics cache;
        size_t backingFilesCreated{ 0 };
        size_t disposals{ 0 };
        size_t disposalFailures{ 0 };
    };

    /**
     * Holds the per-key mutex for as long as it exists. Acquire it with @ref BlockCache::lockKey.
     */
    class KeyLock
    {
        friend class BlockCache;

    public:
        ~KeyLock()
        {
            m_cache.unlockKey( m_key, m_mutex );
        }

        KeyLock( const KeyLock& ) = delete;

        KeyLock( KeyLock&& ) = delete;

        KeyLock&
        operator=( const KeyLock& ) = delete;

        KeyLock&
        operator=( KeyLock&& ) = delete;

        [[nodiscard]] const std::string&
        key() const noexcept
        {
            return m_key;
        }

    private:
        KeyLock( BlockCache& cache,
                 std::string key ) :
            m_cache( cache ),
            m_key( std::move( key ) ),
            m_mutex( m_cache.acquireKeyMutex( m_key ) )
        {
            m_mutex->lock();
        }

    private:
        BlockCache& m_cache;
        const std::string m_key;
        const std::shared_ptr<std::mutex> m_mutex;
    };

public:
    BlockCache() :
        BlockCache( Configuration{} )
    {}

    explicit
    BlockCache( Configuration configuration ) :
        m_configuration( std::move( configuration ) ),
        m_directory( createPrivateDirectory( m_configuration ) ),
        m_disposalPool( checkDisposalParallelism( m_configuration.disposalParallelism ) ),
        m_cache( m_configuration.capacity,
                 [] ( const CacheEntry& entry ) { return entry.length; },
                 [this] ( const std::string&, CacheEntry&& entry ) { dispose( std::move( entry ) ); } )
    {
        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[BlockCache] Created cache folder" << m_directory
                           << "with capacity" << formatBytes( m_configuration.capacity ) ).str();
        }
    }

    ~BlockCache()
    {
        {
            const std::lock_guard lock( m_mutex );
            m_cache.clear();
        }
        waitForDisposals();
        m_disposalPool.stop();

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[BlockCache::~BlockCache]" << statistics().print() ).str();
        }

        /* Also removes backing files that were created but never inserted, e.g., because the fetch failed
         * after the file creation. */
        std::error_code error;
        std::filesystem::remove_all( m_directory, error );
        if ( error ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to remove the cache folder" << m_directory
                           << ":" << error.message() ).str();
        }
    }

    BlockCache( const BlockCache& ) = delete;

    BlockCache&
    operator=( const BlockCache& ) = delete;

    /**
     * Marks the entry as most recently used. The returned entry's backing file may have vanished,
     * which callers have to treat as a cache miss.
     */
    [[nodiscard]] std::optional<CacheEntry>
    get( const std::string& key )
    {
        const std::lock_guard lock( m_mutex );
        return m_cache.get( key );
    }

    /**
     * Inserts or replaces the entry and evicts least recently used entries until the capacity is satisfied.
     * Entries larger than the whole capacity are disposed immediately.
     * @return true if the entry is now cached.
     */
    bool
    insert( const std::string& key,
            CacheEntry         entry )
    {
        entry.key = key;

        const std::lock_guard lock( m_mutex );

        /* Replacing an entry with one referring to the very same file must not delete that file. */
        const auto existing = m_cache.peek( key );
        if ( existing && ( existing->filePath == entry.filePath ) && ( entry.length <= m_cache.capacity() ) ) {
            m_retainedFile = entry.filePath;
        }
        const Finally resetRetainedFile( [this] () { m_retainedFile.reset(); } );

        const auto path = entry.filePath;
        const auto length = entry.length;
        const auto wasInserted = m_cache.insert( key, std::move( entry ) );

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[BlockCache::insert]" << ( wasInserted ? "Inserted" : "Rejected" )
                           << key << "with" << formatBytes( length ) << "backed by" << path ).str();
        }
        return wasInserted;
    }

    /**
     * Removes the entry and disposes its backing file. Unknown keys are ignored.
     * @return true if an entry existed.
     */
    bool
    evict( const std::string& key )
    {
        const std::lock_guard lock( m_mutex );
        return m_cache.evict( key );
    }

    /**
     * Removes all entries and disposes their backing files.
     */
    void
    clear()
    {
        const std::lock_guard lock( m_mutex );
        m_cache.clear();
    }

    [[nodiscard]] bool
    test( const std::string& key ) const
    {
        const std::lock_guard lock( m_mutex );
        return m_cache.test( key );
    }

    /**
     * Creates a new, empty file inside the private cache folder. Its name starts with the hexadecimal
     * SHA-256 digest of @p key. The file is not tracked until an entry referring to it is inserted.
     */
    [[nodiscard]] TemporaryFile
    createBackingFile( const std::string& key )
    {
        auto result = createTemporaryFile( m_directory, sha256Hex( key ) + "-" );
        ++m_backingFilesCreated;
        return result;
    }

    /**
     * Serializes the population of a key. Only one holder per key exists at any time.
     */
    [[nodiscard]] KeyLock
    lockKey( const std::string& key )
    {
        return KeyLock( *this, key );
    }

    /**
     * Blocks until all disposals issued so far, and those issued while waiting, have finished.
     */
    void
    waitForDisposals()
    {
        while ( true ) {
            std::vector<std::future<void> > pending;
            {
                const std::lock_guard lock( m_disposalMutex );
                pending.swap( m_pendingDisposals );
            }
            if ( pending.empty() ) {
                break;
            }

            for ( auto& disposal : pending ) {
                disposal.wait();
            }
        }
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        Statistics result;
        {
            const std::lock_guard lock( m_mutex );
            result.cache = m_cache.statistics();
        }
        {
            const std::lock_guard lock( m_disposalMutex );
            result.disposalFailures = m_disposalFailures.size();
        }
        result.backingFilesCreated = m_backingFilesCreated;
        result.disposals = m_disposals;
        return result;
    }

    [[nodiscard]] std::vector<DisposalFailure>
    disposalFailures() const
    {
        const std::lock_guard lock( m_disposalMutex );
        return m_disposalFailures;
    }

    [[nodiscard]] const std::filesystem::path&
    directory() const noexcept
    {
        return m_directory;
    }

    [[nodiscard]] const Configuration&
    configuration() const noexcept
    {
        return m_configuration;
    }

private:
    [[nodiscard]] static std::filesystem::path
    createPrivateDirectory( const Configuration& configuration )
    {
        const auto parent = configuration.temporaryDirectory.empty()
                            ? std::filesystem::temp_directory_path()
                            : configuration.temporaryDirectory;
        return createTemporaryFolder( parent, "blockreader." + std::to_string( ::getpid() ) + "." );
    }

    [[nodiscard]] static size_t
    checkDisposalParallelism( size_t parallelism )
    {
        if ( parallelism == 0 ) {
            throw std::invalid_argument( "At least one thread is required for disposing backing files!" );
        }
        return parallelism;
    }

    /**
     * Called by the cache while m_mutex is locked.
     */
    void
    dispose( CacheEntry&& entry )
    {
        if ( m_retainedFile && ( *m_retainedFile == entry.filePath ) ) {
            return;
        }

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[BlockCache::dispose]" << entry.key << "backed by"
                           << entry.filePath ).str();
        }

        auto disposal = m_disposalPool.submit(
            [this, filePath = std::move( entry.filePath )] () { deleteBackingFile( filePath ); } );

        const std::lock_guard lock( m_disposalMutex );
        m_pendingDisposals.erase(
            std::remove_if( m_pendingDisposals.begin(), m_pendingDisposals.end(), [] ( const auto& future ) {
                return future.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready;
            } ), m_pendingDisposals.end() );
        m_pendingDisposals.emplace_back( std::move( disposal ) );
    }

    void
    deleteBackingFile( const std::filesystem::path& filePath )
    {
        std::error_code error;
        const auto exists = std::filesystem::exists( filePath, error );
        if ( !error && exists ) {
            std::filesystem::remove( filePath, error );
        }

        if ( !error ) {
            ++m_disposals;
            return;
        }

        std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to delete backing file" << filePath << ":"
                       << error.message() ).str();

        const std::lock_guard lock( m_disposalMutex );
        m_disposalFailures.emplace_back( DisposalFailure{ filePath, error.message() } );
    }

    [[nodiscard]] std::shared_ptr<std::mutex>
    acquireKeyMutex( const std::string& key )
    {
        const std::lock_guard lock( m_keyLocksMutex );
        auto& keyLock = m_keyLocks[key];
        if ( !keyLock.mutex ) {
            keyLock.mutex = std::make_shared<std::mutex>();
        }
        ++keyLock.holders;
        return keyLock.mutex;
    }

    void
    unlockKey( const std::string&                 key,
               const std::shared_ptr<std::mutex>& mutex )
    {
        mutex->unlock();

        const std::lock_guard lock( m_keyLocksMutex );
        const auto match = m_keyLocks.find( key );
        if ( ( match != m_keyLocks.end() ) && ( --match->second.holders == 0 ) ) {
            m_keyLocks.erase( match );
        }
    }

private:
    struct KeyMutex
    {
        std::shared_ptr<std::mutex> mutex;
        /** Number of threads holding or waiting for the mutex. */
        size_t holders{ 0 };
    };

private:
    const Configuration m_configuration;
    const std::filesystem::path m_directory;

    mutable std::mutex m_disposalMutex;
    std::vector<std::future<void> > m_pendingDisposals;
    std::vector<DisposalFailure> m_disposalFailures;
    std::atomic<size_t> m_disposals{ 0 };
    std::atomic<size_t> m_backingFilesCreated{ 0 };

    std::mutex m_keyLocksMutex;
    std::unordered_map<std::string, KeyMutex> m_keyLocks;

    ThreadPool m_disposalPool;

    /** Guards m_cache and m_retainedFile. */
    mutable std::mutex m_mutex;
    std::optional<std::filesystem::path> m_retainedFile;
    Cache m_cache;
};
}  // namespace blockreader
