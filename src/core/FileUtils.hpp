#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>


namespace blockreader
{
[[nodiscard]] inline const char*
originToString( int origin )
{
    switch ( origin )
    {
    case SEEK_SET:
        return "SEEK_SET";
    case SEEK_CUR:
        return "SEEK_CUR";
    case SEEK_END:
        return "SEEK_END";
    default:
        break;
    }

    throw std::invalid_argument( "Unknown origin" );
}


[[nodiscard]] inline bool
fileExists( const std::filesystem::path& filePath )
{
    std::error_code error;
    return std::filesystem::exists( filePath, error ) && !error;
}


inline void
fileSeek( std::FILE*    file,
          long long int offset,
          int           origin )
{
    if ( file == nullptr ) {
        throw std::runtime_error( "File pointer to call seek on must not be null!" );
    }

    if ( offset > static_cast<long long int>( std::numeric_limits<long int>::max() ) ) {
        throw std::out_of_range( "std::fseek only takes long int, try compiling for 64 bit." );
    }

    const auto returnCode = std::fseek( file, static_cast<long int>( offset ), origin );
    if ( returnCode != 0 ) {
        std::stringstream message;
        message << "Seeking to " << offset << " from origin " << originToString( origin ) << " failed with code: "
                << returnCode << ", " << std::strerror( errno ) << "!";
        throw std::runtime_error( std::move( message ).str() );
    }
}


class unique_file_descriptor
{
public:
    explicit
    unique_file_descriptor( int fd ) :
        m_fd( fd )
    {}

    ~unique_file_descriptor()
    {
        close();
    }

    unique_file_descriptor() = default;

    unique_file_descriptor( const unique_file_descriptor& ) = delete;

    unique_file_descriptor&
    operator=( const unique_file_descriptor& ) = delete;

    unique_file_descriptor( unique_file_descriptor&& other ) noexcept :
        m_fd( other.m_fd )
    {
        other.m_fd = -1;
    }

    unique_file_descriptor&
    operator=( unique_file_descriptor&& other ) noexcept
    {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
        return *this;
    }

    [[nodiscard]] constexpr int
    operator*() const noexcept
    {
        return m_fd;
    }

    [[nodiscard]] explicit
    operator bool() const noexcept
    {
        return m_fd >= 0;
    }

    void
    close()
    {
        if ( m_fd >= 0 ) {
            ::close( m_fd );
            m_fd = -1;
        }
    }

private:
    int m_fd{ -1 };
};


using unique_file_ptr = std::unique_ptr<std::FILE, std::function<void ( std::FILE* )> >;

inline unique_file_ptr
make_unique_file_ptr( std::FILE* file )
{
    return {
        file,
        [] ( auto* ownedFile ) {
            if ( ownedFile != nullptr ) {
                std::fclose( ownedFile );  // NOLINT
            }
        }
    };
}


inline unique_file_ptr
throwingOpen( const std::string& filePath,
              const char*        mode )
{
    if ( mode == nullptr ) {
        throw std::invalid_argument( "Mode must be a C-String and not null!" );
    }

    auto file = make_unique_file_ptr( std::fopen( filePath.c_str(), mode ) );  // NOLINT
    if ( file == nullptr ) {
        std::stringstream msg;
        msg << "Opening file '" << filePath << "' with mode '" << mode << "' failed: " << std::strerror( errno );
        throw std::invalid_argument( std::move( msg ).str() );
    }

    return file;
}


/**
 * @return An owned read-only file descriptor or an invalid one if the file does not exist.
 *         Any other error is thrown.
 */
[[nodiscard]] inline unique_file_descriptor
openForReadingIfExists( const std::filesystem::path& filePath )
{
    unique_file_descriptor file( ::open( filePath.c_str(), O_RDONLY | O_CLOEXEC ) );  // NOLINT
    if ( !file && ( errno != ENOENT ) ) {
        std::stringstream message;
        message << "Opening file '" << filePath.string() << "' for reading failed: " << std::strerror( errno );
        throw std::runtime_error( std::move( message ).str() );
    }
    return file;
}


/**
 * Posix read is not guaranteed to read everything even if the file is large enough.
 * Therefore, it has to be looped over.
 * @return the number of bytes read, which is only smaller than @p size if the end of file was reached.
 */
[[nodiscard]] inline size_t
preadAll( const int      fileDescriptor,
          void* const    buffer,
          const size_t   size,
          const uint64_t fileOffset )
{
    size_t nTotalRead = 0;
    while ( nTotalRead < size ) {
        auto* const currentBufferPosition = reinterpret_cast<uint8_t*>( buffer ) + nTotalRead;
        const auto nBytesRead = ::pread( fileDescriptor, currentBufferPosition, size - nTotalRead,
                                         static_cast<off_t>( fileOffset + nTotalRead ) );
        if ( nBytesRead < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            std::stringstream message;
            message << "Unable to read " << size << " B at offset " << fileOffset << " from the given file "
                    << "descriptor. Read " << nTotalRead << " B (" << std::strerror( errno ) << ").";
            throw std::runtime_error( std::move( message ).str() );
        }
        if ( nBytesRead == 0 ) {
            break;
        }
        nTotalRead += static_cast<size_t>( nBytesRead );
    }
    return nTotalRead;
}


/**
 * Posix write is not guaranteed to write everything and in fact was encountered to not write more than
 * 0x7ffff000 (2'147'479'552) B. To avoid this, it has to be looped over.
 * @return 0 on success or the errno of the failed write.
 */
[[nodiscard]] inline int
writeAllToFd( const int         outputFileDescriptor,
              const void* const dataToWrite,
              const uint64_t    dataToWriteSize )
{
    for ( uint64_t nTotalWritten = 0; nTotalWritten < dataToWriteSize; ) {
        const auto* const currentBufferPosition = reinterpret_cast<const uint8_t*>( dataToWrite ) + nTotalWritten;

        const auto nBytesToWritePerCall =
            static_cast<unsigned int>(
                std::min( static_cast<uint64_t>( std::numeric_limits<unsigned int>::max() ),
                          dataToWriteSize - nTotalWritten ) );

        const auto nBytesWritten = ::write( outputFileDescriptor, currentBufferPosition, nBytesToWritePerCall );
        if ( nBytesWritten < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            return errno;
        }
        if ( nBytesWritten == 0 ) {
            return EIO;
        }
        nTotalWritten += static_cast<uint64_t>( nBytesWritten );
    }

    return 0;
}


struct TemporaryFile
{
    std::filesystem::path path;
    unique_file_descriptor file;
};


/**
 * Creates a new file with a unique name starting with @p prefix inside @p folder.
 * The caller owns the file, i.e., it is not deleted automatically.
 */
[[nodiscard]] inline TemporaryFile
createTemporaryFile( const std::filesystem::path& folder,
                     const std::string&           prefix )
{
    auto pathTemplate = ( folder / ( prefix + "XXXXXX" ) ).string();
    std::vector<char> mutableTemplate( pathTemplate.begin(), pathTemplate.end() );
    mutableTemplate.push_back( '\0' );

    unique_file_descriptor file( ::mkstemp( mutableTemplate.data() ) );
    if ( !file ) {
        std::stringstream message;
        message << "Failed to create a temporary file from template '" << pathTemplate << "': "
                << std::strerror( errno );
        throw std::runtime_error( std::move( message ).str() );
    }

    return { std::filesystem::path( mutableTemplate.data() ), std::move( file ) };
}


/**
 * Creates a new, uniquely named folder inside @p parent, which is only accessible by the current user.
 */
[[nodiscard]] inline std::filesystem::path
createTemporaryFolder( const std::filesystem::path& parent,
                       const std::string&           prefix )
{
    auto pathTemplate = ( parent / ( prefix + "XXXXXX" ) ).string();
    std::vector<char> mutableTemplate( pathTemplate.begin(), pathTemplate.end() );
    mutableTemplate.push_back( '\0' );

    if ( ::mkdtemp( mutableTemplate.data() ) == nullptr ) {
        std::stringstream message;
        message << "Failed to create a temporary folder from template '" << pathTemplate << "': "
                << std::strerror( errno );
        throw std::runtime_error( std::move( message ).str() );
    }

    return std::filesystem::path( mutableTemplate.data() );
}
}  // namespace blockreader
