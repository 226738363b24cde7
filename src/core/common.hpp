#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <unistd.h>


namespace blockreader
{
template<typename I1,
         typename I2,
         typename Enable = typename std::enable_if_t<std::is_integral_v<I1> && std::is_integral_v<I2>> >
[[nodiscard]] constexpr I1
ceilDiv( I1 dividend,
         I2 divisor ) noexcept
{
    return ( dividend + divisor - 1 ) / divisor;
}


template<typename U,
         std::enable_if_t<std::is_signed_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    /* Underflow or overflow should only be possible when both values have the same sign! */
    if ( ( a > 0 ) && ( b > 0 ) ) {
        return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
    }

    if ( ( a < 0 ) && ( b < 0 ) ) {
        return a < std::numeric_limits<U>::lowest() - b ? std::numeric_limits<U>::lowest() : a + b;
    }

    return a + b;
}


template<typename T>
std::ostream&
operator<<( std::ostream&         out,
            const std::vector<T>& vector )
{
    if ( vector.empty() ) {
        out << "{}";
        return out;
    }

    out << "{ ";
    for ( auto value = vector.begin(); value != vector.end(); ++value ) {
        if ( value != vector.begin() ) {
            out << ", ";
        }
        if constexpr ( std::is_same_v<T, char> || std::is_same_v<T, uint8_t> ) {
            out << static_cast<int>( static_cast<uint8_t>( *value ) );
        } else {
            out << *value;
        }
    }
    out << " }";

    return out;
}


[[nodiscard]] inline std::string
formatBytes( const uint64_t value )
{
    const std::array<std::pair<std::string_view, uint64_t>, 5U> UNITS{ {
        { "TiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "GiB", 1024ULL * 1024ULL * 1024ULL },
        { "MiB", 1024ULL * 1024ULL },
        { "KiB", 1024ULL },
        { "B", 1ULL },
    } };

    std::stringstream result;
    for ( const auto& [unit, multiplier] : UNITS ) {
        const auto remainder = multiplier == UNITS.front().second
                               ? value / multiplier
                               : ( value / multiplier ) % 1024ULL;
        if ( remainder != 0 ) {
            if ( result.tellp() > 0 ) {
                result << " ";
            }
            result << remainder << " " << unit;
        }
    }

    if ( result.tellp() == 0 ) {
        return "0 B";
    }

    return std::move( result ).str();
}


[[nodiscard]] inline std::chrono::time_point<std::chrono::high_resolution_clock>
now() noexcept
{
    return std::chrono::high_resolution_clock::now();
}


/**
 * @return duration in seconds
 */
template<typename T>
[[nodiscard]] double
duration( const T& t0,
          const T& t1 = now() ) noexcept
{
    return std::chrono::duration<double>( t1 - t0 ).count();
}


[[nodiscard]] inline size_t
availableCores()
{
    return std::max<size_t>( 1U, std::thread::hardware_concurrency() );
}


/**
 * Builds one log line prefixed with the wall-clock time and the calling thread's ID so that lines
 * written concurrently from the worker threads do not interleave. Use like this:
 * @verbatim
 * std::cerr << ( ThreadSafeOutput() << "[BlockCache]" << "Evicted" << key ).str();
 * @endverbatim
 */
class ThreadSafeOutput
{
public:
    ThreadSafeOutput()
    {
        using namespace std::chrono;
        const auto time = system_clock::now();
        const auto timePoint = system_clock::to_time_t( time );
        const auto subseconds = duration_cast<milliseconds>( time.time_since_epoch() ).count() % 1000;
        std::tm localTime{};
        localtime_r( &timePoint, &localTime );
        m_out << "[" << std::put_time( &localTime, "%H:%M:%S" ) << "."
              << std::setfill( '0' ) << std::setw( 3 ) << subseconds << std::setfill( ' ' ) << "]"
              << "[0x" << std::hex << std::this_thread::get_id() << std::dec << "]";
    }

    template<typename T>
    ThreadSafeOutput&
    operator<<( const T& value )
    {
        m_out << " " << value;
        return *this;
    }

    operator std::string() const
    {
        return m_out.str() + "\n";
    }

    [[nodiscard]] std::string
    str() const
    {
        return m_out.str() + "\n";
    }

private:
    std::stringstream m_out;
};


inline std::ostream&
operator<<( std::ostream&           out,
            const ThreadSafeOutput& output )
{
    out << output.str();
    return out;
}


class Finally
{
public:
    explicit
    Finally( std::function<void()> cleanup ) :
        m_cleanup( std::move( cleanup ) )
    {}

    ~Finally()
    {
        if ( m_cleanup ) {
            m_cleanup();
        }
    }

private:
    std::function<void()> m_cleanup;
};


[[nodiscard]] constexpr uint64_t
operator "" _Ki( unsigned long long int value ) noexcept
{
    return value * 1024ULL;
}


[[nodiscard]] constexpr uint64_t
operator "" _Mi( unsigned long long int value ) noexcept
{
    return value * 1024ULL * 1024ULL;
}
}  // namespace blockreader
